#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <memory>
#include <optional>

// TrustPath Engine Version
#define TRUSTPATH_VERSION_MAJOR 0
#define TRUSTPATH_VERSION_MINOR 3
#define TRUSTPATH_VERSION_PATCH 0

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #ifndef TRUSTPATH_PLATFORM_WINDOWS
        #define TRUSTPATH_PLATFORM_WINDOWS
    #endif
#elif defined(__linux__)
    #ifndef TRUSTPATH_PLATFORM_LINUX
        #define TRUSTPATH_PLATFORM_LINUX
    #endif
#endif

#define TRUSTPATH_DISALLOW_COPY_AND_MOVE(TypeName) \
    TypeName(const TypeName&) = delete; \
    TypeName& operator=(const TypeName&) = delete; \
    TypeName(TypeName&&) = delete; \
    TypeName& operator=(TypeName&&) = delete

namespace trustpath {
namespace constants {

// Signature material
constexpr size_t ED25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t ED25519_SECRET_KEY_SIZE = 64;  // libsodium layout: 32-byte seed + 32-byte public key
constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr size_t SECP256K1_COMPRESSED_KEY_SIZE = 33;
constexpr size_t SECP256K1_UNCOMPRESSED_KEY_SIZE = 65;
constexpr size_t SECP256K1_SECRET_KEY_SIZE = 32;
constexpr size_t SECP256K1_COMPACT_SIGNATURE_SIZE = 64;

// Domain constants
constexpr const char* WILDCARD_DOMAIN = "*";

// Trust computation defaults
constexpr uint32_t DEFAULT_MAX_DEPTH = 4;
constexpr uint32_t MAX_DEPTH_LIMIT = 8;
constexpr double DEFAULT_DECAY_FACTOR = 0.9;
constexpr double DEFAULT_DOMAIN_INHERITANCE_DISCOUNT = 0.9;
constexpr double DEFAULT_MIN_PATH_CONFIDENCE = 0.01;
constexpr double DEFAULT_REDUNDANCY_PENALTY = 0.5;
constexpr uint32_t SECONDS_PER_DAY = 86400;

} // namespace constants

using byte = uint8_t;
using bytes = std::vector<byte>;

template<size_t N>
using fixed_bytes = std::array<byte, N>;

using Hash256 = fixed_bytes<32>;

// Identifiers are opaque strings assigned by the storage layer
using PrincipalId = std::string;
using SubjectId = std::string;
using DomainId = std::string;

std::string hash_to_hex(const Hash256& hash);
std::string bytes_to_hex(const bytes& data);

/**
 * Standard base64 with padding, as used for keys and signatures on the wire.
 * Decoding rejects characters outside the alphabet and bad padding.
 */
std::string base64_encode(const bytes& data);
std::optional<bytes> base64_decode(const std::string& encoded);

// Short, log-friendly prefix of an identifier
std::string short_id(const std::string& id, size_t len = 8);

} // namespace trustpath

// Record fingerprints key unordered containers
namespace std {
template<>
struct hash<trustpath::Hash256> {
    size_t operator()(const trustpath::Hash256& h) const noexcept {
        // Fingerprints are uniformly distributed; the first 8 bytes suffice
        size_t result = 0;
        for (size_t i = 0; i < 8 && i < h.size(); ++i) {
            result = (result << 8) | h[i];
        }
        return result;
    }
};
} // namespace std
