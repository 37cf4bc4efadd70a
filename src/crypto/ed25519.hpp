#pragma once

#include "trustpath/common.hpp"
#include <utility>

namespace trustpath::crypto {

using Ed25519PublicKey = fixed_bytes<constants::ED25519_PUBLIC_KEY_SIZE>;
using Ed25519SecretKey = fixed_bytes<constants::ED25519_SECRET_KEY_SIZE>;
using Ed25519Signature = fixed_bytes<constants::ED25519_SIGNATURE_SIZE>;

/**
 * Ed25519 record signatures, backed by libsodium
 */
class Ed25519 {
public:
    /**
     * Generate a new keypair
     * @return pair of (public_key, secret_key)
     */
    static std::pair<Ed25519PublicKey, Ed25519SecretKey> generate_keypair();

    // Deterministic keypair from a 32-byte seed
    static std::pair<Ed25519PublicKey, Ed25519SecretKey> keypair_from_seed(const fixed_bytes<32>& seed);

    static Ed25519Signature sign(const bytes& message, const Ed25519SecretKey& secret_key);

    /**
     * Verify a detached signature taken from an untrusted record.
     * Wrong key or signature lengths yield false.
     */
    static bool verify(const bytes& message, const bytes& signature, const bytes& public_key);

    static Ed25519PublicKey secret_to_public(const Ed25519SecretKey& secret_key);

private:
    static void ensure_initialized();
};

} // namespace trustpath::crypto
