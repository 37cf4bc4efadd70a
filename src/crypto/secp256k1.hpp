#pragma once

#include "trustpath/common.hpp"
#include <utility>

namespace trustpath::crypto {

using Secp256k1SecretKey = fixed_bytes<constants::SECP256K1_SECRET_KEY_SIZE>;

/**
 * ECDSA over secp256k1, backed by OpenSSL
 *
 * Messages are hashed with SHA-256 before signing. Signatures use the
 * 64-byte compact form (r || s, big-endian), public keys use SEC1 encoding
 * (33-byte compressed or 65-byte uncompressed).
 */
class Secp256k1 {
public:
    /**
     * Generate a new keypair
     * @return pair of (compressed public key, secret key)
     */
    static std::pair<bytes, Secp256k1SecretKey> generate_keypair();

    /**
     * Sign a message. The produced signature is normalized to low-S.
     */
    static bytes sign(const bytes& message, const Secp256k1SecretKey& secret_key);

    /**
     * Verify a compact signature. Malformed keys or signatures yield false.
     */
    static bool verify(const bytes& message, const bytes& signature, const bytes& public_key);

    /**
     * Compressed public key for a secret key
     */
    static bytes secret_to_public(const Secp256k1SecretKey& secret_key);

    /**
     * SHA-256 digest used for message hashing
     */
    static Hash256 sha256(const bytes& message);
};

} // namespace trustpath::crypto
