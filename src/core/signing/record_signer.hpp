#pragma once

#include "core/model/records.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/secp256k1.hpp"
#include <variant>

namespace trustpath::core {

/**
 * RecordSigner - Write-side counterpart of SignatureVerifier
 *
 * Signs trust edges, endorsements and distrust edges over the same canonical encoding the
 * verifier checks. Used by tooling and tests; the engine itself never signs.
 */
class RecordSigner {
public:
    static RecordSigner ed25519(const crypto::Ed25519SecretKey& secret_key);
    static RecordSigner secp256k1(const crypto::Secp256k1SecretKey& secret_key);

    // Fresh random keypair for the given algorithm
    static RecordSigner generate(SignatureAlgorithm algorithm);

    SignatureAlgorithm algorithm() const { return algorithm_; }
    RegisteredKey public_key() const { return RegisteredKey{algorithm_, public_key_}; }

    /**
     * Fill in the record's signature block. Throws CryptoException when the
     * payload cannot be canonically encoded or signing fails.
     */
    void sign(TrustEdge& edge, uint64_t signed_at) const;
    void sign(Endorsement& endorsement, uint64_t signed_at) const;
    void sign(DistrustEdge& edge, uint64_t signed_at) const;

    bytes sign_bytes(const bytes& message) const;

private:
    using SecretKey = std::variant<crypto::Ed25519SecretKey, crypto::Secp256k1SecretKey>;

    RecordSigner(SignatureAlgorithm algorithm, SecretKey secret_key, bytes public_key);

    RecordSignature make_signature(const std::optional<bytes>& canonical, uint64_t signed_at) const;

    SignatureAlgorithm algorithm_;
    SecretKey secret_key_;
    bytes public_key_;
};

} // namespace trustpath::core
