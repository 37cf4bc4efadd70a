#include "core/signing/signature_verifier.hpp"
#include "crypto/ed25519.hpp"
#include "crypto/secp256k1.hpp"
#include <exception>

namespace trustpath::core {

const char* to_string(VerifyStatus status) {
    switch (status) {
        case VerifyStatus::Valid: return "valid";
        case VerifyStatus::AlgorithmMismatch: return "algorithm_mismatch";
        case VerifyStatus::KeyMismatch: return "key_mismatch";
        case VerifyStatus::MalformedKey: return "malformed_key";
        case VerifyStatus::MalformedSignature: return "malformed_signature";
        case VerifyStatus::BadSignature: return "bad_signature";
        default: return "unknown";
    }
}

bool SignatureVerifier::well_formed_key(const RegisteredKey& key) {
    switch (key.algorithm) {
        case SignatureAlgorithm::ED25519:
            return key.key.size() == constants::ED25519_PUBLIC_KEY_SIZE;
        case SignatureAlgorithm::SECP256K1:
            if (key.key.size() == constants::SECP256K1_COMPRESSED_KEY_SIZE) {
                return key.key[0] == 0x02 || key.key[0] == 0x03;
            }
            if (key.key.size() == constants::SECP256K1_UNCOMPRESSED_KEY_SIZE) {
                return key.key[0] == 0x04;
            }
            return false;
        default:
            return false;
    }
}

VerifyStatus SignatureVerifier::verify(const bytes& canonical,
                                       const RecordSignature& signature,
                                       const RegisteredKey& registered_key) noexcept {
    if (signature.algorithm != registered_key.algorithm) {
        return VerifyStatus::AlgorithmMismatch;
    }
    // An empty declared key defers entirely to the registry
    if (!signature.public_key.empty() && signature.public_key != registered_key.key) {
        return VerifyStatus::KeyMismatch;
    }
    if (!well_formed_key(registered_key)) {
        return VerifyStatus::MalformedKey;
    }

    try {
        switch (registered_key.algorithm) {
            case SignatureAlgorithm::ED25519:
                if (signature.signature.size() != constants::ED25519_SIGNATURE_SIZE) {
                    return VerifyStatus::MalformedSignature;
                }
                return crypto::Ed25519::verify(canonical, signature.signature, registered_key.key)
                    ? VerifyStatus::Valid : VerifyStatus::BadSignature;

            case SignatureAlgorithm::SECP256K1:
                if (signature.signature.size() != constants::SECP256K1_COMPACT_SIGNATURE_SIZE) {
                    return VerifyStatus::MalformedSignature;
                }
                return crypto::Secp256k1::verify(canonical, signature.signature, registered_key.key)
                    ? VerifyStatus::Valid : VerifyStatus::BadSignature;

            default:
                return VerifyStatus::AlgorithmMismatch;
        }
    } catch (const std::exception&) {
        // Library initialisation failures still exclude the record
        return VerifyStatus::BadSignature;
    }
}

} // namespace trustpath::core
