#include "core/signing/record_signer.hpp"
#include "core/signing/canonical.hpp"
#include "trustpath/error.hpp"

namespace trustpath::core {

RecordSigner::RecordSigner(SignatureAlgorithm algorithm, SecretKey secret_key, bytes public_key)
    : algorithm_(algorithm)
    , secret_key_(std::move(secret_key))
    , public_key_(std::move(public_key))
{}

RecordSigner RecordSigner::ed25519(const crypto::Ed25519SecretKey& secret_key) {
    auto pk = crypto::Ed25519::secret_to_public(secret_key);
    return RecordSigner(SignatureAlgorithm::ED25519, secret_key, bytes(pk.begin(), pk.end()));
}

RecordSigner RecordSigner::secp256k1(const crypto::Secp256k1SecretKey& secret_key) {
    return RecordSigner(SignatureAlgorithm::SECP256K1, secret_key,
                        crypto::Secp256k1::secret_to_public(secret_key));
}

RecordSigner RecordSigner::generate(SignatureAlgorithm algorithm) {
    if (algorithm == SignatureAlgorithm::SECP256K1) {
        auto [pk, sk] = crypto::Secp256k1::generate_keypair();
        return RecordSigner(algorithm, sk, pk);
    }
    auto [pk, sk] = crypto::Ed25519::generate_keypair();
    return RecordSigner(SignatureAlgorithm::ED25519, sk, bytes(pk.begin(), pk.end()));
}

bytes RecordSigner::sign_bytes(const bytes& message) const {
    if (algorithm_ == SignatureAlgorithm::SECP256K1) {
        return crypto::Secp256k1::sign(message, std::get<crypto::Secp256k1SecretKey>(secret_key_));
    }
    auto sig = crypto::Ed25519::sign(message, std::get<crypto::Ed25519SecretKey>(secret_key_));
    return bytes(sig.begin(), sig.end());
}

RecordSignature RecordSigner::make_signature(const std::optional<bytes>& canonical,
                                             uint64_t signed_at) const {
    if (!canonical) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed,
                              "Record payload has no canonical encoding");
    }
    RecordSignature signature;
    signature.algorithm = algorithm_;
    signature.public_key = public_key_;
    signature.signature = sign_bytes(*canonical);
    signature.signed_at = signed_at;
    return signature;
}

void RecordSigner::sign(TrustEdge& edge, uint64_t signed_at) const {
    edge.signature = make_signature(CanonicalEncoder::encode_trust_edge(edge), signed_at);
}

void RecordSigner::sign(Endorsement& endorsement, uint64_t signed_at) const {
    endorsement.signature = make_signature(CanonicalEncoder::encode_endorsement(endorsement), signed_at);
}

void RecordSigner::sign(DistrustEdge& edge, uint64_t signed_at) const {
    edge.signature = make_signature(CanonicalEncoder::encode_distrust(edge), signed_at);
}

} // namespace trustpath::core
