#include "ed25519.hpp"
#include "trustpath/error.hpp"
#include <sodium.h>
#include <mutex>

namespace trustpath::crypto {

void Ed25519::ensure_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        if (sodium_init() < 0) {
            throw CryptoException(ErrorCode::CryptoInitFailed, "Failed to initialize libsodium");
        }
    });
}

std::pair<Ed25519PublicKey, Ed25519SecretKey> Ed25519::generate_keypair() {
    ensure_initialized();
    Ed25519PublicKey pk;
    Ed25519SecretKey sk;
    if (crypto_sign_keypair(pk.data(), sk.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to generate Ed25519 keypair");
    }
    return {pk, sk};
}

std::pair<Ed25519PublicKey, Ed25519SecretKey> Ed25519::keypair_from_seed(const fixed_bytes<32>& seed) {
    ensure_initialized();
    Ed25519PublicKey pk;
    Ed25519SecretKey sk;
    if (crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to derive Ed25519 keypair");
    }
    return {pk, sk};
}

Ed25519Signature Ed25519::sign(const bytes& message, const Ed25519SecretKey& secret_key) {
    ensure_initialized();
    Ed25519Signature sig;
    if (crypto_sign_detached(sig.data(), nullptr, message.data(), message.size(),
                             secret_key.data()) != 0) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to sign record");
    }
    return sig;
}

bool Ed25519::verify(const bytes& message, const bytes& signature, const bytes& public_key) {
    if (signature.size() != crypto_sign_BYTES || public_key.size() != crypto_sign_PUBLICKEYBYTES) {
        return false;
    }
    ensure_initialized();
    return crypto_sign_verify_detached(signature.data(), message.data(), message.size(),
                                       public_key.data()) == 0;
}

Ed25519PublicKey Ed25519::secret_to_public(const Ed25519SecretKey& secret_key) {
    Ed25519PublicKey pk;
    if (crypto_sign_ed25519_sk_to_pk(pk.data(), secret_key.data()) != 0) {
        throw CryptoException(ErrorCode::InvalidSecretKey, "Failed to derive public key from secret key");
    }
    return pk;
}

} // namespace trustpath::crypto
