#include "secp256k1.hpp"
#include "trustpath/error.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/sha.h>
#include <memory>

namespace trustpath::crypto {

namespace {
    struct EcKeyDeleter { void operator()(EC_KEY* k) const { EC_KEY_free(k); } };
    struct EcPointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
    struct EcdsaSigDeleter { void operator()(ECDSA_SIG* s) const { ECDSA_SIG_free(s); } };
    struct BignumDeleter { void operator()(BIGNUM* b) const { BN_clear_free(b); } };
    struct BnCtxDeleter { void operator()(BN_CTX* c) const { BN_CTX_free(c); } };

    using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
    using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
    using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, EcdsaSigDeleter>;
    using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;

    constexpr size_t SCALAR_SIZE = 32;

    bytes encode_public(const EC_GROUP* group, const EC_POINT* point) {
        bytes out(constants::SECP256K1_COMPRESSED_KEY_SIZE);
        size_t written = EC_POINT_point2oct(group, point, POINT_CONVERSION_COMPRESSED,
                                            out.data(), out.size(), nullptr);
        if (written != out.size()) {
            throw CryptoException(ErrorCode::InvalidPublicKey, "Failed to encode secp256k1 public key");
        }
        return out;
    }

    // Build a key holding the secret scalar and its public point
    EcKeyPtr key_from_secret(const Secp256k1SecretKey& secret_key) {
        EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
        if (!key) {
            throw CryptoException(ErrorCode::CryptoInitFailed, "EC_KEY_new_by_curve_name failed");
        }

        const EC_GROUP* group = EC_KEY_get0_group(key.get());
        BignumPtr priv(BN_bin2bn(secret_key.data(), static_cast<int>(secret_key.size()), nullptr));
        EcPointPtr pub(EC_POINT_new(group));
        BnCtxPtr ctx(BN_CTX_new());
        if (!priv || !pub || !ctx) {
            throw CryptoException(ErrorCode::CryptoInitFailed, "OpenSSL allocation failed");
        }

        if (BN_is_zero(priv.get()) ||
            EC_KEY_set_private_key(key.get(), priv.get()) != 1 ||
            EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, ctx.get()) != 1 ||
            EC_KEY_set_public_key(key.get(), pub.get()) != 1) {
            throw CryptoException(ErrorCode::InvalidSecretKey, "Invalid secp256k1 secret key");
        }

        return key;
    }
}

Hash256 Secp256k1::sha256(const bytes& message) {
    Hash256 digest;
    SHA256(message.data(), message.size(), digest.data());
    return digest;
}

std::pair<bytes, Secp256k1SecretKey> Secp256k1::generate_keypair() {
    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key || EC_KEY_generate_key(key.get()) != 1) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to generate secp256k1 keypair");
    }

    Secp256k1SecretKey secret;
    const BIGNUM* priv = EC_KEY_get0_private_key(key.get());
    if (BN_bn2binpad(priv, secret.data(), static_cast<int>(secret.size())) != static_cast<int>(secret.size())) {
        throw CryptoException(ErrorCode::CryptoKeyGenerationFailed, "Failed to export secp256k1 secret key");
    }

    return {encode_public(EC_KEY_get0_group(key.get()), EC_KEY_get0_public_key(key.get())), secret};
}

bytes Secp256k1::secret_to_public(const Secp256k1SecretKey& secret_key) {
    auto key = key_from_secret(secret_key);
    return encode_public(EC_KEY_get0_group(key.get()), EC_KEY_get0_public_key(key.get()));
}

bytes Secp256k1::sign(const bytes& message, const Secp256k1SecretKey& secret_key) {
    auto key = key_from_secret(secret_key);
    auto digest = sha256(message);

    EcdsaSigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), key.get()));
    if (!sig) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "ECDSA_do_sign failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    // Normalize to low-S so each (message, key) pair has one encoding
    const BIGNUM* order = EC_GROUP_get0_order(EC_KEY_get0_group(key.get()));
    BignumPtr half(BN_dup(order));
    BignumPtr low_s(BN_dup(s));
    if (!half || !low_s || BN_rshift1(half.get(), half.get()) != 1) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "OpenSSL allocation failed");
    }
    if (BN_cmp(low_s.get(), half.get()) > 0) {
        if (BN_sub(low_s.get(), order, s) != 1) {
            throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to normalize signature");
        }
    }

    bytes out(constants::SECP256K1_COMPACT_SIGNATURE_SIZE);
    if (BN_bn2binpad(r, out.data(), SCALAR_SIZE) != static_cast<int>(SCALAR_SIZE) ||
        BN_bn2binpad(low_s.get(), out.data() + SCALAR_SIZE, SCALAR_SIZE) != static_cast<int>(SCALAR_SIZE)) {
        throw CryptoException(ErrorCode::CryptoSignatureFailed, "Failed to encode signature");
    }

    return out;
}

bool Secp256k1::verify(const bytes& message, const bytes& signature, const bytes& public_key) {
    if (signature.size() != constants::SECP256K1_COMPACT_SIGNATURE_SIZE) {
        return false;
    }
    if (public_key.size() != constants::SECP256K1_COMPRESSED_KEY_SIZE &&
        public_key.size() != constants::SECP256K1_UNCOMPRESSED_KEY_SIZE) {
        return false;
    }

    EcKeyPtr key(EC_KEY_new_by_curve_name(NID_secp256k1));
    if (!key) {
        return false;
    }

    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr point(EC_POINT_new(group));
    if (!point ||
        EC_POINT_oct2point(group, point.get(), public_key.data(), public_key.size(), nullptr) != 1 ||
        EC_KEY_set_public_key(key.get(), point.get()) != 1 ||
        EC_KEY_check_key(key.get()) != 1) {
        return false;
    }

    BIGNUM* r = BN_bin2bn(signature.data(), SCALAR_SIZE, nullptr);
    BIGNUM* s = BN_bin2bn(signature.data() + SCALAR_SIZE, SCALAR_SIZE, nullptr);
    EcdsaSigPtr sig(ECDSA_SIG_new());
    BignumPtr half(BN_dup(EC_GROUP_get0_order(group)));
    if (!r || !s || !sig || !half || BN_rshift1(half.get(), half.get()) != 1) {
        BN_free(r);
        BN_free(s);
        return false;
    }

    // Only the low-S form that sign() produces is accepted
    if (BN_cmp(s, half.get()) > 0 || ECDSA_SIG_set0(sig.get(), r, s) != 1) {
        BN_free(r);
        BN_free(s);
        return false;
    }

    auto digest = sha256(message);
    return ECDSA_do_verify(digest.data(), static_cast<int>(digest.size()), sig.get(), key.get()) == 1;
}

} // namespace trustpath::crypto
