#include <gtest/gtest.h>
#include "crypto/ed25519.hpp"
#include "crypto/secp256k1.hpp"
#include "crypto/blake3.hpp"

using namespace trustpath;
using namespace trustpath::crypto;

namespace {

// secp256k1 group order n, big-endian
const bytes kCurveOrder = {
    0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE,
    0xBA, 0xAE, 0xDC, 0xE6, 0xAF, 0x48, 0xA0, 0x3B, 0xBF, 0xD2, 0x5E, 0x8C, 0xD0, 0x36, 0x41, 0x41
};

// Replace s with n - s, the other valid encoding of the same signature
bytes negate_s(const bytes& signature) {
    bytes out = signature;
    int borrow = 0;
    for (int i = 31; i >= 0; --i) {
        int diff = static_cast<int>(kCurveOrder[i]) - static_cast<int>(signature[32 + i]) - borrow;
        borrow = diff < 0 ? 1 : 0;
        out[32 + i] = static_cast<byte>(diff + (borrow ? 256 : 0));
    }
    return out;
}

} // namespace

TEST(Ed25519Test, KeypairGeneration) {
    auto [pk, sk] = Ed25519::generate_keypair();
    EXPECT_EQ(pk.size(), 32u);
    EXPECT_EQ(sk.size(), 64u);
    EXPECT_EQ(Ed25519::secret_to_public(sk), pk);
}

TEST(Ed25519Test, SignAndVerify) {
    auto [pk, sk] = Ed25519::generate_keypair();
    bytes key(pk.begin(), pk.end());

    bytes message = {'t', 'r', 'u', 's', 't'};
    auto signature = Ed25519::sign(message, sk);
    bytes sig(signature.begin(), signature.end());

    EXPECT_TRUE(Ed25519::verify(message, sig, key));

    // Tampered message should fail
    message[0] = 'T';
    EXPECT_FALSE(Ed25519::verify(message, sig, key));
}

TEST(Ed25519Test, SingleBitFlipInSignature) {
    auto [pk, sk] = Ed25519::generate_keypair();
    bytes message = {'p', 'a', 'y', 'l', 'o', 'a', 'd'};
    auto signature = Ed25519::sign(message, sk);

    bytes sig(signature.begin(), signature.end());
    sig[10] ^= 0x01;
    EXPECT_FALSE(Ed25519::verify(message, sig, bytes(pk.begin(), pk.end())));
}

TEST(Ed25519Test, WrongLengthsRejected) {
    auto [pk, sk] = Ed25519::generate_keypair();
    bytes message = {'x'};
    auto signature = Ed25519::sign(message, sk);

    bytes sig(signature.begin(), signature.end());
    bytes key(pk.begin(), pk.end());
    EXPECT_TRUE(Ed25519::verify(message, sig, key));

    bytes short_sig(sig.begin(), sig.end() - 1);
    bytes long_key = key;
    long_key.push_back(0);
    EXPECT_FALSE(Ed25519::verify(message, short_sig, key));
    EXPECT_FALSE(Ed25519::verify(message, sig, long_key));
    EXPECT_FALSE(Ed25519::verify(message, bytes{}, bytes{}));
}

TEST(Ed25519Test, SeededKeypairIsDeterministic) {
    fixed_bytes<32> seed{};
    seed[0] = 7;
    auto first = Ed25519::keypair_from_seed(seed);
    auto second = Ed25519::keypair_from_seed(seed);
    EXPECT_EQ(first.first, second.first);
    EXPECT_EQ(Ed25519::secret_to_public(first.second), first.first);

    seed[0] = 8;
    EXPECT_NE(Ed25519::keypair_from_seed(seed).first, first.first);
}

TEST(Secp256k1Test, KeypairGeneration) {
    auto [pk, sk] = Secp256k1::generate_keypair();
    ASSERT_EQ(pk.size(), 33u);
    EXPECT_TRUE(pk[0] == 0x02 || pk[0] == 0x03);
    EXPECT_EQ(Secp256k1::secret_to_public(sk), pk);
}

TEST(Secp256k1Test, SignAndVerify) {
    auto [pk, sk] = Secp256k1::generate_keypair();

    bytes message = {'e', 'n', 'd', 'o', 'r', 's', 'e'};
    auto signature = Secp256k1::sign(message, sk);
    ASSERT_EQ(signature.size(), 64u);

    EXPECT_TRUE(Secp256k1::verify(message, signature, pk));

    message.back() ^= 0x01;
    EXPECT_FALSE(Secp256k1::verify(message, signature, pk));
}

TEST(Secp256k1Test, SignatureIsLowS) {
    // Upper half of the curve order, big-endian: n/2 = 7FFFFFFF...5D576E73 57A4501D DFE92F46 681B20A0
    const bytes half_order = {
        0x7F, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF,
        0x5D, 0x57, 0x6E, 0x73, 0x57, 0xA4, 0x50, 0x1D, 0xDF, 0xE9, 0x2F, 0x46, 0x68, 0x1B, 0x20, 0xA0
    };
    auto [pk, sk] = Secp256k1::generate_keypair();
    for (int i = 0; i < 16; ++i) {
        bytes message = {static_cast<byte>(i), 'm'};
        auto signature = Secp256k1::sign(message, sk);
        bytes s(signature.begin() + 32, signature.end());
        EXPECT_LE(s, half_order);
    }
}

TEST(Secp256k1Test, HighSSignatureRejected) {
    auto [pk, sk] = Secp256k1::generate_keypair();
    bytes message = {'h', 'i', 'g', 'h'};
    auto signature = Secp256k1::sign(message, sk);
    ASSERT_TRUE(Secp256k1::verify(message, signature, pk));

    auto malleated = negate_s(signature);
    EXPECT_NE(malleated, signature);
    EXPECT_FALSE(Secp256k1::verify(message, malleated, pk));
}

TEST(Secp256k1Test, MalformedInputsRejected) {
    auto [pk, sk] = Secp256k1::generate_keypair();
    bytes message = {'m'};
    auto signature = Secp256k1::sign(message, sk);

    bytes bad_key = pk;
    bad_key[0] = 0x05;
    EXPECT_FALSE(Secp256k1::verify(message, signature, bad_key));
    EXPECT_FALSE(Secp256k1::verify(message, bytes(63, 0x01), pk));
    EXPECT_FALSE(Secp256k1::verify(message, bytes(64, 0x00), pk));
    EXPECT_FALSE(Secp256k1::verify(message, signature, bytes{}));
}

TEST(Secp256k1Test, KeyFromOtherPairFails) {
    auto [pk1, sk1] = Secp256k1::generate_keypair();
    auto [pk2, sk2] = Secp256k1::generate_keypair();
    bytes message = {'k', 'e', 'y'};
    EXPECT_FALSE(Secp256k1::verify(message, Secp256k1::sign(message, sk1), pk2));
}

TEST(Secp256k1Test, Sha256KnownVector) {
    bytes abc = {'a', 'b', 'c'};
    EXPECT_EQ(hash_to_hex(Secp256k1::sha256(abc)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Blake3Test, BasicHashing) {
    bytes data = {'t', 'e', 's', 't'};
    auto hash1 = Blake3::hash(data);
    auto hash2 = Blake3::hash(data);

    // Same input should produce same hash
    EXPECT_EQ(hash1, hash2);
    EXPECT_NE(Blake3::hash(bytes{'t', 'e', 's', 'T'}), hash1);
}

TEST(Blake3Test, EmptyInputKnownVector) {
    EXPECT_EQ(hash_to_hex(Blake3::hash(bytes{})),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
}

TEST(Blake3Test, PartsAreLengthPrefixed) {
    bytes ab = {'a', 'b'}, c = {'c'}, a = {'a'}, bc = {'b', 'c'};
    EXPECT_NE(Blake3::hash_parts({&ab, &c}), Blake3::hash_parts({&a, &bc}));
    EXPECT_EQ(Blake3::hash_parts({&ab, &c}), Blake3::hash_parts({&ab, &c}));
}
