#include <gtest/gtest.h>
#include "identity/principal_resolver.hpp"
#include "core/signing/record_signer.hpp"

using namespace trustpath;
using namespace trustpath::core;
using namespace trustpath::identity;

namespace {

Principal make_principal(const std::string& id, const RecordSigner& signer) {
    Principal principal;
    principal.id = id;
    principal.public_key = signer.public_key();
    return principal;
}

PresentedCredential credential_for(const RecordSigner& signer) {
    PresentedCredential credential;
    credential.algorithm = signer.public_key().algorithm;
    credential.public_key = signer.public_key().key;
    return credential;
}

} // namespace

class KeyRegistryResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver = std::make_unique<KeyRegistryResolver>(std::vector<Principal>{
            make_principal("alice", alice),
            make_principal("bob", bob)
        });
    }

    RecordSigner alice = RecordSigner::generate(SignatureAlgorithm::ED25519);
    RecordSigner bob = RecordSigner::generate(SignatureAlgorithm::SECP256K1);
    std::unique_ptr<KeyRegistryResolver> resolver;
};

TEST_F(KeyRegistryResolverTest, ResolvesRegisteredKeys) {
    EXPECT_EQ(resolver->size(), 2u);
    auto a = resolver->resolve(credential_for(alice));
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(a.value(), "alice");
    auto b = resolver->resolve(credential_for(bob));
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(b.value(), "bob");
}

TEST_F(KeyRegistryResolverTest, UnknownKey) {
    auto stranger = RecordSigner::generate(SignatureAlgorithm::ED25519);
    auto result = resolver->resolve(credential_for(stranger));
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::UnknownSigner);
}

TEST_F(KeyRegistryResolverTest, AlgorithmIsPartOfTheKey) {
    auto credential = credential_for(alice);
    credential.algorithm = SignatureAlgorithm::SECP256K1;
    auto result = resolver->resolve(credential);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidPublicKey);
}

TEST_F(KeyRegistryResolverTest, MalformedKey) {
    PresentedCredential credential;
    credential.public_key = bytes(5, 1);
    EXPECT_EQ(resolver->resolve(credential).error().code(), ErrorCode::InvalidPublicKey);
}

TEST_F(KeyRegistryResolverTest, PossessionProof) {
    std::string text = "login:2026-01-01T00:00:00Z";
    bytes challenge(text.begin(), text.end());

    auto credential = credential_for(bob);
    credential.challenge = challenge;
    credential.proof = bob.sign_bytes(challenge);
    EXPECT_EQ(resolver->resolve(credential).value(), "bob");

    // Signed by someone else
    credential.proof = RecordSigner::generate(SignatureAlgorithm::SECP256K1).sign_bytes(challenge);
    EXPECT_EQ(resolver->resolve(credential).error().code(), ErrorCode::InvalidSignature);

    auto alice_credential = credential_for(alice);
    alice_credential.proof = alice.sign_bytes(challenge);
    EXPECT_EQ(resolver->resolve(alice_credential).error().code(), ErrorCode::InvalidArgument);
    alice_credential.challenge = challenge;
    EXPECT_EQ(resolver->resolve(alice_credential).value(), "alice");
}

TEST_F(KeyRegistryResolverTest, RekeyingDropsOldKey) {
    auto replacement = RecordSigner::generate(SignatureAlgorithm::ED25519);
    resolver->register_principal(make_principal("alice", replacement));
    EXPECT_EQ(resolver->size(), 2u);
    EXPECT_EQ(resolver->resolve(credential_for(alice)).error().code(), ErrorCode::UnknownSigner);
    EXPECT_EQ(resolver->resolve(credential_for(replacement)).value(), "alice");

    EXPECT_TRUE(resolver->unregister("alice"));
    EXPECT_FALSE(resolver->unregister("alice"));
    EXPECT_EQ(resolver->size(), 1u);
}
