#include <gtest/gtest.h>
#include "crypto/signature.hh"
#include <algorithm>

using namespace fairplay;

namespace {

template<typename T>
T from_hex(std::string_view hex) {
    T out{};
    auto bytes = hex_to_bytes(hex);
    if (bytes && bytes->size() == out.size()) {
        std::copy(bytes->begin(), bytes->end(), out.begin());
    }
    return out;
}

}  // namespace

// ============================================================================
// Ed25519 Tests
// ============================================================================

TEST(Ed25519Test, Rfc8032Test1PublicKey) {
    auto seed = from_hex<ed25519_secret_key_t>(
        "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60");
    auto kp = Ed25519KeyPair::from_seed(seed);
    ASSERT_TRUE(kp.has_value());
    EXPECT_EQ(bytes_to_hex(kp->public_key()),
              "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a");
}

TEST(Ed25519Test, Rfc8032Test2Signature) {
    auto seed = from_hex<ed25519_secret_key_t>(
        "4ccd089b28ff96da9db6c346ec114e0f5b8a319f35aba624da8cf6ed4fb8a6fb");
    auto kp = Ed25519KeyPair::from_seed(seed);
    ASSERT_TRUE(kp.has_value());
    EXPECT_EQ(bytes_to_hex(kp->public_key()),
              "3d4017c3e843895a92b70aa74d1b7ebc9c982ccf2ec4968cc0cd55f12af4660c");

    std::vector<std::uint8_t> message = {0x72};
    auto sig = kp->sign(message);
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(bytes_to_hex(*sig),
              "92a009a9f0d4cab8720e820b5f642540a2b27b5416503f8fb3762223ebdb69da"
              "085ac1e43e15996e458f3613d0f11d8c387b2eaeb4302aeeb00d291612bb0c00");
    EXPECT_TRUE(ed25519_verify(kp->public_key(), message, *sig));
}

TEST(Ed25519Test, GenerateSignVerify) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    EXPECT_TRUE(kp->has_secret_key());

    auto msg = as_bytes("wallet:1200:abcd:300:1714521600000");
    auto sig = kp->sign(msg);
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(kp->verify(msg, *sig));
}

TEST(Ed25519Test, DeterministicSignatures) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto msg = as_bytes("fairplay-daily-seed:2024-05-01");
    EXPECT_EQ(kp->sign(msg), kp->sign(msg));
}

TEST(Ed25519Test, TamperedMessageOrSignatureFails) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto sig = kp->sign(as_bytes("score:100"));
    ASSERT_TRUE(sig.has_value());

    EXPECT_FALSE(kp->verify(as_bytes("score:101"), *sig));

    auto bad = *sig;
    bad[10] ^= 0x01;
    EXPECT_FALSE(kp->verify(as_bytes("score:100"), bad));
}

TEST(Ed25519Test, PublicKeyOnlyCannotSign) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto sig = kp->sign(as_bytes("msg"));
    ASSERT_TRUE(sig.has_value());

    auto verifier = Ed25519KeyPair::from_public_key(kp->public_key());
    EXPECT_FALSE(verifier.has_secret_key());
    EXPECT_FALSE(verifier.sign(as_bytes("msg")).has_value());
    EXPECT_TRUE(verifier.verify(as_bytes("msg"), *sig));
}

TEST(Ed25519Test, WrongKeyFails) {
    auto a = Ed25519KeyPair::generate();
    auto b = Ed25519KeyPair::generate();
    ASSERT_TRUE(a.has_value() && b.has_value());
    auto sig = a->sign(as_bytes("msg"));
    ASSERT_TRUE(sig.has_value());
    EXPECT_FALSE(ed25519_verify(b->public_key(), as_bytes("msg"), *sig));
}

TEST(Ed25519Test, MoveKeepsKey) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto pk = kp->public_key();

    Ed25519KeyPair moved = std::move(*kp);
    EXPECT_EQ(moved.public_key(), pk);
    EXPECT_TRUE(moved.has_secret_key());
    EXPECT_TRUE(moved.sign(as_bytes("x")).has_value());
}

// ============================================================================
// ML-DSA-65 Tests
// ============================================================================

TEST(MLDSATest, GenerateSignVerify) {
    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());

    auto msg = as_bytes("wallet:1200:abcd:300:1714521600000");
    auto sig = kp->sign(msg);
    ASSERT_TRUE(sig.has_value());
    EXPECT_TRUE(kp->verify(msg, *sig));
    EXPECT_TRUE(mldsa_verify(kp->public_key(), msg, *sig));
}

TEST(MLDSATest, TamperedFails) {
    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto sig = kp->sign(as_bytes("score:100"));
    ASSERT_TRUE(sig.has_value());

    EXPECT_FALSE(kp->verify(as_bytes("score:101"), *sig));

    auto bad = *sig;
    bad[0] ^= 0xff;
    EXPECT_FALSE(kp->verify(as_bytes("score:100"), bad));
}

TEST(MLDSATest, WrongSizeSignatureRejected) {
    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    std::vector<std::uint8_t> short_sig(100, 0);
    EXPECT_FALSE(mldsa_verify(kp->public_key(), as_bytes("msg"), short_sig));
}

TEST(MLDSATest, PublicKeyOnly) {
    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto sig = kp->sign(as_bytes("msg"));
    ASSERT_TRUE(sig.has_value());

    auto verifier = MLDSAKeyPair::from_public_key(kp->public_key());
    EXPECT_FALSE(verifier.has_secret_key());
    EXPECT_FALSE(verifier.sign(as_bytes("msg")).has_value());
    EXPECT_TRUE(verifier.verify(as_bytes("msg"), *sig));
}

// ============================================================================
// Randomness
// ============================================================================

TEST(RandomTest, RandomHashesDiffer) {
    EXPECT_NE(random_hash(), random_hash());
    EXPECT_FALSE(is_zero(random_hash()));
}
