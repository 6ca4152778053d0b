#include <gtest/gtest.h>
#include "crypto/hash.hh"
#include <set>
#include <stdexcept>

using namespace fairplay;

namespace {

bytes_t unhex(std::string_view hex) {
    auto bytes = hex_to_bytes(hex);
    return bytes ? *bytes : bytes_t{};
}

}  // namespace

// ============================================================================
// SHA-256 Tests
// ============================================================================

TEST(Sha256Test, EmptyInput) {
    EXPECT_EQ(bytes_to_hex(sha256(std::span<const std::uint8_t>{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Sha256Test, KnownAnswerAbc) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Sha256Test, SpanAndStringAgree) {
    std::vector<std::uint8_t> input = {'a', 'b', 'c'};
    EXPECT_EQ(sha256(input), sha256(std::string_view("abc")));
    EXPECT_EQ(sha256(input.data(), input.size()), sha256(input));
}

TEST(Sha256Test, DifferentInputsDifferentHashes) {
    EXPECT_NE(sha256("wallet:1"), sha256("wallet:2"));
}

TEST(Sha256HasherTest, IncrementalHashing) {
    Sha256Hasher hasher;
    hasher.update("a");
    hasher.update(std::string_view("bc"));
    EXPECT_EQ(hasher.finalize(), sha256("abc"));
}

TEST(Sha256HasherTest, Reset) {
    Sha256Hasher hasher;
    hasher.update("garbage");
    hasher.reset();
    hasher.update("abc");
    EXPECT_EQ(hasher.finalize(), sha256("abc"));
}

TEST(Sha256HasherTest, MultiConcatenates) {
    hash_t a = sha256("left");
    hash_t b = sha256("right");

    bytes_t joined(a.begin(), a.end());
    joined.insert(joined.end(), b.begin(), b.end());

    EXPECT_EQ(sha256_multi(std::span<const std::uint8_t>(a), std::span<const std::uint8_t>(b)),
              sha256(joined));
}

// ============================================================================
// HMAC-SHA256 (RFC 4231)
// ============================================================================

TEST(HmacTest, Rfc4231Case1) {
    bytes_t key(20, 0x0b);
    EXPECT_EQ(bytes_to_hex(hmac_sha256(key, std::string_view("Hi There"))),
              "b0344c61d8db38535ca8afceaf0bf12b881dc200c9833da726e9376c2e32cff7");
}

TEST(HmacTest, Rfc4231Case2) {
    std::string_view key = "Jefe";
    EXPECT_EQ(bytes_to_hex(hmac_sha256(as_bytes(key), std::string_view("what do ya want for nothing?"))),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HmacTest, KeyChangesOutput) {
    hash_t k1 = sha256("k1");
    hash_t k2 = sha256("k2");
    EXPECT_NE(hmac_sha256(k1, std::string_view("piece:s:0")),
              hmac_sha256(k2, std::string_view("piece:s:0")));
}

// ============================================================================
// HKDF-SHA256 (RFC 5869)
// ============================================================================

TEST(HkdfTest, Rfc5869Case1) {
    bytes_t ikm(22, 0x0b);
    bytes_t salt = unhex("000102030405060708090a0b0c");
    bytes_t info = unhex("f0f1f2f3f4f5f6f7f8f9");

    hash_t prk = hkdf_extract(salt, ikm);
    EXPECT_EQ(bytes_to_hex(prk),
              "077709362c2e32df0ddc3f0dc47bba6390b6c73bb50f9c3122ec844ad7c2b3e5");

    bytes_t okm = hkdf_expand(prk, info, 42);
    EXPECT_EQ(bytes_to_hex(okm),
              "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf"
              "34007208d5b887185865");

    EXPECT_EQ(hkdf_sha256(ikm, salt, info, 42), okm);
}

TEST(HkdfTest, ExpandHashMatchesExpand) {
    hash_t prk = sha256("prk");
    auto info = as_bytes("fairplay/piece-type/v1");
    bytes_t okm = hkdf_expand(prk, info, HASH_SIZE);
    hash_t h = hkdf_expand_hash(prk, info);
    EXPECT_TRUE(std::equal(okm.begin(), okm.end(), h.begin()));
}

TEST(HkdfTest, InfoSeparatesOutputs) {
    hash_t prk = sha256("piece seed");
    EXPECT_NE(hkdf_expand_hash(prk, as_bytes("fairplay/piece-type/v1")),
              hkdf_expand_hash(prk, as_bytes("fairplay/piece-proof/v1")));
}

TEST(HkdfTest, RejectsBadLengths) {
    hash_t prk = sha256("prk");
    EXPECT_THROW((void)hkdf_expand(prk, {}, 0), std::invalid_argument);
    EXPECT_THROW((void)hkdf_expand(prk, {}, 255 * HASH_SIZE + 1), std::invalid_argument);

    bytes_t short_prk(16, 0x01);
    EXPECT_THROW((void)hkdf_expand(short_prk, {}, 32), std::invalid_argument);
}

// ============================================================================
// Merkle Tree Tests
// ============================================================================

namespace {

std::vector<hash_t> make_leaves(std::size_t n) {
    std::vector<hash_t> leaves;
    for (std::size_t i = 0; i < n; ++i) {
        leaves.push_back(sha256("leaf:" + std::to_string(i)));
    }
    return leaves;
}

}  // namespace

TEST(MerkleTreeTest, EmptyTreeHasZeroRoot) {
    MerkleTree tree({});
    EXPECT_TRUE(is_zero(tree.root()));
    EXPECT_EQ(tree.leaf_count(), 0u);
    EXPECT_TRUE(tree.nodes().empty());
}

TEST(MerkleTreeTest, SingleLeafIsRoot) {
    auto leaves = make_leaves(1);
    MerkleTree tree(leaves);
    EXPECT_EQ(tree.root(), leaves[0]);
    EXPECT_TRUE(tree.proof(0).empty());
    EXPECT_TRUE(MerkleTree::verify(leaves[0], {}, 0, tree.root()));
}

TEST(MerkleTreeTest, TwoLeaves) {
    auto leaves = make_leaves(2);
    MerkleTree tree(leaves);
    EXPECT_EQ(tree.root(), MerkleTree::hash_pair(leaves[0], leaves[1]));
}

TEST(MerkleTreeTest, OddLevelDuplicatesLast) {
    auto leaves = make_leaves(3);
    MerkleTree tree(leaves);

    hash_t left = MerkleTree::hash_pair(leaves[0], leaves[1]);
    hash_t right = MerkleTree::hash_pair(leaves[2], leaves[2]);
    EXPECT_EQ(tree.root(), MerkleTree::hash_pair(left, right));

    // 3 leaves + 2 parents + root
    EXPECT_EQ(tree.nodes().size(), 6u);
    EXPECT_EQ(tree.nodes().back(), tree.root());
}

TEST(MerkleTreeTest, AllProofsVerify) {
    for (std::size_t n : {2u, 5u, 8u, 13u}) {
        auto leaves = make_leaves(n);
        MerkleTree tree(leaves);
        for (std::size_t i = 0; i < n; ++i) {
            auto proof = tree.proof(i);
            EXPECT_TRUE(MerkleTree::verify(leaves[i], proof, i, tree.root()))
                << "n=" << n << " i=" << i;
        }
    }
}

TEST(MerkleTreeTest, WrongPositionOrRootFails) {
    auto leaves = make_leaves(8);
    MerkleTree tree(leaves);
    auto proof = tree.proof(0);

    EXPECT_FALSE(MerkleTree::verify(leaves[0], proof, 1, tree.root()));
    EXPECT_FALSE(MerkleTree::verify(leaves[1], proof, 0, tree.root()));
    EXPECT_FALSE(MerkleTree::verify(leaves[0], proof, 0, sha256("other root")));

    // An internal node is not accepted as a root
    EXPECT_FALSE(MerkleTree::verify(leaves[0], proof, 0, tree.layers()[1][0]));
}

TEST(MerkleTreeTest, TruncatedProofFails) {
    auto leaves = make_leaves(8);
    MerkleTree tree(leaves);
    auto proof = tree.proof(5);
    proof.pop_back();
    EXPECT_FALSE(MerkleTree::verify(leaves[5], proof, 5, tree.root()));
}

TEST(MerkleTreeTest, ProofOutOfRangeIsEmpty) {
    MerkleTree tree(make_leaves(4));
    EXPECT_TRUE(tree.proof(4).empty());
}

TEST(MerkleTreeTest, ComputeRootMatchesTree) {
    auto leaves = make_leaves(7);
    EXPECT_EQ(compute_merkle_root(leaves), MerkleTree(leaves).root());
}

// ============================================================================
// HashDRBG Tests
// ============================================================================

TEST(HashDrbgTest, Deterministic) {
    hash_t seed = sha256("draw seed");
    HashDRBG a(seed, "label");
    HashDRBG b(seed, "label");
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(a.next_u64(), b.next_u64());
    }
    EXPECT_EQ(a.blocks_drawn(), 10u);
}

TEST(HashDrbgTest, LabelSeparatesStreams) {
    hash_t seed = sha256("draw seed");
    HashDRBG a(seed, "one");
    HashDRBG b(seed, "two");
    EXPECT_NE(a.next(), b.next());
}

TEST(HashDrbgTest, FirstBlockIsHmacOfCounter) {
    hash_t seed = sha256("seed");
    HashDRBG drbg(seed, "lbl");

    bytes_t msg = {'l', 'b', 'l', 0, 0, 0, 0, 0, 0, 0, 0};
    EXPECT_EQ(drbg.next(), hmac_sha256(seed, msg));
}

TEST(HashDrbgTest, RangeBounds) {
    HashDRBG drbg(sha256("range"));
    EXPECT_EQ(drbg.next_range(0), 0u);
    EXPECT_EQ(drbg.next_range(1), 0u);
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(drbg.next_range(55), 55u);
        double u = drbg.next_unit();
        EXPECT_GE(u, 0.0);
        EXPECT_LT(u, 1.0);
    }
}

TEST(HashDrbgTest, RangeIsRoughlyUniform) {
    HashDRBG drbg(sha256("uniformity"));
    std::array<int, 6> buckets{};
    for (int i = 0; i < 6000; ++i) {
        ++buckets[drbg.next_range(6)];
    }
    for (int count : buckets) {
        EXPECT_GT(count, 800);
        EXPECT_LT(count, 1200);
    }
}
