#pragma once

#include "core/types.hh"
#include <span>
#include <string_view>
#include <vector>

namespace fairplay {

// ============================================================================
// SHA-256 Hashing
// ============================================================================

class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);
    void update(const void* data, std::size_t len);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha256(std::string_view data);
[[nodiscard]] hash_t sha256(const void* data, std::size_t len);

[[nodiscard]] inline std::string sha256_hex(std::string_view data) {
    return bytes_to_hex(sha256(data));
}

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha256_multi(Args&&... args) {
    Sha256Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// HMAC-SHA256 / HKDF-SHA256 (RFC 2104, RFC 5869)
// ============================================================================

[[nodiscard]] hash_t hmac_sha256(std::span<const std::uint8_t> key,
                                 std::span<const std::uint8_t> data);

[[nodiscard]] inline hash_t hmac_sha256(std::span<const std::uint8_t> key, std::string_view data) {
    return hmac_sha256(key, as_bytes(data));
}

[[nodiscard]] hash_t hkdf_extract(std::span<const std::uint8_t> salt,
                                  std::span<const std::uint8_t> ikm);

// length is bounded by 255 * HASH_SIZE
[[nodiscard]] bytes_t hkdf_expand(std::span<const std::uint8_t> prk,
                                  std::span<const std::uint8_t> info,
                                  std::size_t length);

// Extract-then-expand
[[nodiscard]] bytes_t hkdf_sha256(std::span<const std::uint8_t> ikm,
                                  std::span<const std::uint8_t> salt,
                                  std::span<const std::uint8_t> info,
                                  std::size_t length);

// Fixed 32-byte expand, the common case for seeds and proofs
[[nodiscard]] hash_t hkdf_expand_hash(std::span<const std::uint8_t> prk,
                                      std::span<const std::uint8_t> info);

// ============================================================================
// Merkle Tree Utilities
// ============================================================================

class MerkleTree {
public:
    explicit MerkleTree(std::vector<hash_t> leaves);

    [[nodiscard]] const hash_t& root() const { return root_; }
    [[nodiscard]] std::size_t leaf_count() const { return leaves_.size(); }
    [[nodiscard]] const std::vector<std::vector<hash_t>>& layers() const { return layers_; }

    // Every node, leaves first, root last
    [[nodiscard]] std::vector<hash_t> nodes() const;

    [[nodiscard]] std::vector<hash_t> proof(std::size_t index) const;
    [[nodiscard]] static bool verify(const hash_t& leaf, const std::vector<hash_t>& proof,
                                      std::size_t index, const hash_t& root);

    // Public for use by compute_merkle_root
    [[nodiscard]] static hash_t hash_pair(const hash_t& left, const hash_t& right);

private:
    std::vector<hash_t> leaves_;
    std::vector<std::vector<hash_t>> layers_;
    hash_t root_;

    void build();
};

// Compute Merkle root directly without building full tree
[[nodiscard]] hash_t compute_merkle_root(std::span<const hash_t> leaves);

// ============================================================================
// Deterministic Random Bit Generator
// ============================================================================

// HMAC-SHA256 in counter mode: block_i = HMAC(seed, label || u64_be(i)).
// Anyone holding the seed can replay the stream.
class HashDRBG {
public:
    explicit HashDRBG(const hash_t& seed, std::string_view label = "");
    ~HashDRBG();

    HashDRBG(const HashDRBG&) = delete;
    HashDRBG& operator=(const HashDRBG&) = delete;

    [[nodiscard]] hash_t next();
    [[nodiscard]] std::uint64_t next_u64();

    // Uniform in [0, max) by rejection sampling; 0 when max == 0
    [[nodiscard]] std::uint64_t next_range(std::uint64_t max);

    // Uniform double in [0, 1)
    [[nodiscard]] double next_unit();

    [[nodiscard]] std::uint64_t blocks_drawn() const { return counter_; }

private:
    hash_t seed_;
    std::string label_;
    std::uint64_t counter_;
};

}  // namespace fairplay
