#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/kdf.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace fairplay {

// ============================================================================
// Sha256Hasher Implementation
// ============================================================================

Sha256Hasher::Sha256Hasher() {
    ctx_ = EVP_MD_CTX_new();
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA-256");
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        throw std::runtime_error("Failed to initialize SHA-256");
    }
}

Sha256Hasher::~Sha256Hasher() {
    if (ctx_) {
        EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
    }
}

Sha256Hasher::Sha256Hasher(Sha256Hasher&& other) noexcept : ctx_(other.ctx_) {
    other.ctx_ = nullptr;
}

Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&& other) noexcept {
    if (this != &other) {
        if (ctx_) {
            EVP_MD_CTX_free(static_cast<EVP_MD_CTX*>(ctx_));
        }
        ctx_ = other.ctx_;
        other.ctx_ = nullptr;
    }
    return *this;
}

void Sha256Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void Sha256Hasher::update(std::string_view data) {
    update(data.data(), data.size());
}

void Sha256Hasher::update(const void* data, std::size_t len) {
    if (EVP_DigestUpdate(static_cast<EVP_MD_CTX*>(ctx_), data, len) != 1) {
        log::crypto.error("SHA-256 update failed");
        throw std::runtime_error("SHA-256 update failed");
    }
}

hash_t Sha256Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(static_cast<EVP_MD_CTX*>(ctx_), result.data(), &len) != 1) {
        log::crypto.error("SHA-256 finalize failed");
        throw std::runtime_error("SHA-256 finalize failed");
    }
    return result;
}

void Sha256Hasher::reset() {
    if (EVP_DigestInit_ex(static_cast<EVP_MD_CTX*>(ctx_), EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 reset failed");
        throw std::runtime_error("SHA-256 reset failed");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

hash_t sha256(std::span<const std::uint8_t> data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(std::string_view data) {
    return sha256(data.data(), data.size());
}

hash_t sha256(const void* data, std::size_t len) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data, len, result.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        log::crypto.error("SHA-256 failed");
        throw std::runtime_error("SHA-256 failed");
    }
    return result;
}

// ============================================================================
// HMAC-SHA256
// ============================================================================

hash_t hmac_sha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;

    // HMAC() rejects a null key pointer even with zero length
    static const std::uint8_t empty_key = 0;
    const std::uint8_t* key_ptr = key.empty() ? &empty_key : key.data();

    if (HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
             data.data(), data.size(), result.data(), &out_len) == nullptr ||
        out_len != HASH_SIZE) {
        log::crypto.error("HMAC-SHA256 failed");
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return result;
}

// ============================================================================
// HKDF-SHA256
// ============================================================================

namespace {

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};

using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

PkeyCtxPtr new_hkdf_ctx(int mode) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
    if (!ctx ||
        EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_hkdf_mode(ctx.get(), mode) <= 0) {
        log::crypto.error("Failed to initialize HKDF context");
        throw std::runtime_error("Failed to initialize HKDF context");
    }
    return ctx;
}

}  // namespace

hash_t hkdf_extract(std::span<const std::uint8_t> salt, std::span<const std::uint8_t> ikm) {
    // RFC 5869: absent salt is HashLen zero bytes
    hash_t zero_salt{};
    if (salt.empty()) {
        salt = zero_salt;
    }

    auto ctx = new_hkdf_ctx(EVP_PKEY_HKDEF_MODE_EXTRACT_ONLY);
    if (EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), salt.data(), static_cast<int>(salt.size())) <= 0) {
        throw std::runtime_error("HKDF salt rejected");
    }

    static const std::uint8_t empty_ikm = 0;
    const std::uint8_t* ikm_ptr = ikm.empty() ? &empty_ikm : ikm.data();
    if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm_ptr, static_cast<int>(ikm.size())) <= 0) {
        throw std::runtime_error("HKDF key rejected");
    }

    hash_t prk;
    std::size_t out_len = prk.size();
    if (EVP_PKEY_derive(ctx.get(), prk.data(), &out_len) <= 0 || out_len != HASH_SIZE) {
        log::crypto.error("HKDF extract failed");
        throw std::runtime_error("HKDF extract failed");
    }
    return prk;
}

bytes_t hkdf_expand(std::span<const std::uint8_t> prk,
                    std::span<const std::uint8_t> info,
                    std::size_t length) {
    if (length == 0 || length > 255 * HASH_SIZE) {
        throw std::invalid_argument("HKDF output length out of range");
    }
    if (prk.size() < HASH_SIZE) {
        throw std::invalid_argument("HKDF PRK shorter than hash length");
    }

    auto ctx = new_hkdf_ctx(EVP_PKEY_HKDEF_MODE_EXPAND_ONLY);
    if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), prk.data(), static_cast<int>(prk.size())) <= 0) {
        throw std::runtime_error("HKDF key rejected");
    }
    if (!info.empty() &&
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info.data(), static_cast<int>(info.size())) <= 0) {
        throw std::runtime_error("HKDF info rejected");
    }

    bytes_t okm(length);
    std::size_t out_len = okm.size();
    if (EVP_PKEY_derive(ctx.get(), okm.data(), &out_len) <= 0 || out_len != length) {
        log::crypto.error("HKDF expand failed");
        throw std::runtime_error("HKDF expand failed");
    }
    return okm;
}

bytes_t hkdf_sha256(std::span<const std::uint8_t> ikm,
                    std::span<const std::uint8_t> salt,
                    std::span<const std::uint8_t> info,
                    std::size_t length) {
    auto prk = hkdf_extract(salt, ikm);
    auto okm = hkdf_expand(prk, info, length);
    secure_zero(prk);
    return okm;
}

hash_t hkdf_expand_hash(std::span<const std::uint8_t> prk, std::span<const std::uint8_t> info) {
    auto okm = hkdf_expand(prk, info, HASH_SIZE);
    hash_t out;
    std::copy(okm.begin(), okm.end(), out.begin());
    secure_zero(okm);
    return out;
}

// ============================================================================
// Merkle Tree Implementation
// ============================================================================

MerkleTree::MerkleTree(std::vector<hash_t> leaves) : leaves_(std::move(leaves)) {
    if (leaves_.empty()) {
        root_ = {};
    } else {
        build();
    }
}

void MerkleTree::build() {
    layers_.clear();
    layers_.push_back(leaves_);

    while (layers_.back().size() > 1) {
        const auto& prev = layers_.back();
        std::vector<hash_t> next;
        next.reserve((prev.size() + 1) / 2);

        for (std::size_t i = 0; i < prev.size(); i += 2) {
            if (i + 1 < prev.size()) {
                next.push_back(hash_pair(prev[i], prev[i + 1]));
            } else {
                // Odd number: duplicate the last element
                next.push_back(hash_pair(prev[i], prev[i]));
            }
        }
        layers_.push_back(std::move(next));
    }

    root_ = layers_.back()[0];
}

hash_t MerkleTree::hash_pair(const hash_t& left, const hash_t& right) {
    Sha256Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

std::vector<hash_t> MerkleTree::nodes() const {
    std::vector<hash_t> out;
    for (const auto& layer : layers_) {
        out.insert(out.end(), layer.begin(), layer.end());
    }
    return out;
}

std::vector<hash_t> MerkleTree::proof(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }

    std::vector<hash_t> proof;
    std::size_t idx = index;

    for (std::size_t layer = 0; layer < layers_.size() - 1; ++layer) {
        const auto& current = layers_[layer];
        std::size_t sibling_idx = (idx % 2 == 0) ? idx + 1 : idx - 1;

        if (sibling_idx < current.size()) {
            proof.push_back(current[sibling_idx]);
        } else {
            // Odd layer, sibling is self
            proof.push_back(current[idx]);
        }

        idx /= 2;
    }

    return proof;
}

bool MerkleTree::verify(const hash_t& leaf, const std::vector<hash_t>& proof,
                        std::size_t index, const hash_t& root) {
    hash_t current = leaf;
    std::size_t idx = index;

    for (const auto& sibling : proof) {
        if (idx % 2 == 0) {
            current = hash_pair(current, sibling);
        } else {
            current = hash_pair(sibling, current);
        }
        idx /= 2;
    }

    // Index bits left over mean the proof is too short for this position
    return idx == 0 && current == root;
}

hash_t compute_merkle_root(std::span<const hash_t> leaves) {
    if (leaves.empty()) {
        return {};
    }
    if (leaves.size() == 1) {
        return leaves[0];
    }

    std::vector<hash_t> layer(leaves.begin(), leaves.end());

    while (layer.size() > 1) {
        std::vector<hash_t> next;
        next.reserve((layer.size() + 1) / 2);

        for (std::size_t i = 0; i < layer.size(); i += 2) {
            if (i + 1 < layer.size()) {
                next.push_back(MerkleTree::hash_pair(layer[i], layer[i + 1]));
            } else {
                next.push_back(MerkleTree::hash_pair(layer[i], layer[i]));
            }
        }
        layer = std::move(next);
    }

    return layer[0];
}

// ============================================================================
// HashDRBG Implementation
// ============================================================================

HashDRBG::HashDRBG(const hash_t& seed, std::string_view label)
    : seed_(seed), label_(label), counter_(0) {}

HashDRBG::~HashDRBG() {
    secure_zero(seed_);
}

hash_t HashDRBG::next() {
    bytes_t input(label_.begin(), label_.end());
    std::array<std::uint8_t, 8> counter_bytes;
    encode_u64_be(counter_bytes.data(), counter_++);
    input.insert(input.end(), counter_bytes.begin(), counter_bytes.end());

    return hmac_sha256(seed_, input);
}

std::uint64_t HashDRBG::next_u64() {
    auto h = next();
    return decode_u64_be(h.data());
}

std::uint64_t HashDRBG::next_range(std::uint64_t max) {
    if (max == 0) return 0;

    // Largest multiple of max representable in 64 bits; values at or above
    // it are rejected so every residue is equally likely
    const std::uint64_t limit = UINT64_MAX - (UINT64_MAX % max);
    while (true) {
        std::uint64_t v = next_u64();
        if (v < limit) {
            return v % max;
        }
    }
}

double HashDRBG::next_unit() {
    // 53 significant bits
    return static_cast<double>(next_u64() >> 11) * (1.0 / 9007199254740992.0);
}

}  // namespace fairplay
