#pragma once

#include "core/types.hh"
#include <memory>
#include <optional>
#include <span>

namespace fairplay {

// ============================================================================
// Ed25519 Key Pair (RFC 8032, OpenSSL EVP)
// ============================================================================

class Ed25519KeyPair {
public:
    ~Ed25519KeyPair();

    Ed25519KeyPair(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair& operator=(const Ed25519KeyPair&) = delete;
    Ed25519KeyPair(Ed25519KeyPair&&) noexcept;
    Ed25519KeyPair& operator=(Ed25519KeyPair&&) noexcept;

    // Generate a new random key pair
    [[nodiscard]] static std::optional<Ed25519KeyPair> generate();

    // Deterministic: the 32-byte seed is the RFC 8032 private key
    [[nodiscard]] static std::optional<Ed25519KeyPair> from_seed(const ed25519_secret_key_t& seed);

    // Load public key only (for verification)
    [[nodiscard]] static Ed25519KeyPair from_public_key(const ed25519_public_key_t& pk);

    [[nodiscard]] const ed25519_public_key_t& public_key() const { return public_key_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    // Sign a message (requires secret key)
    [[nodiscard]] std::optional<ed25519_signature_t> sign(std::span<const std::uint8_t> message) const;

    // Verify a signature (only requires public key)
    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                              const ed25519_signature_t& signature) const;

private:
    Ed25519KeyPair() = default;

    ed25519_public_key_t public_key_{};
    std::unique_ptr<ed25519_secret_key_t> secret_key_;
};

[[nodiscard]] bool ed25519_verify(
    const ed25519_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const ed25519_signature_t& signature);

// ============================================================================
// ML-DSA-65 Key Pair (liboqs)
// ============================================================================

class MLDSAKeyPair {
public:
    ~MLDSAKeyPair();

    MLDSAKeyPair(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair& operator=(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair(MLDSAKeyPair&&) noexcept;
    MLDSAKeyPair& operator=(MLDSAKeyPair&&) noexcept;

    // Generate a new random key pair
    [[nodiscard]] static std::optional<MLDSAKeyPair> generate();

    // Load from existing keys
    [[nodiscard]] static MLDSAKeyPair from_keys(const mldsa_public_key_t& pk,
                                                const mldsa_secret_key_t& sk);

    // Load public key only (for verification)
    [[nodiscard]] static MLDSAKeyPair from_public_key(const mldsa_public_key_t& pk);

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return *public_key_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    // Null for public-key-only pairs
    [[nodiscard]] const mldsa_secret_key_t* secret_key() const { return secret_key_.get(); }

    // Sign a message (requires secret key)
    [[nodiscard]] std::optional<mldsa_signature_t> sign(std::span<const std::uint8_t> message) const;

    // Verify a signature (only requires public key)
    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                              const mldsa_signature_t& signature) const;

private:
    MLDSAKeyPair() = default;

    // Heap-held: the keys are several KB
    std::unique_ptr<mldsa_public_key_t> public_key_;
    std::unique_ptr<mldsa_secret_key_t> secret_key_;
};

[[nodiscard]] bool mldsa_verify(
    const mldsa_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    std::span<const std::uint8_t> signature);

// ============================================================================
// Secure Randomness
// ============================================================================

// OpenSSL RAND_bytes; throws std::runtime_error if the CSPRNG is unavailable
void random_bytes(std::span<std::uint8_t> out);

[[nodiscard]] hash_t random_hash();

}  // namespace fairplay
