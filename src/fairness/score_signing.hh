#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "crypto/signature.hh"
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace fairplay {

// ============================================================================
// Score Proof
// ============================================================================

struct ScoreProof {
    std::string wallet_address;
    score_t score = 0;
    hash_t seed_hash{};
    std::uint64_t move_count = 0;
    std::int64_t timestamp_ms = 0;
    SignatureScheme scheme = SignatureScheme::ED25519;
    bytes_t signature;

    // wallet:score:seed_hash_hex:move_count:timestamp_ms
    [[nodiscard]] std::string canonical_message() const;
};

[[nodiscard]] std::string score_canonical_message(std::string_view wallet,
                                                  score_t score,
                                                  const hash_t& seed_hash,
                                                  std::uint64_t move_count,
                                                  std::int64_t timestamp_ms);

// ============================================================================
// Score Verifier (public key only)
// ============================================================================

class ScoreVerifier {
public:
    static ScoreVerifier ed25519(const ed25519_public_key_t& public_key);
    static ScoreVerifier mldsa65(const mldsa_public_key_t& public_key);

    // Pure; never throws
    [[nodiscard]] bool verify(const ScoreProof& proof) const;

    [[nodiscard]] SignatureScheme scheme() const { return scheme_; }
    [[nodiscard]] std::string public_key_hex() const;

private:
    friend class ScoreSigner;
    ScoreVerifier() = default;

    SignatureScheme scheme_ = SignatureScheme::ED25519;
    ed25519_public_key_t ed25519_key_{};
    std::shared_ptr<const mldsa_public_key_t> mldsa_key_;
};

// ============================================================================
// Score Signing Manager
// ============================================================================

class ScoreSigner {
public:
    // Loads the key from config, or generates one with a warning.
    // Throws INVALID_CONFIG for a malformed key, CRYPTO_FAILURE when key
    // generation fails.
    explicit ScoreSigner(const ScoreSigningConfig& config = {});

    ScoreSigner(const ScoreSigner&) = delete;
    ScoreSigner& operator=(const ScoreSigner&) = delete;

    // Throws INVALID_ARGUMENT for an empty wallet, CRYPTO_FAILURE when signing fails
    ScoreProof sign_score(std::string_view wallet,
                          score_t score,
                          const hash_t& seed_hash,
                          std::uint64_t move_count,
                          system_time_t now = std::chrono::system_clock::now()) const;

    // Pure; never throws
    [[nodiscard]] bool verify_score_signature(const ScoreProof& proof) const;

    [[nodiscard]] const ScoreVerifier& verifier() const { return verifier_; }
    [[nodiscard]] std::string public_key_hex() const { return verifier_.public_key_hex(); }
    [[nodiscard]] SignatureScheme scheme() const { return scheme_; }

private:
    [[nodiscard]] static std::optional<MLDSAKeyPair> load_mldsa_key(const std::string& key_hex);

    SignatureScheme scheme_;
    std::optional<Ed25519KeyPair> ed25519_;
    std::optional<MLDSAKeyPair> mldsa_;
    ScoreVerifier verifier_;

    static ScoreVerifier make_verifier(SignatureScheme scheme,
                                       const std::optional<Ed25519KeyPair>& ed25519,
                                       const std::optional<MLDSAKeyPair>& mldsa);
};

}  // namespace fairplay
