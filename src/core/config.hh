#pragma once

#include "core/types.hh"
#include "core/logging.hh"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fairplay {

// ============================================================================
// Seed Authority
// ============================================================================

enum class OracleFallbackPolicy : std::uint8_t {
    FAIL_CLOSED = 0,      // Refuse new seeds; callers see ORACLE_UNAVAILABLE
    LOCAL_CSPRNG = 1,     // Seed from RAND_bytes, flagged unverifiable
};

[[nodiscard]] std::string_view oracle_fallback_string(OracleFallbackPolicy policy);
[[nodiscard]] std::optional<OracleFallbackPolicy> parse_oracle_fallback(std::string_view name);

struct SeedAuthorityConfig {
    std::uint64_t oracle_timeout_ms = DEFAULT_ORACLE_TIMEOUT_MS;
    std::uint32_t oracle_max_attempts = DEFAULT_ORACLE_MAX_ATTEMPTS;
    std::uint64_t oracle_backoff_ms = DEFAULT_ORACLE_BACKOFF_MS;   // Doubles per retry
    OracleFallbackPolicy fallback = OracleFallbackPolicy::FAIL_CLOSED;
    std::size_t history_limit = SEED_HISTORY_LIMIT;
};

// ============================================================================
// Sessions
// ============================================================================

struct SessionConfig {
    std::uint64_t ttl_ms = DEFAULT_SESSION_TTL_MS;
};

// ============================================================================
// Score Signing
// ============================================================================

enum class SignatureScheme : std::uint8_t {
    ED25519 = 0,
    MLDSA65 = 1,
};

[[nodiscard]] std::string_view signature_scheme_string(SignatureScheme scheme);
[[nodiscard]] std::optional<SignatureScheme> parse_signature_scheme(std::string_view name);

struct ScoreSigningConfig {
    SignatureScheme scheme = SignatureScheme::ED25519;
    // Hex-encoded key; empty means generate at startup.
    // ed25519: the 32-byte seed. ml-dsa-65: secret key || public key.
    std::string private_key_hex;
};

// ============================================================================
// Abuse Detection
// ============================================================================

struct AbuseConfig {
    double bot_threshold = 0.5;
    std::size_t min_moves = 3;
    double variance_floor_ms2 = 100.0;
    std::int64_t fast_move_ms = 50;
    double fast_fraction_trigger = 0.1;
    double drop_ratio_trigger = 0.8;
    double regularity_cv = 0.3;          // Coefficient of variation at which regularity scores 0
    std::uint32_t plays_per_device_per_day = 1;
};

// ============================================================================
// Raffle
// ============================================================================

struct RaffleConfig {
    std::uint32_t leaderboard_slice_percent = DEFAULT_LEADERBOARD_SLICE_PERCENT;
    ticket_count_t tickets_rank1 = DEFAULT_TICKETS_RANK1;
    ticket_count_t tickets_ranks2to5 = DEFAULT_TICKETS_RANKS2TO5;
    ticket_count_t tickets_ranks6to10 = DEFAULT_TICKETS_RANKS6TO10;
    ticket_count_t tickets_remaining = DEFAULT_TICKETS_REMAINING;
    ticket_count_t max_tickets_per_wallet = DEFAULT_MAX_TICKETS_PER_WALLET;
    std::uint32_t winner_count = DEFAULT_RAFFLE_WINNERS;

    [[nodiscard]] ticket_count_t base_tickets(TicketTier tier) const;
};

// ============================================================================
// Aggregate
// ============================================================================

struct FairplayConfig {
    SeedAuthorityConfig seed;
    SessionConfig session;
    ScoreSigningConfig signing;
    AbuseConfig abuse;
    RaffleConfig raffle;
    LogConfig logging;
};

// Problems found in a config, one human-readable line each; empty when valid
[[nodiscard]] std::vector<std::string> validate_config(const FairplayConfig& config);
[[nodiscard]] std::vector<std::string> validate_raffle_config(const RaffleConfig& config);

// Overlays FAIRPLAY_* environment variables onto the defaults.
// Throws FairnessException(INVALID_CONFIG) on unparseable values.
[[nodiscard]] FairplayConfig load_config_from_env();

// Same, overlaying onto an existing config
void apply_env_overrides(FairplayConfig& config);

}  // namespace fairplay
