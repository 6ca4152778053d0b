#include "config.hh"
#include "core/error.hh"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace fairplay {

// ============================================================================
// Enum Names
// ============================================================================

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace

std::string_view oracle_fallback_string(OracleFallbackPolicy policy) {
    switch (policy) {
        case OracleFallbackPolicy::FAIL_CLOSED: return "fail-closed";
        case OracleFallbackPolicy::LOCAL_CSPRNG: return "local-csprng";
    }
    return "unknown";
}

std::optional<OracleFallbackPolicy> parse_oracle_fallback(std::string_view name) {
    auto lower = to_lower(name);
    if (lower == "fail-closed" || lower == "fail_closed") return OracleFallbackPolicy::FAIL_CLOSED;
    if (lower == "local-csprng" || lower == "local_csprng") return OracleFallbackPolicy::LOCAL_CSPRNG;
    return std::nullopt;
}

std::string_view signature_scheme_string(SignatureScheme scheme) {
    switch (scheme) {
        case SignatureScheme::ED25519: return "ed25519";
        case SignatureScheme::MLDSA65: return "ml-dsa-65";
    }
    return "unknown";
}

std::optional<SignatureScheme> parse_signature_scheme(std::string_view name) {
    auto lower = to_lower(name);
    if (lower == "ed25519") return SignatureScheme::ED25519;
    if (lower == "ml-dsa-65" || lower == "mldsa65") return SignatureScheme::MLDSA65;
    return std::nullopt;
}

ticket_count_t RaffleConfig::base_tickets(TicketTier tier) const {
    switch (tier) {
        case TicketTier::RANK1: return tickets_rank1;
        case TicketTier::RANKS2TO5: return tickets_ranks2to5;
        case TicketTier::RANKS6TO10: return tickets_ranks6to10;
        case TicketTier::REMAINING: return tickets_remaining;
    }
    return 0;
}

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> validate_raffle_config(const RaffleConfig& config) {
    std::vector<std::string> problems;

    if (config.leaderboard_slice_percent == 0 || config.leaderboard_slice_percent > 100) {
        problems.push_back("leaderboard_slice_percent must be in 1..100");
    }
    if (config.max_tickets_per_wallet == 0) {
        problems.push_back("max_tickets_per_wallet must be positive");
    }
    if (config.tickets_rank1 == 0 || config.tickets_ranks2to5 == 0 ||
        config.tickets_ranks6to10 == 0 || config.tickets_remaining == 0) {
        problems.push_back("every ticket tier must grant at least one ticket");
    }
    if (config.winner_count == 0) {
        problems.push_back("winner_count must be positive");
    }

    return problems;
}

std::vector<std::string> validate_config(const FairplayConfig& config) {
    std::vector<std::string> problems = validate_raffle_config(config.raffle);

    if (config.seed.oracle_timeout_ms == 0) {
        problems.push_back("oracle_timeout_ms must be positive");
    }
    if (config.seed.oracle_max_attempts == 0) {
        problems.push_back("oracle_max_attempts must be at least 1");
    }
    if (config.session.ttl_ms == 0) {
        problems.push_back("session ttl_ms must be positive");
    }
    if (config.abuse.bot_threshold < 0.0 || config.abuse.bot_threshold > 1.0) {
        problems.push_back("bot_threshold must be in [0, 1]");
    }
    if (config.abuse.min_moves < 3) {
        problems.push_back("abuse min_moves must be at least 3");
    }
    if (config.abuse.plays_per_device_per_day == 0) {
        problems.push_back("plays_per_device_per_day must be positive");
    }
    if (!config.signing.private_key_hex.empty()) {
        auto key = hex_to_bytes(config.signing.private_key_hex);
        const std::size_t expected = config.signing.scheme == SignatureScheme::MLDSA65
                                         ? MLDSA65_KEY_MATERIAL_SIZE
                                         : ED25519_SECRET_KEY_SIZE;
        if (!key || key->size() != expected) {
            problems.push_back("score signing key must be " + std::to_string(expected) +
                               " bytes of hex for " +
                               std::string(signature_scheme_string(config.signing.scheme)));
        }
        if (key) {
            secure_zero(*key);
        }
    }

    return problems;
}

// ============================================================================
// Environment Loading
// ============================================================================

namespace {

std::optional<std::string> env_value(const char* name) {
    const char* value = std::getenv(name);
    if (!value || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

template<typename T>
void read_unsigned(const char* name, T& target) {
    auto value = env_value(name);
    if (!value) {
        return;
    }

    T parsed{};
    auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), parsed);
    if (ec != std::errc() || ptr != value->data() + value->size()) {
        throw FairnessException(FairnessError::INVALID_CONFIG,
                                std::string(name) + " is not an unsigned integer: " + *value);
    }
    target = parsed;
}

bool parse_bool(std::string_view value) {
    auto lower = to_lower(value);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

}  // namespace

void apply_env_overrides(FairplayConfig& config) {
    // Logging
    if (auto level = env_value("FAIRPLAY_LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            throw FairnessException(FairnessError::INVALID_CONFIG,
                                    "FAIRPLAY_LOG_LEVEL is not a log level: " + *level);
        }
        config.logging.default_level = *parsed;
    }
    if (auto path = env_value("FAIRPLAY_LOG_FILE")) {
        config.logging.file_enabled = true;
        config.logging.file_path = *path;
    }
    if (auto async = env_value("FAIRPLAY_LOG_ASYNC")) {
        config.logging.async_logging = parse_bool(*async);
    }

    // Seed authority
    read_unsigned("FAIRPLAY_ORACLE_TIMEOUT_MS", config.seed.oracle_timeout_ms);
    read_unsigned("FAIRPLAY_ORACLE_MAX_ATTEMPTS", config.seed.oracle_max_attempts);
    read_unsigned("FAIRPLAY_ORACLE_BACKOFF_MS", config.seed.oracle_backoff_ms);
    if (auto fallback = env_value("FAIRPLAY_ORACLE_FALLBACK")) {
        auto parsed = parse_oracle_fallback(*fallback);
        if (!parsed) {
            throw FairnessException(FairnessError::INVALID_CONFIG,
                                    "FAIRPLAY_ORACLE_FALLBACK must be fail-closed or local-csprng");
        }
        config.seed.fallback = *parsed;
    }

    // Sessions
    read_unsigned("FAIRPLAY_SESSION_TTL_MS", config.session.ttl_ms);

    // Score signing
    if (auto key = env_value("FAIRPLAY_SCORE_SIGNING_KEY")) {
        config.signing.private_key_hex = *key;
    }
    if (auto scheme = env_value("FAIRPLAY_SCORE_SCHEME")) {
        auto parsed = parse_signature_scheme(*scheme);
        if (!parsed) {
            throw FairnessException(FairnessError::INVALID_CONFIG,
                                    "FAIRPLAY_SCORE_SCHEME must be ed25519 or ml-dsa-65");
        }
        config.signing.scheme = *parsed;
    }

    // Abuse
    read_unsigned("FAIRPLAY_PLAYS_PER_DEVICE", config.abuse.plays_per_device_per_day);

    // Raffle
    read_unsigned("FAIRPLAY_SLICE_PERCENT", config.raffle.leaderboard_slice_percent);
    read_unsigned("FAIRPLAY_TICKETS_RANK1", config.raffle.tickets_rank1);
    read_unsigned("FAIRPLAY_TICKETS_RANKS2TO5", config.raffle.tickets_ranks2to5);
    read_unsigned("FAIRPLAY_TICKETS_RANKS6TO10", config.raffle.tickets_ranks6to10);
    read_unsigned("FAIRPLAY_TICKETS_REMAINING", config.raffle.tickets_remaining);
    read_unsigned("FAIRPLAY_MAX_TICKETS_PER_WALLET", config.raffle.max_tickets_per_wallet);
    read_unsigned("FAIRPLAY_RAFFLE_WINNERS", config.raffle.winner_count);
}

FairplayConfig load_config_from_env() {
    FairplayConfig config;
    apply_env_overrides(config);

    auto problems = validate_config(config);
    if (!problems.empty()) {
        throw FairnessException(FairnessError::INVALID_CONFIG, problems.front());
    }

    log::core.debug("Configuration loaded from environment");
    return config;
}

}  // namespace fairplay
