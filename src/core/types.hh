#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace fairplay {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// SHA-256 / HMAC-SHA256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Ed25519 (RFC 8032)
inline constexpr std::size_t ED25519_PUBLIC_KEY_SIZE = 32;
inline constexpr std::size_t ED25519_SECRET_KEY_SIZE = 32;   // seed form
inline constexpr std::size_t ED25519_SIGNATURE_SIZE = 64;

// ML-DSA-65 (FIPS 204 / Dilithium Level 3), optional attestation scheme
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;
// Stored key form: secret key followed by public key
inline constexpr std::size_t MLDSA65_KEY_MATERIAL_SIZE =
    MLDSA65_SECRET_KEY_SIZE + MLDSA65_PUBLIC_KEY_SIZE;

// ============================================================================
// Game Constants
// ============================================================================

inline constexpr std::size_t TETROMINO_COUNT = 7;

// Random session id suffix (bytes, rendered as hex)
inline constexpr std::size_t SESSION_ID_RANDOM_BYTES = 8;

// ============================================================================
// Timing Constants
// ============================================================================

inline constexpr std::uint64_t MS_PER_DAY = 24ULL * 60 * 60 * 1000;
inline constexpr std::uint64_t DEFAULT_SESSION_TTL_MS = MS_PER_DAY;
inline constexpr std::uint64_t DEFAULT_ORACLE_TIMEOUT_MS = 8'000;
inline constexpr std::uint32_t DEFAULT_ORACLE_MAX_ATTEMPTS = 3;
inline constexpr std::uint64_t DEFAULT_ORACLE_BACKOFF_MS = 250;
inline constexpr std::size_t SEED_HISTORY_LIMIT = 30;

// ============================================================================
// Raffle Constants
// ============================================================================

inline constexpr std::uint32_t DEFAULT_LEADERBOARD_SLICE_PERCENT = 25;
inline constexpr std::uint32_t DEFAULT_TICKETS_RANK1 = 25;
inline constexpr std::uint32_t DEFAULT_TICKETS_RANKS2TO5 = 15;
inline constexpr std::uint32_t DEFAULT_TICKETS_RANKS6TO10 = 10;
inline constexpr std::uint32_t DEFAULT_TICKETS_REMAINING = 1;
inline constexpr std::uint32_t DEFAULT_MAX_TICKETS_PER_WALLET = 25;
inline constexpr std::uint32_t DEFAULT_RAFFLE_WINNERS = 10;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using seed_t = hash_t;
using bytes_t = std::vector<std::uint8_t>;

using ed25519_public_key_t = std::array<std::uint8_t, ED25519_PUBLIC_KEY_SIZE>;
using ed25519_secret_key_t = std::array<std::uint8_t, ED25519_SECRET_KEY_SIZE>;
using ed25519_signature_t = std::array<std::uint8_t, ED25519_SIGNATURE_SIZE>;

using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

using piece_index_t = std::uint64_t;
using rank_t = std::uint32_t;
using ticket_count_t = std::uint32_t;
using ticket_number_t = std::uint64_t;
using score_t = std::uint64_t;

// ============================================================================
// Time Utilities
// ============================================================================

using system_time_t = std::chrono::system_clock::time_point;
using utc_day_t = std::int64_t;   // days since 1970-01-01 (UTC)

[[nodiscard]] inline std::int64_t to_unix_ms(system_time_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count();
}

[[nodiscard]] inline system_time_t from_unix_ms(std::int64_t ms) {
    return system_time_t(std::chrono::milliseconds(ms));
}

[[nodiscard]] inline utc_day_t utc_day(system_time_t t) {
    auto ms = to_unix_ms(t);
    auto day = ms / static_cast<std::int64_t>(MS_PER_DAY);
    if (ms < 0 && ms % static_cast<std::int64_t>(MS_PER_DAY) != 0) {
        --day;
    }
    return day;
}

[[nodiscard]] inline system_time_t utc_day_start(utc_day_t day) {
    return from_unix_ms(day * static_cast<std::int64_t>(MS_PER_DAY));
}

// First UTC midnight strictly after t
[[nodiscard]] inline system_time_t next_utc_midnight(system_time_t t) {
    return utc_day_start(utc_day(t) + 1);
}

// YYYY-MM-DD
[[nodiscard]] std::string utc_day_string(utc_day_t day);

// ============================================================================
// Tetromino Kinds
// ============================================================================

enum class TetrominoType : std::uint8_t {
    I = 0,
    J = 1,
    L = 2,
    O = 3,
    S = 4,
    T = 5,
    Z = 6,
};

[[nodiscard]] inline std::string_view tetromino_name(TetrominoType type) {
    switch (type) {
        case TetrominoType::I: return "I";
        case TetrominoType::J: return "J";
        case TetrominoType::L: return "L";
        case TetrominoType::O: return "O";
        case TetrominoType::S: return "S";
        case TetrominoType::T: return "T";
        case TetrominoType::Z: return "Z";
    }
    return "?";
}

[[nodiscard]] inline TetrominoType tetromino_from_value(std::uint64_t value) {
    return static_cast<TetrominoType>(value % TETROMINO_COUNT);
}

// ============================================================================
// Ticket Tiers
// ============================================================================

enum class TicketTier : std::uint8_t {
    RANK1 = 0,
    RANKS2TO5 = 1,
    RANKS6TO10 = 2,
    REMAINING = 3,
};

[[nodiscard]] inline std::string_view ticket_tier_string(TicketTier tier) {
    switch (tier) {
        case TicketTier::RANK1: return "rank1";
        case TicketTier::RANKS2TO5: return "ranks2to5";
        case TicketTier::RANKS6TO10: return "ranks6to10";
        case TicketTier::REMAINING: return "remaining";
    }
    return "unknown";
}

[[nodiscard]] inline TicketTier tier_for_rank(rank_t rank) {
    if (rank == 1) return TicketTier::RANK1;
    if (rank >= 2 && rank <= 5) return TicketTier::RANKS2TO5;
    if (rank >= 6 && rank <= 10) return TicketTier::RANKS6TO10;
    return TicketTier::REMAINING;
}

// ============================================================================
// Session State
// ============================================================================

enum class SessionState : std::uint8_t {
    INITIALIZED = 0,    // Created, no piece issued yet
    GENERATING = 1,     // At least one piece issued
    EXPORTED = 2,       // Game finished, snapshot handed to validation
    EXPIRED = 3,        // Evicted by TTL sweep (terminal)
};

[[nodiscard]] inline std::string_view session_state_string(SessionState state) {
    switch (state) {
        case SessionState::INITIALIZED: return "initialized";
        case SessionState::GENERATING: return "generating";
        case SessionState::EXPORTED: return "exported";
        case SessionState::EXPIRED: return "expired";
    }
    return "unknown";
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Big-endian encoding (network order, matches published derivation inputs)
inline void encode_u64_be(std::uint8_t* dst, std::uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        dst[7 - i] = static_cast<std::uint8_t>(val >> (i * 8));
    }
}

[[nodiscard]] inline std::uint64_t decode_u64_be(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | src[i];
    }
    return val;
}

[[nodiscard]] inline std::uint32_t decode_u32_be(const std::uint8_t* src) {
    return (static_cast<std::uint32_t>(src[0]) << 24) |
           (static_cast<std::uint32_t>(src[1]) << 16) |
           (static_cast<std::uint32_t>(src[2]) << 8) |
           static_cast<std::uint32_t>(src[3]);
}

[[nodiscard]] inline std::span<const std::uint8_t> as_bytes(std::string_view s) {
    return {reinterpret_cast<const std::uint8_t*>(s.data()), s.size()};
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);
[[nodiscard]] std::optional<hash_t> hex_to_hash(std::string_view hex);

// First 16 hex chars, for log lines
[[nodiscard]] std::string short_hex(std::span<const std::uint8_t> bytes);

[[nodiscard]] bool is_zero(const hash_t& h);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace fairplay

// ============================================================================
// Hash specialization for hash_t (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<fairplay::hash_t> {
    std::size_t operator()(const fairplay::hash_t& h) const noexcept {
        // Already uniformly distributed; first 8 bytes suffice
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

}  // namespace std
