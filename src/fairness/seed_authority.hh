#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "fairness/vrf_oracle.hh"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace fairplay {

// ============================================================================
// Seed Record
// ============================================================================

struct SeedRecord {
    seed_t seed;
    std::string vrf_signature;   // Hex; empty for unverifiable seeds
    bytes_t proof;
    std::string alpha;           // Oracle input, e.g. "fairplay-daily-seed:2024-05-01"
    utc_day_t day = 0;
    system_time_t created_at;
    system_time_t rotates_at;
    bool verifiable = true;      // false when produced by the CSPRNG fallback
    bool active = true;
};

// Oracle randomness for a raffle draw
struct DrawRandomness {
    hash_t randomness;
    std::string vrf_signature;
    bytes_t proof;
    std::string alpha;
    bool verifiable = true;
};

// ============================================================================
// Seed Authority
// ============================================================================

// Holds the day's VRF seed and swaps it at UTC midnight. Readers take a
// shared_ptr copy of the active record, so a rotation is never observed
// half-done.
class SeedAuthority {
public:
    explicit SeedAuthority(std::shared_ptr<VrfOracle> oracle,
                           SeedAuthorityConfig config = {});

    SeedAuthority(const SeedAuthority&) = delete;
    SeedAuthority& operator=(const SeedAuthority&) = delete;

    // Active record, rotating first if now >= rotates_at.
    // Throws FairnessException(ORACLE_UNAVAILABLE) when no seed can be
    // obtained under the FAIL_CLOSED policy.
    [[nodiscard]] std::shared_ptr<const SeedRecord> current_seed(
        system_time_t now = std::chrono::system_clock::now());

    // Unconditional rotation to the seed for utc_day(now)
    std::shared_ptr<const SeedRecord> rotate(
        system_time_t now = std::chrono::system_clock::now());

    // HMAC-SHA256(seed, wallet ":" session_id)
    [[nodiscard]] hash_t derive_round_seed(
        std::string_view wallet,
        std::string_view session_id,
        system_time_t now = std::chrono::system_clock::now());

    // Same derivation against a specific record
    [[nodiscard]] static hash_t round_seed(const SeedRecord& record,
                                           std::string_view wallet,
                                           std::string_view session_id);

    // Independent oracle request for a raffle draw, same retry and fallback policy
    [[nodiscard]] DrawRandomness request_draw_randomness(
        std::string_view label,
        system_time_t now = std::chrono::system_clock::now());

    // Retired records, oldest first
    [[nodiscard]] std::vector<SeedRecord> history() const;

    [[nodiscard]] bool has_seed() const;
    [[nodiscard]] const SeedAuthorityConfig& config() const { return config_; }
    [[nodiscard]] VrfOracle& oracle() { return *oracle_; }

    [[nodiscard]] static std::string daily_alpha(utc_day_t day);
    [[nodiscard]] static std::string draw_alpha(std::string_view label);

private:
    std::shared_ptr<VrfOracle> oracle_;
    SeedAuthorityConfig config_;

    std::shared_ptr<const SeedRecord> current_;
    std::deque<SeedRecord> history_;
    mutable std::mutex mutex_;

    // Serializes oracle round-trips so concurrent expiries rotate once
    std::mutex rotate_mutex_;

    std::optional<VrfOutput> query_oracle(const std::string& alpha);
    std::shared_ptr<const SeedRecord> rotate_locked(system_time_t now);
    void install(std::shared_ptr<const SeedRecord> record);
};

}  // namespace fairplay
