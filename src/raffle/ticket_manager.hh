#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include <array>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace fairplay {

// ============================================================================
// Raffle Records
// ============================================================================

// One finished, signed play as supplied by the play store
struct PlayRecord {
    std::string wallet;
    score_t score = 0;
    system_time_t timestamp;
    hash_t seed_hash{};
    std::string move_hash;
};

struct QualifiedWallet {
    std::string wallet;
    score_t score = 0;
    rank_t rank = 0;                 // 1-based, dense
    ticket_count_t tickets = 0;
    TicketTier tier = TicketTier::REMAINING;
    system_time_t best_play_at;
};

struct RaffleTicket {
    std::string wallet_address;
    ticket_number_t ticket_number = 0;   // 1-based, global for the day
    TicketTier tier = TicketTier::REMAINING;
    score_t score = 0;
    rank_t rank = 0;
};

struct TierDistribution {
    TicketTier tier = TicketTier::REMAINING;
    std::size_t wallets = 0;
    std::uint64_t tickets = 0;
};

// ============================================================================
// Ticket Manager
// ============================================================================

class TicketManager {
public:
    // Throws FairnessException(INVALID_CONFIG) for an invalid config
    explicit TicketManager(RaffleConfig config = {});

    // Best score per wallet (ties go to the earlier play), ordered by score
    // desc, then earlier play, then wallet. Top ceil(N * slice / 100) qualify.
    [[nodiscard]] std::vector<QualifiedWallet> daily_qualified_wallets(
        std::span<const PlayRecord> plays) const;

    // Flattens to sequential ticket numbers starting at 1, in rank order
    [[nodiscard]] static std::vector<RaffleTicket> generate_raffle_tickets(
        std::span<const QualifiedWallet> qualified);

    [[nodiscard]] static std::uint64_t calculate_ticket_budget(
        std::span<const QualifiedWallet> qualified);

    [[nodiscard]] static std::vector<PlayRecord> plays_for_utc_day(
        std::span<const PlayRecord> plays, utc_day_t day);

    // Wallets and tickets per tier, indexed by TicketTier
    [[nodiscard]] static std::array<TierDistribution, 4> ticket_distribution(
        std::span<const QualifiedWallet> qualified);

    // ceil(wallets * slice / 100)
    [[nodiscard]] std::size_t qualified_count(std::size_t wallets) const;

    // Throws FairnessException(INVALID_CONFIG) and keeps the old config on failure
    void update_config(const RaffleConfig& config);
    [[nodiscard]] RaffleConfig config() const;

private:
    RaffleConfig config_;
    mutable std::mutex mutex_;
};

}  // namespace fairplay
