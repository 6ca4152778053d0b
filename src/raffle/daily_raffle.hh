#pragma once

#include "fairness/seed_authority.hh"
#include "raffle/draw_manager.hh"
#include "raffle/merkle_audit.hh"
#include "raffle/ticket_manager.hh"
#include <array>
#include <string>
#include <vector>

namespace fairplay {

struct WalletProof {
    std::string wallet;
    rank_t rank = 0;
    score_t score = 0;
    ticket_count_t tickets = 0;
    std::vector<hash_t> proof;
};

struct DailyRaffleReport {
    utc_day_t day = 0;
    std::string day_string;
    std::size_t play_count = 0;
    std::size_t wallet_count = 0;

    std::vector<QualifiedWallet> qualified;
    std::uint64_t ticket_budget = 0;
    std::array<TierDistribution, 4> distribution{};

    hash_t merkle_root{};
    hash_t play_root{};
    std::vector<WalletProof> proofs;     // rank order

    std::string draw_alpha;
    RaffleResult result;
};

// ============================================================================
// Daily Raffle
// ============================================================================

// Runs one day's pipeline: plays -> qualification -> Merkle commitment ->
// oracle randomness bound to the root -> draw.
class DailyRaffle {
public:
    DailyRaffle(SeedAuthority& authority, const TicketManager& tickets);

    // Uses the plays from the UTC day containing `now`. Throws
    // FairnessException(EMPTY_QUALIFICATION_SET) when nobody qualifies and
    // ORACLE_UNAVAILABLE per the authority's fallback policy.
    [[nodiscard]] DailyRaffleReport run(std::span<const PlayRecord> plays,
                                        std::size_t winner_count,
                                        system_time_t now = std::chrono::system_clock::now());

    // Winner count from the ticket manager's config
    [[nodiscard]] DailyRaffleReport run(std::span<const PlayRecord> plays,
                                        system_time_t now = std::chrono::system_clock::now());

    // Label passed to the oracle: "<YYYY-MM-DD>:<root hex>"
    [[nodiscard]] static std::string draw_label(utc_day_t day, const hash_t& merkle_root);

private:
    SeedAuthority& authority_;
    const TicketManager& tickets_;
};

}  // namespace fairplay
