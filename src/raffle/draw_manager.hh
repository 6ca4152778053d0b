#pragma once

#include "core/types.hh"
#include "fairness/seed_authority.hh"
#include "raffle/ticket_manager.hh"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace fairplay {

// ============================================================================
// Draw Results
// ============================================================================

struct RaffleWinner {
    std::string wallet;
    ticket_number_t ticket_number = 0;   // winning ticket in the day's numbering
    rank_t rank = 0;
    std::uint32_t order = 0;             // 1 = first drawn
};

struct RaffleResult {
    std::vector<RaffleWinner> winners;
    hash_t draw_randomness{};
    std::string vrf_signature;
    std::uint64_t total_tickets = 0;
    system_time_t draw_timestamp;
    hash_t merkle_root{};
    bool verifiable = true;
};

// ============================================================================
// Fenwick Tree
// ============================================================================

// Prefix sums over per-wallet ticket weights. Maps a point in
// [0, total) to the wallet whose cumulative range contains it.
class TicketWeightTree {
public:
    explicit TicketWeightTree(std::span<const std::uint64_t> weights);

    void add(std::size_t index, std::int64_t delta);

    // Sum of weights [0, index)
    [[nodiscard]] std::uint64_t prefix(std::size_t index) const;
    [[nodiscard]] std::uint64_t total() const { return total_; }
    [[nodiscard]] std::uint64_t weight(std::size_t index) const;

    // Smallest index whose cumulative range contains `point`; point < total()
    [[nodiscard]] std::size_t find(std::uint64_t point) const;

    [[nodiscard]] std::size_t size() const { return tree_.size() - 1; }

private:
    std::vector<std::uint64_t> tree_;   // 1-based
    std::uint64_t total_ = 0;
};

// ============================================================================
// Raffle Draw Manager
// ============================================================================

class RaffleDrawManager {
public:
    // Draws min(winner_count, wallets) winners without replacement at wallet
    // granularity. Seed = HKDF-SHA256(randomness, info
    // "fairplay/raffle-draw/v1" || merkle_root). Each draw takes a uniform
    // point in the remaining tickets, then removes the winner's whole range.
    // Throws FairnessException(EMPTY_QUALIFICATION_SET) when nothing qualified.
    [[nodiscard]] static RaffleResult draw(std::span<const QualifiedWallet> qualified,
                                           std::size_t winner_count,
                                           const hash_t& randomness,
                                           const hash_t& merkle_root,
                                           system_time_t now = std::chrono::system_clock::now());

    // Same, carrying the oracle signature and verifiable flag into the result
    [[nodiscard]] static RaffleResult draw(std::span<const QualifiedWallet> qualified,
                                           std::size_t winner_count,
                                           const DrawRandomness& randomness,
                                           const hash_t& merkle_root,
                                           system_time_t now = std::chrono::system_clock::now());

    // Owner of a 1-based ticket number in rank order, nullopt if out of range
    [[nodiscard]] static std::optional<QualifiedWallet> ticket_owner(
        std::span<const QualifiedWallet> qualified, ticket_number_t ticket_number);

    // Rejects a result whose merkle_root is not the root of `qualified`, then
    // replays the draw and compares winners and totals. Never throws.
    [[nodiscard]] static bool verify_draw(const RaffleResult& result,
                                          std::span<const QualifiedWallet> qualified,
                                          const hash_t& randomness);

    [[nodiscard]] static hash_t derive_draw_seed(const hash_t& randomness,
                                                 const hash_t& merkle_root);
};

}  // namespace fairplay
