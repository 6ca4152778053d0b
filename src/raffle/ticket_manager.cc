#include "ticket_manager.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <numeric>
#include <unordered_map>

namespace fairplay {

namespace {

void require_valid(const RaffleConfig& config) {
    auto problems = validate_raffle_config(config);
    if (!problems.empty()) {
        throw FairnessException(FairnessError::INVALID_CONFIG, problems.front());
    }
}

}  // namespace

TicketManager::TicketManager(RaffleConfig config)
    : config_(config) {
    require_valid(config_);
}

void TicketManager::update_config(const RaffleConfig& config) {
    require_valid(config);

    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    FAIRPLAY_LOG_INFO(log::raffle) << "Raffle config updated: slice="
                                   << config.leaderboard_slice_percent << "% tiers="
                                   << config.tickets_rank1 << "/" << config.tickets_ranks2to5
                                   << "/" << config.tickets_ranks6to10 << "/"
                                   << config.tickets_remaining
                                   << " cap=" << config.max_tickets_per_wallet;
}

RaffleConfig TicketManager::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

std::size_t TicketManager::qualified_count(std::size_t wallets) const {
    const auto slice = config().leaderboard_slice_percent;
    return (wallets * slice + 99) / 100;
}

// ============================================================================
// Qualification
// ============================================================================

std::vector<QualifiedWallet> TicketManager::daily_qualified_wallets(
    std::span<const PlayRecord> plays) const {
    const RaffleConfig cfg = config();

    // Best play per wallet
    std::unordered_map<std::string, const PlayRecord*> best;
    for (const auto& play : plays) {
        if (play.wallet.empty()) {
            continue;
        }
        auto [it, inserted] = best.emplace(play.wallet, &play);
        if (inserted) {
            continue;
        }
        const PlayRecord* current = it->second;
        if (play.score > current->score ||
            (play.score == current->score && play.timestamp < current->timestamp)) {
            it->second = &play;
        }
    }

    std::vector<const PlayRecord*> ranked;
    ranked.reserve(best.size());
    for (const auto& [wallet, play] : best) {
        ranked.push_back(play);
    }

    std::sort(ranked.begin(), ranked.end(), [](const PlayRecord* a, const PlayRecord* b) {
        if (a->score != b->score) return a->score > b->score;
        if (a->timestamp != b->timestamp) return a->timestamp < b->timestamp;
        return a->wallet < b->wallet;
    });

    const std::size_t take = std::min(ranked.size(),
                                      (ranked.size() * cfg.leaderboard_slice_percent + 99) / 100);

    std::vector<QualifiedWallet> qualified;
    qualified.reserve(take);
    for (std::size_t i = 0; i < take; ++i) {
        QualifiedWallet q;
        q.wallet = ranked[i]->wallet;
        q.score = ranked[i]->score;
        q.rank = static_cast<rank_t>(i + 1);
        q.tier = tier_for_rank(q.rank);
        q.tickets = std::min(cfg.base_tickets(q.tier), cfg.max_tickets_per_wallet);
        q.best_play_at = ranked[i]->timestamp;
        qualified.push_back(std::move(q));
    }

    FAIRPLAY_LOG_INFO(log::raffle) << "Qualified " << qualified.size() << " of "
                                   << ranked.size() << " wallets ("
                                   << plays.size() << " plays)";
    return qualified;
}

// ============================================================================
// Tickets
// ============================================================================

std::vector<RaffleTicket> TicketManager::generate_raffle_tickets(
    std::span<const QualifiedWallet> qualified) {
    std::vector<RaffleTicket> tickets;
    tickets.reserve(calculate_ticket_budget(qualified));

    ticket_number_t next = 1;
    for (const auto& q : qualified) {
        for (ticket_count_t i = 0; i < q.tickets; ++i) {
            RaffleTicket t;
            t.wallet_address = q.wallet;
            t.ticket_number = next++;
            t.tier = q.tier;
            t.score = q.score;
            t.rank = q.rank;
            tickets.push_back(std::move(t));
        }
    }
    return tickets;
}

std::uint64_t TicketManager::calculate_ticket_budget(std::span<const QualifiedWallet> qualified) {
    return std::accumulate(qualified.begin(), qualified.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const QualifiedWallet& q) {
                               return acc + q.tickets;
                           });
}

std::vector<PlayRecord> TicketManager::plays_for_utc_day(std::span<const PlayRecord> plays,
                                                         utc_day_t day) {
    std::vector<PlayRecord> out;
    for (const auto& play : plays) {
        if (utc_day(play.timestamp) == day) {
            out.push_back(play);
        }
    }
    return out;
}

std::array<TierDistribution, 4> TicketManager::ticket_distribution(
    std::span<const QualifiedWallet> qualified) {
    std::array<TierDistribution, 4> dist{{
        {TicketTier::RANK1, 0, 0},
        {TicketTier::RANKS2TO5, 0, 0},
        {TicketTier::RANKS6TO10, 0, 0},
        {TicketTier::REMAINING, 0, 0},
    }};

    for (const auto& q : qualified) {
        auto& bucket = dist[static_cast<std::size_t>(q.tier)];
        ++bucket.wallets;
        bucket.tickets += q.tickets;
    }
    return dist;
}

}  // namespace fairplay
