#include "daily_raffle.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <unordered_set>

namespace fairplay {

DailyRaffle::DailyRaffle(SeedAuthority& authority, const TicketManager& tickets)
    : authority_(authority), tickets_(tickets) {}

std::string DailyRaffle::draw_label(utc_day_t day, const hash_t& merkle_root) {
    return utc_day_string(day) + ":" + bytes_to_hex(merkle_root);
}

DailyRaffleReport DailyRaffle::run(std::span<const PlayRecord> plays, system_time_t now) {
    return run(plays, tickets_.config().winner_count, now);
}

DailyRaffleReport DailyRaffle::run(std::span<const PlayRecord> plays,
                                   std::size_t winner_count,
                                   system_time_t now) {
    DailyRaffleReport report;
    report.day = utc_day(now);
    report.day_string = utc_day_string(report.day);

    const auto today = TicketManager::plays_for_utc_day(plays, report.day);
    report.play_count = today.size();

    std::unordered_set<std::string> wallets;
    for (const auto& p : today) {
        if (!p.wallet.empty()) {
            wallets.insert(p.wallet);
        }
    }
    report.wallet_count = wallets.size();

    report.qualified = tickets_.daily_qualified_wallets(today);
    if (report.qualified.empty()) {
        log::raffle.warn("No qualifying plays for " + report.day_string);
        throw FairnessException(FairnessError::EMPTY_QUALIFICATION_SET,
                                "no qualified wallets for " + report.day_string);
    }

    report.ticket_budget = TicketManager::calculate_ticket_budget(report.qualified);
    report.distribution = TicketManager::ticket_distribution(report.qualified);

    // Commit the qualification set before any randomness exists
    MerkleAudit audit(report.qualified);
    report.merkle_root = audit.root();
    report.play_root = MerkleAudit::build_daily_play_root(today);

    report.proofs.reserve(report.qualified.size());
    for (const auto& q : report.qualified) {
        WalletProof wp;
        wp.wallet = q.wallet;
        wp.rank = q.rank;
        wp.score = q.score;
        wp.tickets = q.tickets;
        wp.proof = audit.proof_for(q.rank).value_or(std::vector<hash_t>{});
        report.proofs.push_back(std::move(wp));
    }

    const std::string label = draw_label(report.day, report.merkle_root);
    report.draw_alpha = SeedAuthority::draw_alpha(label);

    const DrawRandomness randomness = authority_.request_draw_randomness(label, now);
    report.result = RaffleDrawManager::draw(report.qualified, winner_count, randomness,
                                            report.merkle_root, now);

    FAIRPLAY_LOG_INFO(log::raffle) << "Daily raffle " << report.day_string << ": "
                                   << report.play_count << " plays, " << report.wallet_count
                                   << " wallets, " << report.qualified.size() << " qualified, "
                                   << report.ticket_budget << " tickets, "
                                   << report.result.winners.size() << " winners"
                                   << (report.result.verifiable ? "" : " (unverifiable)");
    return report;
}

}  // namespace fairplay
