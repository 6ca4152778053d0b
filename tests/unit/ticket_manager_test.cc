#include <gtest/gtest.h>
#include "core/error.hh"
#include "raffle/ticket_manager.hh"
#include <algorithm>
#include <cstdio>

using namespace fairplay;

namespace {

const system_time_t kDayStart = utc_day_start(19844);   // 2024-05-01

PlayRecord play(std::string wallet, score_t score, std::int64_t offset_s) {
    PlayRecord p;
    p.wallet = std::move(wallet);
    p.score = score;
    p.timestamp = kDayStart + std::chrono::seconds(offset_s);
    return p;
}

// wallet00..wallet{n-1} with scores 500, 480, ... one play each
std::vector<PlayRecord> ladder(std::size_t n) {
    std::vector<PlayRecord> plays;
    for (std::size_t i = 0; i < n; ++i) {
        char name[16];
        std::snprintf(name, sizeof(name), "wallet%02zu", i);
        plays.push_back(play(name, 500 - 20 * i, static_cast<std::int64_t>(i)));
    }
    return plays;
}

}  // namespace

// ============================================================================
// Qualification
// ============================================================================

TEST(TicketManagerTest, TopQuarterQualifies) {
    TicketManager manager;
    auto plays = ladder(12);
    auto qualified = manager.daily_qualified_wallets(plays);

    ASSERT_EQ(qualified.size(), 3u);
    EXPECT_EQ(qualified[0].wallet, "wallet00");
    EXPECT_EQ(qualified[0].rank, 1u);
    EXPECT_EQ(qualified[0].tier, TicketTier::RANK1);
    EXPECT_EQ(qualified[0].tickets, 25u);

    EXPECT_EQ(qualified[1].wallet, "wallet01");
    EXPECT_EQ(qualified[1].tickets, 15u);
    EXPECT_EQ(qualified[2].wallet, "wallet02");
    EXPECT_EQ(qualified[2].rank, 3u);
    EXPECT_EQ(qualified[2].tier, TicketTier::RANKS2TO5);
    EXPECT_EQ(qualified[2].tickets, 15u);

    EXPECT_EQ(TicketManager::calculate_ticket_budget(qualified), 55u);
}

TEST(TicketManagerTest, QualifiedCountRoundsUp) {
    TicketManager manager;
    EXPECT_EQ(manager.qualified_count(0), 0u);
    EXPECT_EQ(manager.qualified_count(1), 1u);
    EXPECT_EQ(manager.qualified_count(4), 1u);
    EXPECT_EQ(manager.qualified_count(5), 2u);
    EXPECT_EQ(manager.qualified_count(100), 25u);

    auto qualified = manager.daily_qualified_wallets(ladder(1));
    ASSERT_EQ(qualified.size(), 1u);
    EXPECT_EQ(qualified[0].tickets, 25u);
}

TEST(TicketManagerTest, EmptyInput) {
    TicketManager manager;
    EXPECT_TRUE(manager.daily_qualified_wallets({}).empty());
    EXPECT_TRUE(TicketManager::generate_raffle_tickets({}).empty());
    EXPECT_EQ(TicketManager::calculate_ticket_budget({}), 0u);
}

TEST(TicketManagerTest, BestPlayPerWallet) {
    RaffleConfig config;
    config.leaderboard_slice_percent = 100;
    TicketManager manager(config);

    std::vector<PlayRecord> plays = {
        play("alice", 100, 0),
        play("alice", 300, 10),
        play("bob", 200, 5),
        play("alice", 250, 20),
        play("", 999, 1),
    };
    auto qualified = manager.daily_qualified_wallets(plays);

    ASSERT_EQ(qualified.size(), 2u);
    EXPECT_EQ(qualified[0].wallet, "alice");
    EXPECT_EQ(qualified[0].score, 300u);
    EXPECT_EQ(qualified[0].best_play_at, kDayStart + std::chrono::seconds(10));
    EXPECT_EQ(qualified[1].wallet, "bob");
}

TEST(TicketManagerTest, TiesGoToEarlierPlayThenWallet) {
    RaffleConfig config;
    config.leaderboard_slice_percent = 100;
    TicketManager manager(config);

    std::vector<PlayRecord> plays = {
        play("carol", 100, 30),
        play("bob", 100, 10),
        play("dave", 100, 10),
        play("alice", 100, 20),
        // Same score replayed later does not move bob's best play
        play("bob", 100, 50),
    };
    auto qualified = manager.daily_qualified_wallets(plays);

    ASSERT_EQ(qualified.size(), 4u);
    EXPECT_EQ(qualified[0].wallet, "bob");
    EXPECT_EQ(qualified[0].best_play_at, kDayStart + std::chrono::seconds(10));
    EXPECT_EQ(qualified[1].wallet, "dave");
    EXPECT_EQ(qualified[2].wallet, "alice");
    EXPECT_EQ(qualified[3].wallet, "carol");

    // Input order does not matter
    std::reverse(plays.begin(), plays.end());
    auto again = manager.daily_qualified_wallets(plays);
    for (std::size_t i = 0; i < qualified.size(); ++i) {
        EXPECT_EQ(again[i].wallet, qualified[i].wallet);
    }
}

TEST(TicketManagerTest, TiersAcrossFullLadder) {
    RaffleConfig config;
    config.leaderboard_slice_percent = 100;
    TicketManager manager(config);

    auto qualified = manager.daily_qualified_wallets(ladder(12));
    ASSERT_EQ(qualified.size(), 12u);

    for (const auto& q : qualified) {
        EXPECT_EQ(q.tier, tier_for_rank(q.rank));
    }
    EXPECT_EQ(qualified[4].tickets, 15u);    // rank 5
    EXPECT_EQ(qualified[5].tickets, 10u);    // rank 6
    EXPECT_EQ(qualified[9].tickets, 10u);    // rank 10
    EXPECT_EQ(qualified[10].tickets, 1u);    // rank 11

    // 25 + 4*15 + 5*10 + 2*1
    EXPECT_EQ(TicketManager::calculate_ticket_budget(qualified), 137u);

    auto dist = TicketManager::ticket_distribution(qualified);
    EXPECT_EQ(dist[0].tier, TicketTier::RANK1);
    EXPECT_EQ(dist[0].wallets, 1u);
    EXPECT_EQ(dist[0].tickets, 25u);
    EXPECT_EQ(dist[1].wallets, 4u);
    EXPECT_EQ(dist[1].tickets, 60u);
    EXPECT_EQ(dist[2].wallets, 5u);
    EXPECT_EQ(dist[2].tickets, 50u);
    EXPECT_EQ(dist[3].tier, TicketTier::REMAINING);
    EXPECT_EQ(dist[3].wallets, 2u);
    EXPECT_EQ(dist[3].tickets, 2u);
}

TEST(TicketManagerTest, CapLimitsTickets) {
    RaffleConfig config;
    config.max_tickets_per_wallet = 12;
    TicketManager manager(config);

    auto qualified = manager.daily_qualified_wallets(ladder(12));
    ASSERT_EQ(qualified.size(), 3u);
    for (const auto& q : qualified) {
        EXPECT_EQ(q.tickets, 12u);
    }
}

// ============================================================================
// Tickets
// ============================================================================

TEST(TicketManagerTest, TicketNumbersAreSequentialInRankOrder) {
    TicketManager manager;
    auto qualified = manager.daily_qualified_wallets(ladder(12));
    auto tickets = TicketManager::generate_raffle_tickets(qualified);

    ASSERT_EQ(tickets.size(), 55u);
    for (std::size_t i = 0; i < tickets.size(); ++i) {
        EXPECT_EQ(tickets[i].ticket_number, i + 1);
    }
    EXPECT_EQ(tickets[0].wallet_address, "wallet00");
    EXPECT_EQ(tickets[24].wallet_address, "wallet00");
    EXPECT_EQ(tickets[25].wallet_address, "wallet01");
    EXPECT_EQ(tickets[25].rank, 2u);
    EXPECT_EQ(tickets[39].wallet_address, "wallet01");
    EXPECT_EQ(tickets[40].wallet_address, "wallet02");
    EXPECT_EQ(tickets[54].tier, TicketTier::RANKS2TO5);
    EXPECT_EQ(tickets[54].score, 460u);
}

// ============================================================================
// Day Filter
// ============================================================================

TEST(TicketManagerTest, PlaysForUtcDay) {
    std::vector<PlayRecord> plays = {
        play("a", 1, -1),                   // 2024-04-30T23:59:59Z
        play("b", 1, 0),
        play("c", 1, 86399),
        play("d", 1, 86400),                // next day
    };
    auto day = TicketManager::plays_for_utc_day(plays, 19844);
    ASSERT_EQ(day.size(), 2u);
    EXPECT_EQ(day[0].wallet, "b");
    EXPECT_EQ(day[1].wallet, "c");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(TicketManagerTest, InvalidConfigRejected) {
    RaffleConfig bad;
    bad.leaderboard_slice_percent = 0;
    EXPECT_THROW(TicketManager{bad}, FairnessException);

    bad = RaffleConfig{};
    bad.max_tickets_per_wallet = 0;
    EXPECT_THROW(TicketManager{bad}, FairnessException);
}

TEST(TicketManagerTest, UpdateConfigKeepsOldOnFailure) {
    TicketManager manager;

    RaffleConfig bad;
    bad.leaderboard_slice_percent = 101;
    try {
        manager.update_config(bad);
        FAIL() << "expected INVALID_CONFIG";
    } catch (const FairnessException& e) {
        EXPECT_EQ(e.code(), FairnessError::INVALID_CONFIG);
    }
    EXPECT_EQ(manager.config().leaderboard_slice_percent, DEFAULT_LEADERBOARD_SLICE_PERCENT);

    RaffleConfig wide;
    wide.leaderboard_slice_percent = 50;
    manager.update_config(wide);
    EXPECT_EQ(manager.config().leaderboard_slice_percent, 50u);
    EXPECT_EQ(manager.daily_qualified_wallets(ladder(12)).size(), 6u);
}
