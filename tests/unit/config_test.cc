#include <gtest/gtest.h>
#include "core/config.hh"
#include "core/error.hh"
#include <cstdlib>

namespace fairplay {
namespace {

const char* const kEnvVars[] = {
    "FAIRPLAY_LOG_LEVEL",
    "FAIRPLAY_LOG_FILE",
    "FAIRPLAY_LOG_ASYNC",
    "FAIRPLAY_ORACLE_TIMEOUT_MS",
    "FAIRPLAY_ORACLE_MAX_ATTEMPTS",
    "FAIRPLAY_ORACLE_BACKOFF_MS",
    "FAIRPLAY_ORACLE_FALLBACK",
    "FAIRPLAY_SESSION_TTL_MS",
    "FAIRPLAY_SCORE_SIGNING_KEY",
    "FAIRPLAY_SCORE_SCHEME",
    "FAIRPLAY_PLAYS_PER_DEVICE",
    "FAIRPLAY_SLICE_PERCENT",
    "FAIRPLAY_TICKETS_RANK1",
    "FAIRPLAY_TICKETS_RANKS2TO5",
    "FAIRPLAY_TICKETS_RANKS6TO10",
    "FAIRPLAY_TICKETS_REMAINING",
    "FAIRPLAY_MAX_TICKETS_PER_WALLET",
    "FAIRPLAY_RAFFLE_WINNERS",
};

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* name : kEnvVars) {
            ::unsetenv(name);
        }
    }
};

TEST_F(ConfigTest, Defaults) {
    FairplayConfig config;

    EXPECT_EQ(config.seed.fallback, OracleFallbackPolicy::FAIL_CLOSED);
    EXPECT_EQ(config.seed.oracle_max_attempts, 3u);
    EXPECT_EQ(config.session.ttl_ms, MS_PER_DAY);
    EXPECT_EQ(config.signing.scheme, SignatureScheme::ED25519);
    EXPECT_EQ(config.raffle.leaderboard_slice_percent, 25u);
    EXPECT_EQ(config.raffle.tickets_rank1, 25u);
    EXPECT_EQ(config.raffle.tickets_ranks2to5, 15u);
    EXPECT_EQ(config.raffle.tickets_ranks6to10, 10u);
    EXPECT_EQ(config.raffle.tickets_remaining, 1u);
    EXPECT_EQ(config.raffle.max_tickets_per_wallet, 25u);
    EXPECT_DOUBLE_EQ(config.abuse.bot_threshold, 0.5);

    EXPECT_TRUE(validate_config(config).empty());
}

TEST_F(ConfigTest, BaseTicketsPerTier) {
    RaffleConfig raffle;
    EXPECT_EQ(raffle.base_tickets(TicketTier::RANK1), 25u);
    EXPECT_EQ(raffle.base_tickets(TicketTier::RANKS2TO5), 15u);
    EXPECT_EQ(raffle.base_tickets(TicketTier::RANKS6TO10), 10u);
    EXPECT_EQ(raffle.base_tickets(TicketTier::REMAINING), 1u);
}

TEST_F(ConfigTest, ValidateRaffleProblems) {
    RaffleConfig raffle;
    raffle.leaderboard_slice_percent = 0;
    raffle.max_tickets_per_wallet = 0;
    EXPECT_EQ(validate_raffle_config(raffle).size(), 2u);

    raffle = RaffleConfig{};
    raffle.leaderboard_slice_percent = 101;
    EXPECT_EQ(validate_raffle_config(raffle).size(), 1u);

    raffle = RaffleConfig{};
    raffle.tickets_remaining = 0;
    EXPECT_FALSE(validate_raffle_config(raffle).empty());
}

TEST_F(ConfigTest, ValidateRejectsBadSigningKey) {
    FairplayConfig config;
    config.signing.private_key_hex = "abcd";
    EXPECT_FALSE(validate_config(config).empty());

    config.signing.private_key_hex = std::string(64, '1');
    EXPECT_TRUE(validate_config(config).empty());

    // Key length follows the scheme
    config.signing.scheme = SignatureScheme::MLDSA65;
    EXPECT_FALSE(validate_config(config).empty());

    config.signing.private_key_hex = std::string(MLDSA65_KEY_MATERIAL_SIZE * 2, 'a');
    EXPECT_TRUE(validate_config(config).empty());
}

TEST_F(ConfigTest, EnumNames) {
    EXPECT_EQ(oracle_fallback_string(OracleFallbackPolicy::LOCAL_CSPRNG), "local-csprng");
    EXPECT_EQ(parse_oracle_fallback("FAIL-CLOSED"), OracleFallbackPolicy::FAIL_CLOSED);
    EXPECT_FALSE(parse_oracle_fallback("maybe").has_value());

    EXPECT_EQ(signature_scheme_string(SignatureScheme::MLDSA65), "ml-dsa-65");
    EXPECT_EQ(parse_signature_scheme("Ed25519"), SignatureScheme::ED25519);
    EXPECT_FALSE(parse_signature_scheme("rsa").has_value());
}

TEST_F(ConfigTest, LoadFromEnvironment) {
    ::setenv("FAIRPLAY_LOG_LEVEL", "debug", 1);
    ::setenv("FAIRPLAY_LOG_ASYNC", "false", 1);
    ::setenv("FAIRPLAY_SLICE_PERCENT", "10", 1);
    ::setenv("FAIRPLAY_TICKETS_RANK1", "40", 1);
    ::setenv("FAIRPLAY_MAX_TICKETS_PER_WALLET", "30", 1);
    ::setenv("FAIRPLAY_SESSION_TTL_MS", "60000", 1);
    ::setenv("FAIRPLAY_ORACLE_FALLBACK", "local-csprng", 1);
    ::setenv("FAIRPLAY_ORACLE_MAX_ATTEMPTS", "5", 1);

    auto config = load_config_from_env();

    EXPECT_EQ(config.logging.default_level, LogLevel::DEBUG);
    EXPECT_FALSE(config.logging.async_logging);
    EXPECT_EQ(config.raffle.leaderboard_slice_percent, 10u);
    EXPECT_EQ(config.raffle.tickets_rank1, 40u);
    EXPECT_EQ(config.raffle.max_tickets_per_wallet, 30u);
    EXPECT_EQ(config.session.ttl_ms, 60000u);
    EXPECT_EQ(config.seed.fallback, OracleFallbackPolicy::LOCAL_CSPRNG);
    EXPECT_EQ(config.seed.oracle_max_attempts, 5u);
}

TEST_F(ConfigTest, LogFileEnablesFileSink) {
    ::setenv("FAIRPLAY_LOG_FILE", "/tmp/fairplay-test.log", 1);
    auto config = load_config_from_env();
    EXPECT_TRUE(config.logging.file_enabled);
    EXPECT_EQ(config.logging.file_path, "/tmp/fairplay-test.log");
}

TEST_F(ConfigTest, UnparseableNumberThrows) {
    ::setenv("FAIRPLAY_SLICE_PERCENT", "25%", 1);
    try {
        (void)load_config_from_env();
        FAIL() << "expected INVALID_CONFIG";
    } catch (const FairnessException& e) {
        EXPECT_EQ(e.code(), FairnessError::INVALID_CONFIG);
    }
}

TEST_F(ConfigTest, OutOfRangeValueFailsValidation) {
    ::setenv("FAIRPLAY_SLICE_PERCENT", "150", 1);
    EXPECT_THROW((void)load_config_from_env(), FairnessException);
}

TEST_F(ConfigTest, UnknownSchemeThrows) {
    ::setenv("FAIRPLAY_SCORE_SCHEME", "rsa-2048", 1);
    EXPECT_THROW((void)load_config_from_env(), FairnessException);
}

TEST_F(ConfigTest, ErrorStrings) {
    EXPECT_EQ(fairness_error_string(FairnessError::EMPTY_QUALIFICATION_SET),
              "EMPTY_QUALIFICATION_SET");

    FairnessException e(FairnessError::SESSION_NOT_FOUND, "session_1");
    EXPECT_EQ(e.code(), FairnessError::SESSION_NOT_FOUND);
    EXPECT_NE(std::string(e.what()).find("session_1"), std::string::npos);
}

}  // namespace
}  // namespace fairplay
