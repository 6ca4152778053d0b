#include <gtest/gtest.h>
#include "core/error.hh"
#include "crypto/hash.hh"
#include "fairness/seed_authority.hh"
#include "fairness/vrf_oracle.hh"
#include <atomic>
#include <set>
#include <stdexcept>
#include <thread>

namespace fairplay {
namespace {

// 2024-05-01T00:00:00Z
const system_time_t kDay1 = from_unix_ms(1714521600000LL);
const system_time_t kDay2 = kDay1 + std::chrono::hours(24);

ed25519_secret_key_t test_seed(std::uint8_t fill) {
    ed25519_secret_key_t seed;
    seed.fill(fill);
    return seed;
}

// Wraps a real oracle, counts requests and can fail the first N of them
class ScriptedOracle : public VrfOracle {
public:
    explicit ScriptedOracle(std::uint32_t failures = 0, bool throw_on_fail = false)
        : inner_(Ed25519VrfOracle::from_seed(test_seed(0x42)))
        , failures_(failures)
        , throw_on_fail_(throw_on_fail) {}

    std::optional<VrfOutput> request(std::string_view alpha,
                                     std::chrono::milliseconds timeout) override {
        auto n = calls_.fetch_add(1);
        if (n < failures_) {
            if (throw_on_fail_) {
                throw std::runtime_error("connection reset");
            }
            return std::nullopt;
        }
        return inner_->request(alpha, timeout);
    }

    bool verify(std::string_view alpha, const VrfOutput& output) const override {
        return inner_->verify(alpha, output);
    }

    std::string_view name() const override { return "scripted"; }

    std::uint32_t calls() const { return calls_.load(); }

private:
    std::unique_ptr<Ed25519VrfOracle> inner_;
    std::uint32_t failures_;
    bool throw_on_fail_;
    std::atomic<std::uint32_t> calls_{0};
};

// Answers with output whose proof does not verify
class ForgingOracle : public VrfOracle {
public:
    std::optional<VrfOutput> request(std::string_view, std::chrono::milliseconds) override {
        VrfOutput out;
        out.randomness = sha256("chosen by the operator");
        out.proof.assign(64, 0x01);
        out.signature = bytes_to_hex(out.proof);
        return out;
    }
    bool verify(std::string_view alpha, const VrfOutput& output) const override {
        return Ed25519VrfOracle::verify_with_key(ed25519_public_key_t{}, alpha, output);
    }
    std::string_view name() const override { return "forging"; }
};

SeedAuthorityConfig fast_config(OracleFallbackPolicy fallback = OracleFallbackPolicy::FAIL_CLOSED) {
    SeedAuthorityConfig config;
    config.oracle_backoff_ms = 0;
    config.oracle_max_attempts = 3;
    config.fallback = fallback;
    return config;
}

// ============================================================================
// Ed25519 VRF Oracle
// ============================================================================

TEST(VrfOracleTest, RequestVerifies) {
    auto oracle = Ed25519VrfOracle::from_seed(test_seed(0x07));
    auto out = oracle->request("fairplay-daily-seed:2024-05-01", std::chrono::seconds(1));
    ASSERT_TRUE(out.has_value());

    EXPECT_EQ(out->proof.size(), ED25519_SIGNATURE_SIZE);
    EXPECT_EQ(out->randomness, sha256(out->proof));
    EXPECT_EQ(out->signature, bytes_to_hex(out->proof));
    EXPECT_TRUE(oracle->verify("fairplay-daily-seed:2024-05-01", *out));
    EXPECT_TRUE(Ed25519VrfOracle::verify_with_key(oracle->public_key(),
                                                  "fairplay-daily-seed:2024-05-01", *out));
}

TEST(VrfOracleTest, DeterministicPerAlpha) {
    auto oracle = Ed25519VrfOracle::from_seed(test_seed(0x07));
    auto a = oracle->request("alpha", std::chrono::seconds(1));
    auto b = oracle->request("alpha", std::chrono::seconds(1));
    auto c = oracle->request("other", std::chrono::seconds(1));
    ASSERT_TRUE(a && b && c);
    EXPECT_EQ(a->randomness, b->randomness);
    EXPECT_NE(a->randomness, c->randomness);
}

TEST(VrfOracleTest, RejectsTampering) {
    auto oracle = Ed25519VrfOracle::from_seed(test_seed(0x07));
    auto out = oracle->request("alpha", std::chrono::seconds(1));
    ASSERT_TRUE(out.has_value());

    EXPECT_FALSE(oracle->verify("alpha2", *out));

    auto bad_randomness = *out;
    bad_randomness.randomness[0] ^= 0x01;
    EXPECT_FALSE(oracle->verify("alpha", bad_randomness));

    auto bad_proof = *out;
    bad_proof.proof[5] ^= 0x01;
    EXPECT_FALSE(oracle->verify("alpha", bad_proof));

    auto short_proof = *out;
    short_proof.proof.resize(10);
    EXPECT_FALSE(oracle->verify("alpha", short_proof));

    auto bad_sig = *out;
    bad_sig.signature = "00";
    EXPECT_FALSE(oracle->verify("alpha", bad_sig));
}

TEST(VrfOracleTest, OtherKeyRejects) {
    auto a = Ed25519VrfOracle::from_seed(test_seed(0x01));
    auto b = Ed25519VrfOracle::from_seed(test_seed(0x02));
    auto out = a->request("alpha", std::chrono::seconds(1));
    ASSERT_TRUE(out.has_value());
    EXPECT_FALSE(b->verify("alpha", *out));
}

TEST(VrfOracleTest, PublicKeyOnlyKeypairRejected) {
    auto kp = Ed25519KeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto public_only = Ed25519KeyPair::from_public_key(kp->public_key());
    EXPECT_THROW(Ed25519VrfOracle oracle(std::move(public_only)), FairnessException);
}

// ============================================================================
// Seed Authority
// ============================================================================

TEST(SeedAuthorityTest, NullOracleRejected) {
    try {
        SeedAuthority authority(nullptr);
        FAIL() << "expected INVALID_ARGUMENT";
    } catch (const FairnessException& e) {
        EXPECT_EQ(e.code(), FairnessError::INVALID_ARGUMENT);
    }
}

TEST(SeedAuthorityTest, FirstCallSeedsTheDay) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());
    EXPECT_FALSE(authority.has_seed());

    auto record = authority.current_seed(kDay1 + std::chrono::hours(3));
    ASSERT_NE(record, nullptr);
    EXPECT_TRUE(authority.has_seed());
    EXPECT_EQ(record->day, utc_day(kDay1));
    EXPECT_EQ(record->alpha, "fairplay-daily-seed:2024-05-01");
    EXPECT_EQ(record->rotates_at, kDay2);
    EXPECT_TRUE(record->verifiable);
    EXPECT_TRUE(record->active);
    EXPECT_FALSE(record->vrf_signature.empty());

    VrfOutput out{record->seed, record->proof, record->vrf_signature};
    EXPECT_TRUE(oracle->verify(record->alpha, out));
}

TEST(SeedAuthorityTest, SameDayReturnsSameRecord) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());

    auto a = authority.current_seed(kDay1 + std::chrono::hours(1));
    auto b = authority.current_seed(kDay1 + std::chrono::hours(23));
    EXPECT_EQ(a, b);
    EXPECT_EQ(oracle->calls(), 1u);
}

TEST(SeedAuthorityTest, RotatesAtMidnight) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());

    auto day1 = authority.current_seed(kDay1 + std::chrono::hours(12));
    auto day2 = authority.current_seed(kDay2);
    EXPECT_NE(day1->seed, day2->seed);
    EXPECT_EQ(day2->day, utc_day(kDay1) + 1);

    auto history = authority.history();
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].seed, day1->seed);
    EXPECT_FALSE(history[0].active);

    // Records held by readers are never mutated
    EXPECT_TRUE(day1->active);
}

TEST(SeedAuthorityTest, HistoryIsBounded) {
    auto oracle = std::make_shared<ScriptedOracle>();
    auto config = fast_config();
    config.history_limit = 2;
    SeedAuthority authority(oracle, config);

    for (int d = 0; d < 5; ++d) {
        (void)authority.current_seed(kDay1 + std::chrono::hours(24 * d));
    }
    auto history = authority.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0].day, utc_day(kDay1) + 2);
    EXPECT_EQ(history[1].day, utc_day(kDay1) + 3);
}

TEST(SeedAuthorityTest, RoundSeedIsHmacOfWalletAndSession) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());

    auto record = authority.current_seed(kDay1);
    auto round = authority.derive_round_seed("wallet1", "session_1", kDay1);
    EXPECT_EQ(round, hmac_sha256(record->seed, std::string_view("wallet1:session_1")));
    EXPECT_EQ(round, SeedAuthority::round_seed(*record, "wallet1", "session_1"));
    EXPECT_NE(round, authority.derive_round_seed("wallet1", "session_2", kDay1));
    EXPECT_NE(round, authority.derive_round_seed("wallet2", "session_1", kDay1));
}

TEST(SeedAuthorityTest, RetriesTransientFailures) {
    auto oracle = std::make_shared<ScriptedOracle>(2);
    SeedAuthority authority(oracle, fast_config());

    auto record = authority.current_seed(kDay1);
    EXPECT_TRUE(record->verifiable);
    EXPECT_EQ(oracle->calls(), 3u);
}

TEST(SeedAuthorityTest, OracleExceptionsCountAsFailedAttempts) {
    auto oracle = std::make_shared<ScriptedOracle>(1, true);
    SeedAuthority authority(oracle, fast_config());

    auto record = authority.current_seed(kDay1);
    EXPECT_TRUE(record->verifiable);
    EXPECT_EQ(oracle->calls(), 2u);
}

TEST(SeedAuthorityTest, FailClosedThrows) {
    auto oracle = std::make_shared<ScriptedOracle>(100);
    SeedAuthority authority(oracle, fast_config());

    try {
        (void)authority.current_seed(kDay1);
        FAIL() << "expected ORACLE_UNAVAILABLE";
    } catch (const FairnessException& e) {
        EXPECT_EQ(e.code(), FairnessError::ORACLE_UNAVAILABLE);
    }
    EXPECT_EQ(oracle->calls(), 3u);
    EXPECT_FALSE(authority.has_seed());
    EXPECT_THROW((void)authority.derive_round_seed("w", "s", kDay1), FairnessException);
}

TEST(SeedAuthorityTest, FailClosedKeepsServingUnexpiredSeed) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());
    auto record = authority.current_seed(kDay1);

    // Same day: no oracle call, no failure
    EXPECT_EQ(authority.current_seed(kDay1 + std::chrono::hours(2)), record);
}

TEST(SeedAuthorityTest, CsprngFallbackIsFlagged) {
    auto oracle = std::make_shared<ScriptedOracle>(100);
    SeedAuthority authority(oracle, fast_config(OracleFallbackPolicy::LOCAL_CSPRNG));

    auto record = authority.current_seed(kDay1);
    EXPECT_FALSE(record->verifiable);
    EXPECT_TRUE(record->vrf_signature.empty());
    EXPECT_FALSE(is_zero(record->seed));
}

TEST(SeedAuthorityTest, ForgedProofIsNotAccepted) {
    auto oracle = std::make_shared<ForgingOracle>();
    SeedAuthority authority(oracle, fast_config());
    EXPECT_THROW((void)authority.current_seed(kDay1), FairnessException);
}

TEST(SeedAuthorityTest, ConcurrentReadersSeeOneRotation) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());
    auto day1 = authority.current_seed(kDay1);

    std::vector<std::thread> threads;
    std::vector<hash_t> seen(8);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i]() {
            seen[i] = authority.current_seed(kDay2 + std::chrono::minutes(i))->seed;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::set<hash_t> distinct(seen.begin(), seen.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), day1->seed);
    EXPECT_EQ(oracle->calls(), 2u);
}

TEST(SeedAuthorityTest, DrawRandomnessUsesSeparateAlpha) {
    auto oracle = std::make_shared<ScriptedOracle>();
    SeedAuthority authority(oracle, fast_config());

    auto draw = authority.request_draw_randomness("2024-05-01:abcd", kDay1);
    EXPECT_EQ(draw.alpha, "fairplay-raffle-draw:2024-05-01:abcd");
    EXPECT_TRUE(draw.verifiable);

    VrfOutput out{draw.randomness, draw.proof, draw.vrf_signature};
    EXPECT_TRUE(oracle->verify(draw.alpha, out));

    auto seed = authority.current_seed(kDay1);
    EXPECT_NE(seed->seed, draw.randomness);
}

TEST(SeedAuthorityTest, DrawRandomnessFallbackPolicy) {
    auto failing = std::make_shared<ScriptedOracle>(100);
    SeedAuthority closed(failing, fast_config());
    EXPECT_THROW((void)closed.request_draw_randomness("label", kDay1), FairnessException);

    auto failing2 = std::make_shared<ScriptedOracle>(100);
    SeedAuthority open(failing2, fast_config(OracleFallbackPolicy::LOCAL_CSPRNG));
    auto draw = open.request_draw_randomness("label", kDay1);
    EXPECT_FALSE(draw.verifiable);
}

}  // namespace
}  // namespace fairplay
