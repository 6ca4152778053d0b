#include "seed_authority.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include <thread>

namespace fairplay {

SeedAuthority::SeedAuthority(std::shared_ptr<VrfOracle> oracle, SeedAuthorityConfig config)
    : oracle_(std::move(oracle))
    , config_(config) {
    if (!oracle_) {
        throw FairnessException(FairnessError::INVALID_ARGUMENT, "seed authority needs an oracle");
    }
    if (config_.oracle_max_attempts == 0) {
        throw FairnessException(FairnessError::INVALID_CONFIG, "oracle_max_attempts must be at least 1");
    }
}

std::string SeedAuthority::daily_alpha(utc_day_t day) {
    return "fairplay-daily-seed:" + utc_day_string(day);
}

std::string SeedAuthority::draw_alpha(std::string_view label) {
    return "fairplay-raffle-draw:" + std::string(label);
}

// ============================================================================
// Current Seed / Rotation
// ============================================================================

std::shared_ptr<const SeedRecord> SeedAuthority::current_seed(system_time_t now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && now < current_->rotates_at) {
            return current_;
        }
    }

    std::lock_guard<std::mutex> rotate_lock(rotate_mutex_);
    {
        // Another caller may have rotated while we waited
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_ && now < current_->rotates_at) {
            return current_;
        }
    }
    return rotate_locked(now);
}

std::shared_ptr<const SeedRecord> SeedAuthority::rotate(system_time_t now) {
    std::lock_guard<std::mutex> rotate_lock(rotate_mutex_);
    return rotate_locked(now);
}

std::shared_ptr<const SeedRecord> SeedAuthority::rotate_locked(system_time_t now) {
    auto record = std::make_shared<SeedRecord>();
    record->day = utc_day(now);
    record->alpha = daily_alpha(record->day);
    record->created_at = now;
    record->rotates_at = next_utc_midnight(now);

    auto output = query_oracle(record->alpha);
    if (output) {
        record->seed = output->randomness;
        record->proof = std::move(output->proof);
        record->vrf_signature = std::move(output->signature);
        record->verifiable = true;
    } else if (config_.fallback == OracleFallbackPolicy::LOCAL_CSPRNG) {
        record->seed = random_hash();
        record->verifiable = false;
        FAIRPLAY_LOG_WARN(log::seed) << "Oracle unavailable, seeding "
                                     << utc_day_string(record->day)
                                     << " from local CSPRNG (unverifiable)";
    } else {
        FAIRPLAY_LOG_ERROR(log::seed) << "Oracle unavailable for " << record->alpha
                                      << ", refusing to rotate";
        throw FairnessException(FairnessError::ORACLE_UNAVAILABLE,
                                "no seed for " + utc_day_string(record->day));
    }

    install(record);

    FAIRPLAY_LOG_INFO(log::seed) << "Rotated seed for " << utc_day_string(record->day)
                                 << " hash=" << short_hex(sha256(record->seed))
                                 << (record->verifiable ? "" : " [unverifiable]");
    return record;
}

void SeedAuthority::install(std::shared_ptr<const SeedRecord> record) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (current_) {
        SeedRecord retired = *current_;
        retired.active = false;
        history_.push_back(std::move(retired));
        while (history_.size() > config_.history_limit) {
            history_.pop_front();
        }
    }
    current_ = std::move(record);
}

// ============================================================================
// Oracle Round-trip
// ============================================================================

std::optional<VrfOutput> SeedAuthority::query_oracle(const std::string& alpha) {
    const std::chrono::milliseconds timeout(config_.oracle_timeout_ms);
    std::uint64_t backoff_ms = config_.oracle_backoff_ms;

    for (std::uint32_t attempt = 1; attempt <= config_.oracle_max_attempts; ++attempt) {
        auto started = std::chrono::steady_clock::now();

        std::optional<VrfOutput> output;
        try {
            output = oracle_->request(alpha, timeout);
        } catch (const std::exception& e) {
            FAIRPLAY_LOG_WARN(log::oracle) << oracle_->name() << " threw on attempt "
                                           << attempt << ": " << e.what();
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        if (output && elapsed > timeout) {
            FAIRPLAY_LOG_WARN(log::oracle) << "Discarding late oracle answer ("
                                           << elapsed.count() << "ms > "
                                           << timeout.count() << "ms)";
            output.reset();
        }

        if (output) {
            if (oracle_->verify(alpha, *output)) {
                FAIRPLAY_LOG_DEBUG(log::oracle) << "Oracle answered '" << alpha
                                                << "' on attempt " << attempt;
                return output;
            }
            FAIRPLAY_LOG_WARN(log::oracle) << "Oracle proof for '" << alpha
                                           << "' failed verification";
        }

        if (attempt < config_.oracle_max_attempts) {
            FAIRPLAY_LOG_DEBUG(log::oracle) << "Retrying oracle in " << backoff_ms << "ms";
            if (backoff_ms > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            }
            backoff_ms *= 2;
        }
    }

    FAIRPLAY_LOG_ERROR(log::oracle) << oracle_->name() << " gave no valid answer for '"
                                    << alpha << "' after " << config_.oracle_max_attempts
                                    << " attempts";
    return std::nullopt;
}

// ============================================================================
// Derivations
// ============================================================================

hash_t SeedAuthority::derive_round_seed(std::string_view wallet,
                                        std::string_view session_id,
                                        system_time_t now) {
    auto record = current_seed(now);
    return round_seed(*record, wallet, session_id);
}

hash_t SeedAuthority::round_seed(const SeedRecord& record,
                                 std::string_view wallet,
                                 std::string_view session_id) {
    std::string message;
    message.reserve(wallet.size() + 1 + session_id.size());
    message.append(wallet).append(":").append(session_id);

    return hmac_sha256(record.seed, message);
}

DrawRandomness SeedAuthority::request_draw_randomness(std::string_view label, system_time_t now) {
    std::lock_guard<std::mutex> rotate_lock(rotate_mutex_);

    DrawRandomness result;
    result.alpha = draw_alpha(label);

    auto output = query_oracle(result.alpha);
    if (output) {
        result.randomness = output->randomness;
        result.proof = std::move(output->proof);
        result.vrf_signature = std::move(output->signature);
        result.verifiable = true;
    } else if (config_.fallback == OracleFallbackPolicy::LOCAL_CSPRNG) {
        result.randomness = random_hash();
        result.verifiable = false;
        FAIRPLAY_LOG_WARN(log::seed) << "Draw randomness for '" << label
                                     << "' from local CSPRNG (unverifiable)";
    } else {
        throw FairnessException(FairnessError::ORACLE_UNAVAILABLE,
                                "no draw randomness for " + std::string(label));
    }

    FAIRPLAY_LOG_INFO(log::seed) << "Draw randomness for '" << label << "' at "
                                 << format_log_timestamp(now) << " -> "
                                 << short_hex(result.randomness);
    return result;
}

// ============================================================================
// Accessors
// ============================================================================

std::vector<SeedRecord> SeedAuthority::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<SeedRecord>(history_.begin(), history_.end());
}

bool SeedAuthority::has_seed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_ != nullptr;
}

}  // namespace fairplay
