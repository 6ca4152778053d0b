#include "abuse_detector.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <cmath>
#include <vector>

namespace fairplay {

namespace {

constexpr double WEIGHT_REGULARITY = 0.40;
constexpr double WEIGHT_VARIANCE = 0.25;
constexpr double WEIGHT_FAST = 0.20;
constexpr double WEIGHT_DROPS = 0.15;

double clamp_unit(double v) {
    return std::clamp(v, 0.0, 1.0);
}

}  // namespace

std::string_view move_type_string(MoveType type) {
    switch (type) {
        case MoveType::MOVE: return "move";
        case MoveType::ROTATE: return "rotate";
        case MoveType::DROP: return "drop";
        case MoveType::HOLD: return "hold";
    }
    return "unknown";
}

AbuseDetector::AbuseDetector(AbuseConfig config)
    : config_(config) {}

// ============================================================================
// Bot Detection
// ============================================================================

BotAssessment AbuseDetector::detect_bot(std::span<const GameMove> moves) const {
    BotAssessment result;
    if (moves.size() < std::max<std::size_t>(config_.min_moves, 3)) {
        return result;
    }

    std::vector<std::int64_t> deltas;
    deltas.reserve(moves.size() - 1);
    for (std::size_t i = 1; i < moves.size(); ++i) {
        deltas.push_back(moves[i].timestamp_ms - moves[i - 1].timestamp_ms);
    }

    const double n = static_cast<double>(deltas.size());
    double sum = 0.0;
    for (auto d : deltas) {
        sum += static_cast<double>(d);
    }
    const double mean = sum / n;

    double sq = 0.0;
    for (auto d : deltas) {
        double diff = static_cast<double>(d) - mean;
        sq += diff * diff;
    }
    const double variance = sq / n;

    result.samples = deltas.size();
    result.mean_interval_ms = mean;
    result.variance_ms2 = variance;
    result.min_interval_ms = *std::min_element(deltas.begin(), deltas.end());

    // Regularity: coefficient of variation near zero means metronomic input
    if (mean <= 0.0) {
        result.regularity = 1.0;
    } else {
        const double cv = std::sqrt(variance) / mean;
        result.regularity = clamp_unit(1.0 - cv / config_.regularity_cv);
    }

    result.low_variance = variance < config_.variance_floor_ms2 ? 1.0 : 0.0;

    // Out-of-order timestamps count as fast
    const auto fast = std::count_if(deltas.begin(), deltas.end(), [this](std::int64_t d) {
        return d < config_.fast_move_ms;
    });
    const double fast_share = static_cast<double>(fast) / n;
    result.fast_moves = config_.fast_fraction_trigger > 0.0
        ? clamp_unit(fast_share / config_.fast_fraction_trigger)
        : (fast > 0 ? 1.0 : 0.0);

    const auto drops = std::count_if(moves.begin(), moves.end(), [](const GameMove& m) {
        return m.type == MoveType::DROP;
    });
    const double drop_share = static_cast<double>(drops) / static_cast<double>(moves.size());
    result.drop_efficiency = drop_share > config_.drop_ratio_trigger ? 1.0 : 0.0;

    result.confidence = clamp_unit(WEIGHT_REGULARITY * result.regularity +
                                   WEIGHT_VARIANCE * result.low_variance +
                                   WEIGHT_FAST * result.fast_moves +
                                   WEIGHT_DROPS * result.drop_efficiency);
    result.is_bot = result.confidence > config_.bot_threshold;

    if (result.is_bot) {
        FAIRPLAY_LOG_INFO(log::abuse) << "Bot-like input: confidence=" << result.confidence
                                      << " mean=" << mean << "ms var=" << variance
                                      << " min=" << result.min_interval_ms << "ms";
    }
    return result;
}

// ============================================================================
// Device Fingerprint / Rate Limit
// ============================================================================

std::string AbuseDetector::device_fingerprint(std::string_view ip, std::string_view user_agent) {
    std::string combined(ip);
    combined.append(":").append(user_agent);
    return sha256_hex(combined);
}

bool AbuseDetector::check_rate_limit(std::string_view fingerprint,
                                     std::string_view wallet,
                                     system_time_t now) {
    std::string key(fingerprint);
    key.append(":").append(wallet);

    const auto window = std::chrono::milliseconds(MS_PER_DAY);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = rate_windows_[key];

    if (entry.count == 0 || now - entry.window_start > window) {
        entry.count = 1;
        entry.window_start = now;
        return true;
    }

    if (entry.count < config_.plays_per_device_per_day) {
        ++entry.count;
        return true;
    }

    FAIRPLAY_LOG_DEBUG(log::abuse) << "Rate limit reached for device "
                                   << fingerprint.substr(0, 16) << " / " << wallet;
    return false;
}

std::size_t AbuseDetector::prune_rate_limits(system_time_t now) {
    const auto window = std::chrono::milliseconds(MS_PER_DAY);

    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = rate_windows_.begin(); it != rate_windows_.end();) {
        if (now - it->second.window_start > window) {
            it = rate_windows_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

// ============================================================================
// Move Sequence Hash
// ============================================================================

std::string AbuseDetector::hash_move_sequence(std::span<const GameMove> moves) {
    std::string data;
    for (std::size_t i = 0; i < moves.size(); ++i) {
        if (i > 0) {
            data.push_back('|');
        }
        const auto& m = moves[i];
        data.append(move_type_string(m.type));
        data.append(":").append(std::to_string(m.timestamp_ms));
        data.append(":").append(m.direction);
        data.append(":").append(m.rotation);
    }
    return sha256_hex(data);
}

}  // namespace fairplay
