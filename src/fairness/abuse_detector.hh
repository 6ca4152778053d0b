#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>

namespace fairplay {

// ============================================================================
// Game Moves
// ============================================================================

enum class MoveType : std::uint8_t {
    MOVE = 0,
    ROTATE = 1,
    DROP = 2,
    HOLD = 3,
};

[[nodiscard]] std::string_view move_type_string(MoveType type);

struct GameMove {
    MoveType type = MoveType::MOVE;
    std::int64_t timestamp_ms = 0;
    std::string direction;    // "left" / "right" / "down" or empty
    std::string rotation;     // "cw" / "ccw" or empty
};

// ============================================================================
// Bot Assessment
// ============================================================================

struct BotAssessment {
    bool is_bot = false;
    double confidence = 0.0;            // [0, 1]

    // Inter-move statistics
    std::size_t samples = 0;
    double mean_interval_ms = 0.0;
    double variance_ms2 = 0.0;
    std::int64_t min_interval_ms = 0;

    // Per-signal scores in [0, 1]
    double regularity = 0.0;
    double low_variance = 0.0;
    double fast_moves = 0.0;
    double drop_efficiency = 0.0;
};

// ============================================================================
// Abuse Detector
// ============================================================================

// Advisory only: the assessment feeds flagging and analytics, it never
// rejects a score or a piece.
class AbuseDetector {
public:
    explicit AbuseDetector(AbuseConfig config = {});

    // Weighted signals over inter-move deltas:
    //   0.40 regularity   1 - cv / regularity_cv, clamped
    //   0.25 variance     variance < variance_floor_ms2
    //   0.20 fast moves   share of deltas < fast_move_ms over fast_fraction_trigger
    //   0.15 drops        drop share > drop_ratio_trigger
    // Fewer than min_moves moves yields {false, 0}.
    [[nodiscard]] BotAssessment detect_bot(std::span<const GameMove> moves) const;

    // SHA-256 hex of "ip:user_agent"
    [[nodiscard]] static std::string device_fingerprint(std::string_view ip,
                                                       std::string_view user_agent);

    // Counts a play for (fingerprint, wallet) if under the daily allowance.
    // Returns false when the allowance is used up.
    bool check_rate_limit(std::string_view fingerprint,
                          std::string_view wallet,
                          system_time_t now = std::chrono::system_clock::now());

    // Drops rate-limit windows older than a day
    std::size_t prune_rate_limits(system_time_t now = std::chrono::system_clock::now());

    // SHA-256 hex of "type:ts:direction:rotation" joined with '|'
    [[nodiscard]] static std::string hash_move_sequence(std::span<const GameMove> moves);

    [[nodiscard]] const AbuseConfig& config() const { return config_; }

private:
    AbuseConfig config_;

    struct RateWindow {
        std::uint32_t count = 0;
        system_time_t window_start;
    };
    std::unordered_map<std::string, RateWindow> rate_windows_;
    mutable std::mutex mutex_;
};

}  // namespace fairplay
