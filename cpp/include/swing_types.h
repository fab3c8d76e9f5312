#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_types.h  –  Swing Phases, Classifications & the Per-Swing Record
// ─────────────────────────────────────────────────────────────────────────────

#include <optional>
#include <vector>

namespace swing {

enum class SwingPhase {
    IDLE,
    ADDRESS,
    BACKSWING,
    TOP_OF_SWING,
    TRANSITION,
    DOWNSWING,
    IMPACT,
    FOLLOW_THROUGH,
    FINISHED
};

enum class SwingPath { INSIDE_OUT, NEUTRAL, OVER_THE_TOP, UNKNOWN };

enum class SwingType { FULL_SWING, IRON_SWING, CHIP_OR_PITCH, PUTT, UNKNOWN };

enum class TempoRating { EXCELLENT, GOOD, NEEDS_WORK, POOR };

const char* to_string(SwingPhase phase);
const char* to_string(SwingPath path);
const char* to_string(SwingType type);
const char* to_string(TempoRating rating);

/// Bucket a backswing/downswing ratio.  Tour average sits around 3.0.
TempoRating rate_tempo(double tempo_ratio);

/// Entry time (seconds) of each phase reached by the current swing.
struct PhaseTimers {
    std::optional<double> address_start;
    std::optional<double> backswing_start;
    std::optional<double> top_of_swing;
    std::optional<double> downswing_start;
    std::optional<double> impact;   // confirmed contact only
};

/// Complete analytics for one golf swing.  Only published once finalized.
struct SwingAnalytics {
    double start_time = 0.0;           // backswing start (s)

    double backswing_duration = 0.0;   // s
    double downswing_duration = 0.0;   // s
    double total_duration     = 0.0;   // s

    double peak_acceleration  = 0.0;   // G
    double peak_rotation_rate = 0.0;   // rad/s

    bool   impact_detected     = false;
    double impact_deceleration = 0.0;  // G

    double peak_hand_speed          = 0.0;  // mph (approximation)
    double estimated_clubhead_speed = 0.0;  // mph

    SwingPath path = SwingPath::UNKNOWN;
    SwingType type = SwingType::UNKNOWN;

    PhaseTimers phases;

    // Bounded tail of raw magnitudes for offline analysis; may be empty.
    std::vector<double> acceleration_samples;
    std::vector<double> rotation_samples;

    double tempo_ratio() const {
        if (downswing_duration <= 0.0) return 0.0;
        return backswing_duration / downswing_duration;
    }

    TempoRating tempo_rating() const { return rate_tempo(tempo_ratio()); }
};

}  // namespace swing
