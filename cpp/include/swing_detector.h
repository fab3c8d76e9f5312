#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_detector.h  –  Golf Swing Phase State Machine
//
// Fed one MotionSample at a time.  Each call evaluates the transition rule
// of the current phase, tracks per-swing measurements, and on Finished
// publishes a SwingAnalytics record, folds it into the session stats and
// returns to Idle.
//
// All timeouts are evaluated when a sample arrives; a stalled stream leaves
// the detector parked in its current phase.
//
// Thread-safety: process/reset/force_complete/reset_session/set_practice_mode
// are serialised, and each call delivers its events before the next mutating
// call starts, so the handler sees events in state order whichever thread
// made the call.  Events are dispatched after the state lock is released;
// the handler may call snapshot() or phase() but none of the mutating
// entry points.
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_buffer.h"
#include "session_stats.h"
#include "swing_analytics.h"
#include "swing_types.h"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace swing {

struct DetectorConfig {
    double sensitivity = 1.0;   // clamped to [kMinSensitivity, kMaxSensitivity]

    // Base thresholds, multiplied by sensitivity
    double backswing_start_threshold     = 1.5;   // G
    double top_of_swing_threshold        = 0.8;   // rad/s
    double downswing_start_threshold     = 4.0;   // G
    double impact_threshold              = 8.0;   // G
    double impact_deceleration_threshold = 6.0;   // G

    std::size_t buffer_capacity  = 300;
    std::size_t retained_samples = 200;
    std::size_t session_window   = 20;

    double hand_speed_factor = 2.2;
    double clubhead_factor   = 4.0;

    bool log_events = true;
};

constexpr double kMinSensitivity = 0.5;
constexpr double kMaxSensitivity = 1.5;

/// Sensitivity-scaled thresholds currently in force.
struct Thresholds {
    double backswing_start;
    double top_of_swing;
    double downswing_start;
    double impact;
    double impact_deceleration;
};

// ─── Events ─────────────────────────────────────────────────────────────────
struct PhaseChanged {
    SwingPhase phase;
    double timestamp;
};

struct SwingCompleted {
    SwingAnalytics analytics;
};

using SwingEvent = std::variant<PhaseChanged, SwingCompleted>;
using EventHandler = std::function<void(const SwingEvent&)>;

/// Read-only view of the published detector state.
struct DetectorSnapshot {
    SwingPhase phase = SwingPhase::IDLE;
    bool swing_in_progress = false;
    std::optional<SwingAnalytics> last_swing;
    SessionSummary session;
    double hand_speed = 0.0;      // mph, from the newest sample
    double rotation_rate = 0.0;   // rad/s, from the newest sample
    double sensitivity = 1.0;
    bool practice_mode = false;
};

// ─── Swing Detector ─────────────────────────────────────────────────────────
class SwingDetector {
public:
    explicit SwingDetector(const DetectorConfig& cfg = {});

    SwingDetector(const SwingDetector&) = delete;
    SwingDetector& operator=(const SwingDetector&) = delete;

    /// Feed the next sample.  Returns false (state untouched) when the
    /// timestamp goes backwards or any field is not finite.
    bool process(const MotionSample& sample);

    /// Abandon any swing in progress and return to Idle with empty buffers.
    void reset();

    /// Finalize the swing in progress from what has been measured so far.
    /// Returns true when a record was produced; otherwise behaves as reset().
    bool force_complete();

    /// Clear session statistics and the last record, then reset().
    void reset_session();

    /// Practice-mode switch; either direction starts a fresh session.
    void set_practice_mode(bool enabled);

    /// Clamped to [kMinSensitivity, kMaxSensitivity].
    void set_sensitivity(double sensitivity);

    /// Install the event sink (phase changes, completed swings).
    void set_event_handler(EventHandler handler);

    DetectorSnapshot snapshot() const;
    SwingPhase phase() const;
    Thresholds thresholds() const;

private:
    using EventList = std::vector<SwingEvent>;

    void step(const MotionSample& s, EventList& events);

    void detect_address(const MotionSample& s, EventList& events);
    void detect_backswing_start(const MotionSample& s, EventList& events);
    void detect_top_of_swing(const MotionSample& s, EventList& events);
    void detect_downswing_start(const MotionSample& s, EventList& events);
    void detect_impact(const MotionSample& s, EventList& events);
    void detect_swing_end(const MotionSample& s, EventList& events);

    bool impact_signature(double& deceleration) const;

    void begin_backswing(double t, EventList& events);
    void enter_impact(double t, EventList& events);
    void transition_to(SwingPhase next, double t, EventList& events);
    void complete_swing(double t, EventList& events);
    void cancel_swing(const std::string& reason, double t, EventList& events);
    void reset_session_locked(EventList& events);
    void reset_locked(double t, EventList& events);

    Thresholds thresholds_locked() const;
    void dispatch(const EventList& events);

    DetectorConfig cfg_;

    std::mutex dispatch_mu_;   // held across a whole mutating call
    mutable std::mutex mu_;    // state
    EventHandler handler_;

    SampleBuffer buffer_;
    SwingAnalyticsBuilder builder_;
    SessionStats session_;

    SwingPhase phase_ = SwingPhase::IDLE;
    double phase_start_ = 0.0;
    PhaseTimers timers_;
    bool in_progress_ = false;
    bool practice_mode_ = false;

    std::optional<SwingAnalytics> last_swing_;
    double hand_speed_ = 0.0;
    double rotation_rate_ = 0.0;

    bool   has_last_timestamp_ = false;
    double last_timestamp_ = 0.0;
};

}  // namespace swing
