#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_analytics.h  –  Per-Swing Analytics Builder
//
// Accumulates measurements for the swing in progress.  finalize() derives
// speeds, runs the classifier and copies the raw-sample tail, returning an
// immutable SwingAnalytics.
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_buffer.h"
#include "swing_types.h"

#include <cstddef>

namespace swing {

struct AnalyticsOptions {
    double      hand_speed_factor = 2.2;   // mph per G
    double      clubhead_factor   = 4.0;   // clubhead ≈ 4× hand speed (driver)
    std::size_t retained_samples  = 200;   // 0 disables raw retention
};

class SwingAnalyticsBuilder {
public:
    explicit SwingAnalyticsBuilder(const AnalyticsOptions& opts = {});

    /// Start a new record at backswing start.  Discards any previous one.
    void begin(double timestamp);

    /// Drop the in-progress record.
    void clear();

    bool active() const { return active_; }

    void set_backswing_duration(double seconds);
    void set_downswing_duration(double seconds);

    /// Fold one downswing sample into the running peaks.
    void track_peaks(double acceleration, double rotation);

    /// Impact confirmed: sets the flag and the measured deceleration.
    void record_impact(double deceleration);

    /// Build the frozen record.  The builder becomes inactive.
    SwingAnalytics finalize(const SampleBuffer& buffer, const PhaseTimers& timers);

    /// Live readout: hand speed for an instantaneous acceleration.
    double hand_speed(double acceleration) const {
        return acceleration * opts_.hand_speed_factor;
    }

    /// In-progress values, for inspection while a swing is being built.
    const SwingAnalytics& current() const { return current_; }

private:
    AnalyticsOptions opts_;
    SwingAnalytics current_;
    bool active_ = false;
};

}  // namespace swing
