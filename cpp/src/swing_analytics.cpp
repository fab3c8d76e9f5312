// ─────────────────────────────────────────────────────────────────────────────
// swing_analytics.cpp  –  Per-Swing Analytics Builder
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_analytics.h"
#include "swing_classifier.h"

#include <utility>

namespace swing {

SwingAnalyticsBuilder::SwingAnalyticsBuilder(const AnalyticsOptions& opts)
    : opts_(opts) {}

void SwingAnalyticsBuilder::begin(double timestamp) {
    current_ = SwingAnalytics{};
    current_.start_time = timestamp;
    active_ = true;
}

void SwingAnalyticsBuilder::clear() {
    current_ = SwingAnalytics{};
    active_ = false;
}

void SwingAnalyticsBuilder::set_backswing_duration(double seconds) {
    current_.backswing_duration = seconds;
}

void SwingAnalyticsBuilder::set_downswing_duration(double seconds) {
    current_.downswing_duration = seconds;
}

void SwingAnalyticsBuilder::track_peaks(double acceleration, double rotation) {
    if (acceleration > current_.peak_acceleration) {
        current_.peak_acceleration = acceleration;
    }
    if (rotation > current_.peak_rotation_rate) {
        current_.peak_rotation_rate = rotation;
    }
}

void SwingAnalyticsBuilder::record_impact(double deceleration) {
    current_.impact_detected = true;
    current_.impact_deceleration = deceleration;
}

SwingAnalytics SwingAnalyticsBuilder::finalize(const SampleBuffer& buffer,
                                               const PhaseTimers& timers) {
    SwingAnalytics a = std::move(current_);

    a.total_duration = a.backswing_duration + a.downswing_duration;
    a.peak_hand_speed = hand_speed(a.peak_acceleration);
    a.estimated_clubhead_speed = a.peak_hand_speed * opts_.clubhead_factor;
    a.path = classify_path(buffer);
    a.type = classify_type(a.peak_acceleration, a.tempo_ratio());
    a.phases = timers;

    if (opts_.retained_samples > 0) {
        a.acceleration_samples = buffer.last(Channel::ACCELERATION, opts_.retained_samples);
        a.rotation_samples = buffer.last(Channel::ROTATION, opts_.retained_samples);
    }

    clear();
    return a;
}

}  // namespace swing
