// ─────────────────────────────────────────────────────────────────────────────
// test_swing_analytics.cpp  –  Per-Swing Record Construction
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_analytics.h"

#include <gtest/gtest.h>

namespace swing {
namespace {

SampleBuffer downswing_window(std::size_t count) {
    SampleBuffer buf(300);
    for (std::size_t i = 0; i < count; ++i) {
        buf.push(make_sample(i * 0.01, 0.1 * i, -4.0, 0.0, 0.0));
    }
    return buf;
}

TEST(SwingAnalyticsBuilder, InactiveUntilBegin) {
    SwingAnalyticsBuilder b;
    EXPECT_FALSE(b.active());
    b.begin(2.0);
    EXPECT_TRUE(b.active());
    EXPECT_DOUBLE_EQ(b.current().start_time, 2.0);
    b.clear();
    EXPECT_FALSE(b.active());
}

TEST(SwingAnalyticsBuilder, PeaksAreRunningMaxima) {
    SwingAnalyticsBuilder b;
    b.begin(0.0);
    b.track_peaks(4.0, 6.0);
    b.track_peaks(9.0, 2.0);
    b.track_peaks(3.0, 7.5);
    EXPECT_DOUBLE_EQ(b.current().peak_acceleration, 9.0);
    EXPECT_DOUBLE_EQ(b.current().peak_rotation_rate, 7.5);
}

TEST(SwingAnalyticsBuilder, FinalizeDerivesSpeedsAndLabels) {
    SwingAnalyticsBuilder b;
    b.begin(1.0);
    b.set_backswing_duration(0.9);
    b.set_downswing_duration(0.3);
    b.track_peaks(12.0, 9.0);
    b.record_impact(8.5);

    PhaseTimers timers;
    timers.backswing_start = 1.0;
    timers.impact = 2.2;

    SampleBuffer buf = downswing_window(80);
    SwingAnalytics a = b.finalize(buf, timers);

    EXPECT_NEAR(a.total_duration, 1.2, 1e-12);
    EXPECT_NEAR(a.tempo_ratio(), 3.0, 1e-12);
    EXPECT_EQ(a.tempo_rating(), TempoRating::EXCELLENT);
    EXPECT_NEAR(a.peak_hand_speed, 26.4, 1e-9);
    EXPECT_NEAR(a.estimated_clubhead_speed, 105.6, 1e-9);
    EXPECT_TRUE(a.impact_detected);
    EXPECT_DOUBLE_EQ(a.impact_deceleration, 8.5);
    EXPECT_EQ(a.type, SwingType::FULL_SWING);
    EXPECT_EQ(a.path, SwingPath::OVER_THE_TOP);
    ASSERT_TRUE(a.phases.impact.has_value());
    EXPECT_DOUBLE_EQ(*a.phases.impact, 2.2);
    EXPECT_FALSE(a.phases.top_of_swing.has_value());

    EXPECT_EQ(a.acceleration_samples.size(), 80u);
    EXPECT_EQ(a.rotation_samples.size(), 80u);
    EXPECT_NEAR(a.acceleration_samples.back(), 7.9, 1e-9);

    EXPECT_FALSE(b.active());
}

TEST(SwingAnalyticsBuilder, RetentionIsBounded) {
    AnalyticsOptions opts;
    opts.retained_samples = 25;
    SwingAnalyticsBuilder b(opts);
    b.begin(0.0);

    SwingAnalytics a = b.finalize(downswing_window(100), PhaseTimers{});
    ASSERT_EQ(a.acceleration_samples.size(), 25u);
    EXPECT_NEAR(a.acceleration_samples.front(), 7.5, 1e-9);
}

TEST(SwingAnalyticsBuilder, NoDownswingMeansZeroTempo) {
    SwingAnalyticsBuilder b;
    b.begin(0.0);
    b.set_backswing_duration(0.8);

    SwingAnalytics a = b.finalize(downswing_window(10), PhaseTimers{});
    EXPECT_DOUBLE_EQ(a.tempo_ratio(), 0.0);
    EXPECT_EQ(a.tempo_rating(), TempoRating::POOR);
    EXPECT_FALSE(a.impact_detected);
    EXPECT_EQ(a.path, SwingPath::UNKNOWN);
    EXPECT_EQ(a.type, SwingType::PUTT);
}

TEST(SwingAnalyticsBuilder, CustomSpeedFactors) {
    AnalyticsOptions opts;
    opts.hand_speed_factor = 3.0;
    opts.clubhead_factor = 2.5;
    SwingAnalyticsBuilder b(opts);

    EXPECT_DOUBLE_EQ(b.hand_speed(2.0), 6.0);

    b.begin(0.0);
    b.track_peaks(4.0, 1.0);
    SwingAnalytics a = b.finalize(downswing_window(5), PhaseTimers{});
    EXPECT_DOUBLE_EQ(a.peak_hand_speed, 12.0);
    EXPECT_DOUBLE_EQ(a.estimated_clubhead_speed, 30.0);
}

}  // namespace
}  // namespace swing
