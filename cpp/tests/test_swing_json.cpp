// ─────────────────────────────────────────────────────────────────────────────
// test_swing_json.cpp  –  JSON Payloads for the API and Telemetry
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_json.h"

#include <gtest/gtest.h>

#include <string>

namespace swing {
namespace {

bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}

SwingAnalytics sample_swing() {
    SwingAnalytics a;
    a.start_time = 12.5;
    a.backswing_duration = 0.9;
    a.downswing_duration = 0.3;
    a.total_duration = 1.2;
    a.peak_acceleration = 11.0;
    a.peak_rotation_rate = 9.25;
    a.impact_detected = true;
    a.impact_deceleration = 7.5;
    a.peak_hand_speed = 24.2;
    a.estimated_clubhead_speed = 96.8;
    a.path = SwingPath::INSIDE_OUT;
    a.type = SwingType::FULL_SWING;
    a.acceleration_samples.assign(42, 1.0);
    a.rotation_samples.assign(42, 2.0);
    return a;
}

TEST(SwingJson, AnalyticsFields) {
    std::string j = analytics_json(sample_swing());
    EXPECT_EQ(j.front(), '{');
    EXPECT_EQ(j.back(), '}');
    EXPECT_TRUE(contains(j, "\"start_time\":12.500"));
    EXPECT_TRUE(contains(j, "\"tempo_ratio\":3.00"));
    EXPECT_TRUE(contains(j, "\"tempo_rating\":\"excellent\""));
    EXPECT_TRUE(contains(j, "\"impact_detected\":true"));
    EXPECT_TRUE(contains(j, "\"peak_hand_speed\":24.2"));
    EXPECT_TRUE(contains(j, "\"estimated_clubhead_speed\":96.8"));
    EXPECT_TRUE(contains(j, "\"swing_path\":\"inside_out\""));
    EXPECT_TRUE(contains(j, "\"swing_type\":\"full_swing\""));
    EXPECT_TRUE(contains(j, "\"retained_samples\":42"));
}

TEST(SwingJson, SessionFields) {
    SessionSummary s;
    s.total_swings = 7;
    s.average_tempo = 2.876;
    s.average_hand_speed = 81.24;
    s.consistency_score = 64;

    std::string j = session_json(s);
    EXPECT_TRUE(contains(j, "\"total_swings\":7"));
    EXPECT_TRUE(contains(j, "\"average_tempo\":2.88"));
    EXPECT_TRUE(contains(j, "\"average_hand_speed\":81.2"));
    EXPECT_TRUE(contains(j, "\"consistency_score\":64"));
}

TEST(SwingJson, LiveFields) {
    DetectorSnapshot snap;
    snap.phase = SwingPhase::DOWNSWING;
    snap.swing_in_progress = true;
    snap.hand_speed = 13.2;
    snap.practice_mode = true;

    std::string j = live_json(snap);
    EXPECT_TRUE(contains(j, "\"phase\":\"downswing\""));
    EXPECT_TRUE(contains(j, "\"swing_in_progress\":true"));
    EXPECT_TRUE(contains(j, "\"hand_speed\":13.2"));
    EXPECT_TRUE(contains(j, "\"practice_mode\":true"));
}

TEST(SwingJson, PhaseChangedEvent) {
    SwingEvent ev = PhaseChanged{SwingPhase::TOP_OF_SWING, 3.25};
    std::string j = event_json(ev);
    EXPECT_EQ(j, "{\"event\":\"phase_changed\",\"phase\":\"top_of_swing\",\"timestamp\":3.250}");
}

TEST(SwingJson, SwingCompletedEventWrapsAnalytics) {
    SwingEvent ev = SwingCompleted{sample_swing()};
    std::string j = event_json(ev);
    EXPECT_EQ(j.rfind("{\"event\":\"swing_completed\",\"analytics\":{", 0), 0u);
    EXPECT_TRUE(contains(j, "\"swing_type\":\"full_swing\""));
    EXPECT_EQ(j.back(), '}');
}

}  // namespace
}  // namespace swing
