// ─────────────────────────────────────────────────────────────────────────────
// swing_json.cpp  –  JSON Encoding of Detector State
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_json.h"

#include <cstdio>
#include <type_traits>

namespace swing {

std::string analytics_json(const SwingAnalytics& a) {
    char buf[768];
    std::snprintf(buf, sizeof(buf),
        "{"
            "\"start_time\":%.3f,"
            "\"backswing_duration\":%.3f,"
            "\"downswing_duration\":%.3f,"
            "\"total_duration\":%.3f,"
            "\"tempo_ratio\":%.2f,"
            "\"tempo_rating\":\"%s\","
            "\"peak_acceleration\":%.2f,"
            "\"peak_rotation_rate\":%.2f,"
            "\"impact_detected\":%s,"
            "\"impact_deceleration\":%.2f,"
            "\"peak_hand_speed\":%.1f,"
            "\"estimated_clubhead_speed\":%.1f,"
            "\"swing_path\":\"%s\","
            "\"swing_type\":\"%s\","
            "\"retained_samples\":%zu"
        "}",
        a.start_time,
        a.backswing_duration, a.downswing_duration, a.total_duration,
        a.tempo_ratio(), to_string(a.tempo_rating()),
        a.peak_acceleration, a.peak_rotation_rate,
        a.impact_detected ? "true" : "false", a.impact_deceleration,
        a.peak_hand_speed, a.estimated_clubhead_speed,
        to_string(a.path), to_string(a.type),
        a.acceleration_samples.size());
    return buf;
}

std::string session_json(const SessionSummary& s) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
        "{"
            "\"total_swings\":%d,"
            "\"average_tempo\":%.2f,"
            "\"average_hand_speed\":%.1f,"
            "\"tempo_std_dev\":%.3f,"
            "\"speed_std_dev\":%.2f,"
            "\"consistency_score\":%d"
        "}",
        s.total_swings, s.average_tempo, s.average_hand_speed,
        s.tempo_std_dev, s.speed_std_dev, s.consistency_score);
    return buf;
}

std::string live_json(const DetectorSnapshot& snap) {
    char buf[256];
    std::snprintf(buf, sizeof(buf),
        "{"
            "\"phase\":\"%s\","
            "\"swing_in_progress\":%s,"
            "\"hand_speed\":%.1f,"
            "\"rotation_rate\":%.2f,"
            "\"sensitivity\":%.2f,"
            "\"practice_mode\":%s"
        "}",
        to_string(snap.phase),
        snap.swing_in_progress ? "true" : "false",
        snap.hand_speed, snap.rotation_rate, snap.sensitivity,
        snap.practice_mode ? "true" : "false");
    return buf;
}

std::string event_json(const SwingEvent& ev) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PhaseChanged>) {
            char buf[128];
            std::snprintf(buf, sizeof(buf),
                "{\"event\":\"phase_changed\",\"phase\":\"%s\",\"timestamp\":%.3f}",
                to_string(e.phase), e.timestamp);
            return buf;
        } else {
            return "{\"event\":\"swing_completed\",\"analytics\":" +
                   analytics_json(e.analytics) + "}";
        }
    }, ev);
}

}  // namespace swing
