// ─────────────────────────────────────────────────────────────────────────────
// session_stats.cpp  –  Session Averages & Consistency Score
// ─────────────────────────────────────────────────────────────────────────────

#include "session_stats.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace swing {

static constexpr int kMinSwingsForConsistency = 3;

// Sample standard deviation; 0 for fewer than two values.
static double std_dev(const std::deque<double>& v) {
    if (v.size() < 2) return 0.0;
    double mean = std::accumulate(v.begin(), v.end(), 0.0) / v.size();
    double sq = 0.0;
    for (double x : v) sq += (x - mean) * (x - mean);
    return std::sqrt(sq / static_cast<double>(v.size() - 1));
}

SessionStats::SessionStats(std::size_t window)
    : window_(std::max<std::size_t>(window, 2)) {}

void SessionStats::add_swing(const SwingAnalytics& a) {
    summary_.total_swings++;

    double tempo = a.tempo_ratio();
    if (tempo > 0.0) {
        tempo_sum_ += tempo;
        tempo_count_++;
        summary_.average_tempo = tempo_sum_ / tempo_count_;
        push_bounded(recent_tempo_, tempo);
    }

    if (a.peak_hand_speed > 0.0) {
        speed_sum_ += a.peak_hand_speed;
        speed_count_++;
        summary_.average_hand_speed = speed_sum_ / speed_count_;
        push_bounded(recent_speed_, a.peak_hand_speed);
    }

    recompute_consistency();
}

void SessionStats::reset() {
    summary_ = SessionSummary{};
    tempo_sum_ = 0.0;
    tempo_count_ = 0;
    speed_sum_ = 0.0;
    speed_count_ = 0;
    recent_tempo_.clear();
    recent_speed_.clear();
}

void SessionStats::push_bounded(std::deque<double>& values, double v) {
    values.push_back(v);
    if (values.size() > window_) values.pop_front();
}

void SessionStats::recompute_consistency() {
    summary_.tempo_std_dev = std_dev(recent_tempo_);
    summary_.speed_std_dev = std_dev(recent_speed_);

    if (summary_.total_swings < kMinSwingsForConsistency) {
        summary_.consistency_score = 0;
        return;
    }

    // A tempo spread of 2.0 or a speed spread of 20 mph zeroes its half.
    double tempo_score = std::max(0.0, 100.0 - summary_.tempo_std_dev * 50.0);
    double speed_score = std::max(0.0, 100.0 - summary_.speed_std_dev * 5.0);
    double score = (tempo_score + speed_score) / 2.0;
    summary_.consistency_score = static_cast<int>(std::clamp(score, 0.0, 100.0));
}

}  // namespace swing
