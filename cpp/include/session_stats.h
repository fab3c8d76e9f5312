#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// session_stats.h  –  Rolling Statistics Across Completed Swings
//
// Averages run over the whole session; spread (and therefore consistency)
// is measured over a bounded window of the most recent swings so memory
// stays constant however long the session runs.
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_types.h"

#include <cstddef>
#include <deque>

namespace swing {

struct SessionSummary {
    int    total_swings       = 0;
    double average_tempo      = 0.0;
    double average_hand_speed = 0.0;   // mph
    double tempo_std_dev      = 0.0;   // recent window
    double speed_std_dev      = 0.0;   // recent window
    int    consistency_score  = 0;     // 0-100
};

class SessionStats {
public:
    /// @param window  number of recent swings used for the spread metrics
    explicit SessionStats(std::size_t window = 20);

    void add_swing(const SwingAnalytics& analytics);
    void reset();

    SessionSummary summary() const { return summary_; }

private:
    void push_bounded(std::deque<double>& values, double v);
    void recompute_consistency();

    std::size_t window_;

    SessionSummary summary_;

    double tempo_sum_ = 0.0;
    int    tempo_count_ = 0;
    double speed_sum_ = 0.0;
    int    speed_count_ = 0;

    std::deque<double> recent_tempo_;
    std::deque<double> recent_speed_;
};

}  // namespace swing
