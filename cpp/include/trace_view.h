#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// trace_view.h  –  OpenCV Debug Preview of the Motion Trace
//
// Scrolling plot of acceleration and rotation magnitude with the current
// phase, live readouts and the last swing's metrics overlaid.
// ─────────────────────────────────────────────────────────────────────────────

#include "motion_sample.h"
#include "swing_detector.h"

#include <opencv2/core.hpp>

#include <cstddef>
#include <deque>

namespace swing {

class TraceView {
public:
    /// @param history  samples kept on screen
    /// @param width    canvas width (px)
    /// @param height   canvas height (px)
    explicit TraceView(std::size_t history = 300, int width = 900, int height = 420);

    void push(const MotionSample& s, SwingPhase phase);

    /// Render into @p canvas (reallocated to the view size).
    void render(cv::Mat& canvas, const DetectorSnapshot& snap) const;

private:
    struct Point {
        double acceleration;
        double rotation;
        SwingPhase phase;
    };

    std::size_t history_;
    int width_;
    int height_;
    std::deque<Point> points_;
};

}  // namespace swing
