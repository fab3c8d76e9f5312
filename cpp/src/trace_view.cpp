// ─────────────────────────────────────────────────────────────────────────────
// trace_view.cpp  –  OpenCV Motion Trace Plot
// ─────────────────────────────────────────────────────────────────────────────

#include "trace_view.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstdio>
#include <vector>

namespace swing {

static const cv::Scalar kAccelColor(0, 255, 255);     // yellow
static const cv::Scalar kRotationColor(255, 0, 255);  // magenta
static const cv::Scalar kTextColor(255, 255, 255);

// Full-scale values for the plot
static constexpr double kAccelScale    = 12.0;   // G
static constexpr double kRotationScale = 30.0;   // rad/s

static cv::Scalar phase_color(SwingPhase p) {
    switch (p) {
        case SwingPhase::IDLE:           return {40, 40, 40};
        case SwingPhase::ADDRESS:        return {80, 60, 20};
        case SwingPhase::BACKSWING:      return {20, 80, 20};
        case SwingPhase::TOP_OF_SWING:   return {20, 80, 80};
        case SwingPhase::TRANSITION:     return {20, 60, 100};
        case SwingPhase::DOWNSWING:      return {20, 20, 110};
        case SwingPhase::IMPACT:         return {0, 0, 160};
        case SwingPhase::FOLLOW_THROUGH: return {90, 20, 90};
        case SwingPhase::FINISHED:       return {40, 40, 40};
    }
    return {40, 40, 40};
}

TraceView::TraceView(std::size_t history, int width, int height)
    : history_(std::max<std::size_t>(history, 2)), width_(width), height_(height) {}

void TraceView::push(const MotionSample& s, SwingPhase phase) {
    points_.push_back({s.acceleration, s.rotation, phase});
    if (points_.size() > history_) points_.pop_front();
}

void TraceView::render(cv::Mat& canvas, const DetectorSnapshot& snap) const {
    canvas.create(height_, width_, CV_8UC3);
    canvas.setTo(cv::Scalar(15, 15, 15));

    const int plot_top = 60;
    const int plot_h = height_ - plot_top - 20;
    const double dx = static_cast<double>(width_) / (history_ - 1);

    // Phase bands behind the traces
    for (std::size_t i = 0; i < points_.size(); ++i) {
        int x0 = static_cast<int>(i * dx);
        int x1 = static_cast<int>((i + 1) * dx);
        cv::rectangle(canvas, cv::Point(x0, plot_top), cv::Point(x1, plot_top + plot_h),
                      phase_color(points_[i].phase), cv::FILLED);
    }

    auto to_y = [&](double v, double scale) {
        double norm = std::clamp(v / scale, 0.0, 1.0);
        return plot_top + plot_h - static_cast<int>(norm * plot_h);
    };

    std::vector<cv::Point> accel_pts;
    std::vector<cv::Point> rot_pts;
    accel_pts.reserve(points_.size());
    rot_pts.reserve(points_.size());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        int x = static_cast<int>(i * dx);
        accel_pts.emplace_back(x, to_y(points_[i].acceleration, kAccelScale));
        rot_pts.emplace_back(x, to_y(points_[i].rotation, kRotationScale));
    }
    if (accel_pts.size() > 1) {
        cv::polylines(canvas, accel_pts, false, kAccelColor, 2);
        cv::polylines(canvas, rot_pts, false, kRotationColor, 1);
    }

    // Overlay
    char info[160];
    std::snprintf(info, sizeof(info), "Phase: %s  Hand: %.1f mph  Rot: %.1f rad/s  Sens: %.2f%s",
                  to_string(snap.phase), snap.hand_speed, snap.rotation_rate,
                  snap.sensitivity, snap.practice_mode ? "  [practice]" : "");
    cv::putText(canvas, info, cv::Point(10, 22), cv::FONT_HERSHEY_SIMPLEX, 0.55,
                kTextColor, 1);

    if (snap.last_swing) {
        const SwingAnalytics& a = *snap.last_swing;
        std::snprintf(info, sizeof(info),
                      "Last: tempo %.1f:1 (%s)  peak %.1f G  club %.0f mph  %s / %s  impact %s",
                      a.tempo_ratio(), to_string(a.tempo_rating()), a.peak_acceleration,
                      a.estimated_clubhead_speed, to_string(a.type), to_string(a.path),
                      a.impact_detected ? "yes" : "no");
    } else {
        std::snprintf(info, sizeof(info), "Last: --");
    }
    cv::putText(canvas, info, cv::Point(10, 44), cv::FONT_HERSHEY_SIMPLEX, 0.5,
                kAccelColor, 1);

    std::snprintf(info, sizeof(info), "Swings: %d  Avg tempo: %.2f  Consistency: %d",
                  snap.session.total_swings, snap.session.average_tempo,
                  snap.session.consistency_score);
    cv::putText(canvas, info, cv::Point(10, height_ - 5), cv::FONT_HERSHEY_SIMPLEX, 0.45,
                kTextColor, 1);
}

}  // namespace swing
