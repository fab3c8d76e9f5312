#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// sample_buffer.h  –  Fixed-Capacity Sliding Window of Motion Samples
//
// Parallel ring buffers (acceleration, rotation, rotation x/y/z, timestamp).
// Storage is allocated once in the constructor; push() overwrites the oldest
// entry once the window is full.
// ─────────────────────────────────────────────────────────────────────────────

#include "motion_sample.h"

#include <cstddef>
#include <vector>

namespace swing {

enum class Channel { ACCELERATION, ROTATION, ROTATION_X, ROTATION_Y, ROTATION_Z, TIMESTAMP };

class SampleBuffer {
public:
    /// @param capacity  maximum samples kept (300 ≈ 3 s at 100 Hz)
    explicit SampleBuffer(std::size_t capacity = 300);

    /// Append a sample, evicting the oldest one when full.
    void push(const MotionSample& s);

    /// Drop every stored sample.  Capacity is preserved.
    void clear();

    /// Up to the @p n newest values of a channel, oldest first.
    std::vector<double> last(Channel ch, std::size_t n) const;

    /// Newest value of a channel (0 when empty).
    double newest(Channel ch) const;

    std::size_t size() const { return size_; }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return size_ == 0; }

private:
    const std::vector<double>& column(Channel ch) const;
    std::size_t index_from_oldest(std::size_t i) const;

    std::size_t capacity_;
    std::size_t head_ = 0;   // next write position
    std::size_t size_ = 0;

    std::vector<double> accel_;
    std::vector<double> rotation_;
    std::vector<double> rot_x_;
    std::vector<double> rot_y_;
    std::vector<double> rot_z_;
    std::vector<double> timestamp_;
};

}  // namespace swing
