// ─────────────────────────────────────────────────────────────────────────────
// sample_buffer.cpp  –  Ring Buffer for Reduced Motion Samples
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_buffer.h"

#include <algorithm>

namespace swing {

SampleBuffer::SampleBuffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)),
      accel_(capacity_),
      rotation_(capacity_),
      rot_x_(capacity_),
      rot_y_(capacity_),
      rot_z_(capacity_),
      timestamp_(capacity_) {}

void SampleBuffer::push(const MotionSample& s) {
    accel_[head_]     = s.acceleration;
    rotation_[head_]  = s.rotation;
    rot_x_[head_]     = s.rotation_x;
    rot_y_[head_]     = s.rotation_y;
    rot_z_[head_]     = s.rotation_z;
    timestamp_[head_] = s.timestamp;

    head_ = (head_ + 1) % capacity_;
    if (size_ < capacity_) ++size_;
}

void SampleBuffer::clear() {
    head_ = 0;
    size_ = 0;
}

std::vector<double> SampleBuffer::last(Channel ch, std::size_t n) const {
    const auto& col = column(ch);
    const std::size_t count = std::min(n, size_);

    std::vector<double> out;
    out.reserve(count);
    for (std::size_t i = size_ - count; i < size_; ++i) {
        out.push_back(col[index_from_oldest(i)]);
    }
    return out;
}

double SampleBuffer::newest(Channel ch) const {
    if (size_ == 0) return 0.0;
    return column(ch)[index_from_oldest(size_ - 1)];
}

// ─── Helpers ────────────────────────────────────────────────────────────────
const std::vector<double>& SampleBuffer::column(Channel ch) const {
    switch (ch) {
        case Channel::ACCELERATION: return accel_;
        case Channel::ROTATION:     return rotation_;
        case Channel::ROTATION_X:   return rot_x_;
        case Channel::ROTATION_Y:   return rot_y_;
        case Channel::ROTATION_Z:   return rot_z_;
        case Channel::TIMESTAMP:    return timestamp_;
    }
    return accel_;
}

std::size_t SampleBuffer::index_from_oldest(std::size_t i) const {
    // Oldest entry sits at head_ once full, at 0 before that.
    const std::size_t oldest = (size_ == capacity_) ? head_ : 0;
    return (oldest + i) % capacity_;
}

}  // namespace swing
