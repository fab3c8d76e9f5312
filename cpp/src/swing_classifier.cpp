// ─────────────────────────────────────────────────────────────────────────────
// swing_classifier.cpp  –  Path & Type Classification
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_classifier.h"

#include <numeric>

namespace swing {

SwingPath classify_path(const SampleBuffer& buffer) {
    if (buffer.size() < kPathMinSamples) return SwingPath::UNKNOWN;

    auto xs = buffer.last(Channel::ROTATION_X, kPathWindow);
    double avg = std::accumulate(xs.begin(), xs.end(), 0.0) /
                 static_cast<double>(xs.size());

    // Positive x rotation = club coming from the inside
    if (avg > kPathBiasThreshold)  return SwingPath::INSIDE_OUT;
    if (avg < -kPathBiasThreshold) return SwingPath::OVER_THE_TOP;
    return SwingPath::NEUTRAL;
}

SwingType classify_type(double peak, double tempo) {
    if (peak > 10.0 && tempo > 2.0) return SwingType::FULL_SWING;
    if (peak > 6.0 && tempo > 2.0)  return SwingType::IRON_SWING;
    if (peak > 3.0 && peak <= 6.0)  return SwingType::CHIP_OR_PITCH;
    if (peak <= 3.0)                return SwingType::PUTT;
    return SwingType::UNKNOWN;
}

}  // namespace swing
