#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_classifier.h  –  Swing Path & Swing Type Labelling
//
// Path comes from the lateral (x-axis) rotation bias in the buffered window;
// type is a decision table over peak G and tempo, first match wins.
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_buffer.h"
#include "swing_types.h"

#include <cstddef>

namespace swing {

constexpr std::size_t kPathMinSamples    = 50;
constexpr std::size_t kPathWindow        = 30;
constexpr double      kPathBiasThreshold = 3.0;   // rad/s

/// Inside-out / over-the-top / neutral from the last kPathWindow x-axis
/// rotation samples.  UNKNOWN when fewer than kPathMinSamples are buffered.
SwingPath classify_path(const SampleBuffer& buffer);

/// Full swing, iron, chip/pitch or putt from peak acceleration (G) and tempo.
SwingType classify_type(double peak_acceleration, double tempo_ratio);

}  // namespace swing
