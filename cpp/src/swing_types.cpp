// ─────────────────────────────────────────────────────────────────────────────
// swing_types.cpp  –  Names & Tempo Rating
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_types.h"

namespace swing {

const char* to_string(SwingPhase phase) {
    switch (phase) {
        case SwingPhase::IDLE:           return "idle";
        case SwingPhase::ADDRESS:        return "address";
        case SwingPhase::BACKSWING:      return "backswing";
        case SwingPhase::TOP_OF_SWING:   return "top_of_swing";
        case SwingPhase::TRANSITION:     return "transition";
        case SwingPhase::DOWNSWING:      return "downswing";
        case SwingPhase::IMPACT:         return "impact";
        case SwingPhase::FOLLOW_THROUGH: return "follow_through";
        case SwingPhase::FINISHED:       return "finished";
    }
    return "unknown";
}

const char* to_string(SwingPath path) {
    switch (path) {
        case SwingPath::INSIDE_OUT:   return "inside_out";
        case SwingPath::NEUTRAL:      return "neutral";
        case SwingPath::OVER_THE_TOP: return "over_the_top";
        case SwingPath::UNKNOWN:      return "unknown";
    }
    return "unknown";
}

const char* to_string(SwingType type) {
    switch (type) {
        case SwingType::FULL_SWING:    return "full_swing";
        case SwingType::IRON_SWING:    return "iron_swing";
        case SwingType::CHIP_OR_PITCH: return "chip_or_pitch";
        case SwingType::PUTT:          return "putt";
        case SwingType::UNKNOWN:       return "unknown";
    }
    return "unknown";
}

const char* to_string(TempoRating rating) {
    switch (rating) {
        case TempoRating::EXCELLENT:  return "excellent";
        case TempoRating::GOOD:       return "good";
        case TempoRating::NEEDS_WORK: return "needs_work";
        case TempoRating::POOR:       return "poor";
    }
    return "poor";
}

TempoRating rate_tempo(double r) {
    if (r >= 2.5 && r < 3.5) return TempoRating::EXCELLENT;
    if ((r >= 2.0 && r < 2.5) || (r >= 3.5 && r < 4.0)) return TempoRating::GOOD;
    if ((r >= 1.5 && r < 2.0) || (r >= 4.0 && r < 4.5)) return TempoRating::NEEDS_WORK;
    return TempoRating::POOR;
}

}  // namespace swing
