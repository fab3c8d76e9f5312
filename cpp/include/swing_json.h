#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_json.h  –  JSON Encoding of Detector State
//
// Shared by the REST API and the UDP telemetry sender.  Raw sample tails are
// not included; they stay with the in-process record.
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_detector.h"

#include <string>

namespace swing {

std::string analytics_json(const SwingAnalytics& a);
std::string session_json(const SessionSummary& s);

/// Phase, in-progress flag and live readouts.
std::string live_json(const DetectorSnapshot& snap);

/// {"event":"phase_changed",...} or {"event":"swing_completed",...}
std::string event_json(const SwingEvent& ev);

}  // namespace swing
