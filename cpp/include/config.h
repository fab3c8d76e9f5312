#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// config.h  –  Application Configuration
//
// Defaults, overridden by an optional config file (any format OpenCV
// FileStorage reads: YAML / JSON / XML), then by command-line flags.
//
// Recognised keys (all optional):
//   sensitivity, buffer_capacity, retained_samples, session_window,
//   hand_speed_factor, clubhead_factor, source, telemetry_host,
//   telemetry_port, api_port, gui, realtime, practice_mode, verbose
// Flags are integers (0 / 1); FileStorage has no boolean type.
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_detector.h"

#include <cstdint>
#include <string>

namespace swing {

struct AppConfig {
    DetectorConfig detector;

    std::string source         = "-";          // "-" = CSV on stdin
    std::string telemetry_host = "127.0.0.1";
    uint16_t    telemetry_port = 7001;
    uint16_t    api_port       = 8080;
    bool        show_gui       = false;
    bool        realtime       = false;
    bool        practice_mode  = false;
};

/// Merge values from @p path into @p cfg.  Returns false (cfg untouched)
/// when the file cannot be opened or parsed, or holds an invalid value.
bool load_config_file(const std::string& path, AppConfig& cfg);

}  // namespace swing
