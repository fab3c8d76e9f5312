// ─────────────────────────────────────────────────────────────────────────────
// config.cpp  –  Config File Loader (OpenCV FileStorage)
// ─────────────────────────────────────────────────────────────────────────────

#include "config.h"

#include <opencv2/core.hpp>

#include <algorithm>
#include <iostream>

namespace swing {

static void read_double(const cv::FileNode& root, const char* key, double& out) {
    cv::FileNode n = root[key];
    if (!n.empty() && n.isReal()) out = static_cast<double>(n);
    else if (!n.empty() && n.isInt()) out = static_cast<int>(n);
}

static bool read_count(const cv::FileNode& root, const char* key, std::size_t& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return true;
    if (!n.isInt() || static_cast<int>(n) < 0) {
        std::cerr << "[Config] '" << key << "' must be a non-negative integer\n";
        return false;
    }
    out = static_cast<std::size_t>(static_cast<int>(n));
    return true;
}

static bool read_port(const cv::FileNode& root, const char* key, uint16_t& out) {
    cv::FileNode n = root[key];
    if (n.empty()) return true;
    int v = n.isInt() ? static_cast<int>(n) : -1;
    if (v <= 0 || v > 65535) {
        std::cerr << "[Config] '" << key << "' must be a port number\n";
        return false;
    }
    out = static_cast<uint16_t>(v);
    return true;
}

static void read_flag(const cv::FileNode& root, const char* key, bool& out) {
    cv::FileNode n = root[key];
    if (!n.empty() && n.isInt()) out = static_cast<int>(n) != 0;
}

static void read_string(const cv::FileNode& root, const char* key, std::string& out) {
    cv::FileNode n = root[key];
    if (!n.empty() && n.isString()) out = static_cast<std::string>(n);
}

bool load_config_file(const std::string& path, AppConfig& cfg) {
    AppConfig next = cfg;
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[Config] Cannot open " << path << "\n";
            return false;
        }
        cv::FileNode root = fs.root();

        DetectorConfig& d = next.detector;
        read_double(root, "sensitivity", d.sensitivity);
        read_double(root, "hand_speed_factor", d.hand_speed_factor);
        read_double(root, "clubhead_factor", d.clubhead_factor);
        if (!read_count(root, "buffer_capacity", d.buffer_capacity) ||
            !read_count(root, "retained_samples", d.retained_samples) ||
            !read_count(root, "session_window", d.session_window)) {
            return false;
        }
        if (d.buffer_capacity == 0) {
            std::cerr << "[Config] 'buffer_capacity' must be positive\n";
            return false;
        }

        read_string(root, "source", next.source);
        read_string(root, "telemetry_host", next.telemetry_host);
        if (!read_port(root, "telemetry_port", next.telemetry_port) ||
            !read_port(root, "api_port", next.api_port)) {
            return false;
        }
        read_flag(root, "gui", next.show_gui);
        read_flag(root, "realtime", next.realtime);
        read_flag(root, "practice_mode", next.practice_mode);
        read_flag(root, "verbose", d.log_events);
    } catch (const cv::Exception& e) {
        std::cerr << "[Config] Failed to parse " << path << ": " << e.what() << "\n";
        return false;
    }

    if (next.detector.sensitivity < kMinSensitivity ||
        next.detector.sensitivity > kMaxSensitivity) {
        std::cerr << "[Config] Sensitivity " << next.detector.sensitivity
                  << " out of range [" << kMinSensitivity << ", "
                  << kMaxSensitivity << "], clamping\n";
        next.detector.sensitivity = std::clamp(next.detector.sensitivity,
                                               kMinSensitivity, kMaxSensitivity);
    }

    cfg = next;
    std::cout << "[Config] Loaded " << path << "\n";
    return true;
}

}  // namespace swing
