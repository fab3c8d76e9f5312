// ─────────────────────────────────────────────────────────────────────────────
// sample_source.cpp  –  CSV & OpenCV FileStorage Recording Reader
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_source.h"

#include <opencv2/core.hpp>

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace swing {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ─── CSV ────────────────────────────────────────────────────────────────────
bool parse_csv_sample(const std::string& line, MotionSample& out) {
    if (line.empty() || line[0] == '#') return false;

    std::vector<double> v;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        try {
            std::size_t used = 0;
            double x = std::stod(field, &used);
            // Allow trailing whitespace / '\r' only
            if (field.find_first_not_of(" \t\r", used) != std::string::npos) return false;
            v.push_back(x);
        } catch (const std::exception&) {
            return false;
        }
    }

    if (v.size() == 7) {
        out = make_sample(v[0], v[1], v[2], v[3], v[4], v[5], v[6]);
        return true;
    }
    if (v.size() == 5) {
        out = make_sample(v[0], v[1], v[2], v[3], v[4]);
        return true;
    }
    return false;
}

// ─── Open ───────────────────────────────────────────────────────────────────
bool SampleSource::open(const std::string& source) {
    samples_.clear();
    idx_ = 0;
    lines_ = nullptr;
    has_prev_ = false;

    if (source == "-") {
        lines_ = &std::cin;
        std::cout << "[SampleSource] Reading CSV samples from stdin\n";
        return true;
    }

    if (ends_with(source, ".csv")) {
        if (file_.is_open()) file_.close();
        file_.clear();
        file_.open(source);
        if (!file_.is_open()) {
            std::cerr << "[SampleSource] Cannot open " << source << "\n";
            return false;
        }
        lines_ = &file_;
        std::cout << "[SampleSource] Opened CSV " << source << "\n";
        return true;
    }

    return load_file_storage(source);
}

bool SampleSource::load_file_storage(const std::string& path) {
    try {
        cv::FileStorage fs(path, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            std::cerr << "[SampleSource] Cannot open " << path << "\n";
            return false;
        }

        cv::FileNode seq = fs["samples"];
        if (!seq.isSeq()) {
            std::cerr << "[SampleSource] " << path << ": 'samples' must be a sequence\n";
            return false;
        }

        samples_.reserve(seq.size());
        int skipped = 0;
        for (const auto& node : seq) {
            if (!node.isMap() || node["t"].empty() || node["gyro"].size() != 3) {
                skipped++;
                continue;
            }
            double t = static_cast<double>(node["t"]);
            cv::FileNode g = node["gyro"];
            double gx = static_cast<double>(g[0]);
            double gy = static_cast<double>(g[1]);
            double gz = static_cast<double>(g[2]);

            cv::FileNode a = node["accel"];
            if (a.isSeq() && a.size() == 3) {
                samples_.push_back(make_sample(t,
                    static_cast<double>(a[0]), static_cast<double>(a[1]),
                    static_cast<double>(a[2]), gx, gy, gz));
            } else if (!node["accel_mag"].empty()) {
                samples_.push_back(make_sample(t,
                    static_cast<double>(node["accel_mag"]), gx, gy, gz));
            } else {
                skipped++;
            }
        }

        if (skipped > 0) {
            std::cerr << "[SampleSource] Skipped " << skipped
                      << " malformed entries in " << path << "\n";
        }
        std::cout << "[SampleSource] Loaded " << samples_.size()
                  << " samples from " << path << "\n";
        return true;
    } catch (const cv::Exception& e) {
        std::cerr << "[SampleSource] Failed to parse " << path << ": " << e.what() << "\n";
        return false;
    }
}

// ─── Read ───────────────────────────────────────────────────────────────────
bool SampleSource::read(MotionSample& sample) {
    bool ok = false;
    if (lines_) {
        ok = read_line_sample(sample);
    } else if (idx_ < samples_.size()) {
        sample = samples_[idx_++];
        ok = true;
    }

    if (ok && realtime_) pace(sample.timestamp);
    return ok;
}

bool SampleSource::read_line_sample(MotionSample& sample) {
    std::string line;
    while (std::getline(*lines_, line)) {
        if (parse_csv_sample(line, sample)) return true;
    }
    return false;
}

void SampleSource::pace(double t) {
    if (has_prev_) {
        double dt = t - prev_t_;
        if (dt > 0.0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(dt));
        }
    }
    prev_t_ = t;
    has_prev_ = true;
}

}  // namespace swing
