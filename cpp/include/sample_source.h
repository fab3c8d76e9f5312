#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// sample_source.h  –  Motion Sample Recording Reader
//
// Replays recorded wrist IMU data into the detector.
//
// Sources:
//   "-"        CSV lines on stdin (streamed, e.g. piped from a serial bridge)
//   *.csv      CSV file
//   otherwise  OpenCV FileStorage document (YAML / JSON / XML)
//
// CSV rows:  t,ax,ay,az,gx,gy,gz   or   t,accel,gx,gy,gz
//            '#' comments and a non-numeric header line are skipped.
//
// FileStorage layout:
//   samples:
//     - { t: 0.01, accel: [x, y, z], gyro: [x, y, z] }
//     - { t: 0.02, accel_mag: 1.3,   gyro: [x, y, z] }
// ─────────────────────────────────────────────────────────────────────────────

#include "motion_sample.h"

#include <cstddef>
#include <fstream>
#include <istream>
#include <string>
#include <vector>

namespace swing {

/// Parse one CSV row.  Returns false for blank, comment or malformed lines.
bool parse_csv_sample(const std::string& line, MotionSample& out);

class SampleSource {
public:
    /// Open a recording.  Returns false (and logs) when it cannot be read.
    bool open(const std::string& source);

    /// Next sample.  Returns false when the stream ends.
    bool read(MotionSample& sample);

    /// Sleep so samples are delivered at their recorded spacing.
    void set_realtime(bool realtime) { realtime_ = realtime; }

    /// Samples preloaded from a FileStorage document (0 for streamed input).
    std::size_t preloaded() const { return samples_.size(); }

private:
    bool load_file_storage(const std::string& path);
    bool read_line_sample(MotionSample& sample);
    void pace(double timestamp);

    std::vector<MotionSample> samples_;
    std::size_t idx_ = 0;

    std::ifstream file_;
    std::istream* lines_ = nullptr;

    bool realtime_ = false;
    bool has_prev_ = false;
    double prev_t_ = 0.0;
};

}  // namespace swing
