#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// motion_sample.h  –  Reduced Inertial Sample
//
// One wrist IMU reading reduced to the features the swing detector needs:
// total acceleration, total rotation rate and the per-axis rotation.
// ─────────────────────────────────────────────────────────────────────────────

#include <cmath>

namespace swing {

/// A single reduced motion sample.  Units follow the sensor: acceleration in
/// G (gravity removed), rotation rate in rad/s, timestamp in seconds.
struct MotionSample {
    double timestamp    = 0.0;
    double acceleration = 0.0;   // |a|
    double rotation     = 0.0;   // |ω|
    double rotation_x   = 0.0;
    double rotation_y   = 0.0;
    double rotation_z   = 0.0;
};

/// Build a sample from raw 3-axis user acceleration and rotation rate.
inline MotionSample make_sample(double t,
                                double ax, double ay, double az,
                                double gx, double gy, double gz) {
    MotionSample s;
    s.timestamp    = t;
    s.acceleration = std::sqrt(ax * ax + ay * ay + az * az);
    s.rotation     = std::sqrt(gx * gx + gy * gy + gz * gz);
    s.rotation_x   = gx;
    s.rotation_y   = gy;
    s.rotation_z   = gz;
    return s;
}

/// Build a sample when the source already reduced acceleration to a magnitude.
inline MotionSample make_sample(double t, double accel_magnitude,
                                double gx, double gy, double gz) {
    MotionSample s;
    s.timestamp    = t;
    s.acceleration = accel_magnitude;
    s.rotation     = std::sqrt(gx * gx + gy * gy + gz * gz);
    s.rotation_x   = gx;
    s.rotation_y   = gy;
    s.rotation_z   = gz;
    return s;
}

}  // namespace swing
