// ─────────────────────────────────────────────────────────────────────────────
// swing_detector.cpp  –  Swing Phase State Machine
// ─────────────────────────────────────────────────────────────────────────────

#include "swing_detector.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <utility>

namespace swing {

// Address: wrist held still before the takeaway
static constexpr double kAddressMaxAccel      = 0.5;   // G
static constexpr double kAddressMaxRotation   = 1.0;   // rad/s
static constexpr double kAddressHoldTime      = 0.5;   // s
static constexpr double kAddressTimeout       = 3.0;   // s

static constexpr double kBackswingMinRotation = 2.0;   // rad/s
static constexpr double kTopMaxAccel          = 2.0;   // G
static constexpr double kFinishMaxAccel       = 1.5;   // G

// Timing bounds, independent of sensitivity
static constexpr double kMinBackswing         = 0.3;   // s
static constexpr double kMaxBackswing         = 2.5;   // s
static constexpr double kMinDownswing         = 0.1;   // s
static constexpr double kMaxDownswing         = 0.8;   // s
static constexpr double kTransitionWindow     = 1.0;   // s
static constexpr double kFollowThroughWindow  = 1.0;   // s

static constexpr std::size_t kImpactWindow    = 5;

static AnalyticsOptions analytics_options(const DetectorConfig& cfg) {
    AnalyticsOptions o;
    o.hand_speed_factor = cfg.hand_speed_factor;
    o.clubhead_factor = cfg.clubhead_factor;
    o.retained_samples = std::min(cfg.retained_samples, cfg.buffer_capacity);
    return o;
}

static bool finite_motion(const MotionSample& s) {
    return std::isfinite(s.acceleration) && std::isfinite(s.rotation) &&
           std::isfinite(s.rotation_x) && std::isfinite(s.rotation_y) &&
           std::isfinite(s.rotation_z);
}

static double clamp_sensitivity(double s) {
    if (!std::isfinite(s)) return 1.0;
    return std::clamp(s, kMinSensitivity, kMaxSensitivity);
}

SwingDetector::SwingDetector(const DetectorConfig& cfg)
    : cfg_(cfg),
      buffer_(cfg.buffer_capacity),
      builder_(analytics_options(cfg)),
      session_(cfg.session_window) {
    cfg_.sensitivity = clamp_sensitivity(cfg.sensitivity);
    if (cfg_.sensitivity != cfg.sensitivity) {
        std::cerr << "[SwingDetector] Sensitivity " << cfg.sensitivity
                  << " out of range, using " << cfg_.sensitivity << "\n";
    }
}

// ─── Public API ─────────────────────────────────────────────────────────────
bool SwingDetector::process(const MotionSample& s) {
    std::lock_guard<std::mutex> order(dispatch_mu_);
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mu_);

        if (!std::isfinite(s.timestamp) ||
            (has_last_timestamp_ && s.timestamp < last_timestamp_)) {
            std::cerr << "[SwingDetector] Rejected sample with timestamp "
                      << s.timestamp << " (last " << last_timestamp_ << ")\n";
            return false;
        }
        if (!finite_motion(s)) {
            std::cerr << "[SwingDetector] Rejected non-finite sample at t="
                      << s.timestamp << "\n";
            return false;
        }
        last_timestamp_ = s.timestamp;
        has_last_timestamp_ = true;

        hand_speed_ = builder_.hand_speed(s.acceleration);
        rotation_rate_ = s.rotation;

        buffer_.push(s);
        step(s, events);
    }
    dispatch(events);
    return true;
}

void SwingDetector::reset() {
    std::lock_guard<std::mutex> order(dispatch_mu_);
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mu_);
        reset_locked(last_timestamp_, events);
    }
    dispatch(events);
}

bool SwingDetector::force_complete() {
    std::lock_guard<std::mutex> order(dispatch_mu_);
    EventList events;
    bool produced = false;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (in_progress_ && builder_.active()) {
            transition_to(SwingPhase::FINISHED, last_timestamp_, events);
            complete_swing(last_timestamp_, events);
            produced = true;
        } else {
            reset_locked(last_timestamp_, events);
        }
    }
    dispatch(events);
    return produced;
}

void SwingDetector::reset_session() {
    std::lock_guard<std::mutex> order(dispatch_mu_);
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mu_);
        reset_session_locked(events);
    }
    dispatch(events);
}

void SwingDetector::set_practice_mode(bool enabled) {
    std::lock_guard<std::mutex> order(dispatch_mu_);
    EventList events;
    {
        std::lock_guard<std::mutex> lock(mu_);
        practice_mode_ = enabled;
        reset_session_locked(events);
    }
    dispatch(events);
}

void SwingDetector::set_sensitivity(double sensitivity) {
    std::lock_guard<std::mutex> lock(mu_);
    double clamped = clamp_sensitivity(sensitivity);
    if (clamped != sensitivity) {
        std::cerr << "[SwingDetector] Sensitivity " << sensitivity
                  << " out of range, using " << clamped << "\n";
    }
    cfg_.sensitivity = clamped;
}

void SwingDetector::set_event_handler(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mu_);
    handler_ = std::move(handler);
}

DetectorSnapshot SwingDetector::snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    DetectorSnapshot snap;
    snap.phase = phase_;
    snap.swing_in_progress = in_progress_;
    snap.last_swing = last_swing_;
    snap.session = session_.summary();
    snap.hand_speed = hand_speed_;
    snap.rotation_rate = rotation_rate_;
    snap.sensitivity = cfg_.sensitivity;
    snap.practice_mode = practice_mode_;
    return snap;
}

SwingPhase SwingDetector::phase() const {
    std::lock_guard<std::mutex> lock(mu_);
    return phase_;
}

Thresholds SwingDetector::thresholds() const {
    std::lock_guard<std::mutex> lock(mu_);
    return thresholds_locked();
}

// ─── Phase Processing ───────────────────────────────────────────────────────
void SwingDetector::step(const MotionSample& s, EventList& events) {
    switch (phase_) {
        case SwingPhase::IDLE:
            detect_address(s, events);
            break;
        case SwingPhase::ADDRESS:
            detect_backswing_start(s, events);
            break;
        case SwingPhase::BACKSWING:
            detect_top_of_swing(s, events);
            break;
        case SwingPhase::TOP_OF_SWING:
        case SwingPhase::TRANSITION:
            detect_downswing_start(s, events);
            break;
        case SwingPhase::DOWNSWING:
            detect_impact(s, events);
            break;
        case SwingPhase::IMPACT:
            transition_to(SwingPhase::FOLLOW_THROUGH, s.timestamp, events);
            break;
        case SwingPhase::FOLLOW_THROUGH:
            detect_swing_end(s, events);
            break;
        case SwingPhase::FINISHED:
            complete_swing(s.timestamp, events);
            break;
    }
}

void SwingDetector::detect_address(const MotionSample& s, EventList& events) {
    const Thresholds th = thresholds_locked();

    // Fast start straight from idle, address skipped
    if (s.acceleration > th.backswing_start && s.rotation > kBackswingMinRotation) {
        begin_backswing(s.timestamp, events);
        return;
    }

    if (s.acceleration < kAddressMaxAccel && s.rotation < kAddressMaxRotation) {
        if (!timers_.address_start) {
            timers_.address_start = s.timestamp;
        } else if (s.timestamp - *timers_.address_start >= kAddressHoldTime) {
            transition_to(SwingPhase::ADDRESS, s.timestamp, events);
        }
    } else {
        timers_.address_start.reset();
    }
}

void SwingDetector::detect_backswing_start(const MotionSample& s, EventList& events) {
    const Thresholds th = thresholds_locked();

    if (s.acceleration > th.backswing_start && s.rotation > kBackswingMinRotation) {
        begin_backswing(s.timestamp, events);
        return;
    }

    if (s.timestamp - phase_start_ > kAddressTimeout) {
        if (cfg_.log_events) {
            std::cout << "[SwingDetector] Address timed out\n";
        }
        reset_locked(s.timestamp, events);
    }
}

void SwingDetector::detect_top_of_swing(const MotionSample& s, EventList& events) {
    const Thresholds th = thresholds_locked();
    const double elapsed = s.timestamp - timers_.backswing_start.value_or(phase_start_);

    if (elapsed > kMaxBackswing) {
        cancel_swing("backswing too long", s.timestamp, events);
        return;
    }

    // Club decelerates and stops rotating at the top
    if (elapsed >= kMinBackswing &&
        s.rotation < th.top_of_swing && s.acceleration < kTopMaxAccel) {
        timers_.top_of_swing = s.timestamp;
        builder_.set_backswing_duration(elapsed);
        transition_to(SwingPhase::TOP_OF_SWING, s.timestamp, events);
    }
}

void SwingDetector::detect_downswing_start(const MotionSample& s, EventList& events) {
    const Thresholds th = thresholds_locked();

    if (s.acceleration > th.downswing_start) {
        timers_.downswing_start = s.timestamp;
        builder_.track_peaks(s.acceleration, s.rotation);
        transition_to(SwingPhase::DOWNSWING, s.timestamp, events);
        return;
    }

    if (s.timestamp - timers_.top_of_swing.value_or(phase_start_) > kTransitionWindow) {
        cancel_swing("transition too slow", s.timestamp, events);
    }
}

void SwingDetector::detect_impact(const MotionSample& s, EventList& events) {
    const double elapsed = s.timestamp - timers_.downswing_start.value_or(phase_start_);

    builder_.track_peaks(s.acceleration, s.rotation);

    double deceleration = 0.0;
    if (elapsed >= kMinDownswing && impact_signature(deceleration)) {
        builder_.record_impact(deceleration);
        builder_.set_downswing_duration(elapsed);
        timers_.impact = s.timestamp;
        enter_impact(s.timestamp, events);
        return;
    }

    // Missed the impact signature; the swing still completes without it
    if (elapsed > kMaxDownswing) {
        builder_.set_downswing_duration(elapsed);
        enter_impact(s.timestamp, events);
    }
}

void SwingDetector::detect_swing_end(const MotionSample& s, EventList& events) {
    const bool settled = s.acceleration < kFinishMaxAccel;
    const bool timed_out = s.timestamp - phase_start_ > kFollowThroughWindow;
    if (settled || timed_out) {
        transition_to(SwingPhase::FINISHED, s.timestamp, events);
        complete_swing(s.timestamp, events);
    }
}

// Sharp spike followed by a rapid drop within the last few samples.
bool SwingDetector::impact_signature(double& deceleration) const {
    auto recent = buffer_.last(Channel::ACCELERATION, kImpactWindow);
    if (recent.size() < kImpactWindow) return false;

    const Thresholds th = thresholds_locked();
    double peak = *std::max_element(recent.begin(), recent.end());
    double current = recent.back();
    double decel = peak - current;

    if (peak > th.impact && decel > th.impact_deceleration) {
        deceleration = decel;
        return true;
    }
    return false;
}

// ─── Transitions ────────────────────────────────────────────────────────────
void SwingDetector::begin_backswing(double t, EventList& events) {
    timers_.backswing_start = t;
    in_progress_ = true;
    builder_.begin(t);
    transition_to(SwingPhase::BACKSWING, t, events);
}

void SwingDetector::enter_impact(double t, EventList& events) {
    transition_to(SwingPhase::IMPACT, t, events);
    // Impact is a bookkeeping phase; follow-through starts immediately
    transition_to(SwingPhase::FOLLOW_THROUGH, t, events);
}

void SwingDetector::transition_to(SwingPhase next, double t, EventList& events) {
    SwingPhase prev = phase_;
    phase_ = next;
    phase_start_ = t;

    if (prev != next) {
        events.push_back(PhaseChanged{next, t});
        if (cfg_.log_events) {
            std::cout << "[SwingDetector] Phase: " << to_string(prev)
                      << " -> " << to_string(next) << "\n";
        }
    }
}

void SwingDetector::complete_swing(double t, EventList& events) {
    if (!builder_.active()) {
        reset_locked(t, events);
        return;
    }

    SwingAnalytics a = builder_.finalize(buffer_, timers_);
    session_.add_swing(a);
    last_swing_ = a;

    if (cfg_.log_events) {
        char line[160];
        std::snprintf(line, sizeof(line),
            "[SwingDetector] Swing complete: tempo %.1f:1, speed %.0f mph, "
            "type %s, path %s, impact %s\n",
            a.tempo_ratio(), a.peak_hand_speed, to_string(a.type),
            to_string(a.path), a.impact_detected ? "yes" : "no");
        std::cout << line;
    }

    events.push_back(SwingCompleted{std::move(a)});
    reset_locked(t, events);
}

void SwingDetector::cancel_swing(const std::string& reason, double t,
                                 EventList& events) {
    if (cfg_.log_events) {
        std::cout << "[SwingDetector] Swing cancelled: " << reason << "\n";
    }
    reset_locked(t, events);
}

void SwingDetector::reset_session_locked(EventList& events) {
    session_.reset();
    last_swing_.reset();
    reset_locked(last_timestamp_, events);
}

void SwingDetector::reset_locked(double t, EventList& events) {
    transition_to(SwingPhase::IDLE, t, events);
    in_progress_ = false;
    buffer_.clear();
    timers_ = PhaseTimers{};
    builder_.clear();
}

// ─── Helpers ────────────────────────────────────────────────────────────────
Thresholds SwingDetector::thresholds_locked() const {
    const double k = cfg_.sensitivity;
    return Thresholds{
        cfg_.backswing_start_threshold * k,
        cfg_.top_of_swing_threshold * k,
        cfg_.downswing_start_threshold * k,
        cfg_.impact_threshold * k,
        cfg_.impact_deceleration_threshold * k,
    };
}

void SwingDetector::dispatch(const EventList& events) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mu_);
        handler = handler_;
    }
    if (!handler) return;
    for (const auto& e : events) handler(e);
}

}  // namespace swing
