#include "fallwatch/fall_state_machine.hpp"

#include <algorithm>
#include <stdexcept>

namespace fallwatch {

FallStateMachine::FallStateMachine(const Thresholds& thresholds, double cooldown_seconds, double start_time)
    : thresholds_(thresholds), cooldown_seconds_(cooldown_seconds), last_standing_time_(start_time) {
    if (cooldown_seconds_ < 0.0) throw std::invalid_argument("cooldown_seconds must be non-negative");
}

FallDecision FallStateMachine::update(const FallInputs& in, double now) {
    FallDecision d;

    if (prev_time_ && prev_hip_y_) {
        const double dt = std::max(kMinDeltaSec, now - *prev_time_);
        d.vertical_speed = (in.hip_y - *prev_hip_y_) / dt;
    }

    // Hysteresis: upright within the grace window still counts as standing.
    d.was_standing = in.torso_angle > kStandingAngleDeg || (now - last_standing_time_) < kStandingGraceSec;
    if (in.torso_angle > kStandingAngleDeg) {
        last_standing_time_ = now;
    }

    if (in.torso_angle < thresholds_.angle_deg) {
        d.criteria_met++;
        d.confidence += kAngleWeight;
    }
    if (in.aspect_ratio > thresholds_.aspect) {
        d.criteria_met++;
        d.confidence += kAspectWeight;
    }
    if (d.vertical_speed > thresholds_.speed) {
        d.criteria_met++;
        d.confidence += kSpeedWeight;
    }
    d.confidence = std::min(1.0, d.confidence);

    if (now >= cooldown_until_ && d.was_standing && d.criteria_met >= 2) {
        d.fall_detected = true;
        cooldown_until_ = std::max(cooldown_until_, now + cooldown_seconds_);
        if (!fall_start_time_) fall_start_time_ = now;
    } else {
        // Also cleared inside an active cooldown window.
        fall_start_time_.reset();
    }

    prev_hip_y_ = in.hip_y;
    prev_time_ = now;
    return d;
}

void FallStateMachine::reset(double now) {
    prev_hip_y_.reset();
    prev_time_.reset();
    cooldown_until_ = 0.0;
    fall_start_time_.reset();
    last_standing_time_ = now;
}

}  // namespace fallwatch
