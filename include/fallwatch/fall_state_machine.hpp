#pragma once

#include <optional>

#include "fallwatch/sensitivity_profile.hpp"

namespace fallwatch {

struct FallInputs {
    double torso_angle{90.0};   // smoothed, degrees from vertical
    double aspect_ratio{0.0};   // smoothed
    double hip_y{0.0};
};

struct FallDecision {
    bool fall_detected{false};
    double confidence{0.0};
    int criteria_met{0};
    double vertical_speed{0.0};
    bool was_standing{false};
};

// Edge-triggered, refractory fall decision. Every call is an independent
// per-frame decision; a false -> true transition of fall_detected marks an
// incident. Not safe for concurrent use.
class FallStateMachine {
public:
    static constexpr double kStandingAngleDeg = 50.0;
    static constexpr double kStandingGraceSec = 2.0;
    static constexpr double kMinDeltaSec = 1e-3;
    static constexpr double kAngleWeight = 0.35;
    static constexpr double kAspectWeight = 0.35;
    static constexpr double kSpeedWeight = 0.30;

    FallStateMachine(const Thresholds& thresholds, double cooldown_seconds, double start_time);

    FallDecision update(const FallInputs& in, double now);

    // Forget all per-subject history; now becomes the last standing time.
    void reset(double now);

    const Thresholds& thresholds() const { return thresholds_; }
    double cooldown_seconds() const { return cooldown_seconds_; }
    double cooldown_until() const { return cooldown_until_; }
    std::optional<double> fall_start_time() const { return fall_start_time_; }
    double last_standing_time() const { return last_standing_time_; }

private:
    Thresholds thresholds_;
    double cooldown_seconds_;

    std::optional<double> prev_hip_y_;
    std::optional<double> prev_time_;
    double cooldown_until_{0.0};
    std::optional<double> fall_start_time_;
    double last_standing_time_;
};

}  // namespace fallwatch
