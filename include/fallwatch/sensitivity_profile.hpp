#pragma once

#include <string>

namespace fallwatch {

enum class Sensitivity { LOW, MEDIUM, HIGH };

struct Thresholds {
    double angle_deg{35.0};   // torso angle from vertical below which the angle criterion is met
    double speed{30.0};       // px/s downward hip speed
    double aspect{1.3};       // keypoint bbox width / height
};

inline std::string sensitivity_to_string(Sensitivity s) {
    switch (s) {
        case Sensitivity::LOW: return "low";
        case Sensitivity::HIGH: return "high";
        default: return "medium";
    }
}

// Unrecognized names resolve to MEDIUM.
Sensitivity parse_sensitivity(const std::string& name);

Thresholds thresholds_for(Sensitivity s);

inline Thresholds thresholds_for(const std::string& name) {
    return thresholds_for(parse_sensitivity(name));
}

}  // namespace fallwatch
