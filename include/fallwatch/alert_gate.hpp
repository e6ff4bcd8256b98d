#pragma once

#include <cstdint>

namespace fallwatch {

// Passes only the false -> true edge of a per-frame fall flag.
class AlertGate {
public:
    bool update(bool fall_detected) {
        const bool rising = fall_detected && !last_;
        last_ = fall_detected;
        if (rising) incidents_++;
        return rising;
    }

    void reset() { last_ = false; }

    uint64_t incidents() const { return incidents_; }

private:
    bool last_{false};
    uint64_t incidents_{0};
};

}  // namespace fallwatch
