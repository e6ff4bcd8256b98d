#pragma once

#include <cstddef>
#include <functional>
#include <string>

#include "fallwatch/fall_state_machine.hpp"
#include "fallwatch/feature_extractor.hpp"
#include "fallwatch/frame_types.hpp"
#include "fallwatch/pose_estimator.hpp"
#include "fallwatch/sensitivity_profile.hpp"
#include "fallwatch/temporal_smoother.hpp"

namespace fallwatch {

// Immutable for the lifetime of a detector.
struct DetectorConfig {
    std::string sensitivity{"medium"};
    float conf_threshold{0.3f};
    double cooldown_seconds{3.0};
    size_t smoothing_window{5};
    bool verbose{false};
};

using Clock = std::function<double()>;

// Seconds since the epoch.
double wall_clock_seconds();

// Local time formatted as %Y-%m-%d %H:%M:%S.
std::string local_timestamp();

// One instance per monitored stream, driven by a single consumer thread.
class FallDetector {
public:
    FallDetector(PoseEstimator& estimator, const DetectorConfig& cfg, Clock clock = wall_clock_seconds);

    // Runs pose estimation on the frame. Estimator failures are logged and
    // yield a default non-fall result.
    DetectionResult process(const cv::Mat& frame);

    // Decision pipeline for an already-estimated pose.
    DetectionResult evaluate(const PoseResult& pose, double now);

    // New stream or new subject.
    void reset();

    Sensitivity sensitivity() const { return sensitivity_; }
    const DetectorConfig& config() const { return cfg_; }
    const FallStateMachine& state() const { return state_; }
    const TemporalSmoother& smoother() const { return smoother_; }

private:
    DetectionResult empty_result(double now) const;

    PoseEstimator& estimator_;
    DetectorConfig cfg_;
    Clock clock_;
    Sensitivity sensitivity_;
    FeatureExtractor extractor_;
    TemporalSmoother smoother_;
    FallStateMachine state_;
};

}  // namespace fallwatch
