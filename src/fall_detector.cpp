#include "fallwatch/fall_detector.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fallwatch {

namespace {
DetectorConfig validated(const DetectorConfig& cfg) {
    if (cfg.conf_threshold < 0.0f || cfg.conf_threshold > 1.0f) {
        throw std::invalid_argument("conf_threshold must be within [0, 1]");
    }
    if (cfg.cooldown_seconds < 0.0) {
        throw std::invalid_argument("cooldown_seconds must be non-negative");
    }
    if (cfg.smoothing_window == 0) {
        throw std::invalid_argument("smoothing_window must be at least 1");
    }
    return cfg;
}
}  // namespace

double wall_clock_seconds() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

std::string local_timestamp() {
    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf);
}

FallDetector::FallDetector(PoseEstimator& estimator, const DetectorConfig& cfg, Clock clock)
    : estimator_(estimator),
      cfg_(validated(cfg)),
      clock_(clock ? std::move(clock) : Clock(wall_clock_seconds)),
      sensitivity_(parse_sensitivity(cfg_.sensitivity)),
      smoother_(cfg_.smoothing_window),
      state_(thresholds_for(sensitivity_), cfg_.cooldown_seconds, clock_()) {}

DetectionResult FallDetector::empty_result(double now) const {
    DetectionResult res;
    res.timestamp = local_timestamp();
    res.timestamp_sec = now;
    return res;
}

DetectionResult FallDetector::process(const cv::Mat& frame) {
    const double now = clock_();
    if (frame.empty()) return empty_result(now);

    PoseResult pose;
    try {
        pose = estimator_.estimate(frame, cfg_.conf_threshold);
    } catch (const std::exception& e) {
        std::cerr << "[WARN] Pose estimation failed: " << e.what() << std::endl;
        return empty_result(now);
    }
    return evaluate(pose, now);
}

DetectionResult FallDetector::evaluate(const PoseResult& pose, double now) {
    DetectionResult res = empty_result(now);
    res.boxes = pose.boxes;
    res.keypoints = pose.keypoints;

    FrameFeatures& f = res.features;
    f.raw = extractor_.extract(pose.keypoints);
    if (f.raw.torso_angle) f.torso_angle_smooth = smoother_.smooth_angle(*f.raw.torso_angle);
    if (f.raw.aspect_ratio) f.aspect_ratio_smooth = smoother_.smooth_aspect(*f.raw.aspect_ratio);

    if (!f.raw.hip_y) return res;  // no signal this frame

    FallInputs in;
    in.torso_angle = f.torso_angle_smooth.value_or(f.raw.torso_angle.value_or(90.0));
    in.aspect_ratio = f.aspect_ratio_smooth.value_or(f.raw.aspect_ratio.value_or(0.0));
    in.hip_y = *f.raw.hip_y;

    const FallDecision d = state_.update(in, now);
    f.vertical_speed = d.vertical_speed;
    res.fall_detected = d.fall_detected;
    res.confidence = d.confidence;
    res.criteria_met = d.criteria_met;

    if (cfg_.verbose) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1)
            << "[DEBUG] angle=" << in.torso_angle
            << " aspect=" << std::setprecision(2) << in.aspect_ratio
            << " speed=" << std::setprecision(1) << d.vertical_speed
            << " criteria=" << d.criteria_met << "/3"
            << " conf=" << std::setprecision(2) << d.confidence;
        std::cout << oss.str() << std::endl;
    }
    return res;
}

void FallDetector::reset() {
    smoother_.reset();
    state_.reset(clock_());
}

}  // namespace fallwatch
