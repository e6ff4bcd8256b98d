#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace fallwatch {

// COCO 17-point layout
constexpr int kNumKeypoints = 17;
constexpr int kLeftShoulder = 5;
constexpr int kRightShoulder = 6;
constexpr int kLeftHip = 11;
constexpr int kRightHip = 12;
constexpr int kLeftKnee = 13;
constexpr int kRightKnee = 14;

// A point with x <= 0 is undetected.
using KeypointSet = std::vector<cv::Point2f>;

struct Frame {
    cv::Mat image;                 // BGR image
    double timestamp_sec{0.0};     // frame_index / fps
    uint64_t index{0};
};

struct PoseResult {
    std::optional<KeypointSet> keypoints;  // highest-confidence person only
    std::vector<cv::Rect2f> boxes;         // model score order
};

struct RawFeatures {
    std::optional<double> torso_angle;
    std::optional<double> hip_y;
    std::optional<double> aspect_ratio;
    std::optional<double> hip_knee_diff;

    bool empty() const {
        return !torso_angle && !hip_y && !aspect_ratio && !hip_knee_diff;
    }
};

struct FrameFeatures {
    RawFeatures raw;
    std::optional<double> torso_angle_smooth;
    std::optional<double> aspect_ratio_smooth;
    std::optional<double> vertical_speed;
};

struct DetectionResult {
    bool fall_detected{false};
    double confidence{0.0};
    int criteria_met{0};
    std::string timestamp;         // local wall clock, %Y-%m-%d %H:%M:%S
    double timestamp_sec{0.0};
    FrameFeatures features;
    std::optional<KeypointSet> keypoints;
    std::vector<cv::Rect2f> boxes;
};

}  // namespace fallwatch
