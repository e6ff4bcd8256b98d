#include "fallwatch/feature_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace fallwatch {

namespace {
constexpr double kPi = 3.14159265358979323846;

cv::Point2f midpoint(const cv::Point2f& a, const cv::Point2f& b) {
    return cv::Point2f((a.x + b.x) / 2.0f, (a.y + b.y) / 2.0f);
}
}  // namespace

double angle_from_vertical_deg(const cv::Point2f& p1, const cv::Point2f& p2) {
    double vx = static_cast<double>(p2.x) - p1.x;
    double vy = static_cast<double>(p2.y) - p1.y;
    const double norm = std::max(1e-6, std::sqrt(vx * vx + vy * vy));
    vx /= norm;
    vy /= norm;
    const double ang_h = std::abs(std::atan2(vy, vx) * 180.0 / kPi);
    return 90.0 - std::min(ang_h, 180.0 - ang_h);
}

double keypoint_aspect_ratio(const KeypointSet& keypoints) {
    if (keypoints.size() < static_cast<size_t>(kNumKeypoints)) return 0.0;

    float min_x = std::numeric_limits<float>::max();
    float max_x = std::numeric_limits<float>::lowest();
    float min_y = std::numeric_limits<float>::max();
    float max_y = std::numeric_limits<float>::lowest();
    int valid = 0;
    for (const auto& kp : keypoints) {
        if (kp.x <= 0.0f) continue;
        min_x = std::min(min_x, kp.x);
        max_x = std::max(max_x, kp.x);
        min_y = std::min(min_y, kp.y);
        max_y = std::max(max_y, kp.y);
        valid++;
    }
    if (valid == 0) return 0.0;

    const double width = static_cast<double>(max_x) - min_x;
    const double height = static_cast<double>(max_y) - min_y;
    if (height < 1e-6) return 0.0;
    return width / height;
}

RawFeatures FeatureExtractor::extract(const std::optional<KeypointSet>& keypoints) const {
    if (!keypoints) return RawFeatures{};
    return extract(*keypoints);
}

RawFeatures FeatureExtractor::extract(const KeypointSet& kps) const {
    RawFeatures f;
    if (kps.size() < static_cast<size_t>(kNumKeypoints)) return f;

    const cv::Point2f shoulder = midpoint(kps[kLeftShoulder], kps[kRightShoulder]);
    const cv::Point2f hip = midpoint(kps[kLeftHip], kps[kRightHip]);
    const double knee_y = (static_cast<double>(kps[kLeftKnee].y) + kps[kRightKnee].y) / 2.0;

    f.torso_angle = angle_from_vertical_deg(hip, shoulder);
    f.hip_y = hip.y;
    f.aspect_ratio = keypoint_aspect_ratio(kps);
    f.hip_knee_diff = knee_y - hip.y;  // positive while hips sit above knees
    return f;
}

}  // namespace fallwatch
