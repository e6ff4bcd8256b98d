#pragma once

#include "fallwatch/frame_types.hpp"

namespace fallwatch {

// Angle of the p1 -> p2 vector from the vertical axis, folded into [0, 90].
double angle_from_vertical_deg(const cv::Point2f& p1, const cv::Point2f& p2);

// Width / height of the bounding box over detected keypoints (x > 0).
// 0 for fewer than kNumKeypoints points, no detected point, or a flat box.
double keypoint_aspect_ratio(const KeypointSet& keypoints);

class FeatureExtractor {
public:
    // Empty result when keypoints are absent or incomplete.
    RawFeatures extract(const std::optional<KeypointSet>& keypoints) const;
    RawFeatures extract(const KeypointSet& keypoints) const;
};

}  // namespace fallwatch
