#pragma once

#include <string>

#include <opencv2/core.hpp>

#include "fallwatch/frame_types.hpp"

namespace fallwatch {

// Returns an annotated copy; the input frame is left untouched.
// fall_latched colours the overlay red once any fall has been seen.
cv::Mat draw_detections(const cv::Mat& frame, const DetectionResult& res, bool fall_latched);

// HH:MM:SS.mmm
std::string format_video_time(double seconds);

}  // namespace fallwatch
