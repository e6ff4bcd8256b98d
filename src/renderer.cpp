#include "fallwatch/renderer.hpp"

#include <array>
#include <cstdio>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace fallwatch {

namespace {
const std::array<std::pair<int, int>, 16> kSkeleton = {{
    {0, 1}, {0, 2}, {1, 3}, {2, 4},
    {5, 6}, {5, 7}, {7, 9}, {6, 8}, {8, 10},
    {5, 11}, {6, 12}, {11, 12},
    {11, 13}, {13, 15}, {12, 14}, {14, 16},
}};

bool inside(const cv::Point& p, const cv::Mat& frame) {
    return p.x >= 0 && p.x < frame.cols && p.y >= 0 && p.y < frame.rows;
}

cv::Mat overlay_band(const cv::Mat& frame_in, int height, const cv::Scalar& color, double alpha) {
    cv::Mat frame = frame_in.clone();
    cv::Mat overlay = frame.clone();
    cv::rectangle(overlay, cv::Point(0, 0), cv::Point(frame.cols, height), color, cv::FILLED);
    cv::addWeighted(overlay, alpha, frame, 1.0 - alpha, 0, frame);
    return frame;
}
}  // namespace

std::string format_video_time(double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    const int hours = static_cast<int>(seconds / 3600.0);
    const int minutes = static_cast<int>((seconds - hours * 3600.0) / 60.0);
    const double secs = seconds - hours * 3600.0 - minutes * 60.0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%06.3f", hours, minutes, secs);
    return std::string(buf);
}

cv::Mat draw_detections(const cv::Mat& frame_in, const DetectionResult& res, bool fall_latched) {
    if (frame_in.empty()) return frame_in.clone();
    cv::Mat frame = frame_in.clone();
    const int w = frame.cols;
    const int h = frame.rows;

    const cv::Scalar red(0, 0, 255);
    const cv::Scalar green(0, 255, 0);
    const cv::Scalar blue(255, 0, 0);
    const cv::Scalar white(255, 255, 255);

    for (const auto& box : res.boxes) {
        cv::rectangle(frame, cv::Rect(box), fall_latched ? red : green, fall_latched ? 3 : 2);
    }

    if (res.keypoints) {
        const KeypointSet& kps = *res.keypoints;
        for (const auto& kp : kps) {
            const cv::Point p(static_cast<int>(kp.x), static_cast<int>(kp.y));
            if (inside(p, frame)) cv::circle(frame, p, 4, cv::Scalar(0, 255, 255), cv::FILLED);
        }
        const cv::Scalar line_color = fall_latched ? red : blue;
        for (const auto& link : kSkeleton) {
            if (link.first >= static_cast<int>(kps.size()) || link.second >= static_cast<int>(kps.size())) continue;
            const cv::Point a(static_cast<int>(kps[link.first].x), static_cast<int>(kps[link.first].y));
            const cv::Point b(static_cast<int>(kps[link.second].x), static_cast<int>(kps[link.second].y));
            if (inside(a, frame) && inside(b, frame)) cv::line(frame, a, b, line_color, 2);
        }
    }

    if (fall_latched) {
        frame = overlay_band(frame, 120, cv::Scalar(0, 0, 200), 0.4);
        cv::putText(frame, "FALL DETECTED!", cv::Point(20, 50),
                    cv::FONT_HERSHEY_DUPLEX, 1.5, white, 3);
        cv::putText(frame, cv::format("Confidence: %.1f%%", res.confidence * 100.0), cv::Point(20, 90),
                    cv::FONT_HERSHEY_SIMPLEX, 0.8, white, 2);
    } else {
        cv::putText(frame, "Status: Normal", cv::Point(20, 40),
                    cv::FONT_HERSHEY_SIMPLEX, 1.0, green, 2);
    }

    const FrameFeatures& f = res.features;
    int y_pos = h - 100;
    const auto angle = f.torso_angle_smooth ? f.torso_angle_smooth : f.raw.torso_angle;
    if (angle) {
        cv::putText(frame, cv::format("Angle: %.1f", *angle), cv::Point(20, y_pos),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, white, 1);
        y_pos += 25;
    }
    const auto aspect = f.aspect_ratio_smooth ? f.aspect_ratio_smooth : f.raw.aspect_ratio;
    if (aspect) {
        cv::putText(frame, cv::format("Aspect: %.2f", *aspect), cv::Point(20, y_pos),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, white, 1);
        y_pos += 25;
    }
    if (f.vertical_speed) {
        cv::putText(frame, cv::format("Speed: %.1f", *f.vertical_speed), cv::Point(20, y_pos),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, white, 1);
    }

    cv::putText(frame, res.timestamp, cv::Point(w - 200, 30),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, white, 1);
    return frame;
}

}  // namespace fallwatch
