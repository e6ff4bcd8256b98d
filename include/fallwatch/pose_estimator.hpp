#pragma once

#include <memory>
#include <string>
#include <vector>

#include <opencv2/dnn.hpp>

#include "fallwatch/frame_types.hpp"

#ifdef FALLWATCH_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace fallwatch {

class PoseEstimator {
public:
    virtual ~PoseEstimator() = default;

    // Highest-confidence person's keypoints (if any) plus every detected box.
    // May throw; callers treat a throw as "no detection this frame".
    virtual PoseResult estimate(const cv::Mat& frame, float conf_threshold) = 0;
};

// YOLOv8-pose ONNX model. Output rows are (cx, cy, w, h, score, 17 x (x, y, v)).
class YoloPoseEstimator : public PoseEstimator {
public:
    YoloPoseEstimator(const std::string& model_path, int img_size, bool use_onnxruntime);

    bool ready() const { return ready_; }
    bool using_onnxruntime() const { return use_ort_; }

    PoseResult estimate(const cv::Mat& frame, float conf_threshold) override;

    // Decodes a [rows x dims] (or channel-first [dims x rows]) prediction
    // tensor into boxes and the best person's keypoints, in frame coordinates.
    static PoseResult decode(const float* data, int rows, int dims, bool channel_first,
                             float scale_x, float scale_y, float conf_threshold);

private:
    PoseResult run_opencv(const cv::Mat& frame, float conf_threshold);
#ifdef FALLWATCH_USE_ONNXRUNTIME
    PoseResult run_ort(const cv::Mat& frame, float conf_threshold);
#endif

    cv::dnn::Net net_;
    int input_size_;
    bool ready_{false};
    bool use_ort_{false};

#ifdef FALLWATCH_USE_ONNXRUNTIME
    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "fallwatch"};
    std::unique_ptr<Ort::Session> session_;
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    std::vector<std::string> input_name_strs_;
    std::vector<const char*> input_names_;
    std::vector<std::string> output_name_strs_;
    std::vector<const char*> output_names_;
#endif
};

}  // namespace fallwatch
