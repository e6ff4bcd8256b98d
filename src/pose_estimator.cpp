#include "fallwatch/pose_estimator.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <opencv2/imgproc.hpp>

namespace fallwatch {

namespace {
constexpr int kBoxFields = 5;          // cx, cy, w, h, score
constexpr int kKeypointFields = 3;     // x, y, visibility
constexpr float kNmsIou = 0.45f;
constexpr float kMinVisibility = 0.5f;
}  // namespace

YoloPoseEstimator::YoloPoseEstimator(const std::string& model_path, int img_size, bool use_onnxruntime)
    : input_size_(img_size), use_ort_(use_onnxruntime) {
#ifdef FALLWATCH_USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            Ort::SessionOptions opts;
            opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
            session_ = std::make_unique<Ort::Session>(env_, model_path.c_str(), opts);

            Ort::AllocatorWithDefaultOptions allocator;
            const size_t in_count = session_->GetInputCount();
            for (size_t i = 0; i < in_count; ++i) {
                auto name = session_->GetInputNameAllocated(i, allocator);
                input_name_strs_.push_back(name.get());
            }
            const size_t out_count = session_->GetOutputCount();
            for (size_t i = 0; i < out_count; ++i) {
                auto name = session_->GetOutputNameAllocated(i, allocator);
                output_name_strs_.push_back(name.get());
            }
            for (const auto& s : input_name_strs_) input_names_.push_back(s.c_str());
            for (const auto& s : output_name_strs_) output_names_.push_back(s.c_str());

            ready_ = true;
            std::cout << "[INFO] Loaded ORT pose model: " << model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            session_.reset();
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            net_ = cv::dnn::readNet(model_path);
            net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
            net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
            ready_ = true;
            std::cout << "[INFO] Loaded OpenCV DNN pose model: " << model_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Could not load pose model: " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

PoseResult YoloPoseEstimator::estimate(const cv::Mat& frame, float conf_threshold) {
    if (!ready_) throw std::runtime_error("pose model not loaded");
    if (frame.empty()) return PoseResult{};
#ifdef FALLWATCH_USE_ONNXRUNTIME
    if (use_ort_ && session_) {
        return run_ort(frame, conf_threshold);
    }
#endif
    return run_opencv(frame, conf_threshold);
}

PoseResult YoloPoseEstimator::decode(const float* data, int rows, int dims, bool channel_first,
                                     float scale_x, float scale_y, float conf_threshold) {
    PoseResult result;
    if (data == nullptr || dims < kBoxFields + kNumKeypoints * kKeypointFields) return result;

    auto item = [&](int row, int idx) -> float {
        return channel_first ? data[idx * rows + row] : data[row * dims + idx];
    };

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    std::vector<int> candidates;
    for (int i = 0; i < rows; ++i) {
        const float score = item(i, 4);
        if (score < conf_threshold) continue;
        const float cx = item(i, 0);
        const float cy = item(i, 1);
        const float w = item(i, 2);
        const float h = item(i, 3);
        boxes.emplace_back(static_cast<int>((cx - 0.5f * w) * scale_x),
                           static_cast<int>((cy - 0.5f * h) * scale_y),
                           static_cast<int>(w * scale_x),
                           static_cast<int>(h * scale_y));
        scores.push_back(score);
        candidates.push_back(i);
    }
    if (candidates.empty()) return result;

    std::vector<int> keep;
    cv::dnn::NMSBoxes(boxes, scores, conf_threshold, kNmsIou, keep);
    std::sort(keep.begin(), keep.end(), [&](int a, int b) { return scores[a] > scores[b]; });

    for (int k : keep) {
        const int row = candidates[k];
        const float cx = item(row, 0);
        const float cy = item(row, 1);
        const float w = item(row, 2);
        const float h = item(row, 3);
        result.boxes.emplace_back((cx - 0.5f * w) * scale_x, (cy - 0.5f * h) * scale_y,
                                  w * scale_x, h * scale_y);
    }
    if (keep.empty()) return result;

    const int best = candidates[keep.front()];
    KeypointSet kps;
    kps.reserve(kNumKeypoints);
    for (int k = 0; k < kNumKeypoints; ++k) {
        const int base = kBoxFields + k * kKeypointFields;
        const float vis = item(best, base + 2);
        if (vis < kMinVisibility) {
            kps.emplace_back(0.0f, 0.0f);
            continue;
        }
        kps.emplace_back(item(best, base) * scale_x, item(best, base + 1) * scale_y);
    }
    result.keypoints = std::move(kps);
    return result;
}

PoseResult YoloPoseEstimator::run_opencv(const cv::Mat& frame, float conf_threshold) {
    cv::Mat blob = cv::dnn::blobFromImage(frame, 1.0 / 255.0, cv::Size(input_size_, input_size_),
                                          cv::Scalar(), true, false);
    net_.setInput(blob);
    cv::Mat pred = net_.forward();

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (pred.dims == 3) {
        rows = pred.size[1];
        dims = pred.size[2];
        if (pred.size[2] > pred.size[1]) {
            rows = pred.size[2];
            dims = pred.size[1];
            channel_first = true;
        }
    } else if (pred.dims == 2) {
        rows = pred.size[0];
        dims = pred.size[1];
    } else {
        return PoseResult{};
    }

    const float scale_x = static_cast<float>(frame.cols) / static_cast<float>(input_size_);
    const float scale_y = static_cast<float>(frame.rows) / static_cast<float>(input_size_);
    return decode(reinterpret_cast<const float*>(pred.data), rows, dims, channel_first,
                  scale_x, scale_y, conf_threshold);
}

#ifdef FALLWATCH_USE_ONNXRUNTIME
PoseResult YoloPoseEstimator::run_ort(const cv::Mat& frame, float conf_threshold) {
    cv::Mat resized;
    cv::resize(frame, resized, cv::Size(input_size_, input_size_));
    cv::Mat rgb;
    cv::cvtColor(resized, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32F, 1.0 / 255.0);

    std::vector<float> blob;
    blob.reserve(3 * input_size_ * input_size_);
    std::vector<int64_t> input_shape{1, 3, input_size_, input_size_};
    for (int c = 0; c < 3; ++c) {
        for (int y = 0; y < input_size_; ++y) {
            const float* row = rgb.ptr<float>(y);
            for (int x = 0; x < input_size_; ++x) {
                blob.push_back(row[x * 3 + c]);
            }
        }
    }

    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(mem_info_, blob.data(), blob.size(),
                                                              input_shape.data(), input_shape.size());
    auto outputs = session_->Run(Ort::RunOptions{nullptr},
                                 input_names_.data(), &input_tensor, 1,
                                 output_names_.data(), output_names_.size());
    if (outputs.empty()) return PoseResult{};

    auto& out = outputs.front();
    const float* data = out.GetTensorData<float>();
    auto shape = out.GetTensorTypeAndShapeInfo().GetShape();

    int rows = 0;
    int dims = 0;
    bool channel_first = false;
    if (shape.size() == 3) {
        rows = static_cast<int>(shape[1]);
        dims = static_cast<int>(shape[2]);
        if (shape[2] > shape[1]) {
            rows = static_cast<int>(shape[2]);
            dims = static_cast<int>(shape[1]);
            channel_first = true;
        }
    } else if (shape.size() == 2) {
        rows = static_cast<int>(shape[0]);
        dims = static_cast<int>(shape[1]);
    } else {
        return PoseResult{};
    }

    const float scale_x = static_cast<float>(frame.cols) / static_cast<float>(input_size_);
    const float scale_y = static_cast<float>(frame.rows) / static_cast<float>(input_size_);
    return decode(data, rows, dims, channel_first, scale_x, scale_y, conf_threshold);
}
#endif

}  // namespace fallwatch
