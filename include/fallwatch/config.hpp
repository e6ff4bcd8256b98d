#pragma once

#include <cstddef>
#include <string>

#include "fallwatch/fall_detector.hpp"

namespace fallwatch {

struct AppConfig {
    std::string source{"0"};          // camera index as string or file path/URL
    std::string model_path{"models/yolov8n-pose.onnx"};
    std::string sensitivity{"medium"};
    std::string output_path{};        // annotated video; empty disables writing
    float conf_threshold{0.3f};
    double cooldown_seconds{3.0};
    size_t smoothing_window{5};
    int img_size{640};
    bool use_ort{true};               // use ONNX Runtime when available
    bool show_window{false};
    bool verbose{false};
    bool show_help{false};
};

// Environment variables first, then command-line flags.
AppConfig parse_args(int argc, char** argv);

std::string usage();

DetectorConfig to_detector_config(const AppConfig& cfg);

}  // namespace fallwatch
