#include "fallwatch/config.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace fallwatch {

static bool arg_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

static bool truthy(const char* v) {
    return arg_eq(v, "1") || arg_eq(v, "true") || arg_eq(v, "yes") || arg_eq(v, "on");
}

static size_t parse_window(const char* v) {
    const long n = std::atol(v);
    if (n < 1) {
        std::cerr << "[WARN] Ignoring smoothing window '" << v << "', using 1" << std::endl;
        return 1;
    }
    return static_cast<size_t>(n);
}

AppConfig parse_args(int argc, char** argv) {
    AppConfig cfg;

    if (const char* env_src = std::getenv("VIDEO_SOURCE")) cfg.source = env_src;
    if (const char* env_weights = std::getenv("POSE_WEIGHTS")) cfg.model_path = env_weights;
    if (const char* env_sens = std::getenv("FALL_SENSITIVITY")) cfg.sensitivity = env_sens;
    if (const char* env_conf = std::getenv("POSE_CONF")) cfg.conf_threshold = static_cast<float>(std::atof(env_conf));
    if (const char* env_cool = std::getenv("FALL_COOLDOWN")) cfg.cooldown_seconds = std::atof(env_cool);
    if (const char* env_win = std::getenv("FALL_WINDOW")) cfg.smoothing_window = parse_window(env_win);
    if (const char* env_img = std::getenv("IMG_SIZE")) cfg.img_size = std::atoi(env_img);
    if (const char* env_verbose = std::getenv("FALL_VERBOSE")) cfg.verbose = truthy(env_verbose);

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        auto next = [&](int offset = 1) -> const char* {
            if (i + offset < argc) return argv[i + offset];
            return nullptr;
        };

        if ((arg_eq(arg, "--source") || arg_eq(arg, "--video")) && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--camera") && next()) {
            cfg.source = next();
            i++;
        } else if (arg_eq(arg, "--model") && next()) {
            cfg.model_path = next();
            i++;
        } else if (arg_eq(arg, "--sensitivity") && next()) {
            cfg.sensitivity = next();
            i++;
        } else if (arg_eq(arg, "--conf") && next()) {
            cfg.conf_threshold = static_cast<float>(std::atof(next()));
            i++;
        } else if (arg_eq(arg, "--cooldown") && next()) {
            cfg.cooldown_seconds = std::atof(next());
            i++;
        } else if (arg_eq(arg, "--window") && next()) {
            cfg.smoothing_window = parse_window(next());
            i++;
        } else if (arg_eq(arg, "--img") && next()) {
            cfg.img_size = std::atoi(next());
            i++;
        } else if (arg_eq(arg, "--output") && next()) {
            cfg.output_path = next();
            i++;
        } else if (arg_eq(arg, "--show")) {
            cfg.show_window = true;
        } else if (arg_eq(arg, "--no-ort")) {
            cfg.use_ort = false;
        } else if (arg_eq(arg, "--use-ort")) {
            cfg.use_ort = true;
        } else if (arg_eq(arg, "--verbose")) {
            cfg.verbose = true;
        } else if (arg_eq(arg, "--help") || arg_eq(arg, "-h")) {
            cfg.show_help = true;
        } else {
            std::cerr << "[WARN] Ignoring unknown argument: " << arg << std::endl;
        }
    }

    return cfg;
}

std::string usage() {
    return "Usage: fallwatch [--source <idx|path>] [--model <onnx>] [--sensitivity low|medium|high]\n"
           "                 [--conf <thresh>] [--cooldown <sec>] [--window <frames>] [--img <size>]\n"
           "                 [--output <video>] [--show] [--use-ort|--no-ort] [--verbose]\n";
}

DetectorConfig to_detector_config(const AppConfig& cfg) {
    DetectorConfig d;
    d.sensitivity = cfg.sensitivity;
    d.conf_threshold = cfg.conf_threshold;
    d.cooldown_seconds = cfg.cooldown_seconds;
    d.smoothing_window = cfg.smoothing_window;
    d.verbose = cfg.verbose;
    return d;
}

}  // namespace fallwatch
