#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include "fallwatch/alert_gate.hpp"
#include "fallwatch/config.hpp"
#include "fallwatch/fall_detector.hpp"
#include "fallwatch/frame_source.hpp"
#include "fallwatch/pose_estimator.hpp"
#include "fallwatch/renderer.hpp"

namespace {

void print_incident(const fallwatch::DetectionResult& res, const std::string& video_time) {
    const auto& raw = res.features.raw;
    std::cout << std::fixed << std::setprecision(1)
              << "\n============================================================\n"
              << " FALL DETECTED!\n"
              << "Video Time: " << video_time << "\n"
              << "Angle: " << raw.torso_angle.value_or(0.0) << " deg\n"
              << "Aspect Ratio: " << std::setprecision(2) << raw.aspect_ratio.value_or(0.0) << "\n"
              << "Speed: " << std::setprecision(1) << res.features.vertical_speed.value_or(0.0) << " px/s\n"
              << "Confidence: " << std::setprecision(2) << res.confidence << "\n"
              << "============================================================\n"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    fallwatch::AppConfig cfg = fallwatch::parse_args(argc, argv);
    if (cfg.show_help) {
        std::cout << fallwatch::usage();
        return 0;
    }

    std::cout << "[INFO] Starting fallwatch pipeline\n";
    std::cout << "       source     : " << cfg.source << "\n";
    std::cout << "       model      : " << cfg.model_path << "\n";
    std::cout << "       sensitivity: " << cfg.sensitivity << "\n";
    std::cout << "       ORT        : " << (cfg.use_ort ? "enabled" : "disabled (OpenCV DNN fallback)") << "\n";

    std::shared_ptr<fallwatch::OpenCvVideoSource> video;
    try {
        video = std::make_shared<fallwatch::OpenCvVideoSource>(cfg.source);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        return 1;
    }
    const int frame_w = video->width();
    const int frame_h = video->height();

    fallwatch::FrameSource source(video);

    fallwatch::YoloPoseEstimator estimator(cfg.model_path, cfg.img_size, cfg.use_ort);
    if (!estimator.ready()) {
        std::cerr << "[WARN] Pose model unavailable; every frame will report no detection" << std::endl;
    }

    std::unique_ptr<fallwatch::FallDetector> detector;
    try {
        detector = std::make_unique<fallwatch::FallDetector>(estimator, fallwatch::to_detector_config(cfg));
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Invalid detector configuration: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "[INFO] Fall detection initialized with "
              << fallwatch::sensitivity_to_string(detector->sensitivity()) << " sensitivity" << std::endl;

    cv::VideoWriter writer;
    if (!cfg.output_path.empty()) {
        writer.open(cfg.output_path, cv::VideoWriter::fourcc('m', 'p', '4', 'v'), source.fps(),
                    cv::Size(frame_w, frame_h));
        if (writer.isOpened()) {
            std::cout << "[INFO] Saving output to: " << cfg.output_path << std::endl;
        } else {
            std::cerr << "[WARN] Unable to open output video: " << cfg.output_path << std::endl;
        }
    }

    source.start();

    fallwatch::AlertGate alerts;
    bool fall_latched = false;
    bool running = true;
    double fps = 0.0;
    int frames = 0;
    uint64_t processed = 0;
    auto t0 = std::chrono::steady_clock::now();

    while (running) {
        auto item = source.read();
        if (!item) {
            std::cout << "[INFO] End of video stream" << std::endl;
            break;
        }

        const std::string video_time = fallwatch::format_video_time(item->timestamp_sec);
        if (cfg.verbose && processed % 30 == 0) {
            std::cout << "[DEBUG] Frame: " << processed << ", Time: " << video_time << std::endl;
        }

        fallwatch::DetectionResult res = detector->process(item->image);
        processed++;
        if (alerts.update(res.fall_detected)) {
            fall_latched = true;
            print_incident(res, video_time);
        }

        frames++;
        auto now = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(now - t0).count();
        if (elapsed >= 1.0) {
            fps = frames / elapsed;
            frames = 0;
            t0 = now;
        }

        if (!cfg.show_window && !writer.isOpened()) continue;

        cv::Mat view = fallwatch::draw_detections(item->image, res, fall_latched);
        cv::putText(view, video_time, cv::Point(view.cols - 200, 55),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(255, 255, 255), 2);
        cv::putText(view, cv::format("FPS: %.1f", fps), cv::Point(10, view.rows - 12),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);

        if (cfg.show_window) {
            cv::imshow("Fall Detection - Press 'Q' to quit", view);
            int key = cv::waitKey(1) & 0xFF;
            if (key == 'q' || key == 'Q' || key == 27) {
                std::cout << "[INFO] User requested exit" << std::endl;
                running = false;
            }
        }
        if (writer.isOpened()) {
            writer.write(view);
        }
    }

    source.stop();
    if (writer.isOpened()) writer.release();
    if (cfg.show_window) cv::destroyAllWindows();
    std::cout << "[INFO] Processed " << processed << " frames, dropped " << source.frames_dropped()
              << ", incidents " << alerts.incidents() << std::endl;
    std::cout << "[INFO] Resources released" << std::endl;
    return 0;
}
