#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "fallwatch/frame_source.hpp"
#include "fallwatch/frame_types.hpp"
#include "fallwatch/pose_estimator.hpp"

namespace fallwatch {
namespace test_support {

// Torso vertical in image space, hips above knees.
inline KeypointSet upright_person(float hip_y) {
    return {
        {110.0f, hip_y - 120.0f},                            // nose
        {105.0f, hip_y - 125.0f}, {115.0f, hip_y - 125.0f},  // eyes
        {100.0f, hip_y - 120.0f}, {120.0f, hip_y - 120.0f},  // ears
        {100.0f, hip_y - 100.0f}, {120.0f, hip_y - 100.0f},  // shoulders
        {95.0f, hip_y - 50.0f},   {125.0f, hip_y - 50.0f},   // elbows
        {95.0f, hip_y - 10.0f},   {125.0f, hip_y - 10.0f},   // wrists
        {100.0f, hip_y},          {120.0f, hip_y},           // hips
        {100.0f, hip_y + 80.0f},  {120.0f, hip_y + 80.0f},   // knees
        {100.0f, hip_y + 160.0f}, {120.0f, hip_y + 160.0f},  // ankles
    };
}

// Torso horizontal, body stretched along x.
inline KeypointSet lying_person(float hip_y) {
    return {
        {150.0f, hip_y},
        {145.0f, hip_y - 5.0f},  {145.0f, hip_y + 5.0f},
        {150.0f, hip_y - 8.0f},  {150.0f, hip_y + 8.0f},
        {200.0f, hip_y - 10.0f}, {200.0f, hip_y + 10.0f},
        {250.0f, hip_y - 25.0f}, {250.0f, hip_y + 25.0f},
        {290.0f, hip_y - 30.0f}, {290.0f, hip_y + 30.0f},
        {300.0f, hip_y - 10.0f}, {300.0f, hip_y + 10.0f},
        {380.0f, hip_y - 10.0f}, {380.0f, hip_y + 10.0f},
        {460.0f, hip_y - 10.0f}, {460.0f, hip_y + 10.0f},
    };
}

inline PoseResult pose_of(const KeypointSet& kps) {
    PoseResult p;
    p.keypoints = kps;
    p.boxes.emplace_back(90.0f, 50.0f, 40.0f, 300.0f);
    return p;
}

class FakePoseEstimator : public PoseEstimator {
public:
    PoseResult estimate(const cv::Mat&, float conf_threshold) override {
        calls++;
        last_conf = conf_threshold;
        if (fail) throw std::runtime_error("inference backend exploded");
        if (results.empty()) return PoseResult{};
        PoseResult r = results.front();
        results.pop_front();
        return r;
    }

    std::deque<PoseResult> results;
    bool fail{false};
    int calls{0};
    float last_conf{-1.0f};
};

// Yields frame_count small frames, then end of stream.
class FakeVideoSource : public VideoSource {
public:
    FakeVideoSource(int frame_count, double fps, std::chrono::milliseconds read_delay = std::chrono::milliseconds(0))
        : frame_count_(frame_count), fps_(fps), read_delay_(read_delay) {}

    bool read(cv::Mat& frame) override {
        if (released) return false;
        if (read_delay_.count() > 0) std::this_thread::sleep_for(read_delay_);
        if (produced >= frame_count_) return false;
        frame = cv::Mat(4, 4, CV_8UC3, cv::Scalar(produced.load() % 255, 0, 0));
        produced++;
        return true;
    }

    double fps() const override { return fps_; }

    void release() override {
        released = true;
        release_calls++;
    }

    std::atomic<int> produced{0};
    std::atomic<bool> released{false};
    std::atomic<int> release_calls{0};

private:
    int frame_count_;
    double fps_;
    std::chrono::milliseconds read_delay_;
};

// read() blocks until release() or the hold time elapses.
class StuckVideoSource : public VideoSource {
public:
    explicit StuckVideoSource(std::chrono::milliseconds hold) : hold_(hold) {}

    bool read(cv::Mat&) override {
        std::unique_lock<std::mutex> lock(mu_);
        entered = true;
        cv_.wait_for(lock, hold_, [&] { return released.load(); });
        return false;
    }

    double fps() const override { return 25.0; }

    void release() override {
        {
            std::lock_guard<std::mutex> lock(mu_);
            released = true;
        }
        cv_.notify_all();
    }

    std::atomic<bool> entered{false};
    std::atomic<bool> released{false};

private:
    std::chrono::milliseconds hold_;
    std::mutex mu_;
    std::condition_variable cv_;
};

}  // namespace test_support
}  // namespace fallwatch
