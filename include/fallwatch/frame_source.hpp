#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <opencv2/videoio.hpp>

#include "fallwatch/frame_buffer.hpp"
#include "fallwatch/frame_types.hpp"

namespace fallwatch {

// Opaque frame supplier. read() and release() may be called from different
// threads; implementations must tolerate that.
class VideoSource {
public:
    virtual ~VideoSource() = default;

    virtual bool read(cv::Mat& frame) = 0;
    virtual double fps() const = 0;
    virtual void release() = 0;
};

// Camera index ("0", "1", ...) or file/URL. Throws std::runtime_error when
// the source cannot be opened.
class OpenCvVideoSource : public VideoSource {
public:
    explicit OpenCvVideoSource(const std::string& source);
    ~OpenCvVideoSource() override;

    bool read(cv::Mat& frame) override;
    double fps() const override;
    void release() override;

    int width() const;
    int height() const;

private:
    mutable std::mutex mu_;
    cv::VideoCapture cap_;
    std::atomic<bool> release_requested_{false};
};

class FrameSource {
public:
    static constexpr size_t kQueueCapacity = 30;
    static constexpr double kDefaultFps = 30.0;
    static constexpr std::chrono::milliseconds kEnqueueTimeout{100};
    static constexpr std::chrono::milliseconds kReadTimeout{1000};
    static constexpr std::chrono::milliseconds kJoinTimeout{1000};

    explicit FrameSource(std::shared_ptr<VideoSource> source, size_t queue_capacity = kQueueCapacity);
    explicit FrameSource(const std::string& source, size_t queue_capacity = kQueueCapacity);
    ~FrameSource();

    FrameSource(const FrameSource&) = delete;
    FrameSource& operator=(const FrameSource&) = delete;

    void start();

    // Empty when no frame arrived within the timeout.
    std::optional<Frame> read(std::chrono::milliseconds timeout = kReadTimeout);

    // Joins with a bounded timeout, then releases the source regardless.
    void stop();

    bool running() const { return running_->load(); }
    double fps() const { return fps_; }
    uint64_t frames_enqueued() const { return counters_->enqueued.load(); }
    uint64_t frames_dropped() const { return counters_->dropped.load(); }

private:
    struct Counters {
        std::atomic<uint64_t> enqueued{0};
        std::atomic<uint64_t> dropped{0};
    };

    // Owns nothing but shared handles so a detached loop never touches *this.
    static void run(std::shared_ptr<VideoSource> source,
                    std::shared_ptr<FrameBuffer<Frame>> buffer,
                    std::shared_ptr<std::atomic<bool>> running,
                    std::shared_ptr<Counters> counters,
                    double fps);

    std::shared_ptr<VideoSource> source_;
    std::shared_ptr<FrameBuffer<Frame>> buffer_;
    std::shared_ptr<std::atomic<bool>> running_;
    std::shared_ptr<Counters> counters_;
    double fps_{kDefaultFps};
    std::thread worker_;
    std::future<void> finished_;
    bool started_{false};
    bool released_{false};
};

}  // namespace fallwatch
