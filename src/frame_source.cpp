#include "fallwatch/frame_source.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace fallwatch {

namespace {
// Allow numeric index or path/URL
bool parse_camera_index(const std::string& source, int& idx) {
    if (source.empty()) return false;
    for (char c : source) {
        if (c < '0' || c > '9') return false;
    }
    try {
        idx = std::stoi(source);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
}  // namespace

OpenCvVideoSource::OpenCvVideoSource(const std::string& source) {
    int idx = 0;
    if (parse_camera_index(source, idx)) {
        cap_.open(idx);
    } else {
        cap_.open(source);
    }
    if (!cap_.isOpened()) {
        throw std::runtime_error("Unable to open video source: " + source);
    }
}

OpenCvVideoSource::~OpenCvVideoSource() {
    std::lock_guard<std::mutex> lock(mu_);
    cap_.release();
}

bool OpenCvVideoSource::read(cv::Mat& frame) {
    std::lock_guard<std::mutex> lock(mu_);
    if (!cap_.isOpened()) return false;
    const bool ok = cap_.read(frame);
    if (release_requested_) {
        cap_.release();
        return false;
    }
    return ok && !frame.empty();
}

double OpenCvVideoSource::fps() const {
    std::lock_guard<std::mutex> lock(mu_);
    return cap_.get(cv::CAP_PROP_FPS);
}

int OpenCvVideoSource::width() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH));
}

int OpenCvVideoSource::height() const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT));
}

void OpenCvVideoSource::release() {
    release_requested_ = true;
    // A read in progress releases the capture itself once it returns.
    std::unique_lock<std::mutex> lock(mu_, std::try_to_lock);
    if (lock.owns_lock()) cap_.release();
}

FrameSource::FrameSource(std::shared_ptr<VideoSource> source, size_t queue_capacity)
    : source_(std::move(source)),
      buffer_(std::make_shared<FrameBuffer<Frame>>(queue_capacity)),
      running_(std::make_shared<std::atomic<bool>>(false)),
      counters_(std::make_shared<Counters>()) {
    if (!source_) throw std::invalid_argument("FrameSource requires a video source");
    const double src_fps = source_->fps();
    fps_ = src_fps > 0.0 ? src_fps : kDefaultFps;
}

FrameSource::FrameSource(const std::string& source, size_t queue_capacity)
    : FrameSource(std::make_shared<OpenCvVideoSource>(source), queue_capacity) {}

FrameSource::~FrameSource() {
    stop();
}

void FrameSource::start() {
    if (started_) return;
    started_ = true;
    running_->store(true);

    std::promise<void> done;
    finished_ = done.get_future();
    worker_ = std::thread([source = source_, buffer = buffer_, running = running_, counters = counters_,
                           fps = fps_, done = std::move(done)]() mutable {
        run(source, buffer, running, counters, fps);
        done.set_value();
    });
}

std::optional<Frame> FrameSource::read(std::chrono::milliseconds timeout) {
    return buffer_->pop_for(timeout);
}

void FrameSource::stop() {
    running_->store(false);
    buffer_->stop();

    if (worker_.joinable()) {
        if (finished_.wait_for(kJoinTimeout) == std::future_status::ready) {
            worker_.join();
        } else {
            std::cerr << "[WARN] Capture thread did not exit within "
                      << kJoinTimeout.count() << " ms; detaching" << std::endl;
            worker_.detach();
        }
    }

    if (!released_) {
        released_ = true;
        source_->release();
    }
}

void FrameSource::run(std::shared_ptr<VideoSource> source,
                      std::shared_ptr<FrameBuffer<Frame>> buffer,
                      std::shared_ptr<std::atomic<bool>> running,
                      std::shared_ptr<Counters> counters,
                      double fps) {
    uint64_t frame_index = 0;
    try {
        while (running->load()) {
            cv::Mat image;
            if (!source->read(image) || image.empty()) {
                break;  // end of stream
            }

            Frame frame;
            frame.image = std::move(image);
            frame.index = frame_index;
            frame.timestamp_sec = static_cast<double>(frame_index) / fps;

            if (buffer->push_for(std::move(frame), kEnqueueTimeout)) {
                frame_index++;
                counters->enqueued++;
            } else {
                counters->dropped++;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Video capture failed: " << e.what() << std::endl;
    }

    running->store(false);
    source->release();
    buffer->stop();
}

}  // namespace fallwatch
