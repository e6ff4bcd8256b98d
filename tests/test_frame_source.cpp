#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "fallwatch/frame_source.hpp"
#include "test_helpers.hpp"

using namespace fallwatch;
using fallwatch::test_support::FakeVideoSource;
using fallwatch::test_support::StuckVideoSource;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

}  // namespace

TEST(FrameSourceTest, DeliversFramesWithVideoTimestamps) {
    auto video = std::make_shared<FakeVideoSource>(5, 10.0);
    FrameSource source(video);
    source.start();

    for (uint64_t i = 0; i < 5; ++i) {
        auto frame = source.read();
        ASSERT_TRUE(frame.has_value()) << "frame " << i;
        EXPECT_EQ(frame->index, i);
        EXPECT_DOUBLE_EQ(frame->timestamp_sec, static_cast<double>(i) / 10.0);
        EXPECT_FALSE(frame->image.empty());
    }
    EXPECT_FALSE(source.read(200ms).has_value());
    source.stop();

    EXPECT_EQ(source.frames_enqueued(), 5u);
    EXPECT_EQ(source.frames_dropped(), 0u);
    EXPECT_TRUE(video->released.load());
}

TEST(FrameSourceTest, NonPositiveFpsFallsBackToDefault) {
    FrameSource source(std::make_shared<FakeVideoSource>(1, 0.0));
    EXPECT_DOUBLE_EQ(source.fps(), FrameSource::kDefaultFps);
}

TEST(FrameSourceTest, ProducerDropsInsteadOfBlocking) {
    auto video = std::make_shared<FakeVideoSource>(10, 30.0);
    FrameSource source(video, 2);

    const auto t0 = std::chrono::steady_clock::now();
    source.start();
    // Nobody reads: 2 frames fit, the other 8 each wait at most the enqueue timeout.
    ASSERT_TRUE(wait_until([&] { return !source.running(); }, 5s));
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_EQ(video->produced.load(), 10);
    EXPECT_EQ(source.frames_enqueued(), 2u);
    EXPECT_EQ(source.frames_dropped(), 8u);
    EXPECT_LT(elapsed, 8 * FrameSource::kEnqueueTimeout + 1500ms);

    EXPECT_TRUE(source.read(100ms).has_value());
    EXPECT_TRUE(source.read(100ms).has_value());
    EXPECT_FALSE(source.read(100ms).has_value());
    source.stop();
}

TEST(FrameSourceTest, ReadTimesOutWhenNoFrameArrives) {
    auto video = std::make_shared<FakeVideoSource>(100, 30.0, 500ms);
    FrameSource source(video);
    source.start();
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(source.read(50ms).has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - t0, 400ms);
    source.stop();
}

TEST(FrameSourceTest, StopReleasesSourceEvenWhenJoinTimesOut) {
    auto video = std::make_shared<StuckVideoSource>(10s);
    auto source = std::make_unique<FrameSource>(video);
    source->start();
    ASSERT_TRUE(wait_until([&] { return video->entered.load(); }, 2s));

    const auto t0 = std::chrono::steady_clock::now();
    source->stop();
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    EXPECT_TRUE(video->released.load());
    EXPECT_GE(elapsed, FrameSource::kJoinTimeout - 50ms);
    EXPECT_LT(elapsed, 5s);
    source.reset();
}

TEST(FrameSourceTest, StopIsIdempotent) {
    auto video = std::make_shared<FakeVideoSource>(3, 30.0);
    FrameSource source(video);
    source.start();
    ASSERT_TRUE(wait_until([&] { return !source.running(); }, 2s));
    source.stop();
    source.stop();
    EXPECT_TRUE(video->released.load());
    // once by the loop at end of stream, once by stop()
    EXPECT_EQ(video->release_calls.load(), 2);
}

TEST(FrameSourceTest, StopWithoutStartStillReleases) {
    auto video = std::make_shared<FakeVideoSource>(3, 30.0);
    {
        FrameSource source(video);
    }
    EXPECT_TRUE(video->released.load());
}

TEST(FrameSourceTest, UnopenableSourceIsFatal) {
    EXPECT_THROW(FrameSource("/nonexistent/fallwatch/clip.mp4"), std::runtime_error);
    EXPECT_THROW(OpenCvVideoSource("/nonexistent/fallwatch/clip.mp4"), std::runtime_error);
}
