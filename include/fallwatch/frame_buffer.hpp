#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace fallwatch {

// Thread-safe bounded queue with timed put/get. A timeout is a normal
// flow-control outcome, reported through the return value.
template <typename T>
class FrameBuffer {
public:
    explicit FrameBuffer(size_t max_items = 30) : max_items_(max_items == 0 ? 1 : max_items) {}

    template <typename Rep, typename Period>
    bool push_for(T item, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_full_.wait_for(lock, timeout, [&] { return queue_.size() < max_items_ || stopped_; })) {
            return false;
        }
        if (stopped_) return false;
        queue_.push(std::move(item));
        lock.unlock();
        cv_empty_.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mu_);
        if (!cv_empty_.wait_for(lock, timeout, [&] { return !queue_.empty() || stopped_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) return std::nullopt;
        std::optional<T> out(std::move(queue_.front()));
        queue_.pop();
        lock.unlock();
        cv_full_.notify_one();
        return out;
    }

    // Wakes every waiter. Items already queued can still be drained.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu_);
            stopped_ = true;
        }
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return queue_.size();
    }

    size_t capacity() const { return max_items_; }

private:
    size_t max_items_;
    std::queue<T> queue_;
    mutable std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool stopped_{false};
};

}  // namespace fallwatch
