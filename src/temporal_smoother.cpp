#include "fallwatch/temporal_smoother.hpp"

#include <stdexcept>

namespace fallwatch {

RunningMean::RunningMean(size_t capacity) {
    if (capacity == 0) throw std::invalid_argument("smoothing window must be at least 1");
    values_.assign(capacity, 0.0);
}

double RunningMean::push(double value) {
    if (count_ == values_.size()) {
        sum_ -= values_[head_];
    } else {
        count_++;
    }
    values_[head_] = value;
    sum_ += value;
    head_ = (head_ + 1) % values_.size();
    return mean();
}

double RunningMean::mean() const {
    if (count_ == 0) return 0.0;
    return sum_ / static_cast<double>(count_);
}

void RunningMean::clear() {
    head_ = 0;
    count_ = 0;
    sum_ = 0.0;
}

TemporalSmoother::TemporalSmoother(size_t window) : angle_(window), aspect_(window) {}

void TemporalSmoother::reset() {
    angle_.clear();
    aspect_.clear();
}

}  // namespace fallwatch
