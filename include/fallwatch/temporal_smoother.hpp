#pragma once

#include <cstddef>
#include <vector>

namespace fallwatch {

// Fixed-capacity ring buffer keeping a running sum for O(1) means.
class RunningMean {
public:
    explicit RunningMean(size_t capacity);

    double push(double value);
    double mean() const;
    size_t size() const { return count_; }
    size_t capacity() const { return values_.size(); }
    void clear();

private:
    std::vector<double> values_;
    size_t head_{0};
    size_t count_{0};
    double sum_{0.0};
};

class TemporalSmoother {
public:
    explicit TemporalSmoother(size_t window = 5);

    double smooth_angle(double torso_angle) { return angle_.push(torso_angle); }
    double smooth_aspect(double aspect_ratio) { return aspect_.push(aspect_ratio); }

    size_t window() const { return angle_.capacity(); }
    size_t angle_samples() const { return angle_.size(); }
    size_t aspect_samples() const { return aspect_.size(); }

    void reset();

private:
    RunningMean angle_;
    RunningMean aspect_;
};

}  // namespace fallwatch
