#include "vdet/sampler.hpp"

#include <cmath>

#include "vdet/errors.hpp"

namespace vdet {

void FrameSampler::validate(const SamplingPlan& plan) {
    if (plan.stride <= 0) throw ConfigError("stride must be > 0, got " + std::to_string(plan.stride));
    if (plan.max_samples && *plan.max_samples <= 0)
        throw ConfigError("max_samples must be > 0, got " + std::to_string(*plan.max_samples));
}

FrameSampler::FrameSampler(int frame_count, double fps, SamplingPlan plan)
    : frame_count_(frame_count > 0 ? frame_count : 0),
      fps_(fps > 0.0 && std::isfinite(fps) ? fps : 30.0) {
    validate(plan);

    stride_ = plan.stride;
    if (plan.max_samples) {
        int cap = *plan.max_samples;
        stride_ = cap >= frame_count_ ? 1 : static_cast<int>((static_cast<long long>(frame_count_) + cap - 1) / cap);
    }

    if (frame_count_ == 0) {
        grid_size_ = 0;
        append_last_ = false;
        plan_size_ = 0;
        return;
    }

    grid_size_ = static_cast<std::size_t>((frame_count_ - 1) / stride_ + 1);
    int last_grid = static_cast<int>(grid_size_ - 1) * stride_;
    append_last_ = frame_count_ > stride_ && last_grid != frame_count_ - 1;
    plan_size_ = grid_size_ + (append_last_ ? 1 : 0);

    if (plan.max_samples && plan_size_ > static_cast<std::size_t>(*plan.max_samples)) {
        // Keep the last frame by dropping grid entries from the tail.
        grid_size_ = static_cast<std::size_t>(*plan.max_samples) - (append_last_ ? 1 : 0);
        if (grid_size_ == 0) {
            grid_size_ = 1;
            append_last_ = false;
        }
        plan_size_ = grid_size_ + (append_last_ ? 1 : 0);
    }
}

int FrameSampler::indexAt(std::size_t pos) const {
    if (pos < grid_size_) return static_cast<int>(pos) * stride_;
    return frame_count_ - 1;
}

std::optional<SampledFrame> FrameSampler::next() {
    if (exhausted()) return std::nullopt;
    int idx = indexAt(pos_++);
    return SampledFrame{idx, idx / fps_};
}

std::vector<int> FrameSampler::indices() const {
    std::vector<int> out;
    out.reserve(plan_size_);
    for (std::size_t i = 0; i < plan_size_; ++i) out.push_back(indexAt(i));
    return out;
}

}  // namespace vdet
