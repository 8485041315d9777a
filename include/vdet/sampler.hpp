#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include "frame.hpp"

namespace vdet {

struct SamplingPlan {
    int stride = 1;
    std::optional<int> max_samples;
};

// Lazy, finite, restartable walk over the frames of a video.
//
// Frame 0 is always produced for a non-empty video. The last frame is added
// when the video is longer than one stride and the grid misses it. With a
// max_samples cap the stride is derived from the frame count and the last
// frame takes the place of the final grid entry when the cap is reached.
class FrameSampler {
public:
    // Throws ConfigError for stride <= 0 or max_samples <= 0.
    FrameSampler(int frame_count, double fps, SamplingPlan plan);

    std::optional<SampledFrame> next();
    void reset() { pos_ = 0; }

    std::size_t size() const { return plan_size_; }
    std::size_t position() const { return pos_; }
    bool exhausted() const { return pos_ >= plan_size_; }
    int stride() const { return stride_; }

    // Materializes the whole sequence without moving the cursor.
    std::vector<int> indices() const;

    static void validate(const SamplingPlan& plan);

private:
    int indexAt(std::size_t pos) const;

    int frame_count_;
    double fps_;
    int stride_;
    bool append_last_;
    std::size_t grid_size_;
    std::size_t plan_size_;
    std::size_t pos_ = 0;
};

}  // namespace vdet
