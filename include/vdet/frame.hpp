#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace vdet {

// A sampled position in the video. Produced by FrameSampler, never mutated.
struct SampledFrame {
    int index = 0;
    double timestamp_s = 0.0;
};

struct RawDetection {
    std::string label;
    float confidence = 0.f;
    cv::Rect2f box;
};
using RawDetections = std::vector<RawDetection>;

}  // namespace vdet
