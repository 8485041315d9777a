#pragma once
#include <opencv2/core.hpp>

#include "frame.hpp"

namespace vdet {
float IoU(const cv::Rect2f& a, const cv::Rect2f& b);

// Greedy score-ordered suppression. Boxes of different labels never suppress
// each other.
RawDetections NMS(const RawDetections& ds, float thr);
}
