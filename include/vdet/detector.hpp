#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "frame.hpp"

namespace vdet {

// Raised by the executor when a call outlives its deadline. Detectors that
// report cancellable() are expected to poll it and return early.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}
    void cancel() const { flag_->store(true); }
    bool cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

class IDetector {
public:
    virtual ~IDetector() = default;
    virtual std::string name() const = 0;
    virtual RawDetections detect(const cv::Mat& bgr, float confidence_threshold) = 0;

    virtual RawDetections detect(const cv::Mat& bgr, float confidence_threshold, const CancelToken&) {
        return detect(bgr, confidence_threshold);
    }
    virtual bool cancellable() const { return false; }
    virtual bool synthetic() const { return false; }
};

// Stand-in used when no model is configured: one pedestrian box centered in
// the lower half of every frame.
class SyntheticDetector final : public IDetector {
public:
    using IDetector::detect;
    std::string name() const override { return "synthetic"; }
    RawDetections detect(const cv::Mat& bgr, float confidence_threshold) override;
    bool synthetic() const override { return true; }
};

// YOLOv8 ONNX export run through cv::dnn. Output rows are
// [cx, cy, w, h, score_0 .. score_n] over a square input.
class DnnDetector final : public IDetector {
public:
    struct Params {
        int imgsz = 640;
        float nms_thr = 0.45f;
        bool use_cuda = false;
    };

    // Throws std::runtime_error if the model cannot be loaded.
    DnnDetector(const std::string& onnx_path, std::vector<std::string> class_names, Params p);

    std::string name() const override { return name_; }
    RawDetections detect(const cv::Mat& bgr, float confidence_threshold) override;
    RawDetections detect(const cv::Mat& bgr, float confidence_threshold, const CancelToken& token) override;
    bool cancellable() const override { return true; }

    // One label per line. A blank line keeps its class id but drops its boxes.
    static std::vector<std::string> loadClassNames(const std::string& path);
    // COCO ids 0, 1, 3 as pedestrian, cyclist, motorcyclist; other ids dropped.
    static std::vector<std::string> vruLabels();

private:
    Params p_;
    std::vector<std::string> class_names_;
    std::string name_;
    cv::dnn::Net net_;
    std::mutex net_mu_;
};

std::unique_ptr<IDetector> makeDetector(const std::string& model_path, const std::string& classes_path);

}  // namespace vdet
