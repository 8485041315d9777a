#include "vdet/detector.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "vdet/logger.hpp"
#include "vdet/postprocess.hpp"

namespace vdet {

RawDetections SyntheticDetector::detect(const cv::Mat& bgr, float confidence_threshold) {
    const float conf = 0.75f;
    if (bgr.empty() || conf < confidence_threshold) return {};
    float w = bgr.cols * 0.15f, h = bgr.rows * 0.4f;
    cv::Rect2f box(bgr.cols * 0.5f - w / 2, bgr.rows * 0.55f, w, h);
    return RawDetections{RawDetection{"pedestrian", conf, box}};
}

DnnDetector::DnnDetector(const std::string& onnx_path, std::vector<std::string> class_names, Params p)
    : p_(p), class_names_(std::move(class_names)) {
    if (!std::filesystem::exists(onnx_path)) throw std::runtime_error("model not found: " + onnx_path);
    try {
        net_ = cv::dnn::readNetFromONNX(onnx_path);
    } catch (const cv::Exception& e) {
        throw std::runtime_error("failed to load " + onnx_path + ": " + e.what());
    }
    if (net_.empty()) throw std::runtime_error("empty network: " + onnx_path);

    if (p_.use_cuda) {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_CUDA);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CUDA);
    } else {
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    }
    name_ = "yolov8-onnx:" + std::filesystem::path(onnx_path).filename().string();
    Logger::info("loaded %s (%zu classes, imgsz %d)", name_.c_str(), class_names_.size(), p_.imgsz);
}

RawDetections DnnDetector::detect(const cv::Mat& bgr, float confidence_threshold) {
    return detect(bgr, confidence_threshold, CancelToken{});
}

RawDetections DnnDetector::detect(const cv::Mat& bgr, float confidence_threshold, const CancelToken& token) {
    if (bgr.empty()) throw std::runtime_error("empty frame");

    cv::Mat out;
    {
        std::lock_guard<std::mutex> lk(net_mu_);
        if (token.cancelled()) return {};
        cv::Mat blob;
        cv::dnn::blobFromImage(bgr, blob, 1.0 / 255.0, cv::Size(p_.imgsz, p_.imgsz), cv::Scalar(), true, false, CV_32F);
        net_.setInput(blob);
        out = net_.forward().clone();
    }
    if (token.cancelled()) return {};

    // [1, 4 + nc, N] -> rows of proposals
    if (out.dims != 3) throw std::runtime_error("unexpected output rank " + std::to_string(out.dims));
    cv::Mat rows = cv::Mat(out.size[1], out.size[2], CV_32F, out.ptr<float>()).t();

    const float xf = bgr.cols / static_cast<float>(p_.imgsz);
    const float yf = bgr.rows / static_cast<float>(p_.imgsz);
    const int nc = rows.cols - 4;

    RawDetections cands;
    for (int i = 0; i < rows.rows; ++i) {
        const float* r = rows.ptr<float>(i);
        cv::Mat scores(1, nc, CV_32F, const_cast<float*>(r + 4));
        cv::Point best;
        double score;
        cv::minMaxLoc(scores, nullptr, &score, nullptr, &best);
        if (score < confidence_threshold) continue;
        if (best.x >= static_cast<int>(class_names_.size()) || class_names_[best.x].empty()) continue;

        float cx = r[0], cy = r[1], w = r[2], h = r[3];
        cv::Rect2f box((cx - w / 2) * xf, (cy - h / 2) * yf, w * xf, h * yf);
        cands.push_back(RawDetection{class_names_[best.x], static_cast<float>(score), box});
    }
    return NMS(cands, p_.nms_thr);
}

std::vector<std::string> DnnDetector::loadClassNames(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot read class names: " + path);
    std::vector<std::string> names;
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        names.push_back(line);
    }
    return names;
}

std::vector<std::string> DnnDetector::vruLabels() {
    return {"pedestrian", "cyclist", "", "motorcyclist"};
}

std::unique_ptr<IDetector> makeDetector(const std::string& model_path, const std::string& classes_path) {
    if (model_path.empty()) {
        Logger::warn("no model configured, using synthetic detector");
        return std::make_unique<SyntheticDetector>();
    }
    auto names = classes_path.empty() ? DnnDetector::vruLabels() : DnnDetector::loadClassNames(classes_path);
    return std::make_unique<DnnDetector>(model_path, std::move(names), DnnDetector::Params{});
}

}  // namespace vdet
