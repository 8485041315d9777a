#include "vdet/config.hpp"

#include <algorithm>
#include <sstream>
#include <type_traits>

#include <opencv2/core/persistence.hpp>

#include "vdet/errors.hpp"
#include "vdet/logger.hpp"

namespace vdet {

namespace {

void require(bool ok, const std::string& what) {
    if (!ok) throw ConfigError(what);
}

std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

template <typename T>
void readScalar(const cv::FileNode& root, const char* key, T& out) {
    cv::FileNode n = root[key];
    if (n.empty() || n.isNone()) return;
    if (!n.isInt() && !n.isReal()) throw ConfigError(std::string(key) + " must be a number");
    if constexpr (std::is_floating_point_v<T>) {
        out = static_cast<T>(static_cast<double>(n));
    } else {
        if (!n.isInt()) throw ConfigError(std::string(key) + " must be an integer");
        out = static_cast<T>(static_cast<int>(n));
    }
}

}  // namespace

void JobConfig::validate() const {
    require(stride > 0, "stride must be positive, got " + std::to_string(stride));
    require(!max_samples || *max_samples > 0, "max_samples must be positive");
    require(per_frame_timeout_ms > 0, "per_frame_timeout_ms must be positive");
    require(total_timeout_ms > 0, "total_timeout_ms must be positive");
    require(grace_period_ms >= 0, "grace_period_ms must not be negative");
    require(confidence_threshold >= 0.f && confidence_threshold <= 1.f, "confidence_threshold must be in [0, 1]");
    require(max_concurrency >= 1 && max_concurrency <= 64, "max_concurrency must be in [1, 64]");
    require(max_retries >= 0 && max_retries <= 16, "max_retries must be in [0, 16]");
    require(retry_backoff_ms >= 0, "retry_backoff_ms must not be negative");
    require(iou_threshold > 0.f && iou_threshold <= 1.f, "iou_threshold must be in (0, 1]");
    require(max_gap >= 0, "max_gap must not be negative");
    require(confidence_alpha > 0.f && confidence_alpha <= 1.f, "confidence_alpha must be in (0, 1]");
    for (const auto& c : target_classes) require(!trim(c).empty(), "target_classes must not contain empty labels");
}

bool JobConfig::accepts(const std::string& label) const {
    if (target_classes.empty()) return true;
    return std::find(target_classes.begin(), target_classes.end(), label) != target_classes.end();
}

std::vector<std::string> splitList(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

JobConfig loadConfig(const std::string& path, JobConfig base) {
    cv::FileStorage fs;
    try {
        if (!fs.open(path, cv::FileStorage::READ)) throw ConfigError("cannot open config " + path);
    } catch (const cv::Exception& e) {
        throw ConfigError("cannot parse config " + path + ": " + e.what());
    }

    cv::FileNode root = fs.root();
    readScalar(root, "stride", base.stride);
    if (!root["max_samples"].empty()) {
        int n = 0;
        readScalar(root, "max_samples", n);
        base.max_samples = n;
    }
    readScalar(root, "per_frame_timeout_ms", base.per_frame_timeout_ms);
    readScalar(root, "total_timeout_ms", base.total_timeout_ms);
    readScalar(root, "grace_period_ms", base.grace_period_ms);
    readScalar(root, "confidence_threshold", base.confidence_threshold);
    readScalar(root, "max_concurrency", base.max_concurrency);
    readScalar(root, "max_retries", base.max_retries);
    readScalar(root, "retry_backoff_ms", base.retry_backoff_ms);
    readScalar(root, "iou_threshold", base.iou_threshold);
    readScalar(root, "max_gap", base.max_gap);
    readScalar(root, "confidence_alpha", base.confidence_alpha);

    cv::FileNode fb = root["fallback_enabled"];
    if (!fb.empty()) {
        if (!fb.isInt()) throw ConfigError("fallback_enabled must be 0 or 1");
        base.fallback_enabled = static_cast<int>(fb) != 0;
    }

    cv::FileNode targets = root["target_classes"];
    if (!targets.empty()) {
        base.target_classes.clear();
        if (targets.isString()) {
            base.target_classes = splitList(static_cast<std::string>(targets));
        } else if (targets.isSeq()) {
            for (const auto& n : targets) {
                if (!n.isString()) throw ConfigError("target_classes entries must be strings");
                base.target_classes.push_back(trim(static_cast<std::string>(n)));
            }
        } else {
            throw ConfigError("target_classes must be a list or a comma separated string");
        }
    }

    Logger::debug("loaded config %s", path.c_str());
    return base;
}

}  // namespace vdet
