#pragma once
#include <optional>
#include <string>
#include <vector>

namespace vdet {

struct JobConfig {
    // max_samples, when set, overrides stride.
    int stride = 5;
    std::optional<int> max_samples;

    int per_frame_timeout_ms = 15000;
    int total_timeout_ms = 300000;
    int grace_period_ms = 1000;

    float confidence_threshold = 0.35f;
    std::vector<std::string> target_classes;  // empty: accept every label
    int max_concurrency = 4;

    int max_retries = 2;
    int retry_backoff_ms = 100;

    float iou_threshold = 0.3f;
    int max_gap = 3;
    float confidence_alpha = 0.5f;

    bool fallback_enabled = true;

    // Throws ConfigError describing the first invalid field.
    void validate() const;
    bool accepts(const std::string& label) const;
};

struct PipelineOptions {
    int inference_workers = 4;
};

// Reads a YAML or JSON file through cv::FileStorage. Missing keys keep their
// defaults. Throws ConfigError when the file cannot be parsed.
JobConfig loadConfig(const std::string& path, JobConfig base = {});

std::vector<std::string> splitList(const std::string& csv);

}  // namespace vdet
