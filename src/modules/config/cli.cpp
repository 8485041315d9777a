#include "vdet/cli.hpp"

#include <string>

namespace vdet {

const char* cliKeys() {
    return
        "{help h usage ? |            | print this message }"
        "{input i        |            | path to the video (required) }"
        "{config c       |            | YAML/JSON job config; flags below override it }"
        "{model          |            | YOLOv8 ONNX model; synthetic detector when empty }"
        "{classes        |            | class names, one per line (default: COCO vulnerable road users) }"
        "{stride         | -1         | sample every Nth frame }"
        "{max_samples    | -1         | cap on sampled frames, overrides stride }"
        "{frame_timeout  | -1         | per-frame inference timeout, ms }"
        "{total_timeout  | -1         | whole-job budget, ms }"
        "{conf           | -1         | confidence threshold }"
        "{targets        |            | comma separated labels to keep }"
        "{concurrency    | -1         | frames in flight per job }"
        "{workers        | 4          | inference pool threads }"
        "{no_fallback    |            | never return the synthetic result set }"
        "{output o       | result.json| where to write the JSON result }"
        "{latency_csv    |            | dump stage stamps as CSV }";
}

JobConfig configFromArgs(const cv::CommandLineParser& p) {
    JobConfig cfg;
    if (p.has("config")) cfg = loadConfig(p.get<std::string>("config"), cfg);

    if (p.get<int>("stride") != -1) cfg.stride = p.get<int>("stride");
    if (p.get<int>("max_samples") != -1) cfg.max_samples = p.get<int>("max_samples");
    if (p.get<int>("frame_timeout") != -1) cfg.per_frame_timeout_ms = p.get<int>("frame_timeout");
    if (p.get<int>("total_timeout") != -1) cfg.total_timeout_ms = p.get<int>("total_timeout");
    if (p.get<float>("conf") != -1.f) cfg.confidence_threshold = p.get<float>("conf");
    if (p.has("targets")) cfg.target_classes = splitList(p.get<std::string>("targets"));
    if (p.get<int>("concurrency") != -1) cfg.max_concurrency = p.get<int>("concurrency");
    if (p.has("no_fallback")) cfg.fallback_enabled = false;
    return cfg;
}

}  // namespace vdet
