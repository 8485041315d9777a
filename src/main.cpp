#include <algorithm>
#include <iostream>
#include <numeric>
#include <string>

#include "vdet/cli.hpp"
#include "vdet/errors.hpp"
#include "vdet/logger.hpp"
#include "vdet/pipeline.hpp"

using namespace vdet;

static void printProgress(const ProgressEvent& ev) {
    const JobCounters& c = ev.counters;
    Logger::info("#%llu %s %d/%d processed, %d skipped, %d failed, %d detections, %d open tracks",
                 static_cast<unsigned long long>(ev.seq), to_string(ev.state), c.frames_processed, c.frames_total,
                 c.frames_skipped, c.frames_failed, c.detections_found, c.open_tracks);
}

int main(int argc, char** argv) {
    cv::CommandLineParser parser(argc, argv, cliKeys());
    parser.about("vdet: bounded-time object detection over a video");
    if (parser.has("help")) {
        parser.printMessage();
        return 0;
    }
    if (!parser.has("input")) {
        Logger::error("--input is required");
        parser.printMessage();
        return 1;
    }
    const std::string input = parser.get<std::string>("input");
    const std::string output = parser.get<std::string>("output");
    if (!parser.check()) {
        parser.printErrors();
        return 1;
    }

    JobConfig cfg;
    try {
        cfg = configFromArgs(parser);
        cfg.validate();
    } catch (const ConfigError& e) {
        Logger::error("%s", e.what());
        return 1;
    }

    std::shared_ptr<IDetector> detector;
    try {
        detector = makeDetector(parser.get<std::string>("model"), parser.get<std::string>("classes"));
    } catch (const std::exception& e) {
        Logger::error("cannot load detector: %s", e.what());
        return 1;
    }

    PipelineOptions opts;
    opts.inference_workers = std::max(1, parser.get<int>("workers"));
    auto metrics = std::make_shared<Metrics>();

    std::optional<JobResult> result;
    try {
        Pipeline pipeline(opts, detector, metrics);
        JobId id = pipeline.submit(SourceHandle::file(input), cfg);
        SubscriptionId sub = pipeline.subscribe(id, 0, printProgress);

        auto budget = std::chrono::milliseconds(cfg.total_timeout_ms + cfg.grace_period_ms) + std::chrono::seconds(30);
        auto state = pipeline.wait(id, budget);
        pipeline.unsubscribe(sub);
        if (state) result = pipeline.result(id);
        if (!result) {
            Logger::error("[%s] no terminal state within %lld ms", id.c_str(), static_cast<long long>(budget.count()));
            pipeline.cancel(id);
            return 1;
        }
    } catch (const ConfigError& e) {
        Logger::error("%s", e.what());
        return 1;
    } catch (const std::exception& e) {
        Logger::error("pipeline error: %s", e.what());
        return 1;
    }

    if (!writeJson(*result, output)) return 1;
    Logger::info("%s: %zu tracks, %zu detections (%s%s), result saved to %s", to_string(result->state),
                 result->tracks.size(), result->detections.size(), to_string(result->source),
                 result->degraded ? ", degraded" : "", output.c_str());

    auto samples = metrics->latencies();
    if (!samples.empty()) {
        double sum = std::accumulate(samples.begin(), samples.end(), 0.0,
                                     [](double acc, const LatencySample& s) { return acc + s.ms; });
        Logger::info("inference: %zu calls, mean %.1f ms", samples.size(), sum / samples.size());
    }
    if (parser.has("latency_csv")) {
        std::string path = parser.get<std::string>("latency_csv");
        if (metrics->dump_csv(path)) Logger::info("%s saved", path.c_str());
        else Logger::error("cannot write %s", path.c_str());
    }

    return result->state == JobState::Failed ? 1 : 0;
}
