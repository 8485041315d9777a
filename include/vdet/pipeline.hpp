#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

#include "config.hpp"
#include "correlator.hpp"
#include "detector.hpp"
#include "executor.hpp"
#include "frame_source.hpp"
#include "metrics.hpp"
#include "registry.hpp"
#include "supervisor.hpp"

namespace vdet {

// Front door of the service: owns the registry, the shared inference pool and
// one supervisor per submitted job.
class Pipeline {
public:
    // Throws std::runtime_error when the inference pool cannot start.
    Pipeline(PipelineOptions opts, std::shared_ptr<IDetector> detector,
             std::shared_ptr<Metrics> metrics = std::make_shared<Metrics>(),
             TrackIdSequence& track_ids = TrackIdSequence::global());
    ~Pipeline();

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Validates `cfg` (ConfigError) and starts a job, or returns the id of the
    // job already running against the same source key.
    JobId submit(SourceHandle source, const JobConfig& cfg);

    std::optional<JobStatus> status(const JobId& id) { return registry_.status(id); }
    std::optional<JobResult> result(const JobId& id) { return registry_.result(id); }
    std::vector<ProgressEvent> history(const JobId& id, std::uint64_t after_seq = 0) {
        return registry_.history(id, after_seq);
    }
    SubscriptionId subscribe(const JobId& id, std::uint64_t after_seq, ProgressCallback cb) {
        return registry_.subscribe(id, after_seq, std::move(cb));
    }
    void unsubscribe(SubscriptionId sid) { registry_.unsubscribe(sid); }
    bool cancel(const JobId& id) { return registry_.cancel(id); }

    // Terminal state, or nullopt on timeout or an unknown id.
    std::optional<JobState> wait(const JobId& id, std::chrono::milliseconds timeout) {
        return registry_.wait(id, timeout);
    }

    Metrics& metrics() { return *metrics_; }

    // Joins every supervisor and stops the pool. Idempotent.
    void shutdown();

private:
    void reap();

    std::shared_ptr<IDetector> detector_;
    std::shared_ptr<Metrics> metrics_;
    TrackIdSequence& track_ids_;
    TaskRegistry registry_;
    InferencePool pool_;

    std::mutex jobs_mu_;
    std::map<JobId, std::unique_ptr<JobSupervisor>> supervisors_;
    bool stopped_ = false;
};

}  // namespace vdet
