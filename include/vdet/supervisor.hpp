#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "config.hpp"
#include "correlator.hpp"
#include "detector.hpp"
#include "executor.hpp"
#include "frame_source.hpp"
#include "job.hpp"
#include "metrics.hpp"
#include "registry.hpp"

namespace vdet {

struct SupervisorDeps {
    TaskRegistry& registry;
    InferencePool& pool;
    std::shared_ptr<IDetector> detector;
    std::shared_ptr<Metrics> metrics;
    TrackIdSequence& track_ids;
};

// Drives one job from Running to a terminal state on its own thread.
//
// Keeps up to max_concurrency frames in flight on the shared pool, feeds the
// correlator in frame order whatever the completion order, and enforces the
// total budget: once it expires nothing new is dispatched and in-flight calls
// are cut off after the grace period. All state changes are reported to the
// registry; the supervisor never reads job state back from it except the
// cancel flag.
class JobSupervisor {
public:
    JobSupervisor(JobId id, SourceHandle source, JobConfig cfg, CancelFlag cancel, SupervisorDeps deps);
    ~JobSupervisor();

    JobSupervisor(const JobSupervisor&) = delete;
    JobSupervisor& operator=(const JobSupervisor&) = delete;

    [[nodiscard]] bool start();
    void join();
    // Raises the job's cancel flag; the job ends Cancelled once in-flight calls settle.
    void cancel() { cancel_->store(true); }
    bool finished() const { return finished_.load(); }
    const JobId& id() const { return id_; }

private:
    void run();
    void fail(const std::string& message, const JobCounters& counters);

    JobId id_;
    SourceHandle source_;
    JobConfig cfg_;
    CancelFlag cancel_;
    SupervisorDeps deps_;
    Clock::time_point started_;

    std::thread thread_;
    std::atomic<bool> finished_{false};
};

}  // namespace vdet
