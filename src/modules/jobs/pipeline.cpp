#include "vdet/pipeline.hpp"

#include <stdexcept>

#include "vdet/errors.hpp"
#include "vdet/logger.hpp"

namespace vdet {

Pipeline::Pipeline(PipelineOptions opts, std::shared_ptr<IDetector> detector, std::shared_ptr<Metrics> metrics,
                   TrackIdSequence& track_ids)
    : detector_(std::move(detector)),
      metrics_(metrics ? std::move(metrics) : std::make_shared<Metrics>()),
      track_ids_(track_ids),
      pool_(opts.inference_workers) {
    if (!detector_) throw std::invalid_argument("pipeline needs a detector");
    if (!pool_.start()) {
        registry_.stop();
        throw std::runtime_error("failed to start inference pool");
    }
    Logger::info("pipeline up: detector %s, %d inference workers", detector_->name().c_str(), pool_.workerCount());
}

Pipeline::~Pipeline() {
    shutdown();
}

void Pipeline::shutdown() {
    std::map<JobId, std::unique_ptr<JobSupervisor>> jobs;
    {
        std::lock_guard<std::mutex> lk(jobs_mu_);
        if (stopped_) return;
        stopped_ = true;
        jobs.swap(supervisors_);
    }
    if (!jobs.empty()) Logger::info("shutdown: cancelling %zu active jobs", jobs.size());
    for (auto& kv : jobs) kv.second->cancel();
    for (auto& kv : jobs) kv.second->join();
    pool_.stop();
    registry_.stop();
}

// Drops supervisors whose thread has finished. Caller holds jobs_mu_.
void Pipeline::reap() {
    for (auto it = supervisors_.begin(); it != supervisors_.end();) {
        if (it->second->finished()) {
            it->second->join();
            it = supervisors_.erase(it);
        } else {
            ++it;
        }
    }
}

JobId Pipeline::submit(SourceHandle source, const JobConfig& cfg) {
    cfg.validate();
    if (source.key.empty()) throw ConfigError("source key must not be empty");

    std::lock_guard<std::mutex> lk(jobs_mu_);
    if (stopped_) throw std::runtime_error("pipeline is shut down");
    reap();

    Registration reg = registry_.registerJob(source.key);
    if (!reg.created) return reg.job_id;

    const std::string key = source.key;
    SupervisorDeps deps{registry_, pool_, detector_, metrics_, track_ids_};
    auto sup = std::make_unique<JobSupervisor>(reg.job_id, std::move(source), cfg, reg.cancel, deps);
    if (!sup->start()) {
        registry_.transition(reg.job_id, JobState::Running);
        ResultAggregator agg(reg.job_id, key, detector_->name());
        registry_.finalize(reg.job_id,
                           agg.build(JobState::Failed, {}, {}, std::chrono::milliseconds(0), false,
                                     "could not start job thread"));
        return reg.job_id;
    }
    supervisors_.emplace(reg.job_id, std::move(sup));
    return reg.job_id;
}

}  // namespace vdet
