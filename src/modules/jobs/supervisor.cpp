#include "vdet/supervisor.hpp"

#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <system_error>
#include <vector>

#include "vdet/aggregator.hpp"
#include "vdet/errors.hpp"
#include "vdet/logger.hpp"
#include "vdet/sampler.hpp"
#include "vdet/tracer.hpp"

namespace vdet {

namespace {

// Completion doorbell rung from pool workers. Shared so that late calls can
// still ring it after the job is gone.
struct Doorbell {
    std::mutex mu;
    std::condition_variable cv;
    std::uint64_t rings = 0;

    void ring() {
        {
            std::lock_guard<std::mutex> lk(mu);
            ++rings;
        }
        cv.notify_all();
    }

    void waitUntil(Clock::time_point until, std::uint64_t& seen) {
        std::unique_lock<std::mutex> lk(mu);
        cv.wait_until(lk, until, [&] { return rings != seen; });
        seen = rings;
    }
};

struct InFlight {
    std::size_t pos;
    InferenceCall call;
};

}  // namespace

JobSupervisor::JobSupervisor(JobId id, SourceHandle source, JobConfig cfg, CancelFlag cancel, SupervisorDeps deps)
    : id_(std::move(id)), source_(std::move(source)), cfg_(std::move(cfg)), cancel_(std::move(cancel)),
      deps_(std::move(deps)) {}

JobSupervisor::~JobSupervisor() {
    join();
}

bool JobSupervisor::start() {
    if (thread_.joinable()) return false;
    started_ = Clock::now();
    try {
        thread_ = std::thread(&JobSupervisor::run, this);
        return true;
    } catch (const std::system_error& e) {
        Logger::error("[%s] cannot start supervisor: %s", id_.c_str(), e.what());
        return false;
    }
}

void JobSupervisor::join() {
    if (thread_.joinable()) thread_.join();
}

void JobSupervisor::fail(const std::string& message, const JobCounters& counters) {
    Logger::error("[%s] failed: %s", id_.c_str(), message.c_str());
    ResultAggregator agg(id_, source_.key, deps_.detector ? deps_.detector->name() : std::string());
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    JobResult r = agg.build(JobState::Failed, counters, {}, elapsed, false, message);
    deps_.registry.finalize(id_, std::move(r));
}

void JobSupervisor::run() {
    ScopedThreadName name("job-" + id_.substr(id_.size() > 6 ? id_.size() - 6 : 0));
    deps_.registry.transition(id_, JobState::Running);

    JobCounters counters;
    std::unique_ptr<IFrameSource> src;
    try {
        if (source_.open) src = source_.open();
        if (!src) throw SourceUnavailable("no source for " + source_.key);
    } catch (const std::exception& e) {
        fail(e.what(), counters);
        finished_.store(true);
        return;
    }

    const Clock::time_point deadline = started_ + std::chrono::milliseconds(cfg_.total_timeout_ms);
    const Clock::time_point hard_stop = deadline + std::chrono::milliseconds(cfg_.grace_period_ms);

    bool cancelled = false;
    bool timed_out = false;
    bool finalizing = false;
    try {
        FrameSampler sampler(src->frameCount(), src->fps(), SamplingPlan{cfg_.stride, cfg_.max_samples});
        counters.frames_total = static_cast<int>(sampler.size());
        deps_.registry.updateCounters(id_, counters);
        Logger::info("[%s] %s: %d frames @ %.2f fps, %d sampled (stride %d)", id_.c_str(), source_.key.c_str(),
                     src->frameCount(), src->fps(), counters.frames_total, sampler.stride());

        InferenceExecutor exec(deps_.pool, deps_.detector, cfg_, deps_.metrics, id_);
        TrackCorrelator correlator(CorrelatorParams{cfg_.iou_threshold, cfg_.max_gap, cfg_.confidence_alpha},
                                   deps_.track_ids);
        ResultAggregator agg(id_, source_.key, exec.detectorName());
        agg.setVideo(src->frameCount(), src->fps());
        agg.setSynthetic(deps_.detector->synthetic());

        auto bell = std::make_shared<Doorbell>();
        std::uint64_t seen = 0;
        std::vector<InFlight> inflight;
        std::map<std::size_t, FrameOutcome> done;
        std::size_t next_pos = 0;
        int read_errors = 0;

        auto settle = [&](std::size_t pos, FrameOutcome out) {
            switch (out.status) {
                case FrameStatus::Processed: ++counters.frames_processed; break;
                case FrameStatus::Skipped: ++counters.frames_skipped; break;
                case FrameStatus::Failed: ++counters.frames_failed; break;
            }
            done.emplace(pos, std::move(out));
        };

        // Correlate the contiguous run of settled frames, in sample order.
        auto drain = [&]() {
            for (auto it = done.find(next_pos); it != done.end(); it = done.find(++next_pos)) {
                const FrameOutcome& out = it->second;
                if (out.status == FrameStatus::Processed) {
                    auto assigned = correlator.observe(out.frame.index, out.detections);
                    for (const Assignment& a : assigned) {
                        agg.record(out.frame.index, out.frame.timestamp_s, out.detections[a.detection], a.track_id);
                    }
                    counters.detections_found += static_cast<int>(out.detections.size());
                }
                done.erase(it);
            }
            counters.open_tracks = static_cast<int>(correlator.openCount());
        };

        while (true) {
            Clock::time_point now = Clock::now();

            for (auto it = inflight.begin(); it != inflight.end();) {
                if (it->call.ready()) {
                    settle(it->pos, it->call.take());
                } else if (now >= it->call.deadline()) {
                    std::string why = now >= hard_stop ? "job budget exhausted"
                                                       : "no result within " + std::to_string(cfg_.per_frame_timeout_ms) + " ms";
                    settle(it->pos, exec.expire(it->call, why));
                } else {
                    ++it;
                    continue;
                }
                it = inflight.erase(it);
            }
            drain();
            deps_.registry.updateCounters(id_, counters);

            if (!timed_out && !cancelled && now >= deadline && (!sampler.exhausted() || !inflight.empty())) {
                timed_out = true;
                Logger::warn("[%s] total budget of %d ms exceeded with %zu frames in flight", id_.c_str(),
                             cfg_.total_timeout_ms, inflight.size());
            }

            while (!timed_out && !cancelled && !sampler.exhausted() &&
                   inflight.size() < static_cast<std::size_t>(cfg_.max_concurrency)) {
                if (cancel_->load()) {
                    cancelled = true;
                    Logger::info("[%s] cancelled with %zu of %d frames dispatched", id_.c_str(), sampler.position(),
                                 counters.frames_total);
                    break;
                }
                if (Clock::now() >= deadline) break;

                SampledFrame frame = *sampler.next();
                std::size_t pos = sampler.position() - 1;
                ++counters.frames_dispatched;

                cv::Mat image;
                try {
                    VDET_TRACE_METRICS(*deps_.metrics, "read", frame.index);
                    image = src->getFrame(frame.index);
                } catch (const FrameReadError& e) {
                    ++read_errors;
                    FrameOutcome out;
                    out.frame = frame;
                    out.status = FrameStatus::Skipped;
                    out.error = ErrorKind::FrameRead;
                    out.message = e.what();
                    Logger::warn("[%s] %s", id_.c_str(), e.what());
                    settle(pos, std::move(out));
                    continue;
                }
                inflight.push_back({pos, exec.dispatch(frame, std::move(image), [bell] { bell->ring(); }, hard_stop)});
            }
            drain();
            deps_.registry.updateCounters(id_, counters);

            if (inflight.empty() && (sampler.exhausted() || timed_out || cancelled)) break;

            Clock::time_point wake = hard_stop;
            for (const auto& f : inflight) wake = std::min(wake, f.call.deadline());
            if (!timed_out) wake = std::min(wake, deadline);
            if (inflight.empty()) wake = std::min(wake, Clock::now() + std::chrono::milliseconds(5));
            bell->waitUntil(wake, seen);
        }

        if (counters.frames_dispatched > 0 && read_errors == counters.frames_dispatched) {
            fail(SourceUnavailable("every sampled frame of " + source_.key + " was unreadable").what(), counters);
            finished_.store(true);
            return;
        }

        finalizing = true;
        deps_.registry.transition(id_, JobState::Finalizing);

        JobState terminal = cancelled ? JobState::Cancelled : timed_out ? JobState::TimedOut : JobState::Completed;
        std::string note;
        if (timed_out) note = JobTimeout("total budget of " + std::to_string(cfg_.total_timeout_ms) + " ms exceeded").what();

        counters.open_tracks = 0;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
        JobResult r = agg.build(terminal, counters, correlator.finish(), elapsed, cfg_.fallback_enabled, note);
        Logger::info("[%s] %s: %d/%d frames processed, %d skipped, %d failed, %zu tracks, source %s", id_.c_str(),
                     to_string(terminal), counters.frames_processed, counters.frames_total, counters.frames_skipped,
                     counters.frames_failed, r.tracks.size(), to_string(r.source));
        deps_.registry.finalize(id_, std::move(r));
    } catch (const std::exception& e) {
        if (!finalizing) {
            fail(e.what(), counters);
        } else {
            // Finalizing cannot fall back to Failed; publish an empty degraded result.
            Logger::error("[%s] finalization error: %s", id_.c_str(), e.what());
            ResultAggregator agg(id_, source_.key, deps_.detector->name());
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
            JobState terminal = cancelled ? JobState::Cancelled : timed_out ? JobState::TimedOut : JobState::Completed;
            JobResult r = agg.build(terminal, counters, {}, elapsed, false, e.what());
            r.degraded = true;
            deps_.registry.finalize(id_, std::move(r));
        }
    }
    finished_.store(true);
}

}  // namespace vdet
