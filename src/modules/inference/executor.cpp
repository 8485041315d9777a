#include "vdet/executor.hpp"

#include <algorithm>

#include "vdet/logger.hpp"
#include "vdet/tracer.hpp"

namespace vdet {

const char* to_string(FrameStatus s) {
    switch (s) {
        case FrameStatus::Processed: return "processed";
        case FrameStatus::Skipped: return "skipped";
        case FrameStatus::Failed: return "failed";
    }
    return "unknown";
}

namespace {

constexpr long long kMaxBackoffMs = 60000;

RawDetections accept(const JobConfig& cfg, RawDetections dets) {
    dets.erase(std::remove_if(dets.begin(), dets.end(),
                              [&](const RawDetection& d) {
                                  return d.confidence < cfg.confidence_threshold || !cfg.accepts(d.label) ||
                                         d.box.width <= 0.f || d.box.height <= 0.f;
                              }),
               dets.end());
    return dets;
}

FrameOutcome invoke(const detail::ExecContext& ctx, const SampledFrame& frame, const cv::Mat& image,
                    detail::CallState& state) {
    FrameOutcome out;
    out.frame = frame;
    auto t0 = Clock::now();

    for (int attempt = 0; attempt <= ctx.cfg.max_retries; ++attempt) {
        {
            std::lock_guard<std::mutex> lk(state.mu);
            if (state.abandoned) break;
        }
        ++out.attempts;
        try {
            RawDetections dets;
            {
                VDET_TRACE_LATENCY(*ctx.metrics, "infer", frame.index, ctx.job_id);
                dets = ctx.detector->detect(image, ctx.cfg.confidence_threshold, state.token);
            }
            out.status = FrameStatus::Processed;
            out.detections = accept(ctx.cfg, std::move(dets));
            out.error.reset();
            out.message.clear();
            break;
        } catch (const std::exception& e) {
            out.status = FrameStatus::Failed;
            out.error = ErrorKind::Inference;
            out.message = InferenceError(e.what()).what();
        } catch (...) {
            out.status = FrameStatus::Failed;
            out.error = ErrorKind::Inference;
            out.message = InferenceError("non-standard exception").what();
        }

        if (attempt < ctx.cfg.max_retries) {
            long long shifted = static_cast<long long>(ctx.cfg.retry_backoff_ms) << std::min(attempt, 16);
            auto backoff = std::chrono::milliseconds(std::min(shifted, kMaxBackoffMs));
            Logger::warn("[%s] frame %d attempt %d failed (%s), retrying in %lld ms", ctx.job_id.c_str(), frame.index,
                         attempt + 1, out.message.c_str(), static_cast<long long>(backoff.count()));
            std::unique_lock<std::mutex> lk(state.mu);
            if (state.cv.wait_for(lk, backoff, [&] { return state.abandoned; })) break;
        }
    }

    if (out.status == FrameStatus::Failed) {
        Logger::warn("[%s] frame %d failed after %d attempts: %s", ctx.job_id.c_str(), frame.index, out.attempts,
                     out.message.c_str());
    }
    out.latency_ms = std::chrono::duration<double, std::milli>(Clock::now() - t0).count();
    return out;
}

}  // namespace

bool InferenceCall::ready() const {
    return result_.valid() && result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::optional<FrameOutcome> InferenceCall::waitUntil(Clock::time_point until) {
    if (!result_.valid()) return std::nullopt;
    if (result_.wait_until(until) != std::future_status::ready) return std::nullopt;
    return result_.get();
}

FrameOutcome InferenceCall::take() {
    return result_.get();
}

void InferenceCall::abandon(bool request_cancel) {
    if (!state_) return;
    {
        std::lock_guard<std::mutex> lk(state_->mu);
        state_->abandoned = true;
    }
    state_->cv.notify_all();
    if (request_cancel) state_->token.cancel();
}

InferenceExecutor::InferenceExecutor(InferencePool& pool, std::shared_ptr<IDetector> detector, const JobConfig& cfg,
                                     std::shared_ptr<Metrics> metrics, std::string job_id)
    : pool_(pool) {
    if (!detector) throw ConfigError("no detector configured");
    if (!metrics) metrics = std::make_shared<Metrics>();
    detector_name_ = detector->name();
    ctx_ = std::make_shared<const detail::ExecContext>(
        detail::ExecContext{std::move(detector), cfg, std::move(metrics), std::move(job_id)});
}

InferenceCall InferenceExecutor::dispatch(const SampledFrame& frame, cv::Mat image, std::function<void()> on_done,
                                          std::optional<Clock::time_point> hard_stop) {
    InferenceCall call;
    call.frame_ = frame;
    call.deadline_ = Clock::now() + std::chrono::milliseconds(ctx_->cfg.per_frame_timeout_ms);
    if (hard_stop && *hard_stop < call.deadline_) call.deadline_ = *hard_stop;
    call.state_ = std::make_shared<detail::CallState>();

    auto promise = std::make_shared<std::promise<FrameOutcome>>();
    call.result_ = promise->get_future();

    auto ctx = ctx_;
    auto state = call.state_;
    bool queued = pool_.submit([ctx, state, promise, frame, image, on_done]() {
        FrameOutcome out = invoke(*ctx, frame, image, *state);
        bool abandoned;
        {
            std::lock_guard<std::mutex> lk(state->mu);
            abandoned = state->abandoned;
        }
        if (abandoned) {
            out.stale = true;
            Logger::debug("[%s] discarding stale result for frame %d", ctx->job_id.c_str(), frame.index);
        }
        promise->set_value(std::move(out));
        if (!abandoned && on_done) on_done();
    });

    if (!queued) {
        FrameOutcome out;
        out.frame = frame;
        out.status = FrameStatus::Failed;
        out.error = ErrorKind::Inference;
        out.message = InferenceError("inference pool is not running").what();
        promise->set_value(std::move(out));
        if (on_done) on_done();
    }
    return call;
}

FrameOutcome InferenceExecutor::expire(InferenceCall& call, const std::string& reason) {
    call.abandon(ctx_->detector->cancellable());
    FrameOutcome out;
    out.frame = call.frame();
    out.status = FrameStatus::Skipped;
    out.error = ErrorKind::InferenceTimeout;
    out.message = InferenceTimeout(reason).what();
    Logger::warn("[%s] frame %d skipped: %s", ctx_->job_id.c_str(), call.frame().index, out.message.c_str());
    return out;
}

FrameOutcome InferenceExecutor::run(const SampledFrame& frame, cv::Mat image) {
    InferenceCall call = dispatch(frame, std::move(image));
    if (auto out = call.waitUntil(call.deadline())) return std::move(*out);
    return expire(call, "no result within " + std::to_string(ctx_->cfg.per_frame_timeout_ms) + " ms");
}

}  // namespace vdet
