#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "config.hpp"
#include "detector.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "metrics.hpp"

namespace vdet {

using Clock = std::chrono::steady_clock;

// Fixed set of inference threads shared by every job, so the number of
// concurrent detector calls is capped process-wide.
class InferencePool {
public:
    explicit InferencePool(int workers) noexcept;
    ~InferencePool();

    InferencePool(const InferencePool&) = delete;
    InferencePool& operator=(const InferencePool&) = delete;

    [[nodiscard]] bool start();
    void stop() noexcept;
    [[nodiscard]] bool submit(std::function<void()> task);

    bool isRunning() const noexcept { return running_.load(); }
    std::size_t queueSize() const;
    int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable taskAvailable_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> threads_;
};

enum class FrameStatus { Processed, Skipped, Failed };

const char* to_string(FrameStatus s);

struct FrameOutcome {
    SampledFrame frame;
    FrameStatus status = FrameStatus::Processed;
    RawDetections detections;
    int attempts = 0;
    double latency_ms = 0.0;
    bool stale = false;
    std::optional<ErrorKind> error;
    std::string message;
};

namespace detail {
struct CallState {
    std::mutex mu;
    std::condition_variable cv;
    bool abandoned = false;
    CancelToken token;
};

// Everything a queued call needs; shared so abandoned calls may outlive the
// executor that issued them.
struct ExecContext {
    std::shared_ptr<IDetector> detector;
    JobConfig cfg;
    std::shared_ptr<Metrics> metrics;
    std::string job_id;
};
}  // namespace detail

// Handle to one in-flight detector invocation.
class InferenceCall {
public:
    InferenceCall() = default;

    const SampledFrame& frame() const { return frame_; }
    Clock::time_point deadline() const { return deadline_; }
    bool valid() const { return result_.valid(); }
    bool ready() const;

    // Blocks until the result arrives or `until` passes.
    std::optional<FrameOutcome> waitUntil(Clock::time_point until);
    // Takes a result that ready() reported.
    FrameOutcome take();

    // Marks the call stale: any late result is discarded. Raises the cancel
    // token when the detector can observe it.
    void abandon(bool request_cancel);

private:
    friend class InferenceExecutor;

    SampledFrame frame_;
    Clock::time_point deadline_;
    std::future<FrameOutcome> result_;
    std::shared_ptr<detail::CallState> state_;
};

class InferenceExecutor {
public:
    InferenceExecutor(InferencePool& pool, std::shared_ptr<IDetector> detector, const JobConfig& cfg,
                      std::shared_ptr<Metrics> metrics, std::string job_id);

    // Queues a call on the pool. `on_done` runs on the worker thread after the
    // result is published; it is skipped for abandoned calls. The per-frame
    // deadline starts now and is clipped to `hard_stop` when given.
    InferenceCall dispatch(const SampledFrame& frame, cv::Mat image, std::function<void()> on_done = {},
                           std::optional<Clock::time_point> hard_stop = std::nullopt);

    // Abandons `call` and returns the Skipped outcome for its frame.
    FrameOutcome expire(InferenceCall& call, const std::string& reason);

    // dispatch() followed by a wait bounded by the per-frame timeout.
    FrameOutcome run(const SampledFrame& frame, cv::Mat image);

    const std::string& detectorName() const { return detector_name_; }

private:
    InferencePool& pool_;
    std::shared_ptr<const detail::ExecContext> ctx_;
    std::string detector_name_;
};

}  // namespace vdet
