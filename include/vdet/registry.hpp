#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "aggregator.hpp"
#include "job.hpp"

namespace vdet {

using ProgressCallback = std::function<void(const ProgressEvent&)>;
using SubscriptionId = std::uint64_t;
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

struct Registration {
    JobId job_id;
    bool created = false;
    CancelFlag cancel;
};

// Single owner of all job state.
//
// Every mutation and query is a message executed in order on one loop
// thread, so no job field is ever touched concurrently. Mutations are posted
// and return immediately; queries block on the reply. Progress events are
// delivered to subscribers from the loop thread.
class TaskRegistry {
public:
    TaskRegistry();
    ~TaskRegistry();

    TaskRegistry(const TaskRegistry&) = delete;
    TaskRegistry& operator=(const TaskRegistry&) = delete;

    // Creates a Queued job for `video_key`, or returns the active job already
    // holding that key with created = false.
    Registration registerJob(const std::string& video_key);

    void transition(const JobId& id, JobState to, const std::string& error = {});
    void updateCounters(const JobId& id, const JobCounters& counters);
    // Moves the job to its terminal state and stores its result.
    void finalize(const JobId& id, JobResult result);

    // Best-effort: raises the job's cancel flag. False when the job is unknown
    // or already terminal.
    bool cancel(const JobId& id);

    std::optional<JobStatus> status(const JobId& id);
    std::optional<JobResult> result(const JobId& id);
    std::vector<ProgressEvent> history(const JobId& id, std::uint64_t after_seq = 0);
    std::vector<JobId> jobs();

    // Replays logged events with seq > after_seq, then streams live ones.
    // Returns 0 when the job is unknown.
    SubscriptionId subscribe(const JobId& id, std::uint64_t after_seq, ProgressCallback cb);
    void unsubscribe(SubscriptionId sid);

    // Terminal state, or nullopt if the job is unknown or `timeout` passes.
    // After stop() every query returns the unknown-job answer.
    std::optional<JobState> wait(const JobId& id, std::chrono::milliseconds timeout);

    void stop() noexcept;

private:
    struct Entry {
        JobStatus status;
        std::chrono::steady_clock::time_point created;
        std::optional<std::chrono::steady_clock::time_point> ended;
        std::vector<ProgressEvent> log;
        std::optional<JobResult> result;
        CancelFlag cancel;
    };

    struct Subscriber {
        JobId job;
        ProgressCallback cb;
    };

    // False once the registry is stopped; the message is dropped.
    bool post(std::function<void()> fn);

    template <typename F>
    auto call(F fn) -> decltype(fn()) {
        using R = decltype(fn());
        if (std::this_thread::get_id() == loop_id_) return fn();
        auto done = std::make_shared<std::promise<R>>();
        auto fut = done->get_future();
        bool queued = post([done, fn]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    done->set_value();
                } else {
                    done->set_value(fn());
                }
            } catch (...) {
                done->set_exception(std::current_exception());
            }
        });
        // A stopped registry answers every query as if the job were unknown.
        if (!queued) return R();
        return fut.get();
    }

    void loop();
    void emit(Entry& e);
    void deliver(const ProgressEvent& ev);
    JobStatus snapshot(const Entry& e) const;
    static JobId generateId();

    std::mutex queueMutex_;
    std::condition_variable messageAvailable_;
    std::queue<std::function<void()>> messages_;
    bool shutdown_ = false;
    std::thread loop_thread_;
    std::thread::id loop_id_;

    // loop-thread state
    std::unordered_map<JobId, Entry> jobs_;
    std::unordered_map<std::string, JobId> active_by_key_;
    std::map<SubscriptionId, Subscriber> subscribers_;
    SubscriptionId next_sub_ = 1;
};

// Subscriber-side filter for at-least-once delivery: accepts each seq once,
// in increasing order.
class ProgressCursor {
public:
    explicit ProgressCursor(std::uint64_t last_seen = 0) : last_(last_seen) {}
    bool accept(const ProgressEvent& ev) {
        if (ev.seq <= last_) return false;
        last_ = ev.seq;
        return true;
    }
    std::uint64_t lastSeen() const { return last_; }

private:
    std::uint64_t last_;
};

}  // namespace vdet
