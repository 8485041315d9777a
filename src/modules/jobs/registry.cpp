#include "vdet/registry.hpp"

#include <sstream>
#include <unistd.h>

#include "vdet/logger.hpp"

namespace vdet {

TaskRegistry::TaskRegistry() {
    loop_thread_ = std::thread(&TaskRegistry::loop, this);
    loop_id_ = loop_thread_.get_id();
}

TaskRegistry::~TaskRegistry() {
    stop();
}

void TaskRegistry::stop() noexcept {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_) return;
        shutdown_ = true;
    }
    messageAvailable_.notify_all();
    if (loop_thread_.joinable()) loop_thread_.join();
}

bool TaskRegistry::post(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (shutdown_) {
            Logger::debug("registry stopped, message dropped");
            return false;
        }
        messages_.push(std::move(fn));
    }
    messageAvailable_.notify_one();
    return true;
}

void TaskRegistry::loop() {
    ScopedThreadName name("registry");
    while (true) {
        std::function<void()> msg;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            messageAvailable_.wait(lock, [this] { return !messages_.empty() || shutdown_; });
            // drain what is queued before honoring shutdown
            if (messages_.empty()) break;
            msg = std::move(messages_.front());
            messages_.pop();
        }
        try {
            msg();
        } catch (const std::exception& e) {
            Logger::error("registry message failed: %s", e.what());
        }
    }
    Logger::debug("registry loop stopped");
}

JobId TaskRegistry::generateId() {
    static std::atomic<std::uint64_t> counter{0};
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::stringstream ss;
    ss << "job-" << now << "-" << getpid() << "-" << counter.fetch_add(1);
    return ss.str();
}

JobStatus TaskRegistry::snapshot(const Entry& e) const {
    JobStatus s = e.status;
    auto end = e.ended ? *e.ended : std::chrono::steady_clock::now();
    s.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - e.created).count();
    s.cancel_requested = e.cancel->load();
    s.last_seq = e.log.empty() ? 0 : e.log.back().seq;
    return s;
}

void TaskRegistry::emit(Entry& e) {
    ProgressEvent ev;
    ev.job_id = e.status.job_id;
    ev.seq = e.log.empty() ? 1 : e.log.back().seq + 1;
    ev.state = e.status.state;
    ev.counters = e.status.counters;
    ev.timestamp = std::chrono::system_clock::now();
    e.log.push_back(ev);
    deliver(ev);
}

void TaskRegistry::deliver(const ProgressEvent& ev) {
    // callbacks may unsubscribe themselves
    std::vector<SubscriptionId> targets;
    for (const auto& kv : subscribers_) {
        if (kv.second.job == ev.job_id) targets.push_back(kv.first);
    }
    for (SubscriptionId sid : targets) {
        auto it = subscribers_.find(sid);
        if (it == subscribers_.end()) continue;
        ProgressCallback cb = it->second.cb;
        try {
            cb(ev);
        } catch (const std::exception& e) {
            Logger::error("subscriber %llu raised on %s#%llu: %s", static_cast<unsigned long long>(sid),
                          ev.job_id.c_str(), static_cast<unsigned long long>(ev.seq), e.what());
        }
    }
}

Registration TaskRegistry::registerJob(const std::string& video_key) {
    return call([this, video_key]() {
        auto active = active_by_key_.find(video_key);
        if (active != active_by_key_.end()) {
            Logger::info("%s already running as %s", video_key.c_str(), active->second.c_str());
            return Registration{active->second, false, jobs_.at(active->second).cancel};
        }

        Entry e;
        e.status.job_id = generateId();
        e.status.video_key = video_key;
        e.status.state = JobState::Queued;
        e.created = std::chrono::steady_clock::now();
        e.cancel = std::make_shared<std::atomic<bool>>(false);
        JobId id = e.status.job_id;
        auto& stored = jobs_.emplace(id, std::move(e)).first->second;
        active_by_key_[video_key] = id;
        emit(stored);
        return Registration{id, true, stored.cancel};
    });
}

void TaskRegistry::transition(const JobId& id, JobState to, const std::string& error) {
    post([this, id, to, error]() {
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            Logger::error("transition for unknown job %s", id.c_str());
            return;
        }
        Entry& e = it->second;
        if (!canTransition(e.status.state, to)) {
            Logger::error("[%s] illegal transition %s -> %s", id.c_str(), to_string(e.status.state), to_string(to));
            return;
        }
        Logger::info("[%s] %s -> %s", id.c_str(), to_string(e.status.state), to_string(to));
        e.status.state = to;
        if (!error.empty()) e.status.error = error;
        if (isTerminal(to)) {
            e.ended = std::chrono::steady_clock::now();
            active_by_key_.erase(e.status.video_key);
        }
        emit(e);
    });
}

void TaskRegistry::updateCounters(const JobId& id, const JobCounters& counters) {
    post([this, id, counters]() {
        auto it = jobs_.find(id);
        if (it == jobs_.end() || isTerminal(it->second.status.state)) return;
        Entry& e = it->second;
        if (e.status.counters == counters) return;
        e.status.counters = counters;
        emit(e);
    });
}

void TaskRegistry::finalize(const JobId& id, JobResult result) {
    auto shared = std::make_shared<JobResult>(std::move(result));
    post([this, id, shared]() {
        auto it = jobs_.find(id);
        if (it == jobs_.end()) {
            Logger::error("finalize for unknown job %s", id.c_str());
            return;
        }
        Entry& e = it->second;
        JobState to = shared->state;
        if (!isTerminal(to) || !canTransition(e.status.state, to)) {
            Logger::error("[%s] cannot finalize %s as %s", id.c_str(), to_string(e.status.state), to_string(to));
            return;
        }
        Logger::info("[%s] %s -> %s", id.c_str(), to_string(e.status.state), to_string(to));
        e.status.state = to;
        e.status.counters = shared->counters;
        if (!shared->error.empty()) e.status.error = shared->error;
        e.ended = std::chrono::steady_clock::now();
        e.result = std::move(*shared);
        active_by_key_.erase(e.status.video_key);
        emit(e);
    });
}

bool TaskRegistry::cancel(const JobId& id) {
    return call([this, id]() {
        auto it = jobs_.find(id);
        if (it == jobs_.end() || isTerminal(it->second.status.state)) return false;
        if (!it->second.cancel->exchange(true)) Logger::info("[%s] cancellation requested", id.c_str());
        return true;
    });
}

std::optional<JobStatus> TaskRegistry::status(const JobId& id) {
    return call([this, id]() -> std::optional<JobStatus> {
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return std::nullopt;
        return snapshot(it->second);
    });
}

std::optional<JobResult> TaskRegistry::result(const JobId& id) {
    return call([this, id]() -> std::optional<JobResult> {
        auto it = jobs_.find(id);
        if (it == jobs_.end() || !isTerminal(it->second.status.state)) return std::nullopt;
        return it->second.result;
    });
}

std::vector<ProgressEvent> TaskRegistry::history(const JobId& id, std::uint64_t after_seq) {
    return call([this, id, after_seq]() {
        std::vector<ProgressEvent> out;
        auto it = jobs_.find(id);
        if (it == jobs_.end()) return out;
        for (const auto& ev : it->second.log) {
            if (ev.seq > after_seq) out.push_back(ev);
        }
        return out;
    });
}

std::vector<JobId> TaskRegistry::jobs() {
    return call([this]() {
        std::vector<JobId> out;
        out.reserve(jobs_.size());
        for (const auto& kv : jobs_) out.push_back(kv.first);
        return out;
    });
}

SubscriptionId TaskRegistry::subscribe(const JobId& id, std::uint64_t after_seq, ProgressCallback cb) {
    return call([this, id, after_seq, cb]() -> SubscriptionId {
        auto it = jobs_.find(id);
        if (it == jobs_.end() || !cb) return 0;
        SubscriptionId sid = next_sub_++;
        subscribers_[sid] = Subscriber{id, cb};
        // Replay a copy: a callback may append to the log through emit().
        std::vector<ProgressEvent> replay;
        for (const auto& ev : it->second.log) {
            if (ev.seq > after_seq) replay.push_back(ev);
        }
        for (const auto& ev : replay) {
            if (subscribers_.find(sid) == subscribers_.end()) break;
            try {
                cb(ev);
            } catch (const std::exception& e) {
                Logger::error("subscriber %llu raised during replay: %s", static_cast<unsigned long long>(sid),
                              e.what());
            }
        }
        return sid;
    });
}

void TaskRegistry::unsubscribe(SubscriptionId sid) {
    post([this, sid]() { subscribers_.erase(sid); });
}

std::optional<JobState> TaskRegistry::wait(const JobId& id, std::chrono::milliseconds timeout) {
    auto done = std::make_shared<std::promise<JobState>>();
    auto fired = std::make_shared<std::atomic<bool>>(false);
    auto fut = done->get_future();

    SubscriptionId sid = subscribe(id, 0, [done, fired](const ProgressEvent& ev) {
        if (isTerminal(ev.state) && !fired->exchange(true)) done->set_value(ev.state);
    });
    if (sid == 0) return std::nullopt;

    std::optional<JobState> out;
    if (fut.wait_for(timeout) == std::future_status::ready) out = fut.get();
    unsubscribe(sid);
    return out;
}

}  // namespace vdet
