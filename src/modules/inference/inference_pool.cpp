#include "vdet/executor.hpp"
#include "vdet/logger.hpp"

namespace vdet {

InferencePool::InferencePool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    Logger::debug("inference pool created with %d workers", workers_);
}

InferencePool::~InferencePool() {
    stop();
}

bool InferencePool::start() {
    if (running_.load()) {
        Logger::warn("inference pool already running");
        return false;
    }

    running_.store(true);
    shutdown_.store(false);

    try {
        threads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            threads_.emplace_back(&InferencePool::workerLoop, this, i);
        }
        Logger::info("inference pool started with %d workers", workers_);
        return true;
    } catch (const std::exception& e) {
        Logger::error("failed to start inference pool: %s", e.what());
        running_.store(false);
        shutdown_.store(true);
        taskAvailable_.notify_all();
        for (auto& t : threads_) {
            if (t.joinable()) t.join();
        }
        threads_.clear();
        return false;
    }
}

void InferencePool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    shutdown_.store(true);
    running_.store(false);
    taskAvailable_.notify_all();

    // A worker stuck in a detector that never returns blocks here.
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
    threads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = tasks_.size();
        std::queue<std::function<void()>>().swap(tasks_);
    }
    Logger::info("inference pool stopped (%zu queued tasks dropped)", dropped);
}

bool InferencePool::submit(std::function<void()> task) {
    if (!running_.load() || shutdown_.load() || !task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        tasks_.push(std::move(task));
    }
    taskAvailable_.notify_one();
    return true;
}

std::size_t InferencePool::queueSize() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return tasks_.size();
}

void InferencePool::workerLoop(int workerId) {
    ScopedThreadName name("infer-" + std::to_string(workerId));

    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            taskAvailable_.wait(lock, [this] { return !tasks_.empty() || shutdown_.load(); });
            if (shutdown_.load()) break;
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Logger::error("inference task raised: %s", e.what());
        }
    }
    Logger::debug("worker %d stopped", workerId);
}

}  // namespace vdet
