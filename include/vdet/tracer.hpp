#pragma once
#include "metrics.hpp"
#include <chrono>
#include <string>
#include <utility>

#define VDET_CONCAT_(a, b) a##b
#define VDET_CONCAT(a, b) VDET_CONCAT_(a, b)

#define VDET_TRACE_METRICS(metrics, stage, frame) \
    vdet::ScopeStamp VDET_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, frame)

// Same as VDET_TRACE_METRICS, and also records the scope's duration as a
// latency sample for `job`.
#define VDET_TRACE_LATENCY(metrics, stage, frame, job) \
    vdet::ScopeStamp VDET_CONCAT(_scope_stamp_, __LINE__)(metrics, stage, frame, job)

namespace vdet {
struct ScopeStamp {
    Metrics& m;
    std::string stage;
    int frame;
    std::string job;
    std::chrono::steady_clock::time_point start;

    ScopeStamp(Metrics& met, std::string s, int f, std::string j = {})
        : m(met), stage(std::move(s)), frame(f), job(std::move(j)), start(std::chrono::steady_clock::now()) {
        m.mark(stage+":in", frame);
    }

    ~ScopeStamp() {
        m.mark(stage+":out", frame);
        if (!job.empty()) {
            double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
            m.latency(job, frame, ms);
        }
    }

    ScopeStamp(const ScopeStamp&) = delete;
    ScopeStamp& operator=(const ScopeStamp&) = delete;
};
}
