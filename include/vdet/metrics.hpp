#pragma once
#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace vdet {
struct Stamp { std::string name; double ms; int frame; };
struct LatencySample { std::string job; int frame; double ms; };

// Shared sink for stage stamps and per-inference latency samples. Each buffer
// keeps the most recent `capacity` entries.
class Metrics {
public:
    static constexpr std::size_t kDefaultCapacity = 100000;

    explicit Metrics(std::size_t capacity = kDefaultCapacity) : capacity_(capacity > 0 ? capacity : 1) {}

    void mark(const std::string& name, int frame) {
        using clk = std::chrono::steady_clock;
        auto now = clk::now();
        double ms = std::chrono::duration<double, std::milli>(now.time_since_epoch()).count();
        std::lock_guard<std::mutex> lk(mu_);
        if (stamps_.size() == capacity_) stamps_.pop_front();
        stamps_.push_back({name, ms, frame});
    }

    void latency(const std::string& job, int frame, double ms) {
        std::lock_guard<std::mutex> lk(mu_);
        if (latencies_.size() == capacity_) latencies_.pop_front();
        latencies_.push_back({job, frame, ms});
    }

    std::vector<LatencySample> latencies() const {
        std::lock_guard<std::mutex> lk(mu_);
        return {latencies_.begin(), latencies_.end()};
    }

    std::size_t stampCount() const {
        std::lock_guard<std::mutex> lk(mu_);
        return stamps_.size();
    }

    bool dump_csv(const std::string& path) const {
        std::ofstream f(path);
        if (!f) return false;
        std::lock_guard<std::mutex> lk(mu_);
        f << "frame,stage,timestamp_ms\n";
        for (auto& s : stamps_) f << s.frame << "," << s.name << "," << s.ms << "\n";
        return static_cast<bool>(f);
    }

private:
    std::size_t capacity_;
    mutable std::mutex mu_;
    std::deque<Stamp> stamps_;
    std::deque<LatencySample> latencies_;
};
}   // namespace vdet
