#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace vdet {

using JobId = std::string;

enum class JobState : std::uint8_t { Queued, Running, Finalizing, Completed, TimedOut, Failed, Cancelled };

inline const char* to_string(JobState s) {
    switch (s) {
        case JobState::Queued: return "queued";
        case JobState::Running: return "running";
        case JobState::Finalizing: return "finalizing";
        case JobState::Completed: return "completed";
        case JobState::TimedOut: return "timed_out";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline bool isTerminal(JobState s) {
    return s == JobState::Completed || s == JobState::TimedOut || s == JobState::Failed || s == JobState::Cancelled;
}

// Legal edges of the job state machine. Running -> Failed is the only
// terminal edge that bypasses Finalizing.
inline bool canTransition(JobState from, JobState to) {
    switch (from) {
        case JobState::Queued: return to == JobState::Running;
        case JobState::Running: return to == JobState::Finalizing || to == JobState::Failed;
        case JobState::Finalizing:
            return to == JobState::Completed || to == JobState::TimedOut || to == JobState::Cancelled;
        default: return false;
    }
}

struct JobCounters {
    int frames_total = 0;        // sampled frames planned
    int frames_dispatched = 0;
    int frames_processed = 0;
    int frames_skipped = 0;
    int frames_failed = 0;
    int detections_found = 0;
    int open_tracks = 0;

    bool operator==(const JobCounters& o) const {
        return frames_total == o.frames_total && frames_dispatched == o.frames_dispatched &&
               frames_processed == o.frames_processed && frames_skipped == o.frames_skipped &&
               frames_failed == o.frames_failed && detections_found == o.detections_found &&
               open_tracks == o.open_tracks;
    }
    bool operator!=(const JobCounters& o) const { return !(*this == o); }
};

struct ProgressEvent {
    JobId job_id;
    std::uint64_t seq = 0;
    JobState state = JobState::Queued;
    JobCounters counters;
    std::chrono::system_clock::time_point timestamp;
};

struct JobStatus {
    JobId job_id;
    std::string video_key;
    JobState state = JobState::Queued;
    JobCounters counters;
    std::int64_t elapsed_ms = 0;
    bool cancel_requested = false;
    std::uint64_t last_seq = 0;
    std::string error;
};

}  // namespace vdet
