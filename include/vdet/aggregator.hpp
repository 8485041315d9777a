#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "correlator.hpp"
#include "job.hpp"

namespace vdet {

enum class ResultSource { Real, Synthetic };

inline const char* to_string(ResultSource s) { return s == ResultSource::Real ? "real" : "synthetic"; }

struct DetectionRecord {
    int frame_index = 0;
    double timestamp_s = 0.0;
    std::string track_id;
    std::string label;
    float confidence = 0.f;
    cv::Rect2f box;
    bool synthetic = false;
};

// high > 0.8, medium 0.5 - 0.8, low < 0.5
struct ConfidenceHistogram {
    int high = 0;
    int medium = 0;
    int low = 0;

    void add(float c) {
        if (c > 0.8f) ++high;
        else if (c >= 0.5f) ++medium;
        else ++low;
    }
    int total() const { return high + medium + low; }
};

struct JobResult {
    JobId job_id;
    std::string video_key;
    JobState state = JobState::Completed;
    std::vector<Track> tracks;
    std::vector<DetectionRecord> detections;
    std::map<std::string, int> tracks_per_class;
    std::map<std::string, int> detections_per_class;
    ConfidenceHistogram histogram;
    JobCounters counters;
    int video_frame_count = 0;
    double video_fps = 0.0;
    bool degraded = false;
    ResultSource source = ResultSource::Real;
    std::string detector;
    std::int64_t elapsed_ms = 0;
    std::string error;
};

// Collects what a job produced and freezes it into a JobResult.
class ResultAggregator {
public:
    ResultAggregator(JobId job_id, std::string video_key, std::string detector);

    void setVideo(int frame_count, double fps);
    void setSynthetic(bool synthetic) { synthetic_detector_ = synthetic; }

    // Records one accepted detection with the track it was assigned to.
    void record(int frame_index, double timestamp_s, const RawDetection& d, const std::string& track_id);

    std::size_t detectionCount() const { return detections_.size(); }

    // Builds the result. When no detection was recorded and `fallback` is set,
    // the labeled synthetic set replaces the empty result.
    JobResult build(JobState state, const JobCounters& counters, std::vector<Track> tracks,
                    std::chrono::milliseconds elapsed, bool fallback, const std::string& error = {}) const;

    // Three pedestrian placeholders at frames 30, 60 and 90, clamped to the
    // video length.
    static std::vector<DetectionRecord> syntheticSet(int frame_count, double fps);

private:
    JobId job_id_;
    std::string video_key_;
    std::string detector_;
    int frame_count_ = 0;
    double fps_ = 0.0;
    bool synthetic_detector_ = false;
    std::vector<DetectionRecord> detections_;
};

// JSON rendering through cv::FileStorage.
std::string toJson(const JobResult& r);
// Returns false when the file cannot be written.
bool writeJson(const JobResult& r, const std::string& path);

}  // namespace vdet
