#include "vdet/aggregator.hpp"

#include <algorithm>
#include <fstream>

#include <opencv2/core/persistence.hpp>

#include "vdet/logger.hpp"

namespace vdet {

ResultAggregator::ResultAggregator(JobId job_id, std::string video_key, std::string detector)
    : job_id_(std::move(job_id)), video_key_(std::move(video_key)), detector_(std::move(detector)) {}

void ResultAggregator::setVideo(int frame_count, double fps) {
    frame_count_ = frame_count;
    fps_ = fps;
}

void ResultAggregator::record(int frame_index, double timestamp_s, const RawDetection& d, const std::string& track_id) {
    detections_.push_back(DetectionRecord{frame_index, timestamp_s, track_id, d.label, d.confidence, d.box,
                                          synthetic_detector_});
}

std::vector<DetectionRecord> ResultAggregator::syntheticSet(int frame_count, double fps) {
    if (!(fps > 0.0)) fps = 30.0;
    int last = std::max(frame_count - 1, 0);
    std::vector<DetectionRecord> out;
    for (int i = 0; i < 3; ++i) {
        DetectionRecord r;
        r.frame_index = std::min((i + 1) * 30, last);
        r.timestamp_s = r.frame_index / fps;
        r.track_id = "pedestrian-synthetic-" + std::to_string(i + 1);
        r.label = "pedestrian";
        r.confidence = 0.75f + i * 0.05f;
        r.box = cv::Rect2f(100.f + i * 50.f, 50.f + i * 25.f, 80.f + i * 10.f, 150.f + i * 20.f);
        r.synthetic = true;
        out.push_back(r);
    }
    return out;
}

JobResult ResultAggregator::build(JobState state, const JobCounters& counters, std::vector<Track> tracks,
                                  std::chrono::milliseconds elapsed, bool fallback, const std::string& error) const {
    JobResult r;
    r.job_id = job_id_;
    r.video_key = video_key_;
    r.state = state;
    r.counters = counters;
    r.video_frame_count = frame_count_;
    r.video_fps = fps_;
    r.detector = detector_;
    r.elapsed_ms = elapsed.count();
    r.error = error;
    r.degraded = state != JobState::Completed || counters.frames_skipped > 0 || counters.frames_failed > 0;
    r.source = synthetic_detector_ ? ResultSource::Synthetic : ResultSource::Real;

    if (detections_.empty() && fallback && state != JobState::Failed) {
        r.source = ResultSource::Synthetic;
        r.detections = syntheticSet(frame_count_, fps_);
        std::uint64_t seq = 0;
        for (const auto& d : r.detections) {
            Track t;
            t.id = d.track_id;
            t.seq = ++seq;
            t.label = d.label;
            t.history.push_back({d.frame_index, d.box, d.confidence});
            t.confidence = t.peak_confidence = d.confidence;
            t.first_seen = t.last_seen = d.frame_index;
            t.state = TrackState::Closed;
            t.synthetic = true;
            r.tracks.push_back(std::move(t));
        }
        Logger::warn("[%s] no detections accepted, returning synthetic fallback set", job_id_.c_str());
    } else {
        r.detections = detections_;
        std::stable_sort(r.detections.begin(), r.detections.end(),
                         [](const DetectionRecord& a, const DetectionRecord& b) { return a.frame_index < b.frame_index; });
        for (Track& t : tracks) {
            t.state = TrackState::Closed;
            t.synthetic = synthetic_detector_;
        }
        r.tracks = std::move(tracks);
    }

    for (const auto& t : r.tracks) ++r.tracks_per_class[t.label];
    for (const auto& d : r.detections) {
        ++r.detections_per_class[d.label];
        r.histogram.add(d.confidence);
    }
    return r;
}

namespace {

void writeBox(cv::FileStorage& fs, const cv::Rect2f& b) {
    fs << "box" << "{" << "x" << b.x << "y" << b.y << "width" << b.width << "height" << b.height << "}";
}

// Labels are free text, so counts go out as a list rather than as map keys.
void writeCounts(cv::FileStorage& fs, const std::string& key, const std::map<std::string, int>& m) {
    fs << key << "[";
    for (const auto& kv : m) fs << "{" << "label" << kv.first << "count" << kv.second << "}";
    fs << "]";
}

}  // namespace

std::string toJson(const JobResult& r) {
    cv::FileStorage fs(".json", cv::FileStorage::WRITE | cv::FileStorage::MEMORY | cv::FileStorage::FORMAT_JSON);
    fs << "job_id" << r.job_id;
    fs << "video_key" << r.video_key;
    fs << "state" << to_string(r.state);
    fs << "source" << to_string(r.source);
    fs << "degraded" << static_cast<int>(r.degraded);
    fs << "detector" << r.detector;
    fs << "elapsed_ms" << static_cast<double>(r.elapsed_ms);
    if (!r.error.empty()) fs << "error" << r.error;

    fs << "frames" << "{"
       << "video_frame_count" << r.video_frame_count
       << "fps" << r.video_fps
       << "total" << r.counters.frames_total
       << "dispatched" << r.counters.frames_dispatched
       << "processed" << r.counters.frames_processed
       << "skipped" << r.counters.frames_skipped
       << "failed" << r.counters.frames_failed << "}";

    writeCounts(fs, "tracks_per_class", r.tracks_per_class);
    writeCounts(fs, "detections_per_class", r.detections_per_class);
    fs << "confidence_histogram" << "{" << "high" << r.histogram.high << "medium" << r.histogram.medium
       << "low" << r.histogram.low << "}";

    fs << "tracks" << "[";
    for (const auto& t : r.tracks) {
        fs << "{";
        fs << "track_id" << t.id << "label" << t.label << "confidence" << t.confidence
           << "peak_confidence" << t.peak_confidence << "first_seen" << t.first_seen << "last_seen" << t.last_seen
           << "synthetic" << static_cast<int>(t.synthetic);
        fs << "history" << "[";
        for (const auto& o : t.history) {
            fs << "{" << "frame" << o.frame_index << "confidence" << o.confidence;
            writeBox(fs, o.box);
            fs << "}";
        }
        fs << "]";
        fs << "}";
    }
    fs << "]";

    fs << "detections" << "[";
    for (const auto& d : r.detections) {
        fs << "{" << "frame" << d.frame_index << "timestamp" << d.timestamp_s << "track_id" << d.track_id
           << "label" << d.label << "confidence" << d.confidence << "synthetic" << static_cast<int>(d.synthetic);
        writeBox(fs, d.box);
        fs << "}";
    }
    fs << "]";
    return fs.releaseAndGetString();
}

bool writeJson(const JobResult& r, const std::string& path) {
    std::ofstream f(path);
    if (!f) {
        Logger::error("cannot write %s", path.c_str());
        return false;
    }
    f << toJson(r);
    return static_cast<bool>(f);
}

}  // namespace vdet
