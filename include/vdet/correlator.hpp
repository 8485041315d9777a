#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "frame.hpp"

namespace vdet {

// Source of track ids. Ids are `<label>-<seq>` with seq increasing across
// every label drawn from the same sequence.
class TrackIdSequence {
public:
    explicit TrackIdSequence(std::uint64_t first = 1) : next_(first) {}
    std::uint64_t take() { return next_.fetch_add(1); }

    // Shared by every job in the process.
    static TrackIdSequence& global();

private:
    std::atomic<std::uint64_t> next_;
};

struct TrackObservation {
    int frame_index = 0;
    cv::Rect2f box;
    float confidence = 0.f;
};

enum class TrackState { Open, Closed };

struct Track {
    std::string id;
    std::uint64_t seq = 0;
    std::string label;
    std::vector<TrackObservation> history;
    float confidence = 0.f;       // EMA over matched detections
    float peak_confidence = 0.f;
    int first_seen = 0;
    int last_seen = 0;
    int missed = 0;
    TrackState state = TrackState::Open;
    bool synthetic = false;

    const cv::Rect2f& box() const { return history.back().box; }
};

struct CorrelatorParams {
    float iou_threshold = 0.3f;
    int max_gap = 3;
    float alpha = 0.5f;
};

// Assignment made for one detection of an observed frame.
struct Assignment {
    std::size_t detection = 0;
    std::string track_id;
    bool spawned = false;
};

// Greedy IoU association of per-frame detections into tracks.
//
// Frames must arrive in strictly increasing index order. Candidate pairs are
// same-label (detection, open track) pairs with IoU >= iou_threshold, taken
// highest IoU first; ties go to the higher-confidence detection, then the
// detection with the smaller x, then the older track. A track that misses
// more than max_gap consecutive observed frames is closed for good.
class TrackCorrelator {
public:
    explicit TrackCorrelator(CorrelatorParams p = {}, TrackIdSequence& ids = TrackIdSequence::global());

    // Throws std::invalid_argument when frame_index does not increase.
    std::vector<Assignment> observe(int frame_index, const RawDetections& dets);

    // Closes every open track and returns all tracks ordered by first_seen.
    std::vector<Track> finish();

    std::size_t openCount() const;
    const std::vector<Track>& tracks() const { return tracks_; }
    int lastFrame() const { return last_frame_; }

private:
    Track& spawn(int frame_index, const RawDetection& d);
    void update(Track& t, int frame_index, const RawDetection& d);

    CorrelatorParams p_;
    TrackIdSequence& ids_;
    std::vector<Track> tracks_;
    int last_frame_ = -1;
};

}  // namespace vdet
