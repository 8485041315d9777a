#include "vdet/correlator.hpp"

#include <algorithm>
#include <stdexcept>

#include "vdet/logger.hpp"
#include "vdet/postprocess.hpp"

namespace vdet {

TrackIdSequence& TrackIdSequence::global() {
    static TrackIdSequence seq;
    return seq;
}

TrackCorrelator::TrackCorrelator(CorrelatorParams p, TrackIdSequence& ids) : p_(p), ids_(ids) {}

std::size_t TrackCorrelator::openCount() const {
    return static_cast<std::size_t>(std::count_if(tracks_.begin(), tracks_.end(),
                                                  [](const Track& t) { return t.state == TrackState::Open; }));
}

Track& TrackCorrelator::spawn(int frame_index, const RawDetection& d) {
    Track t;
    t.seq = ids_.take();
    t.id = d.label + "-" + std::to_string(t.seq);
    t.label = d.label;
    t.history.push_back({frame_index, d.box, d.confidence});
    t.confidence = d.confidence;
    t.peak_confidence = d.confidence;
    t.first_seen = t.last_seen = frame_index;
    tracks_.push_back(std::move(t));
    return tracks_.back();
}

void TrackCorrelator::update(Track& t, int frame_index, const RawDetection& d) {
    t.history.push_back({frame_index, d.box, d.confidence});
    t.confidence = p_.alpha * d.confidence + (1.f - p_.alpha) * t.confidence;
    t.peak_confidence = std::max(t.peak_confidence, d.confidence);
    t.last_seen = frame_index;
    t.missed = 0;
}

std::vector<Assignment> TrackCorrelator::observe(int frame_index, const RawDetections& dets) {
    if (frame_index <= last_frame_) {
        throw std::invalid_argument("frame " + std::to_string(frame_index) + " observed after frame " +
                                    std::to_string(last_frame_));
    }
    last_frame_ = frame_index;

    struct Pair { float iou; std::size_t det; std::size_t track; };
    std::vector<Pair> pairs;
    for (std::size_t ti = 0; ti < tracks_.size(); ++ti) {
        const Track& t = tracks_[ti];
        if (t.state != TrackState::Open) continue;
        for (std::size_t di = 0; di < dets.size(); ++di) {
            if (dets[di].label != t.label) continue;
            float v = IoU(dets[di].box, t.box());
            if (v >= p_.iou_threshold) pairs.push_back({v, di, ti});
        }
    }

    std::sort(pairs.begin(), pairs.end(), [&](const Pair& a, const Pair& b) {
        if (a.iou != b.iou) return a.iou > b.iou;
        const RawDetection& da = dets[a.det];
        const RawDetection& db = dets[b.det];
        if (da.confidence != db.confidence) return da.confidence > db.confidence;
        if (da.box.x != db.box.x) return da.box.x < db.box.x;
        if (tracks_[a.track].seq != tracks_[b.track].seq) return tracks_[a.track].seq < tracks_[b.track].seq;
        return a.det < b.det;
    });

    std::vector<char> det_used(dets.size(), 0), track_used(tracks_.size(), 0);
    std::vector<Assignment> out;
    out.reserve(dets.size());
    for (const Pair& p : pairs) {
        if (det_used[p.det] || track_used[p.track]) continue;
        det_used[p.det] = track_used[p.track] = 1;
        update(tracks_[p.track], frame_index, dets[p.det]);
        out.push_back({p.det, tracks_[p.track].id, false});
    }

    // Age the tracks that existed before this frame; spawned ones start fresh.
    for (std::size_t ti = 0; ti < tracks_.size(); ++ti) {
        Track& t = tracks_[ti];
        if (t.state != TrackState::Open || track_used[ti]) continue;
        if (++t.missed > p_.max_gap) {
            t.state = TrackState::Closed;
            Logger::debug("track %s closed at frame %d (last seen %d)", t.id.c_str(), frame_index, t.last_seen);
        }
    }

    for (std::size_t di = 0; di < dets.size(); ++di) {
        if (det_used[di]) continue;
        const Track& t = spawn(frame_index, dets[di]);
        out.push_back({di, t.id, true});
    }

    std::sort(out.begin(), out.end(), [](const Assignment& a, const Assignment& b) { return a.detection < b.detection; });
    return out;
}

std::vector<Track> TrackCorrelator::finish() {
    for (Track& t : tracks_) t.state = TrackState::Closed;
    std::vector<Track> out = tracks_;
    std::stable_sort(out.begin(), out.end(), [](const Track& a, const Track& b) {
        if (a.first_seen != b.first_seen) return a.first_seen < b.first_seen;
        return a.seq < b.seq;
    });
    return out;
}

}  // namespace vdet
