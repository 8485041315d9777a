#include <doctest/doctest.h>
#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <vector>
#include "support/fakes.hpp"
#include "vdet/errors.hpp"
#include "vdet/pipeline.hpp"

using namespace vdet;
using namespace vdet::test;
using namespace std::chrono_literals;

namespace {

JobResult finish(Pipeline& pl, const JobId& id, std::chrono::milliseconds timeout = 10s) {
  auto state = pl.wait(id, timeout);
  REQUIRE(state.has_value());
  auto r = pl.result(id);
  REQUIRE(r.has_value());
  CHECK(r->state == *state);
  return *r;
}

void checkCounters(const JobCounters& c) {
  CHECK(c.frames_processed + c.frames_skipped + c.frames_failed == c.frames_dispatched);
  CHECK(c.frames_dispatched <= c.frames_total);
}

// One pedestrian standing still in every frame.
ScriptedDetector::Script still(int sleep_ms = 0) {
  return [sleep_ms](int, int) {
    if (sleep_ms > 0) sleepMs(sleep_ms);
    return RawDetections{det("pedestrian", 0.9f, 100, 100, 50, 120)};
  };
}

}  // namespace

TEST_CASE("completed job accounts for every sampled frame"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>(still());
  Pipeline pl(PipelineOptions{4}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10;

  JobId id = pl.submit(memoryVideo("clip-a", 121), cfg);
  JobResult r = finish(pl, id);

  CHECK(r.state==JobState::Completed);
  CHECK_FALSE(r.degraded);
  CHECK(r.source==ResultSource::Real);
  CHECK(r.counters.frames_total==13);
  CHECK(r.counters.frames_processed==13);
  checkCounters(r.counters);
  CHECK(r.counters.detections_found==13);
  CHECK(r.counters.open_tracks==0);
  REQUIRE(r.tracks.size()==1);
  CHECK(r.tracks[0].id=="pedestrian-1");
  CHECK(r.tracks[0].history.size()==13);
  CHECK(r.tracks[0].first_seen==0);
  CHECK(r.tracks[0].last_seen==120);
  CHECK(r.detections.size()==13);
  CHECK(r.detections[4].timestamp_s==doctest::Approx(40.0 / 30.0));
  CHECK(pl.metrics().latencies().size()==13);

  auto st = pl.status(id);
  REQUIRE(st.has_value());
  CHECK(st->state==JobState::Completed);
  CHECK(st->counters.frames_processed==13);
}

TEST_CASE("progress events are ordered and end in the terminal state"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{2}, std::make_shared<ScriptedDetector>(still(2)), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 5;
  JobId id = pl.submit(memoryVideo("clip-b", 50), cfg);
  finish(pl, id);

  auto log = pl.history(id);
  REQUIRE(log.size()>=4);
  ProgressCursor cur;
  for (const auto& ev : log) CHECK(cur.accept(ev));
  CHECK(log.front().state==JobState::Queued);
  CHECK(log.back().state==JobState::Completed);

  std::vector<JobState> states;
  for (const auto& ev : log) if (states.empty() || states.back()!=ev.state) states.push_back(ev.state);
  CHECK(states==std::vector<JobState>{JobState::Queued, JobState::Running, JobState::Finalizing, JobState::Completed});

  int last_processed = 0;
  for (const auto& ev : log) {
    CHECK(ev.counters.frames_processed>=last_processed);
    last_processed = ev.counters.frames_processed;
    const JobCounters& c = ev.counters;
    CHECK(c.frames_processed + c.frames_skipped + c.frames_failed <= c.frames_dispatched);
    CHECK(c.frames_dispatched <= c.frames_total);
  }

  // late subscribers get the replay from their cursor on
  std::vector<std::uint64_t> seen;
  std::mutex mu;
  auto sid = pl.subscribe(id, log.size() - 2, [&](const ProgressEvent& ev) {
    std::lock_guard<std::mutex> lk(mu);
    seen.push_back(ev.seq);
  });
  CHECK(sid!=0);
  pl.unsubscribe(sid);
  std::lock_guard<std::mutex> lk(mu);
  CHECK(seen==std::vector<std::uint64_t>{log.size() - 1, log.size()});
}

TEST_CASE("two slow frames are skipped and the job completes"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>([](int frame, int) {
    if (frame==30 || frame==70) sleepMs(400);
    return RawDetections{det("pedestrian", 0.9f, 100, 100, 50, 120)};
  });
  Pipeline pl(PipelineOptions{4}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg;
  cfg.stride = 10;
  cfg.per_frame_timeout_ms = 100;

  JobResult r = finish(pl, pl.submit(memoryVideo("clip-c", 121), cfg));
  CHECK(r.state==JobState::Completed);
  CHECK(r.counters.frames_total==13);
  CHECK(r.counters.frames_processed==11);
  CHECK(r.counters.frames_skipped==2);
  checkCounters(r.counters);
  CHECK(r.degraded);
  // skipped frames do not count as misses, so the track survives
  REQUIRE(r.tracks.size()==1);
  CHECK(r.tracks[0].history.size()==11);
}

TEST_CASE("total budget exhaustion ends in TimedOut with a valid result"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{2}, std::make_shared<ScriptedDetector>(still(40)), std::make_shared<Metrics>(), ids);
  JobConfig cfg;
  cfg.stride = 1;
  cfg.max_concurrency = 2;
  cfg.total_timeout_ms = 300;
  cfg.grace_period_ms = 100;

  auto t0 = Clock::now();
  JobResult r = finish(pl, pl.submit(memoryVideo("clip-d", 200), cfg));
  CHECK(Clock::now() - t0 < 2s);
  CHECK(r.state==JobState::TimedOut);
  CHECK(r.degraded);
  CHECK(r.counters.frames_dispatched<r.counters.frames_total);
  CHECK(r.counters.frames_processed>0);
  checkCounters(r.counters);
  CHECK(r.error.find("JobTimeout")!=std::string::npos);
  CHECK_FALSE(r.tracks.empty());
  CHECK(toJson(r).find("timed_out")!=std::string::npos);
}

TEST_CASE("a hung call is cut off after the grace period"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>([](int, int) {
    sleepMs(1500);
    return RawDetections{};
  });
  Pipeline pl(PipelineOptions{1}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg;
  cfg.max_concurrency = 1;
  cfg.per_frame_timeout_ms = 10000;
  cfg.total_timeout_ms = 200;
  cfg.grace_period_ms = 100;

  auto t0 = Clock::now();
  JobId id = pl.submit(memoryVideo("clip-e", 100), cfg);
  REQUIRE(pl.wait(id, 5s)==JobState::TimedOut);
  CHECK(Clock::now() - t0 < 1200ms);
  auto r = pl.result(id);
  REQUIRE(r.has_value());
  CHECK(r->counters.frames_dispatched==1);
  CHECK(r->counters.frames_skipped==1);
  CHECK(r->source==ResultSource::Synthetic);
}

TEST_CASE("resubmitting an active video returns the running job"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{1}, std::make_shared<ScriptedDetector>(still(30)), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 1; cfg.max_concurrency = 1;

  JobId a = pl.submit(memoryVideo("clip-f", 20), cfg);
  JobId b = pl.submit(memoryVideo("clip-f", 20), cfg);
  CHECK(a==b);
  JobId other = pl.submit(memoryVideo("clip-g", 5), cfg);
  CHECK(other!=a);

  finish(pl, a);
  finish(pl, other);
  JobId again = pl.submit(memoryVideo("clip-f", 20), cfg);
  CHECK(again!=a);
  finish(pl, again);
}

TEST_CASE("overlap decides between merging and splitting"){
  auto run = [](float second_x) {
    TrackIdSequence ids;
    auto d = std::make_shared<ScriptedDetector>([second_x](int frame, int) {
      float x = frame==0 ? 0.f : second_x;
      return RawDetections{det("pedestrian", 0.9f, x, 0, 100, 100)};
    });
    Pipeline pl(PipelineOptions{1}, d, std::make_shared<Metrics>(), ids);
    JobConfig cfg; cfg.stride = 10;
    return finish(pl, pl.submit(memoryVideo("clip-h", 11), cfg));
  };

  JobResult merged = run(25.f);  // IoU 0.6
  REQUIRE(merged.tracks.size()==1);
  CHECK(merged.tracks[0].history.size()==2);

  JobResult split = run(82.f);  // IoU ~0.1
  REQUIRE(split.tracks.size()==2);
  CHECK(split.tracks[0].id=="pedestrian-1");
  CHECK(split.tracks[1].id=="pedestrian-2");
}

TEST_CASE("out of order completion gives the same tracks as in order"){
  auto run = [](bool shuffle) {
    TrackIdSequence ids;
    auto d = std::make_shared<ScriptedDetector>([shuffle](int frame, int) {
      if (shuffle) sleepMs((7 - (frame / 4) % 8) * 5);
      float x = frame * 2.f;
      return RawDetections{det("car", 0.7f, x, 0, 60, 40), det("pedestrian", 0.6f, 400 - x, 200, 30, 80)};
    });
    Pipeline pl(PipelineOptions{4}, d, std::make_shared<Metrics>(), ids);
    JobConfig cfg; cfg.stride = 4; cfg.max_concurrency = shuffle ? 4 : 1;
    JobResult r = finish(pl, pl.submit(memoryVideo("clip-i", 64), cfg));
    std::vector<std::string> out;
    for (const auto& t : r.tracks) {
      std::string s = t.id;
      for (const auto& o : t.history) s += ":" + std::to_string(o.frame_index);
      out.push_back(s);
    }
    return out;
  };
  auto ordered = run(false);
  CHECK(ordered.size()==2);
  CHECK(run(true)==ordered);
}

TEST_CASE("track ids are never reused across jobs"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{2}, std::make_shared<ScriptedDetector>(still()), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10;
  JobResult a = finish(pl, pl.submit(memoryVideo("clip-j", 50), cfg));
  JobResult b = finish(pl, pl.submit(memoryVideo("clip-k", 50), cfg));
  std::set<std::string> all;
  for (const auto& t : a.tracks) all.insert(t.id);
  for (const auto& t : b.tracks) CHECK(all.insert(t.id).second);
}

TEST_CASE("cancel after five frames keeps what was processed"){
  TrackIdSequence ids;
  Pipeline* pipeline = nullptr;
  std::promise<JobId> id_promise;
  std::shared_future<JobId> job = id_promise.get_future().share();
  std::atomic<bool> acknowledged{false};

  auto d = std::make_shared<ScriptedDetector>([&](int, int call) {
    if (call==5) acknowledged = pipeline->cancel(job.get());
    return RawDetections{det("pedestrian", 0.9f, 100, 100, 50, 120)};
  });
  Pipeline pl(PipelineOptions{2}, d, std::make_shared<Metrics>(), ids);
  pipeline = &pl;
  JobConfig cfg; cfg.stride = 10; cfg.max_concurrency = 1;

  JobId id = pl.submit(memoryVideo("clip-l", 121), cfg);
  id_promise.set_value(id);
  JobResult r = finish(pl, id);

  CHECK(acknowledged.load());
  CHECK(r.state==JobState::Cancelled);
  CHECK(r.degraded);
  CHECK(r.counters.frames_total==13);
  CHECK(r.counters.frames_dispatched==5);
  CHECK(r.counters.frames_processed==5);
  CHECK(d->calls()==5);
  REQUIRE(r.tracks.size()==1);
  CHECK(r.tracks[0].last_seen==40);
  for (const auto& rec : r.detections) CHECK(rec.frame_index<=40);
  CHECK_FALSE(pl.cancel(id));
}

TEST_CASE("empty detections fall back to the synthetic set unless disabled"){
  auto run = [](bool fallback) {
    TrackIdSequence ids;
    auto d = std::make_shared<ScriptedDetector>([](int, int) { return RawDetections{}; });
    Pipeline pl(PipelineOptions{2}, d, std::make_shared<Metrics>(), ids);
    JobConfig cfg; cfg.stride = 10; cfg.fallback_enabled = fallback;
    return finish(pl, pl.submit(memoryVideo("clip-m", 141), cfg));
  };

  JobResult on = run(true);
  CHECK(on.state==JobState::Completed);
  CHECK(on.source==ResultSource::Synthetic);
  REQUIRE(on.detections.size()==3);
  CHECK(on.detections[0].frame_index==30);
  CHECK(on.detections[0].confidence==doctest::Approx(0.75f));
  CHECK(on.tracks.size()==3);

  JobResult off = run(false);
  CHECK(off.state==JobState::Completed);
  CHECK(off.source==ResultSource::Real);
  CHECK(off.detections.empty());
  CHECK(off.tracks.empty());
  CHECK(off.counters.frames_processed==15);
}

TEST_CASE("below threshold and untargeted detections are dropped"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>([](int, int) {
    return RawDetections{det("pedestrian", 0.3f, 0, 0, 10, 10), det("car", 0.9f, 50, 0, 10, 10),
                         det("cyclist", 0.5f, 100, 0, 10, 10)};
  });
  Pipeline pl(PipelineOptions{2}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10; cfg.target_classes = {"pedestrian", "cyclist"};
  JobResult r = finish(pl, pl.submit(memoryVideo("clip-n", 21), cfg));
  CHECK(r.detections_per_class.size()==1);
  CHECK(r.detections_per_class.at("cyclist")==3);
  CHECK(r.histogram.medium==3);
}

TEST_CASE("unreadable frames are skipped"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{2}, std::make_shared<ScriptedDetector>(still()), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10;
  JobResult r = finish(pl, pl.submit(memoryVideo("clip-o", 101, 30.0, {20, 50}), cfg));
  CHECK(r.state==JobState::Completed);
  CHECK(r.counters.frames_skipped==2);
  CHECK(r.counters.frames_processed==9);
  checkCounters(r.counters);
  CHECK(r.degraded);
}

TEST_CASE("a video with no readable frame fails"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{1}, std::make_shared<ScriptedDetector>(still()), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10;
  JobResult r = finish(pl, pl.submit(memoryVideo("clip-p", 21, 30.0, {0, 10, 20}), cfg));
  CHECK(r.state==JobState::Failed);
  CHECK(r.error.find("SourceUnavailable")!=std::string::npos);
}

TEST_CASE("an unopenable source fails without finalizing"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{1}, std::make_shared<ScriptedDetector>(still()), std::make_shared<Metrics>(), ids);
  JobId id = pl.submit(brokenVideo("clip-q"), JobConfig{});
  JobResult r = finish(pl, id);
  CHECK(r.state==JobState::Failed);
  CHECK(r.tracks.empty());
  CHECK(r.source==ResultSource::Real);

  std::vector<JobState> states;
  for (const auto& ev : pl.history(id)) states.push_back(ev.state);
  CHECK(states==std::vector<JobState>{JobState::Queued, JobState::Running, JobState::Failed});
}

TEST_CASE("detector errors fail single frames, not the job"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>([](int frame, int) -> RawDetections {
    if (frame==10) throw std::runtime_error("bad tensor");
    return RawDetections{det("pedestrian", 0.9f, 100, 100, 50, 120)};
  });
  Pipeline pl(PipelineOptions{2}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 10; cfg.retry_backoff_ms = 1;
  JobResult r = finish(pl, pl.submit(memoryVideo("clip-r", 31), cfg));
  CHECK(r.state==JobState::Completed);
  CHECK(r.counters.frames_failed==1);
  CHECK(r.counters.frames_processed==3);
  CHECK(d->calls()==6);
  CHECK(r.degraded);
}

TEST_CASE("invalid configuration is rejected at submission"){
  TrackIdSequence ids;
  Pipeline pl(PipelineOptions{1}, std::make_shared<ScriptedDetector>(still()), std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 0;
  CHECK_THROWS_AS(pl.submit(memoryVideo("clip-s", 10), cfg), ConfigError);
  JobConfig cap; cap.max_samples = -1;
  CHECK_THROWS_AS(pl.submit(memoryVideo("clip-s", 10), cap), ConfigError);
  CHECK_FALSE(pl.status("job-none").has_value());
}

TEST_CASE("shutdown cancels running jobs and later queries return"){
  TrackIdSequence ids;
  auto d = std::make_shared<ScriptedDetector>(still(20));
  auto pl = std::make_unique<Pipeline>(PipelineOptions{2}, d, std::make_shared<Metrics>(), ids);
  JobConfig cfg; cfg.stride = 1; cfg.max_concurrency = 2;
  JobId id = pl->submit(memoryVideo("long-clip", 3000), cfg);
  while (d->calls() < 3) sleepMs(5);

  auto t0 = std::chrono::steady_clock::now();
  pl->shutdown();
  CHECK(std::chrono::steady_clock::now() - t0 < 5s);
  CHECK(d->calls() < 3000);

  CHECK_FALSE(pl->status(id).has_value());
  CHECK_FALSE(pl->result(id).has_value());
  CHECK(pl->history(id).empty());
  CHECK_FALSE(pl->cancel(id));
  CHECK_FALSE(pl->wait(id, 1s).has_value());
  CHECK_THROWS(pl->submit(memoryVideo("late", 10), cfg));
  pl.reset();
}
