#include <doctest/doctest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include "vdet/cli.hpp"
#include "vdet/config.hpp"
#include "vdet/errors.hpp"

using namespace vdet;

namespace {
std::string writeTemp(const std::string& name, const std::string& body) {
  std::string path = "vdet_test_" + name;
  std::ofstream(path) << body;
  return path;
}

JobConfig fromArgs(std::vector<const char*> args) {
  args.insert(args.begin(), "vdet_cli");
  cv::CommandLineParser p(static_cast<int>(args.size()), args.data(), cliKeys());
  return configFromArgs(p);
}
}

TEST_CASE("defaults are valid"){
  JobConfig cfg;
  CHECK_NOTHROW(cfg.validate());
  CHECK(cfg.stride==5);
  CHECK(cfg.per_frame_timeout_ms==15000);
  CHECK(cfg.total_timeout_ms==300000);
  CHECK(cfg.confidence_threshold==doctest::Approx(0.35f));
  CHECK(cfg.fallback_enabled);
}

TEST_CASE("validate rejects out of range fields"){
  auto bad = [](auto mutate) { JobConfig c; mutate(c); return c; };
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.stride = 0; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.max_samples = 0; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.per_frame_timeout_ms = 0; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.total_timeout_ms = -1; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.confidence_threshold = 1.5f; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.iou_threshold = 0.f; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.confidence_alpha = 0.f; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.max_concurrency = 0; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.max_retries = -1; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.max_retries = 17; }).validate(), ConfigError);
  CHECK_NOTHROW(bad([](JobConfig& c){ c.max_retries = 16; }).validate());
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.max_gap = -1; }).validate(), ConfigError);
  CHECK_THROWS_AS(bad([](JobConfig& c){ c.target_classes = {"car", " "}; }).validate(), ConfigError);
}

TEST_CASE("config errors carry their kind"){
  JobConfig c; c.stride = -2;
  try {
    c.validate();
    FAIL("expected ConfigError");
  } catch (const Error& e) {
    CHECK(e.kind()==ErrorKind::Config);
    CHECK(std::string(e.what()).find("stride")!=std::string::npos);
  }
}

TEST_CASE("target classes filter labels"){
  JobConfig c;
  CHECK(c.accepts("anything"));
  c.target_classes = {"pedestrian", "cyclist"};
  CHECK(c.accepts("cyclist"));
  CHECK_FALSE(c.accepts("car"));
}

TEST_CASE("splitList trims and drops empties"){
  CHECK(splitList(" pedestrian, cyclist,,motorcyclist ")==std::vector<std::string>{"pedestrian","cyclist","motorcyclist"});
  CHECK(splitList("").empty());
}

TEST_CASE("loadConfig reads json"){
  auto path = writeTemp("cfg.json",
    "{ \"stride\": 10, \"max_samples\": 20, \"confidence_threshold\": 0.5,"
    "  \"target_classes\": [\"pedestrian\", \"cyclist\"], \"fallback_enabled\": 0, \"max_gap\": 2 }");
  JobConfig c = loadConfig(path);
  CHECK(c.stride==10);
  REQUIRE(c.max_samples.has_value());
  CHECK(*c.max_samples==20);
  CHECK(c.confidence_threshold==doctest::Approx(0.5f));
  CHECK(c.target_classes==std::vector<std::string>{"pedestrian","cyclist"});
  CHECK_FALSE(c.fallback_enabled);
  CHECK(c.max_gap==2);
  CHECK(c.per_frame_timeout_ms==15000);
  std::remove(path.c_str());
}

TEST_CASE("loadConfig reads yaml over a base"){
  auto path = writeTemp("cfg.yml", "%YAML:1.0\n---\ntotal_timeout_ms: 5000\ntarget_classes: \"car, bus\"\n");
  JobConfig base; base.stride = 3;
  JobConfig c = loadConfig(path, base);
  CHECK(c.stride==3);
  CHECK(c.total_timeout_ms==5000);
  CHECK(c.target_classes==std::vector<std::string>{"car","bus"});
  std::remove(path.c_str());
}

TEST_CASE("loadConfig rejects bad input"){
  CHECK_THROWS_AS(loadConfig("vdet_test_missing.json"), ConfigError);
  auto path = writeTemp("bad.json", "{ \"stride\": \"ten\" }");
  CHECK_THROWS_AS(loadConfig(path), ConfigError);
  std::remove(path.c_str());
}

TEST_CASE("command line overrides defaults"){
  JobConfig c = fromArgs({"--input=clip.mp4", "--stride=3", "--max_samples=20", "--conf=0.5",
                          "--targets=car, bus", "--no_fallback"});
  CHECK(c.stride==3);
  REQUIRE(c.max_samples.has_value());
  CHECK(*c.max_samples==20);
  CHECK(c.confidence_threshold==doctest::Approx(0.5));
  CHECK(c.target_classes==std::vector<std::string>{"car", "bus"});
  CHECK_FALSE(c.fallback_enabled);
  CHECK(c.per_frame_timeout_ms==JobConfig().per_frame_timeout_ms);
}

TEST_CASE("command line keeps out of range values for validate"){
  CHECK(fromArgs({"--input=clip.mp4"}).stride==JobConfig().stride);
  JobConfig zero = fromArgs({"--input=clip.mp4", "--stride=0"});
  CHECK(zero.stride==0);
  CHECK_THROWS_AS(zero.validate(), ConfigError);
  CHECK_THROWS_AS(fromArgs({"--input=clip.mp4", "--stride=-3"}).validate(), ConfigError);
  CHECK_THROWS_AS(fromArgs({"--input=clip.mp4", "--conf=-0.2"}).validate(), ConfigError);
  CHECK_THROWS_AS(fromArgs({"--input=clip.mp4", "--max_samples=0"}).validate(), ConfigError);
}
