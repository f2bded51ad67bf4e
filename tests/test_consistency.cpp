#include "sky_fixtures.hpp"

#include "void_cmb/core/errors.hpp"
#include "void_cmb/measurement/consistency.hpp"
#include "void_cmb/measurement/record_json.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using void_cmb::Aperture;
using void_cmb::ConsistencySummary;
using void_cmb::Direction;
using void_cmb::FitsError;
using void_cmb::InvalidDirection;
using void_cmb::MapMeasurement;
using void_cmb::ValidationError;
using void_cmb::measurement::MapInput;
using void_cmb::measurement::MeasurementOptions;
using void_cmb::testing::galactic;
using void_cmb::testing::make_aperture;
using void_cmb::testing::noise_map;
using void_cmb::testing::step_map;

namespace measurement = void_cmb::measurement;
namespace sky = void_cmb::sky;

namespace {

const Direction kTarget = galactic(120.0, 45.0);
const Aperture kAperture = make_aperture(4.0, 4.0, 8.0);

MeasurementOptions fast_options() {
  MeasurementOptions opt;
  opt.bootstrap.iterations = 200;
  opt.null_test.trials = 60;
  opt.null_test.min_trials = 30;
  opt.null_test.lat_jitter_deg = 5.0;
  opt.workers = 2;
  return opt;
}

MapInput injected(const std::string &label, uint64_t seed, float core, float rim) {
  MapInput in;
  in.label = label;
  in.load = [=]() {
    return step_map(noise_map(32, 1.0, seed, label), kTarget, kAperture, core, rim);
  };
  return in;
}

} // namespace

TEST_CASE("one_failing_map_of_three_is_recorded_and_others_succeed") {
  std::vector<MapInput> inputs = {
      injected("SMICA", 1, 15.0f, 5.0f),
      {"NILC", []() -> sky::SkyMap { throw FitsError("Cannot open FITS file: nilc.fits"); }},
      injected("SEVEM", 3, 14.0f, 5.0f),
  };

  auto record = measurement::run_consistency(inputs, kTarget, kAperture, fast_options());

  REQUIRE(record.maps.size() == 3);
  REQUIRE(record.summary.n_maps == 3);
  REQUIRE(record.summary.n_succeeded == 2);
  REQUIRE(record.summary.n_failed == 1);

  REQUIRE(record.maps[0].label == "SMICA");
  REQUIRE(record.maps[0].success);
  REQUIRE(record.maps[0].photometry.delta_t == Catch::Approx(10.0).margin(1e-6));
  REQUIRE(record.maps[0].null_dist.n_succeeded == 60);

  REQUIRE(record.maps[1].label == "NILC");
  REQUIRE_FALSE(record.maps[1].success);
  REQUIRE(record.maps[1].failure.kind == "FitsError");
  REQUIRE(record.maps[1].failure.message.find("nilc.fits") != std::string::npos);

  REQUIRE(record.maps[2].photometry.delta_t == Catch::Approx(9.0).margin(1e-6));
  REQUIRE(record.summary.mean_delta_t == Catch::Approx(9.5).margin(1e-6));
  REQUIRE(record.summary.spread == Catch::Approx(0.5).margin(1e-6));
  REQUIRE(record.summary.min_delta_t == Catch::Approx(9.0).margin(1e-6));
  REQUIRE(record.summary.max_delta_t == Catch::Approx(10.0).margin(1e-6));
}

TEST_CASE("uninitialized_and_underpopulated_maps_become_failure_entries") {
  std::vector<MapInput> inputs = {
      {"EMPTY", []() { return sky::SkyMap(); }},
      {"COARSE", []() { return void_cmb::testing::uniform_map(1, 1.0f, "COARSE"); }},
      {"NOLOADER", nullptr},
  };
  MeasurementOptions opt = fast_options();
  opt.min_pixels = 5;

  auto record = measurement::run_consistency(inputs, kTarget, kAperture, opt);
  REQUIRE(record.summary.n_succeeded == 0);
  REQUIRE(record.summary.n_failed == 3);
  REQUIRE_FALSE(record.summary.consistent);
  REQUIRE(record.maps[0].failure.kind == "MapUninitialized");
  REQUIRE(record.maps[1].failure.kind == "InsufficientPixels");
  REQUIRE(record.maps[2].failure.kind == "MapUninitialized");
}

TEST_CASE("invalid_target_aborts_before_any_map_is_loaded") {
  std::atomic<int> loads{0};
  std::vector<MapInput> inputs = {
      {"A", [&]() { ++loads; return noise_map(8, 1.0, 1); }},
  };

  REQUIRE_THROWS_AS(measurement::run_consistency(inputs, galactic(0.0, 120.0),
                                                 kAperture, fast_options()),
                    InvalidDirection);
  REQUIRE_THROWS_AS(measurement::run_consistency(inputs, kTarget,
                                                 make_aperture(4.0, 3.0, 8.0),
                                                 fast_options()),
                    ValidationError);
  REQUIRE(loads.load() == 0);
}

TEST_CASE("map_done_callback_fires_once_per_map") {
  std::vector<MapInput> inputs = {
      injected("A", 4, 3.0f, 1.0f),
      injected("B", 5, 3.0f, 1.0f),
      {"C", []() -> sky::SkyMap { throw FitsError("bad"); }},
  };
  std::mutex mu;
  std::multiset<size_t> seen;
  measurement::run_consistency(inputs, kTarget, kAperture, fast_options(),
                               [&](size_t idx, const MapMeasurement &) {
                                 std::lock_guard<std::mutex> lock(mu);
                                 seen.insert(idx);
                               });
  REQUIRE(seen == std::multiset<size_t>{0, 1, 2});
}

TEST_CASE("summary_consistent_flag_compares_spread_to_sigma_boot") {
  std::vector<MapMeasurement> maps(3);
  maps[0].success = true;
  maps[0].photometry.delta_t = 10.0;
  maps[0].bootstrap.sigma = 1.5;
  maps[1].success = true;
  maps[1].photometry.delta_t = 12.0;
  maps[1].bootstrap.sigma = 0.5;
  maps[2].success = false;

  ConsistencySummary s = measurement::summarize_measurements(maps);
  REQUIRE(s.n_maps == 3);
  REQUIRE(s.n_succeeded == 2);
  REQUIRE(s.n_failed == 1);
  REQUIRE(s.mean_delta_t == Catch::Approx(11.0));
  REQUIRE(s.spread == Catch::Approx(1.0));
  REQUIRE(s.max_sigma_boot == Catch::Approx(1.5));
  REQUIRE(s.consistent);

  maps[0].bootstrap.sigma = 0.9;
  REQUIRE_FALSE(measurement::summarize_measurements(maps).consistent);
}

TEST_CASE("record_json_carries_results_and_failure_entries") {
  std::vector<MapInput> inputs = {
      injected("SMICA", 6, 15.0f, 5.0f),
      {"NILC", []() -> sky::SkyMap { throw FitsError("missing"); }},
  };
  auto record = measurement::run_consistency(inputs, kTarget, kAperture, fast_options());
  auto j = measurement::record_to_json(record);

  REQUIRE(j["maps"].size() == 2);
  REQUIRE(j["maps"][0]["success"].get<bool>());
  REQUIRE(j["maps"][0]["photometry"]["DeltaT_uK"].get<double>() ==
          Catch::Approx(10.0).margin(1e-6));
  REQUIRE(j["maps"][0]["null"]["n_trials"].get<int>() == 60);
  REQUIRE(j["maps"][0]["bootstrap"].contains("sigma_uK"));
  REQUIRE_FALSE(j["maps"][0]["null"]["degraded"].get<bool>());
  REQUIRE_FALSE(j["maps"][1]["success"].get<bool>());
  REQUIRE(j["maps"][1]["error"]["kind"].get<std::string>() == "FitsError");
  REQUIRE(j["summary"]["n_succeeded"].get<int>() == 1);
  REQUIRE(j["target_galactic"]["frame"].get<std::string>() == "galactic");

  void_cmb::config::Config cfg;
  cfg.aperture.theta_R_deg = 5.0;
  void_cmb::config::MapConfig smica;
  smica.label = "SMICA";
  smica.path = "maps/smica.fits";
  smica.field = 1;
  smica.mask = "maps/mask.fits";
  smica.mask_threshold = 0.9;
  void_cmb::config::MapConfig nilc;
  nilc.label = "NILC";
  nilc.path = "maps/nilc.fits";
  nilc.in_uK = true;
  cfg.maps = {smica, nilc};

  auto full = measurement::record_to_json(record, cfg);
  const auto &in0 = full["maps"][0]["inputs"];
  REQUIRE(in0["cmb_map"].get<std::string>() == "maps/smica.fits");
  REQUIRE(in0["cmb_field"].get<int>() == 1);
  REQUIRE_FALSE(in0["map_in_uK"].get<bool>());
  REQUIRE(in0["mask"].get<std::string>() == "maps/mask.fits");
  REQUIRE(in0["mask_field"].get<int>() == 0);
  REQUIRE(in0["mask_threshold"].get<double>() == Catch::Approx(0.9));
  // failed maps still say which file they came from
  const auto &in1 = full["maps"][1]["inputs"];
  REQUIRE(in1["cmb_map"].get<std::string>() == "maps/nilc.fits");
  REQUIRE(in1["map_in_uK"].get<bool>());
  REQUIRE(in1["mask"].is_null());

  REQUIRE(full["aperture"]["theta_R_deg"].get<double>() == Catch::Approx(5.0));
  REQUIRE(full["aperture"]["core_frac"].get<double>() == Catch::Approx(0.6));
  REQUIRE(full["aperture"]["rim_in_frac"].get<double>() == Catch::Approx(0.8));
  REQUIRE(full["aperture"]["rim_out_frac"].get<double>() == Catch::Approx(1.2));
  REQUIRE(full["aperture"]["rim_outer_deg"].get<double>() ==
          Catch::Approx(kAperture.rim_outer_deg));
  REQUIRE(full["notes"]["statistic"].get<std::string>().find("mean(core) - mean(rim)") !=
          std::string::npos);
}
