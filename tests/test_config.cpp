#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/errors.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using void_cmb::ConfigError;
using void_cmb::CoordFrame;
using void_cmb::config::Config;

namespace fs = std::filesystem;

namespace {

const char *kThreeMaps = R"(
target: {frame: equatorial, lon_deg: 222.5, lat_deg: 46.0, name: "Bootes Void"}
aperture: {theta_R_deg: 10.0, min_pixels: 20}
maps:
  - {label: SMICA, path: maps/smica.fits, mask: maps/mask.fits}
  - {label: NILC, path: maps/nilc.fits, field: 0, in_uK: true}
  - {label: SEVEM, path: maps/sevem.fits, mask_threshold: 0.9}
bootstrap: {iterations: 200, seed: 7}
null_test: {trials: 100, min_trials: 20, lat_jitter_deg: 2.5}
runtime_limits: {parallel_workers: 2}
void_model: {anchor_preset: baseline, delta_band: [0.7, 0.95]}
)";

} // namespace

TEST_CASE("config_defaults_match_reference_values") {
  Config cfg;
  REQUIRE(cfg.target.lon_deg == 222.5);
  REQUIRE(cfg.target.lat_deg == 46.0);
  REQUIRE(cfg.aperture.min_pixels == 50);
  REQUIRE(cfg.bootstrap.iterations == 1000);
  REQUIRE(cfg.bootstrap.seed == 12345);
  REQUIRE(cfg.null_test.trials == 500);
  REQUIRE(cfg.vacuum.kappa_A == 1.5e-15);
  REQUIRE(cfg.void_model.anchor_preset == "A1_lowz");

  auto ap = cfg.aperture.resolve();
  REQUIRE(ap.core_radius_deg == Catch::Approx(8.4));
  REQUIRE(ap.rim_inner_deg == Catch::Approx(11.2));
  REQUIRE(ap.rim_outer_deg == Catch::Approx(16.8));
  REQUIRE(cfg.effective_null_seed() == 12346);
}

TEST_CASE("config_from_yaml_reads_all_sections") {
  Config cfg = Config::from_yaml(YAML::Load(kThreeMaps));
  REQUIRE_NOTHROW(cfg.validate());

  REQUIRE(cfg.target.direction().frame == CoordFrame::EQUATORIAL);
  REQUIRE(cfg.maps.size() == 3);
  REQUIRE(cfg.maps[0].mask == "maps/mask.fits");
  REQUIRE(cfg.maps[0].mask_threshold == Catch::Approx(0.8));
  REQUIRE(cfg.maps[1].in_uK);
  REQUIRE(cfg.maps[2].mask_threshold == Catch::Approx(0.9));
  REQUIRE(cfg.aperture.resolve().rim_outer_deg == Catch::Approx(12.0));
  REQUIRE(cfg.null_test.lat_jitter_deg == Catch::Approx(2.5));
  REQUIRE(cfg.effective_null_seed() == 8);
  REQUIRE(cfg.void_model.delta_band[1] == Catch::Approx(0.95));
}

TEST_CASE("explicit_radii_override_theta_r_fractions") {
  Config cfg = Config::from_yaml(YAML::Load(
      "aperture: {theta_R_deg: 10.0, core_radius_deg: 5.0, rim_inner_deg: 5.0, rim_outer_deg: 10.0}\n"));
  auto ap = cfg.aperture.resolve();
  REQUIRE(ap.core_radius_deg == 5.0);
  REQUIRE(ap.rim_inner_deg == 5.0);
  REQUIRE(ap.rim_outer_deg == 10.0);
}

TEST_CASE("config_save_load_round_trip") {
  Config cfg = Config::from_yaml(YAML::Load(kThreeMaps));
  fs::path path = fs::temp_directory_path() / "void_cmb_test_config.yaml";
  cfg.save(path);
  Config back = Config::load(path);
  fs::remove(path);

  REQUIRE(back.maps.size() == 3);
  REQUIRE(back.maps[2].label == "SEVEM");
  REQUIRE(back.maps[1].in_uK);
  REQUIRE(back.bootstrap.seed == 7);
  REQUIRE(back.null_test.min_trials == 20);
  REQUIRE(back.runtime_limits.parallel_workers == 2);
  REQUIRE(back.void_model.anchor_preset == "baseline");
  REQUIRE(back.void_model.delta_band[0] == Catch::Approx(0.7));
  REQUIRE(back.target.name == "Bootes Void");
  REQUIRE_NOTHROW(back.validate());
}

TEST_CASE("config_validation_rejects_bad_values") {
  Config cfg = Config::from_yaml(YAML::Load(kThreeMaps));

  Config bad = cfg;
  bad.target.frame = "ecliptic";
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.target.lat_deg = 91.0;
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.maps[2].label = "SMICA";
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.null_test.min_trials = bad.null_test.trials + 1;
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.aperture.rim_in_frac = 0.5;
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.void_model.anchor_preset = "A3_unknown";
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);

  bad = cfg;
  bad.bootstrap.iterations = 0;
  REQUIRE_THROWS_AS(bad.validate(), ConfigError);
}

TEST_CASE("config_load_reports_missing_and_malformed_files") {
  REQUIRE_THROWS_AS(Config::load("/nonexistent/void_cmb.yaml"), ConfigError);

  fs::path path = fs::temp_directory_path() / "void_cmb_test_bad.yaml";
  {
    std::ofstream out(path);
    out << "target: [unclosed\n";
  }
  REQUIRE_THROWS_AS(Config::load(path), ConfigError);
  fs::remove(path);
}
