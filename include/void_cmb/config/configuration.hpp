#pragma once

#include "void_cmb/core/types.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace void_cmb::config {

namespace fs = std::filesystem;

struct TargetConfig {
  std::string frame = "equatorial"; // equatorial | galactic
  double lon_deg = 222.5;
  double lat_deg = 46.0;
  std::string name = "Bootes Void";

  Direction direction() const;
};

// Radii default to theta_R fractions; non-zero explicit radii override.
struct ApertureConfig {
  double theta_R_deg = 14.0;
  double core_frac = 0.6;
  double rim_in_frac = 0.8;
  double rim_out_frac = 1.2;
  double core_radius_deg = 0.0;
  double rim_inner_deg = 0.0;
  double rim_outer_deg = 0.0;
  int min_pixels = 50;

  Aperture resolve() const;
};

struct MapConfig {
  std::string label;
  std::string path;
  int field = 0;
  bool in_uK = false;        // otherwise K -> uK (x1e6)
  std::string mask;          // optional
  int mask_field = 0;
  double mask_threshold = 0.8;
};

struct BootstrapConfig {
  int iterations = 1000;
  uint64_t seed = 12345;
};

struct NullTestConfig {
  int trials = 500;
  double lat_jitter_deg = 0.0;
  double min_separation_deg = 0.0; // 0 -> rim outer radius
  int max_retries = 20;
  int min_trials = 50;
  uint64_t seed = 0;               // 0 -> bootstrap seed + 1
};

struct OutputConfig {
  std::string json_path;
  std::string runs_dir = "runs";
};

struct RuntimeLimitsConfig {
  int parallel_workers = 4;
};

struct VacuumConfig {
  double H0_km_s_Mpc = 67.4;
  double omega_lambda = 0.688;
  double kappa_A = 1.5e-15;
  double E0_erg = 1.0e12;
  double coherence_volume_m3 = 1.0;
};

struct VoidModelConfig {
  std::string anchor_preset = "A1_lowz";
  double R_Mpc = 62.0;
  double z = 0.052;
  double delta_abs = 0.85;
  std::array<double, 2> delta_band{0.75, 0.90};
  double n_exp = 3.0;
};

struct Config {
  TargetConfig target;
  ApertureConfig aperture;
  std::vector<MapConfig> maps;
  BootstrapConfig bootstrap;
  NullTestConfig null_test;
  OutputConfig output;
  RuntimeLimitsConfig runtime_limits;
  VacuumConfig vacuum;
  VoidModelConfig void_model;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  // Throws ConfigError on the first invalid field.
  void validate() const;

  uint64_t effective_null_seed() const;
};

} // namespace void_cmb::config
