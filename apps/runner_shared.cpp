#include "runner_shared.hpp"

#include "void_cmb/io/healpix_fits.hpp"

namespace void_cmb::runner {

namespace fs = std::filesystem;

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

measurement::MeasurementOptions
build_measurement_options(const config::Config &cfg) {
  measurement::MeasurementOptions opt;
  opt.min_pixels = cfg.aperture.min_pixels;
  opt.workers = cfg.runtime_limits.parallel_workers;

  opt.bootstrap.iterations = cfg.bootstrap.iterations;
  opt.bootstrap.seed = cfg.bootstrap.seed;

  opt.null_test.trials = cfg.null_test.trials;
  opt.null_test.lat_jitter_deg = cfg.null_test.lat_jitter_deg;
  opt.null_test.min_separation_deg = cfg.null_test.min_separation_deg;
  opt.null_test.max_retries = cfg.null_test.max_retries;
  opt.null_test.min_trials = cfg.null_test.min_trials;
  opt.null_test.seed = cfg.effective_null_seed();
  return opt;
}

std::vector<measurement::MapInput>
build_map_inputs(const config::Config &cfg, const fs::path &base_dir) {
  std::vector<measurement::MapInput> inputs;
  inputs.reserve(cfg.maps.size());
  for (const auto &m : cfg.maps) {
    measurement::MapInput in;
    in.label = m.label;
    in.load = [m, base_dir]() { return io::load_configured_map(m, base_dir); };
    inputs.push_back(std::move(in));
  }
  return inputs;
}

model::VacuumParams vacuum_params(const config::Config &cfg) {
  model::VacuumParams p;
  p.H0_km_s_Mpc = cfg.vacuum.H0_km_s_Mpc;
  p.omega_lambda = cfg.vacuum.omega_lambda;
  p.kappa_A = cfg.vacuum.kappa_A;
  p.E0_erg = cfg.vacuum.E0_erg;
  p.coherence_volume_m3 = cfg.vacuum.coherence_volume_m3;
  return p;
}

model::VoidTarget void_target(const config::Config &cfg) {
  model::VoidTarget t;
  t.name = cfg.target.name;
  t.R_Mpc = cfg.void_model.R_Mpc;
  t.z = cfg.void_model.z;
  t.delta_abs = cfg.void_model.delta_abs;
  t.delta_band_low = cfg.void_model.delta_band[0];
  t.delta_band_high = cfg.void_model.delta_band[1];
  return t;
}

core::json vacuum_to_json(const model::VacuumComparison &v) {
  core::json j;
  j["lambda_cdm"] = {
      {"H0_km_s_Mpc", v.params.H0_km_s_Mpc},
      {"omega_lambda", v.params.omega_lambda},
      {"rho_crit_kg_m3", v.rho_crit},
      {"rho_lambda_mass_kg_m3", v.rho_lambda_mass},
      {"rho_lambda_energy_J_m3", v.rho_lambda_energy},
  };
  j["gop"] = {
      {"kappa_A", v.params.kappa_A},
      {"E0_erg", v.params.E0_erg},
      {"coherence_volume_m3", v.params.coherence_volume_m3},
      {"rho_vac_J_m3", v.rho_gop},
  };
  j["ratio_gop_over_lambda"] = v.ratio;
  return j;
}

core::json prediction_to_json(const model::VoidPrediction &p) {
  core::json j;
  j["object"] = p.target.name;
  j["anchor_preset"] = p.anchor.name;
  j["anchor_values"] = {
      {"R_cal_Mpc", p.anchor.R_cal_Mpc},
      {"z_cal", p.anchor.z_cal},
      {"DeltaT_cal_uK", p.anchor.delta_t_cal_uK},
      {"delta_cal_abs", p.anchor.delta_cal_abs},
  };
  j["inputs"] = {
      {"R_Mpc", p.target.R_Mpc},
      {"z", p.target.z},
      {"delta_lock_abs", p.target.delta_abs},
      {"delta_band_abs",
       core::json::array({p.target.delta_band_low, p.target.delta_band_high})},
      {"n_exp", p.params.n_exp},
  };
  j["calibration"] = {{"Vc_m3", p.Vc_m3}};
  j["prediction"] = {
      {"g", p.g},
      {"w_gamma", p.w_gamma},
      {"DeltaT_core_uK", p.delta_t_uK},
      {"delta_sensitivity",
       {{"low_delta_abs", p.target.delta_band_low},
        {"low_DeltaT_uK", p.delta_t_low_uK},
        {"high_delta_abs", p.target.delta_band_high},
        {"high_DeltaT_uK", p.delta_t_high_uK}}},
  };
  j["definition_caveat"] = model::kDeltaDefinitionCaveat;
  return j;
}

} // namespace void_cmb::runner
