#include "runner_shared.hpp"

#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/events.hpp"
#include "void_cmb/core/types.hpp"
#include "void_cmb/core/utils.hpp"
#include "void_cmb/io/healpix_fits.hpp"
#include "void_cmb/measurement/consistency.hpp"
#include "void_cmb/measurement/record_json.hpp"
#include "void_cmb/model/vacuum.hpp"
#include "void_cmb/model/void_toy.hpp"
#include "void_cmb/photometry/aperture_photometry.hpp"
#include "void_cmb/sky/coordinates.hpp"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#ifdef HAVE_CLI11
#include <CLI/CLI.hpp>
#endif

namespace fs = std::filesystem;

namespace {

namespace core = void_cmb::core;
namespace config = void_cmb::config;
namespace measurement = void_cmb::measurement;
namespace model = void_cmb::model;
namespace photometry = void_cmb::photometry;
namespace runner = void_cmb::runner;
namespace sky = void_cmb::sky;

using void_cmb::Aperture;
using void_cmb::Direction;
using void_cmb::MapMeasurement;
using void_cmb::Phase;
using void_cmb::VoidCmbError;

} // namespace

void print_usage() {
  std::cout << "Usage: void_cmb_runner <command> [options]\n\n"
            << "Commands:\n"
            << "  run      Aperture photometry, bootstrap and null test per map\n"
            << "  predict  Toy-model core Delta T prediction for the target void\n"
            << "  vacuum   GoP / LambdaCDM vacuum energy density ratio\n"
            << "\nOptions:\n"
            << "  --config <path>       Path to config.yaml (required for run)\n"
            << "  --runs-dir <path>     Directory for run outputs (run)\n"
            << "  --out <path>          Also write the result JSON to this path\n"
            << "  --anchor <name>       Calibration anchor preset (predict):\n"
            << "                        baseline | A1_lowz | A2_lowz_band\n"
            << "  --dry-run             Validate and create the run directory only\n"
            << std::endl;
}

config::Config load_optional_config(const std::string &config_path) {
  if (config_path.empty()) {
    return config::Config();
  }
  config::Config cfg = config::Config::load(config_path);
  cfg.validate();
  return cfg;
}

int vacuum_command(const std::string &config_path, const std::string &out_path) {
  try {
    config::Config cfg = load_optional_config(config_path);
    model::VacuumComparison v = model::compare_vacuum(runner::vacuum_params(cfg));
    core::publish_json(runner::vacuum_to_json(v), std::cout, out_path);
  } catch (const VoidCmbError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int predict_command(const std::string &config_path, const std::string &anchor,
                    const std::string &out_path) {
  try {
    config::Config cfg = load_optional_config(config_path);
    const std::string preset =
        anchor.empty() ? cfg.void_model.anchor_preset : anchor;

    model::VoidModelParams params;
    params.n_exp = cfg.void_model.n_exp;
    model::VoidPrediction p = model::predict_void(
        runner::void_target(cfg), model::find_anchor(preset), params);
    core::publish_json(runner::prediction_to_json(p), std::cout, out_path);
  } catch (const VoidCmbError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int run_command(const std::string &config_path, const std::string &runs_dir,
                const std::string &out_path, bool dry_run) {
  fs::path cfg_path(config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << config_path << std::endl;
    return 1;
  }

  config::Config cfg;
  Direction target;
  Aperture aperture;
  try {
    cfg = config::Config::load(cfg_path);
    cfg.validate();
    target = cfg.target.direction();
    sky::validate_direction(target);
    aperture = cfg.aperture.resolve();
    photometry::validate_aperture(aperture);
  } catch (const VoidCmbError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  if (cfg.maps.empty()) {
    std::cerr << "Error: no maps configured" << std::endl;
    return 1;
  }

  fs::path runs(runs_dir.empty() ? cfg.output.runs_dir : runs_dir);
  std::string run_id = core::get_run_id();
  fs::path run_dir = runs / run_id;
  fs::create_directories(run_dir / "logs");
  fs::create_directories(run_dir / "outputs");
  core::copy_config(cfg_path, run_dir / "config.yaml");

  std::ofstream event_log_file(run_dir / "logs" / "run_events.jsonl");
  runner::TeeBuf tee_buf(std::cout.rdbuf(), event_log_file.rdbuf());
  std::ostream log_file(&tee_buf);

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", config_path},
                     {"run_dir", run_dir.string()},
                     {"target", cfg.target.name},
                     {"maps", cfg.maps.size()},
                     {"dry_run", dry_run}},
                    log_file);

  std::cout << "Run ID: " << run_id << std::endl;
  std::cout << "Target: " << cfg.target.name << " (" << cfg.target.frame << " "
            << cfg.target.lon_deg << ", " << cfg.target.lat_deg << ")" << std::endl;
  std::cout << "Maps: " << cfg.maps.size() << std::endl;
  std::cout << "Output: " << run_dir.string() << std::endl;

  if (dry_run) {
    emitter.phase_start(run_id, Phase::LOAD_MAPS, log_file);
    emitter.phase_end(run_id, Phase::LOAD_MAPS, "skipped",
                      {{"reason", "dry_run"}}, log_file);
    std::cout << "Dry run - no processing" << std::endl;
    emitter.run_end(run_id, true, "ok", log_file);
    return 0;
  }

  // LOAD_MAPS: loaders are built here and invoked per map inside PHOTOMETRY
  emitter.phase_start(run_id, Phase::LOAD_MAPS, log_file);
  const fs::path base_dir = cfg_path.has_parent_path() ? cfg_path.parent_path()
                                                       : fs::current_path();
  auto inputs = runner::build_map_inputs(cfg, base_dir);
  for (const auto &m : cfg.maps) {
    fs::path p(m.path);
    if (p.is_relative()) {
      p = base_dir / p;
    }
    if (!fs::exists(p)) {
      emitter.warning(run_id, "Map '" + m.label + "' not found: " + p.string(),
                      log_file);
    } else if (!void_cmb::io::is_fits_path(p)) {
      emitter.warning(run_id,
                      "Map '" + m.label + "' has no FITS extension: " + p.string(),
                      log_file);
    }
  }
  emitter.phase_end(run_id, Phase::LOAD_MAPS, "ok",
                    {{"n_inputs", inputs.size()}}, log_file);

  // PHOTOMETRY: photometry + bootstrap + null test per map
  emitter.phase_start(run_id, Phase::PHOTOMETRY, log_file);
  std::mutex log_mutex;
  const int total = static_cast<int>(inputs.size());
  int done = 0;
  measurement::MeasurementRecord record;
  try {
    record = measurement::run_consistency(
        inputs, target, aperture, runner::build_measurement_options(cfg),
        [&](size_t idx, const MapMeasurement &m) {
          std::lock_guard<std::mutex> lock(log_mutex);
          ++done;
          emitter.map_processed(run_id, static_cast<int>(idx), total, m.label,
                                m.success, log_file);
          if (!m.success) {
            emitter.warning(run_id,
                            "Map '" + m.label + "' failed (" + m.failure.kind +
                                "): " + m.failure.message,
                            log_file);
          }
          emitter.phase_progress(run_id, Phase::PHOTOMETRY,
                                 static_cast<float>(done) / total, m.label,
                                 log_file);
        });
  } catch (const VoidCmbError &e) {
    emitter.phase_end(run_id, Phase::PHOTOMETRY, "error", {{"error", e.what()}},
                      log_file);
    emitter.error(run_id, e.what(), log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during PHOTOMETRY: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(run_id, Phase::PHOTOMETRY, "ok",
                    {{"n_succeeded", record.summary.n_succeeded},
                     {"n_failed", record.summary.n_failed}},
                    log_file);

  // CONSISTENCY
  emitter.phase_start(run_id, Phase::CONSISTENCY, log_file);
  core::json summary = measurement::summary_to_json(record.summary);
  emitter.phase_end(run_id, Phase::CONSISTENCY,
                    record.summary.n_succeeded > 0 ? "ok" : "no_maps", summary,
                    log_file);

  for (const auto &m : record.maps) {
    if (m.success) {
      std::cout << std::fixed << std::setprecision(3) << "  " << m.label
                << ": DeltaT = " << m.photometry.delta_t << " uK, sigma_boot = "
                << m.bootstrap.sigma << " uK, null = " << m.null_dist.mean
                << " +/- " << m.null_dist.stddev << " uK (z = "
                << m.null_dist.z_score << ")" << std::endl;
    } else {
      std::cout << "  " << m.label << ": FAILED (" << m.failure.kind << ")"
                << std::endl;
    }
  }
  std::cout.unsetf(std::ios::floatfield);

  // WRITE_OUTPUT
  emitter.phase_start(run_id, Phase::WRITE_OUTPUT, log_file);
  core::json artifact = measurement::record_to_json(record, cfg);
  artifact["tool"] = "void_cmb_runner";
  artifact["run_id"] = run_id;
  artifact["target"]["name"] = cfg.target.name;
  artifact["bootstrap"] = {{"iterations", cfg.bootstrap.iterations},
                           {"seed", cfg.bootstrap.seed}};
  artifact["null_test"] = {{"trials", cfg.null_test.trials},
                           {"lat_jitter_deg", cfg.null_test.lat_jitter_deg},
                           {"min_separation_deg", cfg.null_test.min_separation_deg},
                           {"max_retries", cfg.null_test.max_retries},
                           {"min_trials", cfg.null_test.min_trials},
                           {"seed", cfg.effective_null_seed()}};
  artifact["min_pixels"] = cfg.aperture.min_pixels;

  std::vector<fs::path> targets = {run_dir / "outputs" / "measurement.json"};
  const std::string extra_out = out_path.empty() ? cfg.output.json_path : out_path;
  if (!extra_out.empty()) {
    targets.emplace_back(extra_out);
  }
  try {
    for (const auto &p : targets) {
      core::write_text(p, artifact.dump(2));
    }
  } catch (const VoidCmbError &e) {
    emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "error", {{"error", e.what()}},
                      log_file);
    emitter.run_end(run_id, false, "error", log_file);
    std::cerr << "Error during WRITE_OUTPUT: " << e.what() << std::endl;
    return 1;
  }
  emitter.phase_end(run_id, Phase::WRITE_OUTPUT, "ok",
                    {{"path", targets.front().string()}}, log_file);

  const bool ok = record.summary.n_succeeded > 0;
  emitter.phase_start(run_id, Phase::DONE, log_file);
  emitter.phase_end(run_id, Phase::DONE, ok ? "ok" : "error", {}, log_file);
  emitter.run_end(run_id, ok, ok ? "ok" : "all_maps_failed", log_file);
  return ok ? 0 : 1;
}

int main(int argc, char *argv[]) {
#ifdef HAVE_CLI11
  CLI::App app{"Void-CMB aperture photometry runner"};

  std::string config_path, runs_dir, out_path, anchor;
  bool dry_run = false;

  auto run_cmd = app.add_subcommand("run", "Run the aperture photometry harness");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")->required();
  run_cmd->add_option("--runs-dir", runs_dir, "Runs directory");
  run_cmd->add_option("--out", out_path, "Extra JSON output path");
  run_cmd->add_flag("--dry-run", dry_run, "Dry run");

  auto predict_cmd = app.add_subcommand("predict", "Toy-model Delta T prediction");
  predict_cmd->add_option("--config", config_path, "Path to config.yaml");
  predict_cmd->add_option("--anchor", anchor, "Anchor preset");
  predict_cmd->add_option("--out", out_path, "Also write the prediction JSON here");

  auto vacuum_cmd = app.add_subcommand("vacuum", "Vacuum energy density ratio");
  vacuum_cmd->add_option("--config", config_path, "Path to config.yaml");
  vacuum_cmd->add_option("--out", out_path, "Also write the vacuum JSON here");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(config_path, runs_dir, out_path, dry_run);
  }
  if (predict_cmd->parsed()) {
    return predict_command(config_path, anchor, out_path);
  }
  if (vacuum_cmd->parsed()) {
    return vacuum_command(config_path, out_path);
  }

  print_usage();
  return 1;
#else
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];
  std::string config_path, runs_dir, out_path, anchor;
  bool dry_run = false;

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc)
      config_path = argv[++i];
    else if (arg == "--runs-dir" && i + 1 < argc)
      runs_dir = argv[++i];
    else if (arg == "--out" && i + 1 < argc)
      out_path = argv[++i];
    else if (arg == "--anchor" && i + 1 < argc)
      anchor = argv[++i];
    else if (arg == "--dry-run")
      dry_run = true;
    else {
      std::cerr << "Error: unknown option " << arg << std::endl;
      print_usage();
      return 1;
    }
  }

  if (command == "run") {
    if (config_path.empty()) {
      std::cerr << "Error: run requires --config <path>" << std::endl;
      return 1;
    }
    return run_command(config_path, runs_dir, out_path, dry_run);
  }

  if (command == "predict") {
    return predict_command(config_path, anchor, out_path);
  }

  if (command == "vacuum") {
    return vacuum_command(config_path, out_path);
  }

  print_usage();
  return 1;
#endif
}
