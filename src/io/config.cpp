#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/model/void_toy.hpp"

#include <cmath>
#include <fstream>
#include <set>

namespace void_cmb::config {

static void read_double_pair(const YAML::Node& n, std::array<double, 2>& out) {
    if (n && n.IsSequence() && n.size() == 2) {
        out[0] = n[0].as<double>();
        out[1] = n[1].as<double>();
    }
}

Direction TargetConfig::direction() const {
    Direction d;
    if (!string_to_coord_frame(frame, d.frame)) {
        throw ConfigError("target.frame must be 'equatorial' or 'galactic', got '" +
                          frame + "'");
    }
    d.lon_deg = lon_deg;
    d.lat_deg = lat_deg;
    return d;
}

Aperture ApertureConfig::resolve() const {
    Aperture a;
    a.core_radius_deg = core_radius_deg > 0.0 ? core_radius_deg : theta_R_deg * core_frac;
    a.rim_inner_deg = rim_inner_deg > 0.0 ? rim_inner_deg : theta_R_deg * rim_in_frac;
    a.rim_outer_deg = rim_outer_deg > 0.0 ? rim_outer_deg : theta_R_deg * rim_out_frac;
    return a;
}

uint64_t Config::effective_null_seed() const {
    return null_test.seed != 0 ? null_test.seed : bootstrap.seed + 1;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["target"]) {
        auto t = node["target"];
        if (t["frame"]) cfg.target.frame = t["frame"].as<std::string>();
        if (t["lon_deg"]) cfg.target.lon_deg = t["lon_deg"].as<double>();
        if (t["lat_deg"]) cfg.target.lat_deg = t["lat_deg"].as<double>();
        if (t["name"]) cfg.target.name = t["name"].as<std::string>();
    }

    if (node["aperture"]) {
        auto a = node["aperture"];
        if (a["theta_R_deg"]) cfg.aperture.theta_R_deg = a["theta_R_deg"].as<double>();
        if (a["core_frac"]) cfg.aperture.core_frac = a["core_frac"].as<double>();
        if (a["rim_in_frac"]) cfg.aperture.rim_in_frac = a["rim_in_frac"].as<double>();
        if (a["rim_out_frac"]) cfg.aperture.rim_out_frac = a["rim_out_frac"].as<double>();
        if (a["core_radius_deg"]) cfg.aperture.core_radius_deg = a["core_radius_deg"].as<double>();
        if (a["rim_inner_deg"]) cfg.aperture.rim_inner_deg = a["rim_inner_deg"].as<double>();
        if (a["rim_outer_deg"]) cfg.aperture.rim_outer_deg = a["rim_outer_deg"].as<double>();
        if (a["min_pixels"]) cfg.aperture.min_pixels = a["min_pixels"].as<int>();
    }

    if (node["maps"]) {
        auto maps = node["maps"];
        if (!maps.IsSequence()) {
            throw ConfigError("maps must be a list");
        }
        for (const auto& m : maps) {
            MapConfig mc;
            if (m["label"]) mc.label = m["label"].as<std::string>();
            if (m["path"]) mc.path = m["path"].as<std::string>();
            if (m["field"]) mc.field = m["field"].as<int>();
            if (m["in_uK"]) mc.in_uK = m["in_uK"].as<bool>();
            if (m["mask"]) mc.mask = m["mask"].as<std::string>();
            if (m["mask_field"]) mc.mask_field = m["mask_field"].as<int>();
            if (m["mask_threshold"]) mc.mask_threshold = m["mask_threshold"].as<double>();
            cfg.maps.push_back(mc);
        }
    }

    if (node["bootstrap"]) {
        auto b = node["bootstrap"];
        if (b["iterations"]) cfg.bootstrap.iterations = b["iterations"].as<int>();
        if (b["seed"]) cfg.bootstrap.seed = b["seed"].as<uint64_t>();
    }

    if (node["null_test"]) {
        auto n = node["null_test"];
        if (n["trials"]) cfg.null_test.trials = n["trials"].as<int>();
        if (n["lat_jitter_deg"]) cfg.null_test.lat_jitter_deg = n["lat_jitter_deg"].as<double>();
        if (n["min_separation_deg"]) {
            cfg.null_test.min_separation_deg = n["min_separation_deg"].as<double>();
        }
        if (n["max_retries"]) cfg.null_test.max_retries = n["max_retries"].as<int>();
        if (n["min_trials"]) cfg.null_test.min_trials = n["min_trials"].as<int>();
        if (n["seed"]) cfg.null_test.seed = n["seed"].as<uint64_t>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["json_path"]) cfg.output.json_path = o["json_path"].as<std::string>();
        if (o["runs_dir"]) cfg.output.runs_dir = o["runs_dir"].as<std::string>();
    }

    if (node["runtime_limits"]) {
        auto r = node["runtime_limits"];
        if (r["parallel_workers"]) {
            cfg.runtime_limits.parallel_workers = r["parallel_workers"].as<int>();
        }
    }

    if (node["vacuum"]) {
        auto v = node["vacuum"];
        if (v["H0_km_s_Mpc"]) cfg.vacuum.H0_km_s_Mpc = v["H0_km_s_Mpc"].as<double>();
        if (v["omega_lambda"]) cfg.vacuum.omega_lambda = v["omega_lambda"].as<double>();
        if (v["kappa_A"]) cfg.vacuum.kappa_A = v["kappa_A"].as<double>();
        if (v["E0_erg"]) cfg.vacuum.E0_erg = v["E0_erg"].as<double>();
        if (v["coherence_volume_m3"]) {
            cfg.vacuum.coherence_volume_m3 = v["coherence_volume_m3"].as<double>();
        }
    }

    if (node["void_model"]) {
        auto v = node["void_model"];
        if (v["anchor_preset"]) cfg.void_model.anchor_preset = v["anchor_preset"].as<std::string>();
        if (v["R_Mpc"]) cfg.void_model.R_Mpc = v["R_Mpc"].as<double>();
        if (v["z"]) cfg.void_model.z = v["z"].as<double>();
        if (v["delta_abs"]) cfg.void_model.delta_abs = v["delta_abs"].as<double>();
        read_double_pair(v["delta_band"], cfg.void_model.delta_band);
        if (v["n_exp"]) cfg.void_model.n_exp = v["n_exp"].as<double>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["target"]["frame"] = target.frame;
    node["target"]["lon_deg"] = target.lon_deg;
    node["target"]["lat_deg"] = target.lat_deg;
    node["target"]["name"] = target.name;

    node["aperture"]["theta_R_deg"] = aperture.theta_R_deg;
    node["aperture"]["core_frac"] = aperture.core_frac;
    node["aperture"]["rim_in_frac"] = aperture.rim_in_frac;
    node["aperture"]["rim_out_frac"] = aperture.rim_out_frac;
    node["aperture"]["core_radius_deg"] = aperture.core_radius_deg;
    node["aperture"]["rim_inner_deg"] = aperture.rim_inner_deg;
    node["aperture"]["rim_outer_deg"] = aperture.rim_outer_deg;
    node["aperture"]["min_pixels"] = aperture.min_pixels;

    node["maps"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& m : maps) {
        YAML::Node mn;
        mn["label"] = m.label;
        mn["path"] = m.path;
        mn["field"] = m.field;
        mn["in_uK"] = m.in_uK;
        mn["mask"] = m.mask;
        mn["mask_field"] = m.mask_field;
        mn["mask_threshold"] = m.mask_threshold;
        node["maps"].push_back(mn);
    }

    node["bootstrap"]["iterations"] = bootstrap.iterations;
    node["bootstrap"]["seed"] = bootstrap.seed;

    node["null_test"]["trials"] = null_test.trials;
    node["null_test"]["lat_jitter_deg"] = null_test.lat_jitter_deg;
    node["null_test"]["min_separation_deg"] = null_test.min_separation_deg;
    node["null_test"]["max_retries"] = null_test.max_retries;
    node["null_test"]["min_trials"] = null_test.min_trials;
    node["null_test"]["seed"] = null_test.seed;

    node["output"]["json_path"] = output.json_path;
    node["output"]["runs_dir"] = output.runs_dir;

    node["runtime_limits"]["parallel_workers"] = runtime_limits.parallel_workers;

    node["vacuum"]["H0_km_s_Mpc"] = vacuum.H0_km_s_Mpc;
    node["vacuum"]["omega_lambda"] = vacuum.omega_lambda;
    node["vacuum"]["kappa_A"] = vacuum.kappa_A;
    node["vacuum"]["E0_erg"] = vacuum.E0_erg;
    node["vacuum"]["coherence_volume_m3"] = vacuum.coherence_volume_m3;

    node["void_model"]["anchor_preset"] = void_model.anchor_preset;
    node["void_model"]["R_Mpc"] = void_model.R_Mpc;
    node["void_model"]["z"] = void_model.z;
    node["void_model"]["delta_abs"] = void_model.delta_abs;
    node["void_model"]["delta_band"].push_back(void_model.delta_band[0]);
    node["void_model"]["delta_band"].push_back(void_model.delta_band[1]);
    node["void_model"]["n_exp"] = void_model.n_exp;

    return node;
}

void Config::validate() const {
    CoordFrame frame;
    if (!string_to_coord_frame(target.frame, frame)) {
        throw ConfigError("target.frame must be 'equatorial' or 'galactic'");
    }
    if (!std::isfinite(target.lat_deg) || target.lat_deg < -90.0 || target.lat_deg > 90.0) {
        throw ConfigError("target.lat_deg must be in [-90, 90]");
    }
    if (!std::isfinite(target.lon_deg) || target.lon_deg < -360.0 || target.lon_deg > 360.0) {
        throw ConfigError("target.lon_deg must be in [-360, 360]");
    }

    const Aperture ap = aperture.resolve();
    if (!(ap.core_radius_deg > 0.0)) {
        throw ConfigError("aperture core radius must be > 0");
    }
    if (ap.rim_inner_deg < ap.core_radius_deg) {
        throw ConfigError("aperture rim inner radius must be >= core radius");
    }
    if (ap.rim_outer_deg <= ap.rim_inner_deg) {
        throw ConfigError("aperture rim outer radius must be > rim inner radius");
    }
    if (ap.rim_outer_deg > 180.0) {
        throw ConfigError("aperture rim outer radius must be <= 180 deg");
    }
    if (aperture.min_pixels < 1) {
        throw ConfigError("aperture.min_pixels must be >= 1");
    }

    std::set<std::string> labels;
    for (size_t i = 0; i < maps.size(); ++i) {
        const MapConfig& m = maps[i];
        const std::string where = "maps[" + std::to_string(i) + "]";
        if (m.label.empty()) {
            throw ConfigError(where + ".label must not be empty");
        }
        if (!labels.insert(m.label).second) {
            throw ConfigError("duplicate map label '" + m.label + "'");
        }
        if (m.path.empty()) {
            throw ConfigError(where + ".path must not be empty");
        }
        if (m.field < 0 || m.mask_field < 0) {
            throw ConfigError(where + " field indices must be >= 0");
        }
        if (!(m.mask_threshold >= 0.0 && m.mask_threshold <= 1.0)) {
            throw ConfigError(where + ".mask_threshold must be in [0, 1]");
        }
    }

    if (bootstrap.iterations < 1) {
        throw ConfigError("bootstrap.iterations must be >= 1");
    }

    if (null_test.trials < 1) {
        throw ConfigError("null_test.trials must be >= 1");
    }
    if (null_test.min_trials < 1 || null_test.min_trials > null_test.trials) {
        throw ConfigError("null_test.min_trials must be in [1, trials]");
    }
    if (null_test.max_retries < 0) {
        throw ConfigError("null_test.max_retries must be >= 0");
    }
    if (!(null_test.lat_jitter_deg >= 0.0)) {
        throw ConfigError("null_test.lat_jitter_deg must be >= 0");
    }
    if (!(null_test.min_separation_deg >= 0.0)) {
        throw ConfigError("null_test.min_separation_deg must be >= 0");
    }

    if (runtime_limits.parallel_workers < 1) {
        throw ConfigError("runtime_limits.parallel_workers must be >= 1");
    }
    if (output.runs_dir.empty()) {
        throw ConfigError("output.runs_dir must not be empty");
    }

    model::find_anchor(void_model.anchor_preset);
    if (void_model.delta_band[0] > void_model.delta_band[1]) {
        throw ConfigError("void_model.delta_band must be [low, high]");
    }
}

} // namespace void_cmb::config
