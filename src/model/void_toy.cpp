#include "void_cmb/model/void_toy.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/model/vacuum.hpp"

#include <cmath>
#include <string>

namespace void_cmb::model {

const char *const kDefaultAnchor = "A1_lowz";

const char *const kDeltaDefinitionCaveat =
    "|delta| is an effective core underdensity depth used only for the local "
    "regime mapping g(z,|delta|) -> w_Gamma(g). It is not assumed equal to a "
    "catalog-defined density contrast. Future overlays will substitute |delta| "
    "from the chosen void-finder / tracer-bias model.";

namespace {

void require_finite(double v, const char *name) {
    if (!std::isfinite(v)) {
        throw DomainError(std::string(name) + " must be finite");
    }
}

void require_positive(double v, const char *name) {
    require_finite(v, name);
    if (v <= 0.0) {
        throw DomainError(std::string(name) + " must be > 0");
    }
}

void check_params(const VoidModelParams &p) {
    require_positive(p.H0_km_s_Mpc, "H0_km_s_Mpc");
    require_positive(p.omega_m, "omega_m");
    require_positive(p.D_decay, "D_decay");
    require_positive(p.f_ent, "f_ent");
    require_positive(p.delta_ref, "delta_ref");
    require_finite(p.n_exp, "n_exp");
    if (!std::isfinite(p.z_ref) || p.z_ref <= -1.0) {
        throw DomainError("z_ref must be > -1");
    }
}

} // namespace

const std::vector<AnchorPreset> &anchor_presets() {
    static const std::vector<AnchorPreset> presets = {
        {"baseline", 80.0, 0.5, 10.0, 0.3},
        {"A1_lowz", 55.0, 0.3, 10.0, 0.3},
        {"A2_lowz_band", 55.0, 0.3, 8.0, 0.3},
    };
    return presets;
}

const AnchorPreset &find_anchor(const std::string &name) {
    for (const auto &a : anchor_presets()) {
        if (a.name == name) {
            return a;
        }
    }
    throw ConfigError("unknown anchor preset: " + name);
}

double g_of_z_delta(double z, double delta_abs, const VoidModelParams &params) {
    check_params(params);
    if (!std::isfinite(z) || z <= -1.0) {
        throw DomainError("z must be > -1");
    }
    require_positive(delta_abs, "|delta|");
    return (delta_abs / params.delta_ref) *
           std::pow((1.0 + z) / (1.0 + params.z_ref), params.n_exp);
}

double w_gamma_of_g(double g) {
    require_positive(g, "g");
    return g * std::exp(1.0 - g);
}

double k_isw_uK_per_Mpc2(const VoidModelParams &params) {
    check_params(params);
    const double H0 = params.H0_km_s_Mpc * 1.0e3 / kToyMpcInMeters;
    const double phi_over_c2 =
        0.5 * params.omega_m * H0 * H0 * params.delta_ref /
        (kSpeedOfLight * kSpeedOfLight);
    const double k_K_per_m2 = 2.0 * kTcmbKelvin * phi_over_c2 * params.D_decay;
    return k_K_per_m2 * kKelvinToMicroK * kToyMpcInMeters * kToyMpcInMeters;
}

double sphere_volume_m3(double R_m) {
    require_positive(R_m, "R");
    return (4.0 / 3.0) * M_PI * R_m * R_m * R_m;
}

double a_gop(double R_Mpc, double z, double delta_abs, double Vc_m3,
             const VoidModelParams &params) {
    require_positive(R_Mpc, "R_Mpc");
    require_positive(Vc_m3, "Vc_m3");
    const double V = sphere_volume_m3(R_Mpc * kToyMpcInMeters);
    const double w = w_gamma_of_g(g_of_z_delta(z, delta_abs, params));
    return params.f_ent * w * std::sqrt(V / Vc_m3);
}

double delta_t_core_uK(double R_Mpc, double z, double delta_abs, double Vc_m3,
                       const VoidModelParams &params) {
    const double A = a_gop(R_Mpc, z, delta_abs, Vc_m3, params);
    return k_isw_uK_per_Mpc2(params) * R_Mpc * R_Mpc * A;
}

double calibrate_vc(const AnchorPreset &anchor, const VoidModelParams &params) {
    require_positive(anchor.R_cal_Mpc, "anchor R_cal_Mpc");
    require_positive(anchor.delta_t_cal_uK, "anchor DeltaT_cal_uK");

    const double k = k_isw_uK_per_Mpc2(params);
    const double w_cal =
        w_gamma_of_g(g_of_z_delta(anchor.z_cal, anchor.delta_cal_abs, params));
    const double V = sphere_volume_m3(anchor.R_cal_Mpc * kToyMpcInMeters);

    const double denom = k * anchor.R_cal_Mpc * anchor.R_cal_Mpc * params.f_ent * w_cal;
    const double ratio = anchor.delta_t_cal_uK / denom;
    const double Vc = V / (ratio * ratio);
    require_positive(Vc, "calibrated Vc");
    return Vc;
}

VoidPrediction predict_void(const VoidTarget &target, const AnchorPreset &anchor,
                            const VoidModelParams &params) {
    VoidPrediction out;
    out.target = target;
    out.anchor = anchor;
    out.params = params;
    out.Vc_m3 = calibrate_vc(anchor, params);
    out.g = g_of_z_delta(target.z, target.delta_abs, params);
    out.w_gamma = w_gamma_of_g(out.g);
    out.delta_t_uK = delta_t_core_uK(target.R_Mpc, target.z, target.delta_abs,
                                     out.Vc_m3, params);
    out.delta_t_low_uK = delta_t_core_uK(target.R_Mpc, target.z,
                                         target.delta_band_low, out.Vc_m3, params);
    out.delta_t_high_uK = delta_t_core_uK(target.R_Mpc, target.z,
                                          target.delta_band_high, out.Vc_m3, params);
    return out;
}

} // namespace void_cmb::model
