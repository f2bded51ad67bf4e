#pragma once

#include <string>
#include <vector>

namespace void_cmb::model {

constexpr double kTcmbKelvin = 2.725;
constexpr double kToyMpcInMeters = 3.085677581491367e22;
constexpr double kKelvinToMicroK = 1.0e6;

// Model knobs shared by calibration and prediction.
struct VoidModelParams {
    double H0_km_s_Mpc = 67.4;
    double omega_m = 0.315;
    double D_decay = 0.1;   // effective potential-decay factor
    double f_ent = 0.20;    // entanglement fraction
    double z_ref = 0.5;
    double delta_ref = 0.3;
    double n_exp = 3.0;
};

// (radius, redshift, amplitude, depth) fixing the absolute scale via V_c.
struct AnchorPreset {
    std::string name;
    double R_cal_Mpc = 0.0;
    double z_cal = 0.0;
    double delta_t_cal_uK = 0.0;
    double delta_cal_abs = 0.0;
};

struct VoidTarget {
    std::string name = "Bootes Void";
    double R_Mpc = 62.0;
    double z = 0.052;
    double delta_abs = 0.85;
    double delta_band_low = 0.75;
    double delta_band_high = 0.90;
};

struct VoidPrediction {
    VoidTarget target;
    AnchorPreset anchor;
    VoidModelParams params;
    double Vc_m3 = 0.0;
    double g = 0.0;
    double w_gamma = 0.0;
    double delta_t_uK = 0.0;       // at the locked |delta|
    double delta_t_low_uK = 0.0;   // at delta_band_low
    double delta_t_high_uK = 0.0;  // at delta_band_high
};

extern const char *const kDefaultAnchor;
extern const char *const kDeltaDefinitionCaveat;

const std::vector<AnchorPreset> &anchor_presets();
// Throws ConfigError for an unknown name.
const AnchorPreset &find_anchor(const std::string &name);

// g(z,|d|) = (|d|/d_ref) * ((1+z)/(1+z_ref))^n
double g_of_z_delta(double z, double delta_abs,
                    const VoidModelParams &params = VoidModelParams());

// g * exp(1 - g); peak 1 at g = 1. DomainError for g <= 0.
double w_gamma_of_g(double g);

// ISW-like coefficient k with dT[uK] = k * R[Mpc]^2.
double k_isw_uK_per_Mpc2(const VoidModelParams &params = VoidModelParams());

double sphere_volume_m3(double R_m);

// f_ent * w(g) * sqrt(V(R) / V_c)
double a_gop(double R_Mpc, double z, double delta_abs, double Vc_m3,
             const VoidModelParams &params = VoidModelParams());

double delta_t_core_uK(double R_Mpc, double z, double delta_abs, double Vc_m3,
                       const VoidModelParams &params = VoidModelParams());

// V_c such that delta_t_core_uK at the anchor equals its calibration amplitude.
double calibrate_vc(const AnchorPreset &anchor,
                    const VoidModelParams &params = VoidModelParams());

VoidPrediction predict_void(const VoidTarget &target, const AnchorPreset &anchor,
                            const VoidModelParams &params = VoidModelParams());

} // namespace void_cmb::model
