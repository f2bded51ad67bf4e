#include "void_cmb/model/vacuum.hpp"
#include "void_cmb/core/errors.hpp"

#include <cmath>
#include <string>

namespace void_cmb::model {

namespace {

void require_positive(double v, const char *name) {
    if (!std::isfinite(v) || v <= 0.0) {
        throw DomainError(std::string(name) + " must be finite and > 0");
    }
}

} // namespace

void validate_vacuum_params(const VacuumParams &params) {
    require_positive(params.H0_km_s_Mpc, "H0_km_s_Mpc");
    require_positive(params.kappa_A, "kappa_A");
    require_positive(params.E0_erg, "E0_erg");
    require_positive(params.coherence_volume_m3, "coherence_volume_m3");
    if (!std::isfinite(params.omega_lambda) || params.omega_lambda < 0.0 ||
        params.omega_lambda > 1.0) {
        throw DomainError("omega_lambda must be in [0, 1]");
    }
}

double hubble_si(double H0_km_s_Mpc) {
    require_positive(H0_km_s_Mpc, "H0_km_s_Mpc");
    return H0_km_s_Mpc * 1000.0 / kMpcInMeters;
}

double critical_density(double H0_si) {
    require_positive(H0_si, "H0");
    return 3.0 * H0_si * H0_si / (8.0 * M_PI * kGravitationalConstant);
}

double rho_lambda_mass(double H0_si, double omega_lambda) {
    if (!std::isfinite(omega_lambda) || omega_lambda < 0.0 || omega_lambda > 1.0) {
        throw DomainError("omega_lambda must be in [0, 1]");
    }
    return omega_lambda * critical_density(H0_si);
}

double rho_lambda_energy(double H0_si, double omega_lambda) {
    return rho_lambda_mass(H0_si, omega_lambda) * kSpeedOfLight * kSpeedOfLight;
}

double rho_gop_vacuum(double kappa_A, double E0_erg, double coherence_volume_m3) {
    require_positive(kappa_A, "kappa_A");
    require_positive(E0_erg, "E0_erg");
    require_positive(coherence_volume_m3, "coherence_volume_m3");
    return kappa_A * (E0_erg * kErgInJoules) / coherence_volume_m3;
}

VacuumComparison compare_vacuum(const VacuumParams &params) {
    validate_vacuum_params(params);

    VacuumComparison out;
    out.params = params;
    out.H0_si = hubble_si(params.H0_km_s_Mpc);
    out.rho_crit = critical_density(out.H0_si);
    out.rho_lambda_mass = rho_lambda_mass(out.H0_si, params.omega_lambda);
    out.rho_lambda_energy = rho_lambda_energy(out.H0_si, params.omega_lambda);
    out.rho_gop = rho_gop_vacuum(params.kappa_A, params.E0_erg,
                                 params.coherence_volume_m3);
    if (out.rho_lambda_energy <= 0.0) {
        throw DomainError("rho_lambda is zero (omega_lambda = 0), ratio undefined");
    }
    out.ratio = out.rho_gop / out.rho_lambda_energy;
    return out;
}

} // namespace void_cmb::model
