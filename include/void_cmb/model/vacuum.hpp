#pragma once

namespace void_cmb::model {

constexpr double kSpeedOfLight = 299792458.0;         // m/s
constexpr double kGravitationalConstant = 6.67430e-11; // m^3 kg^-1 s^-2
constexpr double kMpcInMeters = 3.0856776e22;
constexpr double kErgInJoules = 1.0e-7;

struct VacuumParams {
    double H0_km_s_Mpc = 67.4;
    double omega_lambda = 0.688;
    double kappa_A = 1.5e-15;
    double E0_erg = 1.0e12;
    double coherence_volume_m3 = 1.0;
};

struct VacuumComparison {
    VacuumParams params;
    double H0_si = 0.0;              // s^-1
    double rho_crit = 0.0;           // kg/m^3
    double rho_lambda_mass = 0.0;    // kg/m^3
    double rho_lambda_energy = 0.0;  // J/m^3
    double rho_gop = 0.0;            // J/m^3
    double ratio = 0.0;              // rho_gop / rho_lambda_energy
};

// Throws DomainError for non-finite values, H0/kappa_A/E0/V_coh <= 0, or
// omega_lambda outside [0, 1].
void validate_vacuum_params(const VacuumParams &params);

double hubble_si(double H0_km_s_Mpc);
double critical_density(double H0_si);
double rho_lambda_mass(double H0_si, double omega_lambda);
double rho_lambda_energy(double H0_si, double omega_lambda);

// kappa_A * E0 / V_coh, E0 in erg.
double rho_gop_vacuum(double kappa_A, double E0_erg, double coherence_volume_m3);

VacuumComparison compare_vacuum(const VacuumParams &params = VacuumParams());

} // namespace void_cmb::model
