#pragma once

#include <Eigen/Dense>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace void_cmb {

namespace fs = std::filesystem;

using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

// Sky coordinate frame
enum class CoordFrame {
    GALACTIC,
    EQUATORIAL  // ICRS / J2000
};

inline std::string coord_frame_to_string(CoordFrame frame) {
    switch (frame) {
        case CoordFrame::GALACTIC: return "galactic";
        case CoordFrame::EQUATORIAL: return "equatorial";
        default: return "unknown";
    }
}

inline bool string_to_coord_frame(const std::string& s, CoordFrame& out) {
    std::string norm = s;
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    norm.erase(norm.begin(),
               std::find_if(norm.begin(), norm.end(), not_space));
    norm.erase(std::find_if(norm.rbegin(), norm.rend(), not_space).base(),
               norm.end());
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (norm == "galactic" || norm == "gal") {
        out = CoordFrame::GALACTIC;
        return true;
    }
    if (norm == "equatorial" || norm == "icrs" || norm == "radec") {
        out = CoordFrame::EQUATORIAL;
        return true;
    }
    return false;
}

// Sky direction in degrees (lon = l or RA, lat = b or Dec)
struct Direction {
    double lon_deg = 0.0;
    double lat_deg = 0.0;
    CoordFrame frame = CoordFrame::GALACTIC;
};

// Core disc + rim annulus, radii in degrees
struct Aperture {
    double core_radius_deg = 0.0;
    double rim_inner_deg = 0.0;
    double rim_outer_deg = 0.0;
};

// Usable pixel values falling in the core and rim regions
struct ApertureSamples {
    VectorXd core_values;
    VectorXd rim_values;
};

struct PhotometryResult {
    Direction center;      // galactic
    Aperture aperture;
    double t_core = 0.0;   // <T>_core
    double t_rim = 0.0;    // <T>_rim
    double delta_t = 0.0;  // <T>_core - <T>_rim
    int n_core_pix = 0;
    int n_rim_pix = 0;
};

struct BootstrapEstimate {
    int iterations = 0;
    uint64_t seed = 0;
    double mean = 0.0;
    double sigma = 0.0;            // sigma_boot
    std::vector<double> samples;   // one delta_t per iteration
};

struct TrialFailure {
    int trial = 0;
    std::string kind;
    std::string message;
};

struct NullDistribution {
    std::vector<double> values;    // successful trials only, trial order
    std::vector<Direction> centers;
    double mean = 0.0;
    double stddev = 0.0;
    double sem = 0.0;              // stddev / sqrt(n)
    int n_requested = 0;
    int n_succeeded = 0;
    int n_failed = 0;
    int total_redraws = 0;
    bool degraded = false;         // some trials failed, min_trials still met
    std::vector<TrialFailure> failures;
    double z_score = 0.0;          // (target - mean) / stddev
    double p_value = 1.0;          // empirical two-sided
};

struct MapFailure {
    std::string kind;
    std::string message;
};

// Per-map entry of the measurement record
struct MapMeasurement {
    std::string label;
    bool success = false;
    int nside = 0;
    PhotometryResult photometry;
    BootstrapEstimate bootstrap;
    NullDistribution null_dist;
    MapFailure failure;
};

struct ConsistencySummary {
    int n_maps = 0;
    int n_succeeded = 0;
    int n_failed = 0;
    double mean_delta_t = 0.0;
    double spread = 0.0;           // std of delta_t across successful maps
    double min_delta_t = 0.0;
    double max_delta_t = 0.0;
    double max_sigma_boot = 0.0;
    bool consistent = false;
};

struct MeasurementRecord {
    Direction target;              // as configured
    Direction target_galactic;
    Aperture aperture;
    std::vector<MapMeasurement> maps;
    ConsistencySummary summary;
};

// Runner phase enumeration
enum class Phase {
    LOAD_MAPS = 0,
    PHOTOMETRY = 1,
    CONSISTENCY = 2,
    WRITE_OUTPUT = 3,
    DONE = 4
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::LOAD_MAPS: return "LOAD_MAPS";
        case Phase::PHOTOMETRY: return "PHOTOMETRY";
        case Phase::CONSISTENCY: return "CONSISTENCY";
        case Phase::WRITE_OUTPUT: return "WRITE_OUTPUT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace void_cmb
