#include "void_cmb/photometry/aperture_photometry.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/sky/coordinates.hpp"
#include "void_cmb/sky/pixel_accessor.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <sstream>
#include <vector>

namespace void_cmb::photometry {

namespace {

VectorXd usable_values(const sky::SkyMap &map, const std::vector<int> &pixels) {
    std::vector<double> vals;
    vals.reserve(pixels.size());
    for (int pix : pixels) {
        if (map.is_usable(pix)) {
            vals.push_back(static_cast<double>(map.value(pix)));
        }
    }
    return Eigen::Map<const VectorXd>(vals.data(), static_cast<Eigen::Index>(vals.size()));
}

} // namespace

Aperture aperture_from_void_radius(double theta_R_deg, double core_frac,
                                   double rim_in_frac, double rim_out_frac) {
    Aperture ap;
    ap.core_radius_deg = core_frac * theta_R_deg;
    ap.rim_inner_deg = rim_in_frac * theta_R_deg;
    ap.rim_outer_deg = rim_out_frac * theta_R_deg;
    validate_aperture(ap);
    return ap;
}

void validate_aperture(const Aperture &aperture) {
    const double rc = aperture.core_radius_deg;
    const double ri = aperture.rim_inner_deg;
    const double ro = aperture.rim_outer_deg;
    if (!std::isfinite(rc) || !std::isfinite(ri) || !std::isfinite(ro)) {
        throw ValidationError("aperture radii must be finite");
    }
    if (rc <= 0.0) {
        throw ValidationError("core radius must be > 0");
    }
    if (ri < rc) {
        std::ostringstream oss;
        oss << "rim inner radius " << ri << " deg is smaller than core radius "
            << rc << " deg";
        throw ValidationError(oss.str());
    }
    if (ro <= ri) {
        std::ostringstream oss;
        oss << "rim outer radius " << ro << " deg must exceed rim inner radius "
            << ri << " deg";
        throw ValidationError(oss.str());
    }
    if (ro > 180.0) {
        throw ValidationError("rim outer radius must not exceed 180 deg");
    }
}

ApertureSamples collect_aperture_samples(const sky::SkyMap &map,
                                         const Direction &center,
                                         const Aperture &aperture) {
    validate_aperture(aperture);

    const std::vector<int> core = sky::query_disc(map, center, aperture.core_radius_deg);
    const std::vector<int> outer = sky::query_disc(map, center, aperture.rim_outer_deg);
    const std::vector<int> inner = sky::query_disc(map, center, aperture.rim_inner_deg);

    // query_disc returns ascending indices
    std::vector<int> rim;
    rim.reserve(outer.size() - std::min(outer.size(), inner.size()));
    std::set_difference(outer.begin(), outer.end(), inner.begin(), inner.end(),
                        std::back_inserter(rim));

    ApertureSamples samples;
    samples.core_values = usable_values(map, core);
    samples.rim_values = usable_values(map, rim);
    return samples;
}

PhotometryResult photometry_from_samples(const ApertureSamples &samples,
                                         const Direction &center,
                                         const Aperture &aperture,
                                         int min_pixels) {
    const int n_core = static_cast<int>(samples.core_values.size());
    const int n_rim = static_cast<int>(samples.rim_values.size());
    const int required = std::max(1, min_pixels);
    if (n_core < required || n_rim < required) {
        std::ostringstream oss;
        oss << "core has " << n_core << " and rim has " << n_rim
            << " usable pixels, " << required << " required per region";
        throw InsufficientPixels(oss.str());
    }

    PhotometryResult res;
    res.center = center;
    res.aperture = aperture;
    res.t_core = samples.core_values.mean();
    res.t_rim = samples.rim_values.mean();
    res.delta_t = res.t_core - res.t_rim;
    res.n_core_pix = n_core;
    res.n_rim_pix = n_rim;
    return res;
}

PhotometryResult measure_aperture(const sky::SkyMap &map,
                                  const Direction &center,
                                  const Aperture &aperture, int min_pixels,
                                  ApertureSamples *samples_out) {
    const Direction gal = sky::to_galactic(center);
    ApertureSamples samples = collect_aperture_samples(map, gal, aperture);
    PhotometryResult res = photometry_from_samples(samples, gal, aperture, min_pixels);
    if (samples_out) {
        *samples_out = std::move(samples);
    }
    return res;
}

} // namespace void_cmb::photometry
