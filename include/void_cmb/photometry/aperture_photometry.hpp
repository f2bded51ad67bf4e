#pragma once

#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/sky_map.hpp"

namespace void_cmb::photometry {

// Aperture scaled to a void angular radius theta_R (degrees).
Aperture aperture_from_void_radius(double theta_R_deg, double core_frac = 0.6,
                                   double rim_in_frac = 0.8,
                                   double rim_out_frac = 1.2);

// Throws ValidationError unless rim_outer > rim_inner >= core > 0.
void validate_aperture(const Aperture &aperture);

// Usable pixel values in the core disc and in the rim annulus
// (outer disc minus inner disc).
ApertureSamples collect_aperture_samples(const sky::SkyMap &map,
                                         const Direction &center,
                                         const Aperture &aperture);

// <T>_core - <T>_rim from already collected samples. Throws
// InsufficientPixels when either region has fewer than `min_pixels`.
PhotometryResult photometry_from_samples(const ApertureSamples &samples,
                                         const Direction &center,
                                         const Aperture &aperture,
                                         int min_pixels = 1);

// Core-minus-rim statistic for one (map, direction, aperture) triple.
// When `samples_out` is given it receives the pixel values used.
PhotometryResult measure_aperture(const sky::SkyMap &map,
                                  const Direction &center,
                                  const Aperture &aperture,
                                  int min_pixels = 1,
                                  ApertureSamples *samples_out = nullptr);

} // namespace void_cmb::photometry
