#pragma once

#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/pixel_accessor.hpp"
#include "void_cmb/sky/sky_map.hpp"

#include <cstdint>
#include <random>
#include <string>

// In-memory HEALPix maps for unit tests.
namespace void_cmb::testing {

inline Direction galactic(double lon, double lat) {
  Direction d;
  d.lon_deg = lon;
  d.lat_deg = lat;
  d.frame = CoordFrame::GALACTIC;
  return d;
}

inline Aperture make_aperture(double core, double rim_in, double rim_out) {
  Aperture a;
  a.core_radius_deg = core;
  a.rim_inner_deg = rim_in;
  a.rim_outer_deg = rim_out;
  return a;
}

inline sky::SkyMap uniform_map(int nside, float value,
                               const std::string &label = "uniform") {
  VectorXf v = VectorXf::Constant(12L * nside * nside, value);
  return sky::SkyMap(nside, sky::PixelOrdering::RING, v, label);
}

inline sky::SkyMap noise_map(int nside, double sigma, uint64_t seed,
                             const std::string &label = "noise") {
  std::mt19937_64 rng(seed);
  std::normal_distribution<double> gauss(0.0, sigma);
  VectorXf v(12L * nside * nside);
  for (Eigen::Index i = 0; i < v.size(); ++i) {
    v[i] = static_cast<float>(gauss(rng));
  }
  return sky::SkyMap(nside, sky::PixelOrdering::RING, v, label);
}

// `base` with the core disc set to `core_value` and the rim annulus to
// `rim_value` around `center`.
inline sky::SkyMap step_map(const sky::SkyMap &base, const Direction &center,
                            const Aperture &ap, float core_value,
                            float rim_value) {
  VectorXf v = base.values();
  for (int p : sky::query_disc(base, center, ap.rim_outer_deg)) {
    v[p] = rim_value;
  }
  for (int p : sky::query_disc(base, center, ap.rim_inner_deg)) {
    v[p] = base.values()[p];
  }
  for (int p : sky::query_disc(base, center, ap.core_radius_deg)) {
    v[p] = core_value;
  }
  return sky::SkyMap(base.nside(), base.ordering(), v, base.label());
}

} // namespace void_cmb::testing
