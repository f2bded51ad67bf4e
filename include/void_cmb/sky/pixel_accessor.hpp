#pragma once

#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/sky_map.hpp"

#include <vector>

namespace void_cmb::sky {

// Pixel containing `dir` (equatorial input is converted to galactic).
// Throws InvalidDirection or MapUninitialized.
int pixel_index(const SkyMap &map, const Direction &dir);

// Galactic centre of pixel `pix`.
Direction pixel_direction(const SkyMap &map, int pix);

// Pixels whose centres lie within `radius_deg` great-circle distance of
// `center`, in ascending index order.
std::vector<int> query_disc(const SkyMap &map, const Direction &center,
                            double radius_deg);

} // namespace void_cmb::sky
