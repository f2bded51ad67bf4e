#pragma once

#include "void_cmb/core/types.hpp"

#include <pointing.h>

namespace void_cmb::sky {

// Throws InvalidDirection unless lat is in [-90, 90], lon in [-360, 360]
// and both are finite.
void validate_direction(const Direction &dir);

// Validated copy with lon wrapped into [0, 360).
Direction normalize_direction(const Direction &dir);

// HEALPix pointing: theta = colatitude, phi = longitude (radians).
pointing to_pointing(const Direction &dir);
Direction from_pointing(const pointing &ptg, CoordFrame frame);

// ICRS/J2000 equatorial -> galactic. Galactic input is returned normalized.
Direction to_galactic(const Direction &dir);

// Great-circle separation in degrees; both directions are compared in the
// galactic frame.
double angular_separation_deg(const Direction &a, const Direction &b);

} // namespace void_cmb::sky
