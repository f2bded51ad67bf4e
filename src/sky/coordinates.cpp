#include "void_cmb/sky/coordinates.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/utils.hpp"

#include <trafos.h>
#include <vec3.h>

#include <cmath>
#include <sstream>

namespace void_cmb::sky {

namespace {

constexpr double kDegToRad = M_PI / 180.0;
constexpr double kRadToDeg = 180.0 / M_PI;

} // namespace

void validate_direction(const Direction &dir) {
    if (!std::isfinite(dir.lon_deg) || !std::isfinite(dir.lat_deg)) {
        throw InvalidDirection("non-finite coordinate");
    }
    if (dir.lat_deg < -90.0 || dir.lat_deg > 90.0) {
        std::ostringstream oss;
        oss << "latitude " << dir.lat_deg << " deg outside [-90, 90]";
        throw InvalidDirection(oss.str());
    }
    if (dir.lon_deg < -360.0 || dir.lon_deg > 360.0) {
        std::ostringstream oss;
        oss << "longitude " << dir.lon_deg << " deg outside [-360, 360]";
        throw InvalidDirection(oss.str());
    }
}

Direction normalize_direction(const Direction &dir) {
    validate_direction(dir);
    Direction out = dir;
    out.lon_deg = core::wrap_degrees_360(dir.lon_deg);
    return out;
}

pointing to_pointing(const Direction &dir) {
    return pointing((90.0 - dir.lat_deg) * kDegToRad, dir.lon_deg * kDegToRad);
}

Direction from_pointing(const pointing &ptg, CoordFrame frame) {
    Direction out;
    out.lon_deg = core::wrap_degrees_360(ptg.phi * kRadToDeg);
    out.lat_deg = 90.0 - ptg.theta * kRadToDeg;
    out.frame = frame;
    return out;
}

Direction to_galactic(const Direction &dir) {
    Direction norm = normalize_direction(dir);
    if (norm.frame == CoordFrame::GALACTIC) {
        return norm;
    }
    static const Trafo equatorial_to_galactic(2000.0, 2000.0, Equatorial, Galactic);
    pointing gal = equatorial_to_galactic(to_pointing(norm));
    gal.normalize();
    return from_pointing(gal, CoordFrame::GALACTIC);
}

double angular_separation_deg(const Direction &a, const Direction &b) {
    const vec3 va = to_pointing(to_galactic(a)).to_vec3();
    const vec3 vb = to_pointing(to_galactic(b)).to_vec3();
    return v_angle(va, vb) * kRadToDeg;
}

} // namespace void_cmb::sky
