#include "void_cmb/sky/pixel_accessor.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/sky/coordinates.hpp"

#include <rangeset.h>

#include <cmath>
#include <sstream>

namespace void_cmb::sky {

namespace {

void require_initialized(const SkyMap &map) {
    if (!map.initialized()) {
        throw MapUninitialized("map '" + map.label() +
                               "' has no data at its resolution");
    }
}

} // namespace

int pixel_index(const SkyMap &map, const Direction &dir) {
    const Direction gal = to_galactic(dir);
    require_initialized(map);
    return map.base().ang2pix(to_pointing(gal));
}

Direction pixel_direction(const SkyMap &map, int pix) {
    require_initialized(map);
    if (pix < 0 || pix >= map.npix()) {
        std::ostringstream oss;
        oss << "pixel " << pix << " outside [0, " << map.npix() << ")";
        throw ValidationError(oss.str());
    }
    return from_pointing(map.base().pix2ang(pix), CoordFrame::GALACTIC);
}

std::vector<int> query_disc(const SkyMap &map, const Direction &center,
                            double radius_deg) {
    const Direction gal = to_galactic(center);
    require_initialized(map);
    if (!std::isfinite(radius_deg) || radius_deg <= 0.0) {
        std::ostringstream oss;
        oss << "query radius must be positive, got " << radius_deg << " deg";
        throw ValidationError(oss.str());
    }

    rangeset<int> ranges;
    map.base().query_disc(to_pointing(gal), radius_deg * M_PI / 180.0, ranges);

    std::vector<int> pixels;
    pixels.reserve(static_cast<size_t>(ranges.nval()));
    for (size_t rn = 0; rn < ranges.nranges(); ++rn) {
        const int range_begin = ranges.ivbegin(rn);
        const int range_end = ranges.ivend(rn);
        for (int pix = range_begin; pix < range_end; ++pix) {
            pixels.push_back(pix);
        }
    }
    return pixels;
}

} // namespace void_cmb::sky
