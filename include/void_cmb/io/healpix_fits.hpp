#pragma once

#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/sky_map.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace void_cmb::io {

// Keywords of the binary-table extension holding a full-sky HEALPix map.
struct HealpixFitsInfo {
    int nside = 0;
    sky::PixelOrdering ordering = sky::PixelOrdering::RING;
    std::string coordsys;   // COORDSYS, e.g. "G"
    long npix = 0;          // rows x repeat count
    int ncols = 0;
    std::vector<std::string> units;  // TUNITn per column, may be empty
};

bool is_fits_path(const fs::path& path);

HealpixFitsInfo read_healpix_info(const fs::path& path);

// Column `field` (0-based) of the first binary-table extension. Values are
// converted K -> uK unless `in_uK`; UNSEEN pixels are kept as the sentinel.
sky::SkyMap read_healpix_map(const fs::path& path, int field, bool in_uK,
                             const std::string& label);

// keep[p] = 1 where the mask value is finite and >= threshold, reordered to
// `ordering`. Throws ValidationError when the mask NSIDE differs from `nside`.
std::vector<uint8_t> read_healpix_mask(const fs::path& path, int field,
                                       double threshold, int nside,
                                       sky::PixelOrdering ordering);

// Single-column HEALPix binary table, overwriting `path`.
void write_healpix_map(const fs::path& path, const VectorXf& values, int nside,
                       sky::PixelOrdering ordering, const std::string& unit = "uK",
                       const std::string& coordsys = "G");

// Map plus optional mask as configured for one pipeline.
sky::SkyMap load_configured_map(const config::MapConfig& cfg,
                                const fs::path& base_dir = fs::path());

} // namespace void_cmb::io
