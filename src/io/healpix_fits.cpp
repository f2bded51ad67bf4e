#include "void_cmb/io/healpix_fits.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/utils.hpp"

#include <fitsio.h>
#include <cmath>
#include <cstring>

namespace void_cmb::io {

namespace {

std::string fits_status_text(int status) {
    char text[FLEN_STATUS];
    fits_get_errstatus(status, text);
    return std::string(text);
}

// Opens `path` and moves to the first binary-table extension.
fitsfile* open_healpix_table(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string() + " (" +
                        fits_status_text(status) + ")");
    }

    int hdutype = 0;
    fits_movabs_hdu(fptr, 2, &hdutype, &status);
    if (status || hdutype != BINARY_TBL) {
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("No HEALPix binary table in " + path.string());
    }
    return fptr;
}

HealpixFitsInfo read_info(fitsfile* fptr, const fs::path& path) {
    HealpixFitsInfo info;
    int status = 0;

    if (fits_read_key(fptr, TINT, "NSIDE", &info.nside, nullptr, &status)) {
        throw FitsError("Missing NSIDE keyword: " + path.string());
    }

    char buf[FLEN_VALUE];
    if (fits_read_key(fptr, TSTRING, "ORDERING", buf, nullptr, &status)) {
        throw FitsError("Missing ORDERING keyword: " + path.string());
    }
    std::string ordering = core::to_lower(buf);
    if (ordering.rfind("ring", 0) == 0) {
        info.ordering = sky::PixelOrdering::RING;
    } else if (ordering.rfind("nest", 0) == 0) {
        info.ordering = sky::PixelOrdering::NESTED;
    } else {
        throw FitsError("Unknown ORDERING '" + std::string(buf) + "': " + path.string());
    }

    if (fits_read_key(fptr, TSTRING, "INDXSCHM", buf, nullptr, &status) == 0) {
        if (core::to_lower(buf).rfind("explicit", 0) == 0) {
            throw FitsError("Partial-sky (INDXSCHM = EXPLICIT) maps are not supported: " +
                            path.string());
        }
    } else {
        status = 0;
    }

    if (fits_read_key(fptr, TSTRING, "COORDSYS", buf, nullptr, &status) == 0) {
        info.coordsys = buf;
    } else {
        status = 0;
    }

    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    fits_get_num_cols(fptr, &info.ncols, &status);
    if (status) {
        throw FitsError("Cannot read table dimensions: " + path.string());
    }

    int typecode = 0;
    long repeat = 0;
    long width = 0;
    if (info.ncols > 0) {
        fits_get_coltype(fptr, 1, &typecode, &repeat, &width, &status);
        if (status) {
            throw FitsError("Cannot read column type: " + path.string());
        }
    }
    info.npix = nrows * repeat;

    for (int c = 1; c <= info.ncols; ++c) {
        std::string key = "TUNIT" + std::to_string(c);
        if (fits_read_key(fptr, TSTRING, key.c_str(), buf, nullptr, &status) == 0) {
            info.units.emplace_back(buf);
        } else {
            status = 0;
            info.units.emplace_back();
        }
    }
    return info;
}

std::vector<float> read_column(fitsfile* fptr, const HealpixFitsInfo& info, int field,
                               const fs::path& path) {
    if (field < 0 || field >= info.ncols) {
        throw FitsError("Field " + std::to_string(field) + " out of range (" +
                        std::to_string(info.ncols) + " columns): " + path.string());
    }

    int status = 0;
    int typecode = 0;
    long repeat = 0;
    long width = 0;
    fits_get_coltype(fptr, field + 1, &typecode, &repeat, &width, &status);
    long nrows = 0;
    fits_get_num_rows(fptr, &nrows, &status);
    if (status || nrows * repeat != info.npix) {
        throw FitsError("Column " + std::to_string(field) +
                        " length does not match the map size: " + path.string());
    }

    std::vector<float> buffer(static_cast<size_t>(info.npix));
    int anynul = 0;
    fits_read_col(fptr, TFLOAT, field + 1, 1, 1, info.npix, nullptr, buffer.data(),
                  &anynul, &status);
    if (status) {
        throw FitsError("Cannot read column " + std::to_string(field) + ": " +
                        path.string() + " (" + fits_status_text(status) + ")");
    }
    return buffer;
}

bool is_unseen(float v) {
    return std::fabs(static_cast<double>(v) - sky::kHealpixUnseen) <=
           1e-5 * std::fabs(sky::kHealpixUnseen);
}

} // namespace

bool is_fits_path(const fs::path& path) {
    std::string name = core::to_lower(path.filename().string());
    return core::ends_with(name, ".fits") || core::ends_with(name, ".fit") ||
           core::ends_with(name, ".fts") || core::ends_with(name, ".fits.gz");
}

HealpixFitsInfo read_healpix_info(const fs::path& path) {
    fitsfile* fptr = open_healpix_table(path);
    try {
        HealpixFitsInfo info = read_info(fptr, path);
        int status = 0;
        fits_close_file(fptr, &status);
        return info;
    } catch (...) {
        int status = 0;
        fits_close_file(fptr, &status);
        throw;
    }
}

sky::SkyMap read_healpix_map(const fs::path& path, int field, bool in_uK,
                             const std::string& label) {
    fitsfile* fptr = open_healpix_table(path);
    HealpixFitsInfo info;
    std::vector<float> buffer;
    try {
        info = read_info(fptr, path);
        buffer = read_column(fptr, info, field, path);
    } catch (...) {
        int status = 0;
        fits_close_file(fptr, &status);
        throw;
    }
    int status = 0;
    fits_close_file(fptr, &status);

    if (info.nside <= 0 || info.npix != 12L * info.nside * info.nside) {
        throw MapUninitialized(path.string() + ": " + std::to_string(info.npix) +
                               " pixels do not match NSIDE " +
                               std::to_string(info.nside));
    }

    VectorXf values(static_cast<Eigen::Index>(buffer.size()));
    const float scale = in_uK ? 1.0f : 1.0e6f;
    for (size_t i = 0; i < buffer.size(); ++i) {
        const float v = buffer[i];
        values[static_cast<Eigen::Index>(i)] = is_unseen(v) ? v : v * scale;
    }

    return sky::SkyMap(info.nside, info.ordering, std::move(values), label, "uK");
}

std::vector<uint8_t> read_healpix_mask(const fs::path& path, int field,
                                       double threshold, int nside,
                                       sky::PixelOrdering ordering) {
    fitsfile* fptr = open_healpix_table(path);
    HealpixFitsInfo info;
    std::vector<float> buffer;
    try {
        info = read_info(fptr, path);
        buffer = read_column(fptr, info, field, path);
    } catch (...) {
        int status = 0;
        fits_close_file(fptr, &status);
        throw;
    }
    int status = 0;
    fits_close_file(fptr, &status);

    if (info.nside != nside) {
        throw ValidationError("NSIDE mismatch: map nside=" + std::to_string(nside) +
                              " vs mask nside=" + std::to_string(info.nside) +
                              " (" + path.string() + ")");
    }

    std::vector<uint8_t> keep(buffer.size(), 0);
    for (size_t i = 0; i < buffer.size(); ++i) {
        const float v = buffer[i];
        keep[i] = (std::isfinite(v) && !is_unseen(v) && v >= threshold) ? 1 : 0;
    }
    if (info.ordering == ordering) {
        return keep;
    }

    Healpix_Base hpx(nside, ordering == sky::PixelOrdering::NESTED ? NEST : RING,
                     SET_NSIDE);
    std::vector<uint8_t> reordered(keep.size(), 0);
    for (int p = 0; p < static_cast<int>(keep.size()); ++p) {
        // p is a pixel in the map's ordering; find it in the mask's ordering.
        const int src = ordering == sky::PixelOrdering::NESTED ? hpx.nest2ring(p)
                                                               : hpx.ring2nest(p);
        reordered[static_cast<size_t>(p)] = keep[static_cast<size_t>(src)];
    }
    return reordered;
}

void write_healpix_map(const fs::path& path, const VectorXf& values, int nside,
                       sky::PixelOrdering ordering, const std::string& unit,
                       const std::string& coordsys) {
    const long npix = 12L * nside * nside;
    if (nside <= 0 || values.size() != npix) {
        throw ValidationError("write_healpix_map: value count does not match NSIDE " +
                              std::to_string(nside));
    }

    fitsfile* fptr = nullptr;
    int status = 0;
    std::string fname = "!" + path.string();

    if (fits_create_file(&fptr, fname.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    char ttype0[] = "TEMPERATURE";
    char tform0[] = "1E";
    std::string tunit_str = unit;
    char* ttype[] = {ttype0};
    char* tform[] = {tform0};
    char* tunit[] = {const_cast<char*>(tunit_str.c_str())};
    char extname[] = "xtension";

    fits_create_tbl(fptr, BINARY_TBL, npix, 1, ttype, tform, tunit, extname, &status);

    std::string pixtype = "HEALPIX";
    std::string order = sky::pixel_ordering_to_string(ordering);
    std::string indxschm = "IMPLICIT";
    std::string coord = coordsys;
    long firstpix = 0;
    long lastpix = npix - 1;
    fits_write_key(fptr, TSTRING, "PIXTYPE", const_cast<char*>(pixtype.c_str()),
                   "HEALPIX pixelisation", &status);
    fits_write_key(fptr, TSTRING, "ORDERING", const_cast<char*>(order.c_str()),
                   "Pixel ordering scheme", &status);
    fits_write_key(fptr, TINT, "NSIDE", &nside, "Resolution parameter", &status);
    fits_write_key(fptr, TLONG, "FIRSTPIX", &firstpix, nullptr, &status);
    fits_write_key(fptr, TLONG, "LASTPIX", &lastpix, nullptr, &status);
    fits_write_key(fptr, TSTRING, "INDXSCHM", const_cast<char*>(indxschm.c_str()),
                   nullptr, &status);
    fits_write_key(fptr, TSTRING, "COORDSYS", const_cast<char*>(coord.c_str()),
                   "Pixelisation coordinate system", &status);

    std::vector<float> buffer(values.data(), values.data() + values.size());
    fits_write_col(fptr, TFLOAT, 1, 1, 1, npix, buffer.data(), &status);

    if (status) {
        std::string msg = fits_status_text(status);
        int close_status = 0;
        fits_close_file(fptr, &close_status);
        throw FitsError("Cannot write HEALPix map " + path.string() + " (" + msg + ")");
    }
    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

sky::SkyMap load_configured_map(const config::MapConfig& cfg, const fs::path& base_dir) {
    auto resolve = [&](const std::string& p) {
        fs::path path(p);
        if (path.is_relative() && !base_dir.empty()) {
            path = base_dir / path;
        }
        return path;
    };

    const fs::path map_path = resolve(cfg.path);
    if (!fs::exists(map_path)) {
        throw IOError("Map file not found: " + map_path.string());
    }
    sky::SkyMap map = read_healpix_map(map_path, cfg.field, cfg.in_uK, cfg.label);

    if (!cfg.mask.empty()) {
        const fs::path mask_path = resolve(cfg.mask);
        if (!fs::exists(mask_path)) {
            throw IOError("Mask file not found: " + mask_path.string());
        }
        map.set_mask(read_healpix_mask(mask_path, cfg.mask_field, cfg.mask_threshold,
                                       map.nside(), map.ordering()));
    }
    return map;
}

} // namespace void_cmb::io
