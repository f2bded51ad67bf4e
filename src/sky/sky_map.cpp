#include "void_cmb/sky/sky_map.hpp"
#include "void_cmb/core/errors.hpp"

#include <cmath>
#include <utility>

namespace void_cmb::sky {

SkyMap::SkyMap(int nside, PixelOrdering ordering, VectorXf values,
               std::string label, std::string unit)
    : nside_(nside), ordering_(ordering), values_(std::move(values)),
      label_(std::move(label)), unit_(std::move(unit)) {
    if (nside_ <= 0) {
        throw MapUninitialized("map '" + label_ + "' has no valid NSIDE (" +
                               std::to_string(nside_) + ")");
    }
    const long expected = 12L * static_cast<long>(nside_) * static_cast<long>(nside_);
    if (static_cast<long>(values_.size()) != expected) {
        throw MapUninitialized("map '" + label_ + "' holds " +
                               std::to_string(values_.size()) +
                               " pixels, NSIDE " + std::to_string(nside_) +
                               " requires " + std::to_string(expected));
    }
    if (ordering_ == PixelOrdering::NESTED && (nside_ & (nside_ - 1)) != 0) {
        throw ValidationError("NESTED ordering requires a power-of-two NSIDE, got " +
                              std::to_string(nside_));
    }
    hpx_ = Healpix_Base(nside_, ordering_ == PixelOrdering::NESTED ? NEST : RING,
                        SET_NSIDE);
}

void SkyMap::set_mask(std::vector<uint8_t> keep) {
    if (static_cast<long>(keep.size()) != npix()) {
        throw ValidationError("mask size " + std::to_string(keep.size()) +
                              " does not match map '" + label_ + "' (" +
                              std::to_string(npix()) + " pixels)");
    }
    keep_ = std::move(keep);
}

bool SkyMap::initialized() const {
    return nside_ > 0 && values_.size() > 0;
}

bool SkyMap::is_usable(int pix) const {
    if (!keep_.empty() && keep_[static_cast<size_t>(pix)] == 0) {
        return false;
    }
    const float v = values_[pix];
    if (!std::isfinite(v)) {
        return false;
    }
    // UNSEEN is stored as float; compare with a relative tolerance
    return std::fabs(static_cast<double>(v) - kHealpixUnseen) >
           1.0e-5 * std::fabs(kHealpixUnseen);
}

long SkyMap::usable_count() const {
    long n = 0;
    for (long p = 0; p < npix(); ++p) {
        if (is_usable(static_cast<int>(p))) ++n;
    }
    return n;
}

} // namespace void_cmb::sky
