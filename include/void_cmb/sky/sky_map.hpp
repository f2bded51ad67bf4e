#pragma once

#include "void_cmb/core/types.hpp"

#include <healpix_base.h>

#include <cstdint>
#include <string>
#include <vector>

namespace void_cmb::sky {

enum class PixelOrdering {
    RING,
    NESTED
};

inline std::string pixel_ordering_to_string(PixelOrdering ordering) {
    return ordering == PixelOrdering::NESTED ? "NESTED" : "RING";
}

// HEALPix "missing data" sentinel written by map-making pipelines
constexpr double kHealpixUnseen = -1.6375e30;

// Full-sky HEALPix temperature map in galactic coordinates, optionally
// masked. Immutable once constructed apart from attaching a mask.
class SkyMap {
public:
    SkyMap() = default;
    SkyMap(int nside, PixelOrdering ordering, VectorXf values,
           std::string label = "", std::string unit = "uK");

    // keep[p] != 0 marks pixel p as usable; size must equal npix().
    void set_mask(std::vector<uint8_t> keep);

    bool initialized() const;
    int nside() const { return nside_; }
    long npix() const { return static_cast<long>(values_.size()); }
    PixelOrdering ordering() const { return ordering_; }
    const std::string& label() const { return label_; }
    const std::string& unit() const { return unit_; }
    bool has_mask() const { return !keep_.empty(); }

    const Healpix_Base& base() const { return hpx_; }
    const VectorXf& values() const { return values_; }

    float value(int pix) const { return values_[pix]; }

    // Kept by the mask, finite and not UNSEEN.
    bool is_usable(int pix) const;
    long usable_count() const;

private:
    int nside_ = 0;
    PixelOrdering ordering_ = PixelOrdering::RING;
    Healpix_Base hpx_;
    VectorXf values_;
    std::vector<uint8_t> keep_;
    std::string label_;
    std::string unit_ = "uK";
};

} // namespace void_cmb::sky
