#pragma once

#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/sky_map.hpp"
#include "void_cmb/stats/bootstrap.hpp"

#include <cstdint>

namespace void_cmb::stats {

struct NullOptions {
    int trials = 500;
    double lat_jitter_deg = 0.0;     // uniform in [-jitter, +jitter]
    double min_separation_deg = 0.0; // <= 0 means the aperture's rim outer radius
    int max_retries = 20;            // redraws per trial before it is given up
    int min_trials = 50;             // fewer successes abort the null test
    int min_pixels = 1;
    uint64_t seed = kDefaultBootstrapSeed + 1;
    int workers = 1;
};

// Matched-latitude null: apertures of identical geometry at uniformly drawn
// galactic longitudes and the target's galactic latitude (optionally
// jittered). Candidates too close to the target, or whose aperture lacks
// usable pixels, are redrawn; a trial that exhausts its retries is recorded
// as a MaskedRegionExhausted failure. Throws MaskedRegionExhausted when fewer
// than `min_trials` trials succeed.
NullDistribution generate_null_distribution(const sky::SkyMap &map,
                                            const Direction &target,
                                            const Aperture &aperture,
                                            double target_delta_t,
                                            const NullOptions &options = NullOptions());

} // namespace void_cmb::stats
