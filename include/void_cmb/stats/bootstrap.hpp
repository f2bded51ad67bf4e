#pragma once

#include "void_cmb/core/types.hpp"

#include <cstdint>

namespace void_cmb::stats {

constexpr uint64_t kDefaultBootstrapSeed = 12345;

struct BootstrapOptions {
    int iterations = 1000;
    uint64_t seed = kDefaultBootstrapSeed;
    int workers = 1;
};

// Resamples core and rim values independently with replacement (same
// cardinality as the originals) and recomputes delta_t per iteration.
// Iteration i draws from its own stream seeded by (seed, i), so the result
// does not depend on the number of workers.
BootstrapEstimate bootstrap_delta_t(const ApertureSamples &samples,
                                    const BootstrapOptions &options = BootstrapOptions());

} // namespace void_cmb::stats
