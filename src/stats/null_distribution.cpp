#include "void_cmb/stats/null_distribution.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/parallel.hpp"
#include "void_cmb/core/trial_gating.hpp"
#include "void_cmb/core/utils.hpp"
#include "void_cmb/photometry/aperture_photometry.hpp"
#include "void_cmb/sky/coordinates.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>
#include <vector>

namespace void_cmb::stats {

namespace {

struct TrialOutcome {
    bool ok = false;
    double delta_t = 0.0;
    Direction center;
    int redraws = 0;
    int too_close = 0;
    int masked = 0;
};

void validate_options(const NullOptions &options) {
    if (options.trials <= 0) {
        throw ValidationError("null trials must be > 0");
    }
    if (options.max_retries < 0) {
        throw ValidationError("null max_retries must be >= 0");
    }
    if (options.min_trials < 1 || options.min_trials > options.trials) {
        throw ValidationError("null min_trials must be in [1, trials]");
    }
    if (!std::isfinite(options.lat_jitter_deg) || options.lat_jitter_deg < 0.0) {
        throw ValidationError("null lat_jitter_deg must be >= 0");
    }
}

} // namespace

NullDistribution generate_null_distribution(const sky::SkyMap &map,
                                            const Direction &target,
                                            const Aperture &aperture,
                                            double target_delta_t,
                                            const NullOptions &options) {
    validate_options(options);
    photometry::validate_aperture(aperture);
    const Direction target_gal = sky::to_galactic(target);
    const double min_sep = options.min_separation_deg > 0.0
                               ? options.min_separation_deg
                               : aperture.rim_outer_deg;

    std::vector<TrialOutcome> outcomes(static_cast<size_t>(options.trials));

    const int workers = core::compute_worker_count(
        options.workers, static_cast<size_t>(options.trials));
    core::parallel_for(static_cast<size_t>(options.trials), workers,
                       [&](size_t trial) {
        std::mt19937_64 rng(core::derive_seed(options.seed, trial));
        std::uniform_real_distribution<double> lon_dist(0.0, 360.0);
        std::uniform_real_distribution<double> jitter_dist(-options.lat_jitter_deg,
                                                           options.lat_jitter_deg);
        TrialOutcome &out = outcomes[trial];

        for (int attempt = 0; attempt <= options.max_retries; ++attempt) {
            Direction cand;
            cand.frame = CoordFrame::GALACTIC;
            cand.lon_deg = core::wrap_degrees_360(lon_dist(rng));
            double lat = target_gal.lat_deg;
            if (options.lat_jitter_deg > 0.0) {
                lat += jitter_dist(rng);
            }
            cand.lat_deg = std::min(90.0, std::max(-90.0, lat));

            if (attempt > 0) {
                ++out.redraws;
            }
            if (sky::angular_separation_deg(cand, target_gal) < min_sep) {
                ++out.too_close;
                continue;
            }
            try {
                PhotometryResult res = photometry::measure_aperture(
                    map, cand, aperture, options.min_pixels);
                out.ok = true;
                out.delta_t = res.delta_t;
                out.center = cand;
                return;
            } catch (const InsufficientPixels &) {
                ++out.masked;
            }
        }
    });

    NullDistribution dist;
    dist.n_requested = options.trials;
    for (size_t t = 0; t < outcomes.size(); ++t) {
        const TrialOutcome &o = outcomes[t];
        dist.total_redraws += o.redraws;
        if (o.ok) {
            dist.values.push_back(o.delta_t);
            dist.centers.push_back(o.center);
            continue;
        }
        std::ostringstream oss;
        oss << "no usable control aperture after " << (options.max_retries + 1)
            << " draws (" << o.masked << " with too few usable pixels, "
            << o.too_close << " within " << min_sep << " deg of the target)";
        TrialFailure f;
        f.trial = static_cast<int>(t);
        f.kind = "MaskedRegionExhausted";
        f.message = oss.str();
        dist.failures.push_back(f);
    }
    dist.n_succeeded = static_cast<int>(dist.values.size());
    dist.n_failed = static_cast<int>(dist.failures.size());

    core::TrialGateDecision gate = core::evaluate_trial_gate(
        dist.n_succeeded, dist.n_requested, options.min_trials);
    if (gate.should_abort) {
        std::ostringstream oss;
        oss << "only " << dist.n_succeeded << " of " << dist.n_requested
            << " null trials succeeded, at least " << options.min_trials
            << " required";
        throw MaskedRegionExhausted(oss.str());
    }
    dist.degraded = gate.degraded;

    dist.mean = core::compute_mean(dist.values);
    dist.stddev = core::compute_std(dist.values, dist.mean);
    dist.sem = dist.stddev / std::sqrt(static_cast<double>(dist.n_succeeded));

    const double target_dev = std::fabs(target_delta_t - dist.mean);
    int n_extreme = 0;
    for (double v : dist.values) {
        if (std::fabs(v - dist.mean) >= target_dev) ++n_extreme;
    }
    dist.p_value = static_cast<double>(n_extreme + 1) /
                   static_cast<double>(dist.n_succeeded + 1);
    dist.z_score = dist.stddev > 0.0 ? (target_delta_t - dist.mean) / dist.stddev : 0.0;
    return dist;
}

} // namespace void_cmb::stats
