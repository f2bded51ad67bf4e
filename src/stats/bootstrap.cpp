#include "void_cmb/stats/bootstrap.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/parallel.hpp"
#include "void_cmb/core/utils.hpp"

#include <random>
#include <string>

namespace void_cmb::stats {

namespace {

double resampled_mean(const VectorXd &values, std::mt19937_64 &rng) {
    const Eigen::Index n = values.size();
    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
    double sum = 0.0;
    for (Eigen::Index k = 0; k < n; ++k) {
        sum += values[pick(rng)];
    }
    return sum / static_cast<double>(n);
}

} // namespace

BootstrapEstimate bootstrap_delta_t(const ApertureSamples &samples,
                                    const BootstrapOptions &options) {
    if (options.iterations <= 0) {
        throw ValidationError("bootstrap iterations must be > 0, got " +
                              std::to_string(options.iterations));
    }
    if (samples.core_values.size() == 0 || samples.rim_values.size() == 0) {
        throw InsufficientPixels("bootstrap needs non-empty core and rim samples");
    }

    BootstrapEstimate est;
    est.iterations = options.iterations;
    est.seed = options.seed;
    est.samples.assign(static_cast<size_t>(options.iterations), 0.0);

    const int workers = core::compute_worker_count(
        options.workers, static_cast<size_t>(options.iterations));
    core::parallel_for(static_cast<size_t>(options.iterations), workers,
                       [&](size_t it) {
        std::mt19937_64 rng(core::derive_seed(options.seed, it));
        const double t_core = resampled_mean(samples.core_values, rng);
        const double t_rim = resampled_mean(samples.rim_values, rng);
        est.samples[it] = t_core - t_rim;
    });

    est.mean = core::compute_mean(est.samples);
    est.sigma = core::compute_std(est.samples, est.mean);
    return est;
}

} // namespace void_cmb::stats
