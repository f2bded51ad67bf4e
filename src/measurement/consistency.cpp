#include "void_cmb/measurement/consistency.hpp"
#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/parallel.hpp"
#include "void_cmb/core/utils.hpp"
#include "void_cmb/photometry/aperture_photometry.hpp"
#include "void_cmb/sky/coordinates.hpp"

#include <algorithm>
#include <exception>

namespace void_cmb::measurement {

MapMeasurement measure_map(const sky::SkyMap &map, const Direction &target,
                           const Aperture &aperture,
                           const MeasurementOptions &options) {
    MapMeasurement m;
    m.label = map.label();
    m.nside = map.nside();

    ApertureSamples samples;
    m.photometry = photometry::measure_aperture(map, target, aperture,
                                                options.min_pixels, &samples);

    stats::BootstrapOptions bopt = options.bootstrap;
    bopt.workers = options.workers;
    m.bootstrap = stats::bootstrap_delta_t(samples, bopt);

    stats::NullOptions nopt = options.null_test;
    nopt.workers = options.workers;
    nopt.min_pixels = options.min_pixels;
    m.null_dist = stats::generate_null_distribution(
        map, target, aperture, m.photometry.delta_t, nopt);

    m.success = true;
    return m;
}

MapMeasurement measure_map_input(const MapInput &input, const Direction &target,
                                 const Aperture &aperture,
                                 const MeasurementOptions &options) {
    MapMeasurement m;
    try {
        if (!input.load) {
            throw MapUninitialized("no loader for map '" + input.label + "'");
        }
        sky::SkyMap map = input.load();
        m = measure_map(map, target, aperture, options);
    } catch (const VoidCmbError &e) {
        m = MapMeasurement();
        m.failure.kind = e.kind();
        m.failure.message = e.what();
    } catch (const std::exception &e) {
        m = MapMeasurement();
        m.failure.kind = "InternalError";
        m.failure.message = e.what();
    }
    m.label = input.label;
    return m;
}

ConsistencySummary summarize_measurements(const std::vector<MapMeasurement> &maps) {
    ConsistencySummary s;
    s.n_maps = static_cast<int>(maps.size());

    std::vector<double> dts;
    for (const auto &m : maps) {
        if (!m.success) {
            ++s.n_failed;
            continue;
        }
        ++s.n_succeeded;
        dts.push_back(m.photometry.delta_t);
        s.max_sigma_boot = std::max(s.max_sigma_boot, m.bootstrap.sigma);
    }
    if (dts.empty()) {
        return s;
    }

    s.mean_delta_t = core::compute_mean(dts);
    s.spread = core::compute_std(dts, s.mean_delta_t);
    auto [lo, hi] = std::minmax_element(dts.begin(), dts.end());
    s.min_delta_t = *lo;
    s.max_delta_t = *hi;
    s.consistent = s.spread <= s.max_sigma_boot;
    return s;
}

MeasurementRecord run_consistency(const std::vector<MapInput> &inputs,
                                  const Direction &target,
                                  const Aperture &aperture,
                                  const MeasurementOptions &options,
                                  const MapDoneCallback &on_map_done) {
    MeasurementRecord record;
    record.target = target;
    record.target_galactic = sky::to_galactic(target);
    photometry::validate_aperture(aperture);
    record.aperture = aperture;

    record.maps.resize(inputs.size());
    const int map_workers = core::compute_worker_count(options.workers, inputs.size());
    MeasurementOptions inner = options;
    inner.workers = std::max(1, options.workers / map_workers);

    core::parallel_for(inputs.size(), map_workers, [&](size_t i) {
        record.maps[i] = measure_map_input(inputs[i], target, aperture, inner);
        if (on_map_done) {
            on_map_done(i, record.maps[i]);
        }
    });

    record.summary = summarize_measurements(record.maps);
    return record;
}

} // namespace void_cmb::measurement
