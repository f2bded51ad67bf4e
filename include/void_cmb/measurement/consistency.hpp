#pragma once

#include "void_cmb/core/types.hpp"
#include "void_cmb/sky/sky_map.hpp"
#include "void_cmb/stats/bootstrap.hpp"
#include "void_cmb/stats/null_distribution.hpp"

#include <functional>
#include <string>
#include <vector>

namespace void_cmb::measurement {

// A labelled map source. `load` is called once, on a worker thread, and may
// throw (FitsError, MapUninitialized, ...) to report an unusable map.
struct MapInput {
    std::string label;
    std::function<sky::SkyMap()> load;
};

struct MeasurementOptions {
    int min_pixels = 1;
    stats::BootstrapOptions bootstrap;
    stats::NullOptions null_test;
    int workers = 1;  // total budget, split between maps and inner loops
};

// Called once per finished map, possibly from several threads at once.
using MapDoneCallback = std::function<void(size_t map_idx, const MapMeasurement &)>;

// Photometry, bootstrap and null test on one loaded map. Errors propagate.
MapMeasurement measure_map(const sky::SkyMap &map, const Direction &target,
                           const Aperture &aperture,
                           const MeasurementOptions &options);

// Loads and measures one input; any failure is captured in the returned
// entry (success = false, failure.kind / failure.message).
MapMeasurement measure_map_input(const MapInput &input, const Direction &target,
                                 const Aperture &aperture,
                                 const MeasurementOptions &options);

// Agreement summary over the successful entries. Spread is the standard
// deviation of delta_t across maps; consistent when spread <= max sigma_boot.
ConsistencySummary summarize_measurements(const std::vector<MapMeasurement> &maps);

// Validates target and aperture (throwing before any map is touched), then
// measures every input independently and summarises the results.
MeasurementRecord run_consistency(const std::vector<MapInput> &inputs,
                                  const Direction &target,
                                  const Aperture &aperture,
                                  const MeasurementOptions &options,
                                  const MapDoneCallback &on_map_done = nullptr);

} // namespace void_cmb::measurement
