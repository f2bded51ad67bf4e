#pragma once

#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/events.hpp"
#include "void_cmb/core/types.hpp"

namespace void_cmb::measurement {

core::json direction_to_json(const Direction &dir);
core::json aperture_to_json(const Aperture &aperture);
core::json map_measurement_to_json(const MapMeasurement &m);
core::json summary_to_json(const ConsistencySummary &s);

// target, target_galactic, aperture, maps[] and summary. Run metadata
// (tool, run_id, sampling settings) is added by the caller.
core::json record_to_json(const MeasurementRecord &record);

// File, field, units and mask settings that produced one map entry.
core::json map_inputs_to_json(const config::MapConfig &map);

// record_to_json plus input provenance: per-map `inputs` (matched by
// label), the theta_R fractions next to the resolved aperture, and the
// statistic definition under `notes`.
core::json record_to_json(const MeasurementRecord &record, const config::Config &cfg);

} // namespace void_cmb::measurement
