#include "void_cmb/measurement/record_json.hpp"

namespace void_cmb::measurement {

core::json direction_to_json(const Direction &dir) {
    core::json j;
    j["frame"] = coord_frame_to_string(dir.frame);
    j["lon_deg"] = dir.lon_deg;
    j["lat_deg"] = dir.lat_deg;
    return j;
}

core::json aperture_to_json(const Aperture &aperture) {
    return {
        {"core_radius_deg", aperture.core_radius_deg},
        {"rim_inner_deg", aperture.rim_inner_deg},
        {"rim_outer_deg", aperture.rim_outer_deg},
    };
}

core::json map_measurement_to_json(const MapMeasurement &m) {
    core::json j;
    j["label"] = m.label;
    j["success"] = m.success;
    if (!m.success) {
        j["error"] = {{"kind", m.failure.kind}, {"message", m.failure.message}};
        return j;
    }

    j["nside"] = m.nside;
    j["photometry"] = {
        {"DeltaT_uK", m.photometry.delta_t},
        {"Tcore_uK", m.photometry.t_core},
        {"Trim_uK", m.photometry.t_rim},
        {"n_core_pix", m.photometry.n_core_pix},
        {"n_rim_pix", m.photometry.n_rim_pix},
    };
    j["bootstrap"] = {
        {"mean_uK", m.bootstrap.mean},
        {"sigma_uK", m.bootstrap.sigma},
        {"iterations", m.bootstrap.iterations},
    };

    const NullDistribution &nd = m.null_dist;
    core::json null_j;
    null_j["mean_uK"] = nd.mean;
    null_j["std_uK"] = nd.stddev;
    null_j["sem_uK"] = nd.sem;
    null_j["n_trials"] = nd.n_succeeded;
    null_j["n_requested"] = nd.n_requested;
    null_j["n_failed"] = nd.n_failed;
    null_j["total_redraws"] = nd.total_redraws;
    null_j["degraded"] = nd.degraded;
    null_j["z_score"] = nd.z_score;
    null_j["p_value"] = nd.p_value;
    null_j["failures"] = core::json::array();
    for (const auto &f : nd.failures) {
        null_j["failures"].push_back(
            {{"trial", f.trial}, {"kind", f.kind}, {"message", f.message}});
    }
    j["null"] = null_j;
    return j;
}

core::json summary_to_json(const ConsistencySummary &s) {
    return {
        {"n_maps", s.n_maps},
        {"n_succeeded", s.n_succeeded},
        {"n_failed", s.n_failed},
        {"mean_DeltaT_uK", s.mean_delta_t},
        {"spread_uK", s.spread},
        {"min_DeltaT_uK", s.min_delta_t},
        {"max_DeltaT_uK", s.max_delta_t},
        {"max_sigma_boot_uK", s.max_sigma_boot},
        {"consistent", s.consistent},
    };
}

core::json record_to_json(const MeasurementRecord &record) {
    core::json j;
    j["target"] = direction_to_json(record.target);
    j["target_galactic"] = direction_to_json(record.target_galactic);
    j["aperture"] = aperture_to_json(record.aperture);
    j["maps"] = core::json::array();
    for (const auto &m : record.maps) {
        j["maps"].push_back(map_measurement_to_json(m));
    }
    j["summary"] = summary_to_json(record.summary);
    return j;
}

core::json map_inputs_to_json(const config::MapConfig &map) {
    core::json j;
    j["cmb_map"] = map.path;
    j["cmb_field"] = map.field;
    j["map_in_uK"] = map.in_uK;
    if (map.mask.empty()) {
        j["mask"] = nullptr;
    } else {
        j["mask"] = map.mask;
    }
    j["mask_field"] = map.mask_field;
    j["mask_threshold"] = map.mask_threshold;
    return j;
}

core::json record_to_json(const MeasurementRecord &record, const config::Config &cfg) {
    core::json j = record_to_json(record);

    const config::ApertureConfig &ap = cfg.aperture;
    j["aperture"]["theta_R_deg"] = ap.theta_R_deg;
    j["aperture"]["core_frac"] = ap.core_frac;
    j["aperture"]["rim_in_frac"] = ap.rim_in_frac;
    j["aperture"]["rim_out_frac"] = ap.rim_out_frac;
    j["aperture"]["min_pixels"] = ap.min_pixels;

    for (auto &entry : j["maps"]) {
        const std::string label = entry["label"].get<std::string>();
        for (const auto &m : cfg.maps) {
            if (m.label == label) {
                entry["inputs"] = map_inputs_to_json(m);
                break;
            }
        }
    }

    j["notes"] = {
        {"statistic", "DeltaT_uK = mean(core) - mean(rim)"},
        {"bootstrap", "core and rim pixels resampled independently with replacement"},
        {"null", "control apertures at the target galactic latitude, random longitude"},
    };
    return j;
}

} // namespace void_cmb::measurement
