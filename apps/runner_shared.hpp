#pragma once

#include "void_cmb/config/configuration.hpp"
#include "void_cmb/core/events.hpp"
#include "void_cmb/measurement/consistency.hpp"
#include "void_cmb/model/vacuum.hpp"
#include "void_cmb/model/void_toy.hpp"

#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace void_cmb::runner {

class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

measurement::MeasurementOptions
build_measurement_options(const config::Config &cfg);

// One lazy loader per configured map; relative paths resolve against
// `base_dir`.
std::vector<measurement::MapInput>
build_map_inputs(const config::Config &cfg, const std::filesystem::path &base_dir);

model::VacuumParams vacuum_params(const config::Config &cfg);
model::VoidTarget void_target(const config::Config &cfg);

core::json vacuum_to_json(const model::VacuumComparison &v);
core::json prediction_to_json(const model::VoidPrediction &p);

} // namespace void_cmb::runner
