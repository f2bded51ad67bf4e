#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace void_cmb::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
void copy_config(const fs::path& src, const fs::path& dst);

// Math utilities
double compute_mean(const std::vector<double>& data);
// Population standard deviation (ddof = 0); 0 for fewer than two values.
double compute_std(const std::vector<double>& data);
double compute_std(const std::vector<double>& data, double mean);

// Independent 64-bit seed for task `index` of a run seeded with `seed`
// (splitmix64 finalizer over seed and index).
uint64_t derive_seed(uint64_t seed, uint64_t index);

// Angle utilities
double wrap_degrees_360(double deg);

// String utilities
std::string to_lower(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);

} // namespace void_cmb::core
