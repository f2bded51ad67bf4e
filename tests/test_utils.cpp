#include "void_cmb/core/errors.hpp"
#include "void_cmb/core/events.hpp"
#include "void_cmb/core/parallel.hpp"
#include "void_cmb/core/utils.hpp"

#include <atomic>
#include <cmath>
#include <filesystem>
#include <set>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace core = void_cmb::core;
namespace fs = std::filesystem;

TEST_CASE("compute_std_is_population_standard_deviation") {
  std::vector<double> v = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  REQUIRE(core::compute_mean(v) == Catch::Approx(5.0));
  REQUIRE(core::compute_std(v) == Catch::Approx(2.0));
  // deviations are taken about the supplied centre
  REQUIRE(core::compute_std(v, 0.0) == Catch::Approx(std::sqrt(29.0)));
  REQUIRE(core::compute_std(std::vector<double>{3.0}) == 0.0);
  REQUIRE(core::compute_mean(std::vector<double>{}) == 0.0);
}

TEST_CASE("derive_seed_gives_distinct_streams_per_index") {
  std::set<uint64_t> seeds;
  for (uint64_t i = 0; i < 1000; ++i) {
    seeds.insert(core::derive_seed(12345, i));
  }
  REQUIRE(seeds.size() == 1000);
  REQUIRE(core::derive_seed(1, 0) != core::derive_seed(2, 0));
  REQUIRE(core::derive_seed(7, 3) == core::derive_seed(7, 3));
}

TEST_CASE("wrap_degrees_360_maps_into_half_open_range") {
  REQUIRE(core::wrap_degrees_360(-90.0) == Catch::Approx(270.0));
  REQUIRE(core::wrap_degrees_360(720.0) == Catch::Approx(0.0));
  REQUIRE(core::wrap_degrees_360(-1e-18) < 360.0);
}

TEST_CASE("parallel_for_visits_every_index_once") {
  std::vector<int> hits(257, 0);
  core::parallel_for(hits.size(), 4, [&](size_t i) { hits[i] += 1; });
  for (int h : hits) {
    REQUIRE(h == 1);
  }
}

TEST_CASE("parallel_for_rethrows_first_task_error") {
  std::atomic<int> ran{0};
  REQUIRE_THROWS_AS(core::parallel_for(100, 3,
                                       [&](size_t i) {
                                         ++ran;
                                         if (i == 10) {
                                           throw void_cmb::DomainError("task 10");
                                         }
                                       }),
                    void_cmb::DomainError);
  REQUIRE(ran.load() >= 11);
}

TEST_CASE("compute_worker_count_is_bounded_by_tasks") {
  REQUIRE(core::compute_worker_count(8, 2) <= 2);
  REQUIRE(core::compute_worker_count(0, 100) == 1);
  REQUIRE(core::compute_worker_count(-3, 0) == 1);
}

TEST_CASE("write_text_creates_parent_directories") {
  fs::path dir = fs::temp_directory_path() / "void_cmb_test_utils";
  fs::remove_all(dir);
  fs::path file = dir / "nested" / "out.json";
  core::write_text(file, "{}");
  REQUIRE(core::read_text(file) == "{}");
  fs::remove_all(dir);
  REQUIRE_THROWS_AS(core::read_text(file), void_cmb::IOError);
}

TEST_CASE("publish_json_prints_and_optionally_writes_file") {
  core::json doc = {{"ratio", 0.28}, {"anchor", "A1_lowz"}};

  std::ostringstream only_stdout;
  core::publish_json(doc, only_stdout);
  REQUIRE(core::json::parse(only_stdout.str()) == doc);

  fs::path dir = fs::temp_directory_path() / "void_cmb_test_publish";
  fs::remove_all(dir);
  fs::path file = dir / "predict" / "bootes.json";
  std::ostringstream both;
  core::publish_json(doc, both, file);
  REQUIRE(core::json::parse(both.str()) == doc);
  REQUIRE(core::json::parse(core::read_text(file)) == doc);
  fs::remove_all(dir);
}
