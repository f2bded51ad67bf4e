#include "sky_fixtures.hpp"

#include "void_cmb/core/errors.hpp"
#include "void_cmb/sky/coordinates.hpp"
#include "void_cmb/sky/pixel_accessor.hpp"
#include "void_cmb/sky/sky_map.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using void_cmb::Direction;
using void_cmb::InvalidDirection;
using void_cmb::MapUninitialized;
using void_cmb::ValidationError;
using void_cmb::VectorXf;
using void_cmb::sky::PixelOrdering;
using void_cmb::sky::SkyMap;
using void_cmb::testing::galactic;
using void_cmb::testing::uniform_map;

namespace sky = void_cmb::sky;

TEST_CASE("sky_map_rejects_value_count_not_matching_nside") {
  VectorXf v = VectorXf::Zero(100);
  REQUIRE_THROWS_AS(SkyMap(4, PixelOrdering::RING, v), MapUninitialized);
  REQUIRE_THROWS_AS(SkyMap(0, PixelOrdering::RING, VectorXf()), MapUninitialized);
}

TEST_CASE("sky_map_nested_requires_power_of_two_nside") {
  VectorXf v = VectorXf::Zero(12 * 3 * 3);
  REQUIRE_THROWS_AS(SkyMap(3, PixelOrdering::NESTED, v), ValidationError);
  REQUIRE_NOTHROW(SkyMap(3, PixelOrdering::RING, v));
}

TEST_CASE("default_sky_map_is_uninitialized_for_pixel_queries") {
  SkyMap empty;
  REQUIRE_FALSE(empty.initialized());
  REQUIRE_THROWS_AS(sky::pixel_index(empty, galactic(10.0, 10.0)), MapUninitialized);
  REQUIRE_THROWS_AS(sky::query_disc(empty, galactic(10.0, 10.0), 5.0), MapUninitialized);
}

TEST_CASE("usable_pixels_exclude_mask_nan_and_unseen") {
  SkyMap map = uniform_map(2, 1.0f);
  VectorXf v = map.values();
  v[3] = std::numeric_limits<float>::quiet_NaN();
  v[4] = static_cast<float>(sky::kHealpixUnseen);
  SkyMap m(2, PixelOrdering::RING, v);

  std::vector<uint8_t> keep(static_cast<size_t>(m.npix()), 1);
  keep[5] = 0;
  m.set_mask(keep);

  REQUIRE(m.is_usable(0));
  REQUIRE_FALSE(m.is_usable(3));
  REQUIRE_FALSE(m.is_usable(4));
  REQUIRE_FALSE(m.is_usable(5));
  REQUIRE(m.usable_count() == m.npix() - 3);

  REQUIRE_THROWS_AS(m.set_mask(std::vector<uint8_t>(7, 1)), ValidationError);
}

TEST_CASE("pixel_index_inverts_pixel_direction") {
  for (PixelOrdering ord : {PixelOrdering::RING, PixelOrdering::NESTED}) {
    SkyMap map(16, ord, VectorXf::Zero(12 * 16 * 16));
    for (int p = 0; p < map.npix(); p += 97) {
      Direction d = sky::pixel_direction(map, p);
      REQUIRE(sky::pixel_index(map, d) == p);
    }
    REQUIRE_THROWS_AS(sky::pixel_direction(map, static_cast<int>(map.npix())),
                      ValidationError);
  }
}

TEST_CASE("query_disc_returns_sorted_pixels_within_radius") {
  SkyMap map = uniform_map(32, 0.0f);
  const Direction c = galactic(123.0, -35.0);
  const double radius = 7.5;

  std::vector<int> pix = sky::query_disc(map, c, radius);
  REQUIRE_FALSE(pix.empty());
  REQUIRE(std::is_sorted(pix.begin(), pix.end()));
  for (int p : pix) {
    REQUIRE(sky::angular_separation_deg(sky::pixel_direction(map, p), c) <=
            radius + 1e-9);
  }

  // Equal-area pixels: count tracks the cap area fraction
  const double cap_fraction = (1.0 - std::cos(radius * M_PI / 180.0)) / 2.0;
  const double expected = cap_fraction * static_cast<double>(map.npix());
  REQUIRE(static_cast<double>(pix.size()) == Catch::Approx(expected).epsilon(0.1));

  // Pixels just outside the disc are not returned
  std::vector<int> wider = sky::query_disc(map, c, radius + 3.0);
  for (int p : wider) {
    const double sep = sky::angular_separation_deg(sky::pixel_direction(map, p), c);
    if (std::fabs(sep - radius) < 1e-6) {
      continue;
    }
    const bool inside = std::binary_search(pix.begin(), pix.end(), p);
    REQUIRE(inside == (sep < radius));
  }
}

TEST_CASE("pixel_queries_reject_invalid_directions") {
  SkyMap map = uniform_map(8, 0.0f);
  REQUIRE_THROWS_AS(sky::pixel_index(map, galactic(0.0, 91.0)), InvalidDirection);
  REQUIRE_THROWS_AS(sky::pixel_index(map, galactic(400.0, 0.0)), InvalidDirection);
  REQUIRE_THROWS_AS(sky::query_disc(map, galactic(std::nan(""), 0.0), 1.0),
                    InvalidDirection);
  REQUIRE_THROWS_AS(sky::query_disc(map, galactic(0.0, 0.0), 0.0), ValidationError);
}
