#include "sky_fixtures.hpp"

#include "void_cmb/core/errors.hpp"
#include "void_cmb/sky/coordinates.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using void_cmb::CoordFrame;
using void_cmb::Direction;
using void_cmb::InvalidDirection;
using void_cmb::testing::galactic;

namespace sky = void_cmb::sky;

namespace {

Direction equatorial(double ra, double dec) {
  Direction d;
  d.lon_deg = ra;
  d.lat_deg = dec;
  d.frame = CoordFrame::EQUATORIAL;
  return d;
}

} // namespace

TEST_CASE("validate_direction_accepts_range_edges") {
  REQUIRE_NOTHROW(sky::validate_direction(galactic(360.0, 90.0)));
  REQUIRE_NOTHROW(sky::validate_direction(galactic(-360.0, -90.0)));
  REQUIRE_THROWS_AS(sky::validate_direction(galactic(0.0, -90.5)), InvalidDirection);
  REQUIRE_THROWS_AS(sky::validate_direction(galactic(-361.0, 0.0)), InvalidDirection);
}

TEST_CASE("normalize_direction_wraps_longitude") {
  Direction d = sky::normalize_direction(galactic(-10.0, 5.0));
  REQUIRE(d.lon_deg == Catch::Approx(350.0));
  REQUIRE(d.lat_deg == Catch::Approx(5.0));
  REQUIRE(sky::normalize_direction(galactic(360.0, 0.0)).lon_deg == Catch::Approx(0.0));
}

TEST_CASE("equatorial_to_galactic_known_points") {
  // Galactic centre
  Direction gc = sky::to_galactic(equatorial(266.405, -28.936));
  REQUIRE(gc.frame == CoordFrame::GALACTIC);
  REQUIRE(gc.lat_deg == Catch::Approx(0.0).margin(0.05));
  const double l = gc.lon_deg > 180.0 ? gc.lon_deg - 360.0 : gc.lon_deg;
  REQUIRE(l == Catch::Approx(0.0).margin(0.05));

  // North galactic pole
  Direction ngp = sky::to_galactic(equatorial(192.85948, 27.12825));
  REQUIRE(ngp.lat_deg == Catch::Approx(90.0).margin(0.05));

  // Bootes void
  Direction bootes = sky::to_galactic(equatorial(222.5, 46.0));
  REQUIRE(bootes.lon_deg == Catch::Approx(79.658).margin(0.05));
  REQUIRE(bootes.lat_deg == Catch::Approx(59.922).margin(0.05));
}

TEST_CASE("angular_separation_is_great_circle_distance") {
  REQUIRE(sky::angular_separation_deg(galactic(0.0, 0.0), galactic(90.0, 0.0)) ==
          Catch::Approx(90.0));
  REQUIRE(sky::angular_separation_deg(galactic(10.0, 90.0), galactic(200.0, -90.0)) ==
          Catch::Approx(180.0));
  REQUIRE(sky::angular_separation_deg(galactic(359.5, 0.0), galactic(0.5, 0.0)) ==
          Catch::Approx(1.0));
  // Frames are reconciled before comparing
  const Direction eq = equatorial(222.5, 46.0);
  REQUIRE(sky::angular_separation_deg(eq, sky::to_galactic(eq)) ==
          Catch::Approx(0.0).margin(1e-6));
}
