/**
 * @file test_geo_math.cpp
 * @brief Great-circle distance, bearing and interpolation tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "sailroute/core/constants.hpp"
#include "sailroute/geo/geo_math.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using sailroute::core::Coordinates;
  namespace geo = sailroute::geo;
  const double nm_per_deg = sailroute::core::constants::kEarthRadiusNm * sailroute::core::constants::kDegToRad;

  const Coordinates origin{.lat_deg = 0.0, .lon_deg = 0.0};
  const Coordinates north{.lat_deg = 1.0, .lon_deg = 0.0};
  const Coordinates east{.lat_deg = 0.0, .lon_deg = 1.0};

  if (!approx(geo::distance_nm(origin, north), nm_per_deg, 1e-9) || !approx(geo::distance_nm(origin, east), nm_per_deg, 1e-9)) {
    spdlog::error("one degree of arc distance mismatch");
    return 1;
  }
  if (geo::distance_nm(north, north) != 0.0) {
    spdlog::error("distance to self must be zero");
    return 2;
  }
  const Coordinates miami{.lat_deg = 25.7617, .lon_deg = -80.1918};
  const Coordinates nassau{.lat_deg = 25.0343, .lon_deg = -77.3963};
  if (!approx(geo::distance_nm(miami, nassau), geo::distance_nm(nassau, miami), 1e-9) ||
      !approx(geo::distance_nm(miami, nassau), 157.0, 3.0)) {
    spdlog::error("miami-nassau distance unexpected: {}", geo::distance_nm(miami, nassau));
    return 3;
  }

  if (!approx(geo::bearing_deg(origin, north), 0.0, 1e-9) || !approx(geo::bearing_deg(origin, east), 90.0, 1e-9) ||
      !approx(geo::bearing_deg(east, origin), 270.0, 1e-9) || !approx(geo::bearing_deg(north, origin), 180.0, 1e-9)) {
    spdlog::error("cardinal bearings mismatch");
    return 4;
  }
  if (geo::bearing_deg(miami, miami) != 0.0) {
    spdlog::error("coincident bearing must be 0");
    return 5;
  }
  const double b = geo::bearing_deg(miami, nassau);
  if (!(b >= 0.0 && b < 360.0) || !approx(b, 105.0, 5.0)) {
    spdlog::error("miami-nassau bearing unexpected: {}", b);
    return 6;
  }

  const auto mid = geo::intermediate_point(origin, Coordinates{.lat_deg = 0.0, .lon_deg = 10.0}, 0.5);
  if (!approx(mid.lat_deg, 0.0, 1e-9) || !approx(mid.lon_deg, 5.0, 1e-9)) {
    spdlog::error("equatorial midpoint mismatch: {}, {}", mid.lat_deg, mid.lon_deg);
    return 7;
  }
  const auto p0 = geo::intermediate_point(miami, nassau, 0.0);
  const auto p1 = geo::intermediate_point(miami, nassau, 1.0);
  if (p0.lat_deg != miami.lat_deg || p0.lon_deg != miami.lon_deg || p1.lat_deg != nassau.lat_deg ||
      p1.lon_deg != nassau.lon_deg) {
    spdlog::error("fraction endpoints must return the inputs exactly");
    return 8;
  }
  const auto quarter = geo::intermediate_point(miami, nassau, 0.25);
  if (!approx(geo::distance_nm(miami, quarter), 0.25 * geo::distance_nm(miami, nassau), 1e-6)) {
    spdlog::error("intermediate point is not on the arc fraction");
    return 9;
  }

  // Dateline crossing stays on the short arc.
  const Coordinates west_of_line{.lat_deg = 0.0, .lon_deg = 179.0};
  const Coordinates east_of_line{.lat_deg = 0.0, .lon_deg = -179.0};
  if (!approx(geo::distance_nm(west_of_line, east_of_line), 2.0 * nm_per_deg, 1e-6) ||
      !approx(geo::bearing_deg(west_of_line, east_of_line), 90.0, 1e-9)) {
    spdlog::error("antimeridian distance or bearing mismatch");
    return 10;
  }
  const auto on_line = geo::intermediate_point(west_of_line, east_of_line, 0.5);
  if (!approx(std::abs(on_line.lon_deg), 180.0, 1e-9)) {
    spdlog::error("antimeridian midpoint mismatch: {}", on_line.lon_deg);
    return 11;
  }

  if (!approx(geo::wrap_longitude(190.0), -170.0, 1e-12) || !approx(geo::wrap_longitude(-190.0), 170.0, 1e-12) ||
      !approx(geo::wrap_360(-10.0), 350.0, 1e-12) || geo::wrap_360(720.0) != 0.0) {
    spdlog::error("angle wrapping mismatch");
    return 12;
  }

  if (!geo::is_valid(miami) || geo::is_valid(Coordinates{.lat_deg = 91.0, .lon_deg = 0.0}) ||
      geo::is_valid(Coordinates{.lat_deg = 0.0, .lon_deg = 181.0}) ||
      geo::is_valid(Coordinates{.lat_deg = std::numeric_limits<double>::quiet_NaN(), .lon_deg = 0.0})) {
    spdlog::error("coordinate validation mismatch");
    return 13;
  }

  return 0;
}
