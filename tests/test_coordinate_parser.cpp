/**
 * @file test_coordinate_parser.cpp
 * @brief Position notation parsing and formatting tests.
 * @author Watosn
 */

#include <cmath>
#include <string>

#include <spdlog/spdlog.h>

#include "sailroute/geo/coordinate_parser.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  namespace geo = sailroute::geo;
  using sailroute::core::Status;

  const auto dd = geo::parse_coordinates("25.7617, -80.1918");
  if (dd.status != Status::Ok || dd.format != geo::CoordinateFormat::DecimalDegrees ||
      !approx(dd.coordinates.lat_deg, 25.7617, 1e-9) || !approx(dd.coordinates.lon_deg, -80.1918, 1e-9)) {
    spdlog::error("decimal degrees parse failed");
    return 1;
  }

  const auto dd_hemi = geo::parse_coordinates("  33.8688 S, 151.2093 E ");
  if (dd_hemi.status != Status::Ok || !approx(dd_hemi.coordinates.lat_deg, -33.8688, 1e-9) ||
      !approx(dd_hemi.coordinates.lon_deg, 151.2093, 1e-9)) {
    spdlog::error("hemisphere decimal degrees parse failed");
    return 2;
  }

  const auto ddm = geo::parse_coordinates("25°45.702'N, 80°11.508'W");
  if (ddm.status != Status::Ok || ddm.format != geo::CoordinateFormat::DegreesDecimalMinutes ||
      !approx(ddm.coordinates.lat_deg, 25.7617, 1e-6) || !approx(ddm.coordinates.lon_deg, -80.1918, 1e-6)) {
    spdlog::error("degrees decimal minutes parse failed");
    return 3;
  }

  const auto dms = geo::parse_coordinates("25°45'42.12\"N 80°11'30.48\"W");
  if (dms.status != Status::Ok || dms.format != geo::CoordinateFormat::DegreesMinutesSeconds ||
      !approx(dms.coordinates.lat_deg, 25.7617, 1e-6) || !approx(dms.coordinates.lon_deg, -80.1918, 1e-6)) {
    spdlog::error("degrees minutes seconds parse failed");
    return 4;
  }

  if (geo::parse_coordinates("").status != Status::InvalidInput ||
      geo::parse_coordinates("not a position").status != Status::InvalidInput ||
      geo::parse_coordinates("95.0, 10.0").status != Status::InvalidInput) {
    spdlog::error("invalid positions must be rejected");
    return 5;
  }

  const sailroute::core::Coordinates miami{.lat_deg = 25.7617, .lon_deg = -80.1918};
  if (geo::format_dd(miami) != "25.761700, -80.191800") {
    spdlog::error("format_dd mismatch: {}", geo::format_dd(miami));
    return 6;
  }
  if (geo::format_ddm(miami) != "25°45.7020'N, 80°11.5080'W") {
    spdlog::error("format_ddm mismatch: {}", geo::format_ddm(miami));
    return 7;
  }
  const auto reparsed = geo::parse_coordinates(geo::format_dms(miami));
  if (reparsed.status != Status::Ok || !approx(reparsed.coordinates.lat_deg, miami.lat_deg, 1e-5) ||
      !approx(reparsed.coordinates.lon_deg, miami.lon_deg, 1e-5)) {
    spdlog::error("format_dms output does not parse back: {}", geo::format_dms(miami));
    return 8;
  }

  return 0;
}
