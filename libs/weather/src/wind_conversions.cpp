/**
 * @file wind_conversions.cpp
 * @brief u/v wind conversion implementation.
 * @author Watosn
 */

#include "sailroute/weather/wind_conversions.hpp"

#include <cmath>

#include "sailroute/core/constants.hpp"

namespace sailroute::weather {
namespace {

namespace constants = sailroute::core::constants;

double round_tenth(double x) { return std::round(x * 10.0) / 10.0; }

}  // namespace

double direction_from_deg(double u_mps, double v_mps) {
  double dir = std::atan2(-u_mps, -v_mps) * constants::kRadToDeg;
  if (dir < 0.0) {
    dir += 360.0;
  }
  return dir;
}

sailroute::core::WindForecast to_forecast(const WindComponents& c) {
  const double speed_mps = std::hypot(c.u_mps, c.v_mps);
  const double gust_mps = c.gust_mps.value_or(speed_mps);
  double dir = std::round(direction_from_deg(c.u_mps, c.v_mps));
  if (dir >= 360.0) {
    dir -= 360.0;
  }
  return sailroute::core::WindForecast{
      .timestamp = c.timestamp,
      .wind_speed_kt = round_tenth(speed_mps * constants::kKnotsPerMps),
      .wind_direction_deg = dir,
      .gust_speed_kt = round_tenth(gust_mps * constants::kKnotsPerMps),
      .wave_height_m = c.wave_height_m,
  };
}

std::vector<sailroute::core::WindForecast> to_forecasts(const std::vector<WindComponents>& series) {
  std::vector<sailroute::core::WindForecast> out;
  out.reserve(series.size());
  for (const auto& c : series) {
    out.push_back(to_forecast(c));
  }
  return out;
}

}  // namespace sailroute::weather
