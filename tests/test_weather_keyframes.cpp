/**
 * @file test_weather_keyframes.cpp
 * @brief Keyframe weather interpolation and boat track tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "sailroute/simulation/weather_keyframes.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

sailroute::core::Waypoint at(double lat, double lon) {
  return sailroute::core::Waypoint{.coordinates = {.lat_deg = lat, .lon_deg = lon}};
}

}  // namespace

int main() {
  namespace sim = sailroute::simulation;
  const auto frames = sim::default_keyframes();

  if (frames.size() != 7U || frames.front().hour != 0.0 || frames.back().hour != 72.0) {
    spdlog::error("default keyframe table mismatch");
    return 1;
  }
  if (sim::classify_conditions(30.0) != sim::SeaConditions::Storm ||
      sim::classify_conditions(29.9) != sim::SeaConditions::Rough ||
      sim::classify_conditions(15.0) != sim::SeaConditions::Moderate ||
      sim::classify_conditions(14.9) != sim::SeaConditions::Good || sim::to_string(sim::SeaConditions::Rough) != "rough") {
    spdlog::error("sea condition classification mismatch");
    return 2;
  }

  const auto h0 = sim::interpolate_keyframes(frames, 0.0);
  if (h0.wind_speed_kt != 12.0 || h0.has_storm || !h0.squalls.empty() || h0.conditions != sim::SeaConditions::Good) {
    spdlog::error("hour 0 weather mismatch");
    return 3;
  }

  const auto h6 = sim::interpolate_keyframes(frames, 6.0);
  if (!approx(h6.wind_speed_kt, 15.0, 1e-12) || !approx(h6.wind_direction_deg, 127.5, 1e-12) ||
      !approx(h6.wave_height_m, 1.5, 1e-12) || !h6.squalls.empty()) {
    spdlog::error("midpoint interpolation mismatch");
    return 4;
  }

  // Storms and squalls follow the nearer keyframe past the visibility fraction.
  const auto h18 = sim::interpolate_keyframes(frames, 18.0);
  const auto h20 = sim::interpolate_keyframes(frames, 20.0);
  if (h18.has_storm || h18.squalls.size() != 1U || !approx(h18.wind_speed_kt, 21.5, 1e-12)) {
    spdlog::error("storm must not be visible at the midpoint");
    return 5;
  }
  if (!h20.has_storm || !h20.storm_location || h20.storm_location->lat_deg != 28.5 || h20.storm_radius_nm != 50.0 ||
      h20.squalls.size() != 2U) {
    spdlog::error("approaching storm must be visible past the midpoint");
    return 6;
  }
  const auto h24 = sim::interpolate_keyframes(frames, 24.0);
  if (!h24.has_storm || h24.wind_speed_kt != 25.0 || h24.conditions != sim::SeaConditions::Rough) {
    spdlog::error("keyframe hour must reproduce the keyframe");
    return 7;
  }
  if (sim::interpolate_keyframes(frames, 90.0).wind_speed_kt != 14.0 ||
      sim::interpolate_keyframes({}, 10.0).wind_speed_kt != 0.0) {
    spdlog::error("out of table hours mismatch");
    return 8;
  }

  sailroute::core::Route route{.waypoints = {at(0.0, 0.0), at(0.0, 1.0), at(0.0, 2.0)}};
  const auto start = sim::boat_position(route, 0.0, 96.0);
  const auto quarter = sim::boat_position(route, 24.0, 96.0);
  const auto half = sim::boat_position(route, 48.0, 96.0);
  const auto done = sim::boat_position(route, 200.0, 96.0);
  if (!start || start->leg_index != 0U || start->position.lon_deg != 0.0 || !quarter ||
      !approx(quarter->position.lon_deg, 0.5, 1e-9) || !half || half->leg_index != 1U ||
      !approx(half->position.lon_deg, 1.0, 1e-9) || !done || done->leg_index != 1U || done->position.lon_deg != 2.0) {
    spdlog::error("boat track mismatch");
    return 9;
  }
  route.waypoints.pop_back();
  route.waypoints.pop_back();
  if (sim::boat_position(route, 10.0, 96.0).has_value()) {
    spdlog::error("single waypoint route has no track");
    return 10;
  }

  return 0;
}
