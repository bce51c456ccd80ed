/**
 * @file weather_keyframes.cpp
 * @brief Keyframe weather implementation.
 * @author Watosn
 */

#include "sailroute/simulation/weather_keyframes.hpp"

#include <algorithm>
#include <cmath>

#include "sailroute/geo/geo_math.hpp"

namespace sailroute::simulation {
namespace {

using sailroute::core::Coordinates;

constexpr double kStormWindKt = 30.0;
constexpr double kRoughWindKt = 22.0;
constexpr double kModerateWindKt = 15.0;

double lerp(double a, double b, double t) { return a + t * (b - a); }

}  // namespace

std::vector<WeatherKeyframe> default_keyframes() {
  return {
      WeatherKeyframe{.hour = 0.0, .wind_speed_kt = 12.0, .wind_direction_deg = 120.0, .wave_height_m = 1.2,
                      .gust_speed_kt = 15.0},
      WeatherKeyframe{.hour = 12.0,
                      .wind_speed_kt = 18.0,
                      .wind_direction_deg = 135.0,
                      .wave_height_m = 1.8,
                      .gust_speed_kt = 22.0,
                      .squalls = {Squall{Coordinates{30.0, -67.0}, 15.0, 28.0}}},
      WeatherKeyframe{.hour = 24.0,
                      .wind_speed_kt = 25.0,
                      .wind_direction_deg = 150.0,
                      .wave_height_m = 2.5,
                      .gust_speed_kt = 32.0,
                      .has_storm = true,
                      .storm_location = Coordinates{28.5, -70.0},
                      .storm_radius_nm = 50.0,
                      .squalls = {Squall{Coordinates{29.5, -68.5}, 12.0, 35.0},
                                  Squall{Coordinates{27.5, -69.0}, 10.0, 30.0}}},
      WeatherKeyframe{.hour = 36.0,
                      .wind_speed_kt = 35.0,
                      .wind_direction_deg = 160.0,
                      .wave_height_m = 4.0,
                      .gust_speed_kt = 45.0,
                      .has_storm = true,
                      .storm_location = Coordinates{27.0, -72.0},
                      .storm_radius_nm = 75.0,
                      .squalls = {Squall{Coordinates{28.0, -70.5}, 15.0, 40.0},
                                  Squall{Coordinates{26.0, -71.5}, 12.0, 38.0},
                                  Squall{Coordinates{29.0, -73.0}, 10.0, 32.0}}},
      WeatherKeyframe{.hour = 48.0,
                      .wind_speed_kt = 30.0,
                      .wind_direction_deg = 170.0,
                      .wave_height_m = 3.5,
                      .gust_speed_kt = 38.0,
                      .has_storm = true,
                      .storm_location = Coordinates{26.0, -74.0},
                      .storm_radius_nm = 60.0,
                      .squalls = {Squall{Coordinates{27.0, -73.0}, 12.0, 35.0}}},
      WeatherKeyframe{.hour = 60.0,
                      .wind_speed_kt = 20.0,
                      .wind_direction_deg = 140.0,
                      .wave_height_m = 2.0,
                      .gust_speed_kt = 25.0,
                      .squalls = {Squall{Coordinates{25.5, -75.5}, 8.0, 26.0}}},
      WeatherKeyframe{.hour = 72.0, .wind_speed_kt = 14.0, .wind_direction_deg = 125.0, .wave_height_m = 1.5,
                      .gust_speed_kt = 18.0},
  };
}

SeaConditions classify_conditions(double wind_speed_kt) {
  if (wind_speed_kt >= kStormWindKt) {
    return SeaConditions::Storm;
  }
  if (wind_speed_kt >= kRoughWindKt) {
    return SeaConditions::Rough;
  }
  if (wind_speed_kt >= kModerateWindKt) {
    return SeaConditions::Moderate;
  }
  return SeaConditions::Good;
}

std::string_view to_string(SeaConditions conditions) {
  switch (conditions) {
    case SeaConditions::Good:
      return "good";
    case SeaConditions::Moderate:
      return "moderate";
    case SeaConditions::Rough:
      return "rough";
    case SeaConditions::Storm:
      return "storm";
  }
  return "unknown";
}

SimulatedWeather interpolate_keyframes(const std::vector<WeatherKeyframe>& keyframes, double hour,
                                       double storm_visibility_fraction) {
  SimulatedWeather out{.hour = hour};
  if (keyframes.empty()) {
    return out;
  }

  std::size_t prev = 0;
  std::size_t next = 0;
  if (hour >= keyframes.back().hour) {
    prev = next = keyframes.size() - 1U;
  } else {
    for (std::size_t i = 0; i + 1U < keyframes.size(); ++i) {
      if (hour >= keyframes[i].hour && hour < keyframes[i + 1U].hour) {
        prev = i;
        next = i + 1U;
        break;
      }
    }
  }

  const WeatherKeyframe& a = keyframes[prev];
  const WeatherKeyframe& b = keyframes[next];
  const double span = b.hour - a.hour;
  const double t = (prev == next || span <= 0.0) ? 0.0 : (hour - a.hour) / span;

  out.wind_speed_kt = lerp(a.wind_speed_kt, b.wind_speed_kt, t);
  out.wind_direction_deg = lerp(a.wind_direction_deg, b.wind_direction_deg, t);
  out.wave_height_m = lerp(a.wave_height_m, b.wave_height_m, t);
  out.gust_speed_kt = lerp(a.gust_speed_kt, b.gust_speed_kt, t);
  out.conditions = classify_conditions(out.wind_speed_kt);

  const WeatherKeyframe& step = t > storm_visibility_fraction ? b : a;
  out.has_storm = step.has_storm;
  if (step.has_storm) {
    out.storm_location = step.storm_location;
    out.storm_radius_nm = step.storm_radius_nm;
  }
  out.squalls = step.squalls;
  return out;
}

std::optional<BoatFix> boat_position(const sailroute::core::Route& route, double hour, double voyage_hours) {
  if (route.waypoints.size() < 2U || !(voyage_hours > 0.0)) {
    return std::nullopt;
  }
  const double progress = std::clamp(hour / voyage_hours, 0.0, 1.0);
  const std::size_t legs = route.waypoints.size() - 1U;
  const double leg_progress = progress * static_cast<double>(legs);
  const std::size_t leg = std::min(static_cast<std::size_t>(std::floor(leg_progress)), legs - 1U);
  const double fraction = leg_progress - static_cast<double>(leg);

  return BoatFix{
      .position = sailroute::geo::intermediate_point(route.waypoints[leg].coordinates,
                                                     route.waypoints[leg + 1U].coordinates, fraction),
      .leg_index = leg,
  };
}

}  // namespace sailroute::simulation
