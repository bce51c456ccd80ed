/**
 * @file hazard_detector.cpp
 * @brief Hazard detection and storm reroute implementation.
 * @author Watosn
 */

#include "sailroute/simulation/hazard_detector.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "sailroute/core/constants.hpp"
#include "sailroute/geo/geo_math.hpp"

namespace sailroute::simulation {
namespace {

using sailroute::core::Coordinates;
using sailroute::core::Route;
using sailroute::core::Waypoint;
namespace constants = sailroute::core::constants;

std::vector<std::string> affected_names(const Route& route, const Coordinates& center, double radius_nm) {
  std::vector<std::string> names;
  for (const auto& wp : route.waypoints) {
    if (is_affected(wp, center, radius_nm)) {
      names.push_back(wp.name);
    }
  }
  return names;
}

}  // namespace

std::string_view to_string(AlertType type) {
  switch (type) {
    case AlertType::Storm:
      return "storm";
    case AlertType::HighWind:
      return "high_wind";
    case AlertType::HighWaves:
      return "high_waves";
    case AlertType::Squall:
      return "squall";
  }
  return "unknown";
}

std::string_view to_string(AlertSeverity severity) {
  switch (severity) {
    case AlertSeverity::Warning:
      return "warning";
    case AlertSeverity::Watch:
      return "watch";
    case AlertSeverity::Advisory:
      return "advisory";
  }
  return "unknown";
}

bool is_affected(const Waypoint& waypoint, const Coordinates& center, double radius_nm) {
  return sailroute::geo::distance_nm(waypoint.coordinates, center) <= radius_nm;
}

std::vector<StormAlert> detect_hazards(const SimulatedWeather& weather, const Route& route,
                                       const sailroute::core::Epoch& now, std::uint64_t sequence,
                                       const HazardThresholds& thresholds) {
  std::vector<StormAlert> alerts;
  if (route.waypoints.empty()) {
    return alerts;
  }

  std::size_t squall_no = 0;
  for (const auto& squall : weather.squalls) {
    auto names = affected_names(route, squall.location, squall.radius_nm);
    ++squall_no;
    if (names.empty()) {
      continue;
    }
    alerts.push_back(StormAlert{
        .id = fmt::format("squall-{}-{}", sequence, squall_no),
        .type = AlertType::Squall,
        .severity = squall.wind_speed_kt > thresholds.squall_warning_kt ? AlertSeverity::Warning : AlertSeverity::Advisory,
        .message = fmt::format("Squall detected! Localized winds to {:.0f} kts. Near waypoints: {}. "
                               "Prepare for sudden wind increase.",
                               squall.wind_speed_kt, fmt::join(names, ", ")),
        .location = squall.location,
        .timestamp = now,
        .affected_waypoints = std::move(names),
    });
  }

  if (weather.has_storm && weather.storm_location && weather.storm_radius_nm > 0.0) {
    auto names = affected_names(route, *weather.storm_location, weather.storm_radius_nm);
    if (!names.empty()) {
      alerts.push_back(StormAlert{
          .id = fmt::format("storm-{}", sequence),
          .type = AlertType::Storm,
          .severity = weather.wind_speed_kt > thresholds.storm_warning_kt ? AlertSeverity::Warning : AlertSeverity::Watch,
          .message = fmt::format("Storm system detected! Wind {:.0f} kts, Waves {:.1f}m. Affecting waypoints: {}. "
                                 "Route deviation recommended.",
                                 weather.wind_speed_kt, weather.wave_height_m, fmt::join(names, ", ")),
          .location = *weather.storm_location,
          .timestamp = now,
          .affected_waypoints = std::move(names),
      });
    }
  }

  if (weather.wind_speed_kt > thresholds.high_wind_kt && !weather.has_storm && alerts.empty()) {
    alerts.push_back(StormAlert{
        .id = fmt::format("wind-{}", sequence),
        .type = AlertType::HighWind,
        .severity =
            weather.wind_speed_kt > thresholds.high_wind_warning_kt ? AlertSeverity::Warning : AlertSeverity::Advisory,
        .message = fmt::format("High winds detected: {:.0f} kts with gusts to {:.0f} kts.", weather.wind_speed_kt,
                               weather.gust_speed_kt),
        .location = route.waypoints.front().coordinates,
        .timestamp = now,
    });
  }

  if (weather.wave_height_m > thresholds.high_wave_m) {
    alerts.push_back(StormAlert{
        .id = fmt::format("wave-{}", sequence),
        .type = AlertType::HighWaves,
        .severity =
            weather.wave_height_m > thresholds.high_wave_warning_m ? AlertSeverity::Warning : AlertSeverity::Advisory,
        .message = fmt::format("Large waves detected: {:.1f}m. Consider reducing sail area.", weather.wave_height_m),
        .location = route.waypoints.front().coordinates,
        .timestamp = now,
    });
  }
  return alerts;
}

Route make_deviated_route(const Route& route, const SimulatedWeather& weather, const sailroute::core::Epoch& now,
                          const DeviationConfig& config) {
  if (!weather.has_storm || !weather.storm_location || !(weather.storm_radius_nm > 0.0)) {
    return route;
  }

  const Coordinates storm = *weather.storm_location;
  Route out = route;
  out.waypoints.clear();
  out.waypoints.reserve(route.waypoints.size() + 1U);
  bool inserted = false;

  for (std::size_t i = 0; i < route.waypoints.size(); ++i) {
    Waypoint wp = route.waypoints[i];
    if (!inserted && is_affected(wp, storm, weather.storm_radius_nm)) {
      Waypoint detour{};
      detour.id = fmt::format("deviation-{}", static_cast<long long>(now.utc_seconds));
      detour.name = "Storm Avoidance";
      detour.coordinates = Coordinates{
          .lat_deg = std::clamp(storm.lat_deg + config.lat_offset_deg, -90.0, 90.0),
          .lon_deg = sailroute::geo::wrap_longitude(storm.lon_deg + config.lon_offset_deg),
      };
      detour.order = static_cast<int>(out.waypoints.size()) + 1;
      detour.sail_plan = sailroute::core::SailConfiguration{.main_sail = true, .jib = true};
      detour.estimated_arrival = now + static_cast<double>(i + 1U) * config.leg_hours * constants::kSecondsPerHour;
      detour.weather_forecast = sailroute::core::WindForecast{
          .timestamp = now,
          .wind_speed_kt = 20.0,
          .wind_direction_deg = weather.wind_direction_deg,
          .gust_speed_kt = 25.0,
          .wave_height_m = 2.0,
      };
      out.waypoints.push_back(std::move(detour));
      inserted = true;
      wp.estimated_arrival = now + static_cast<double>(i + 2U) * config.leg_hours * constants::kSecondsPerHour;
    }
    wp.order = static_cast<int>(out.waypoints.size()) + 1;
    out.waypoints.push_back(std::move(wp));
  }

  if (!inserted) {
    return route;
  }
  out.name = route.name + config.name_suffix;
  out.updated_at = now;
  return out;
}

}  // namespace sailroute::simulation
