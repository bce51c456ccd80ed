/**
 * @file hazard_detector.hpp
 * @brief Storm, squall, wind and wave alerts against a route, and storm reroutes.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sailroute/core/types.hpp"
#include "sailroute/simulation/weather_keyframes.hpp"

namespace sailroute::simulation {

enum class AlertType : std::uint8_t { Storm, HighWind, HighWaves, Squall };
enum class AlertSeverity : std::uint8_t { Warning, Watch, Advisory };

[[nodiscard]] std::string_view to_string(AlertType type);
[[nodiscard]] std::string_view to_string(AlertSeverity severity);

struct StormAlert {
  std::string id{};
  AlertType type{AlertType::Storm};
  AlertSeverity severity{AlertSeverity::Advisory};
  std::string message{};
  sailroute::core::Coordinates location{};
  sailroute::core::Epoch timestamp{};
  std::vector<std::string> affected_waypoints{};
};

/**
 * @brief Alert trigger levels.
 */
struct HazardThresholds {
  double squall_warning_kt{35.0};
  double storm_warning_kt{30.0};
  double high_wind_kt{25.0};
  double high_wind_warning_kt{35.0};
  double high_wave_m{3.0};
  double high_wave_warning_m{4.0};
};

/**
 * @brief Reroute geometry around a storm.
 */
struct DeviationConfig {
  double lat_offset_deg{1.5};
  double lon_offset_deg{2.0};
  double leg_hours{8.0};
  std::string name_suffix{" (Storm Avoidance)"};
};

/**
 * @brief True when the waypoint lies within `radius_nm` (haversine) of `center`.
 */
[[nodiscard]] bool is_affected(const sailroute::core::Waypoint& waypoint, const sailroute::core::Coordinates& center,
                               double radius_nm);

/**
 * @brief Alerts for one weather state.
 *
 * One squall alert per squall covering a waypoint and one storm alert when a visible
 * storm covers a waypoint. A high-wind alert is raised only without a storm and when no
 * other alert fired; the high-wave alert is independent. Ids derive from `sequence`.
 */
[[nodiscard]] std::vector<StormAlert> detect_hazards(const SimulatedWeather& weather, const sailroute::core::Route& route,
                                                     const sailroute::core::Epoch& now, std::uint64_t sequence,
                                                     const HazardThresholds& thresholds = {});

/**
 * @brief Route with a "Storm Avoidance" waypoint inserted before the first waypoint inside the storm.
 *
 * Orders are renumbered densely. The route comes back unchanged when no storm is
 * visible or no waypoint is affected.
 */
[[nodiscard]] sailroute::core::Route make_deviated_route(const sailroute::core::Route& route,
                                                         const SimulatedWeather& weather,
                                                         const sailroute::core::Epoch& now,
                                                         const DeviationConfig& config = {});

}  // namespace sailroute::simulation
