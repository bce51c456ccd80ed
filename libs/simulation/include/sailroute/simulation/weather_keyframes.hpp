/**
 * @file weather_keyframes.hpp
 * @brief Scripted multi-day weather story and its interpolation.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "sailroute/core/types.hpp"

namespace sailroute::simulation {

enum class SeaConditions : std::uint8_t { Good, Moderate, Rough, Storm };

/**
 * @brief Localized cell of strong wind.
 */
struct Squall {
  sailroute::core::Coordinates location{};
  double radius_nm{};
  double wind_speed_kt{};
};

/**
 * @brief Weather state pinned at one virtual hour.
 */
struct WeatherKeyframe {
  double hour{};
  double wind_speed_kt{};
  double wind_direction_deg{};
  double wave_height_m{};
  double gust_speed_kt{};
  bool has_storm{};
  sailroute::core::Coordinates storm_location{};
  double storm_radius_nm{};
  std::vector<Squall> squalls{};
};

/**
 * @brief Weather at a simulated hour, with the boat position along the route.
 */
struct SimulatedWeather {
  double hour{};
  double wind_speed_kt{};
  double wind_direction_deg{};
  double wave_height_m{};
  double gust_speed_kt{};
  bool has_storm{};
  std::optional<sailroute::core::Coordinates> storm_location{};
  double storm_radius_nm{};
  SeaConditions conditions{SeaConditions::Good};
  std::vector<Squall> squalls{};
  std::optional<sailroute::core::Coordinates> boat_position{};
  std::optional<std::size_t> current_leg_index{};
};

/**
 * @brief Boat fix on a route: position and the index of the leg's starting waypoint.
 */
struct BoatFix {
  sailroute::core::Coordinates position{};
  std::size_t leg_index{};
};

/**
 * @brief Three-day story at hours 0..72: squalls build, a storm peaks at hour 36 and clears by 60.
 */
[[nodiscard]] std::vector<WeatherKeyframe> default_keyframes();

/**
 * @brief Storm at >= 30 kt, rough at >= 22, moderate at >= 15, good below.
 */
[[nodiscard]] SeaConditions classify_conditions(double wind_speed_kt);

[[nodiscard]] std::string_view to_string(SeaConditions conditions);

/**
 * @brief Weather at `hour` from keyframes sorted by hour.
 *
 * Wind, direction, waves and gusts interpolate linearly between the bracketing
 * keyframes; past the last keyframe the last one holds. Storm state and squalls are
 * step functions: they come from the next keyframe once the interpolation fraction
 * exceeds `storm_visibility_fraction`, otherwise from the previous one.
 * Boat position is left unset.
 */
[[nodiscard]] SimulatedWeather interpolate_keyframes(const std::vector<WeatherKeyframe>& keyframes, double hour,
                                                     double storm_visibility_fraction = 0.5);

/**
 * @brief Position after `hour` of a `voyage_hours` passage, spread evenly over the legs.
 * @return nullopt for routes with fewer than two waypoints.
 */
[[nodiscard]] std::optional<BoatFix> boat_position(const sailroute::core::Route& route, double hour,
                                                   double voyage_hours);

}  // namespace sailroute::simulation
