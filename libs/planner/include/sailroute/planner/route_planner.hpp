/**
 * @file route_planner.hpp
 * @brief Great-circle passage planning with corridor weather and sail advice.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sailroute/core/interfaces.hpp"
#include "sailroute/core/types.hpp"
#include "sailroute/planner/daylight.hpp"
#include "sailroute/polar/sail_advisor.hpp"
#include "sailroute/weather/corridor_sampler.hpp"

namespace sailroute::planner {

/**
 * @brief Skipper preferences for one passage.
 */
struct RoutePlanningConfig {
  sailroute::core::Coordinates start_point{};
  sailroute::core::Coordinates destination{};
  sailroute::core::SailingMode sailing_mode{sailroute::core::SailingMode::Mixed};
  double wind_threshold_kt{5.0};  ///< motor below this wind speed
  bool avoid_storms{true};
  bool ensure_daytime_arrival{false};
  double max_daily_distance_nm{150.0};
  double preferred_waypoint_interval_nm{50.0};
  std::optional<sailroute::core::Epoch> preferred_departure{};  ///< now when unset
};

/**
 * @brief Planned route with the data it was derived from.
 *
 * Warnings are policy findings (night arrivals, long daily runs); they never abort planning.
 */
struct RoutePlan {
  sailroute::core::Route route{};
  sailroute::weather::RouteCorridorWeather corridor{};
  std::optional<DepartureSolution> departure{};
  std::vector<std::string> warnings{};
  double total_distance_nm{};
  double initial_bearing_deg{};
  double estimated_duration_h{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
  std::string message{};
};

class RoutePlanner {
 public:
  struct Config {
    double nominal_speed_kt{6.0};
    double storm_wind_kt{40.0};  ///< above this, storm avoidance forces comfort mode
    DaylightValidator::Config daylight{};
  };

  /**
   * @param provider Forecast source for corridor sampling; must outlive the planner.
   * @param polar Boat polar for sail advice; must outlive the planner.
   */
  RoutePlanner(const sailroute::core::IForecastProvider& provider, const sailroute::polar::PolarDiagram& polar)
      : RoutePlanner(provider, polar, Config{}) {}
  RoutePlanner(const sailroute::core::IForecastProvider& provider, const sailroute::polar::PolarDiagram& polar,
               const Config& config);

  /**
   * @brief Build the waypoint sequence from start to destination.
   *
   * Waypoints sit at `ceil(distance / interval) + 1` (at least 2) even fractions of the
   * great circle. Each carries the nearest corridor forecast, cumulative timing at the
   * nominal speed and a sail plan (engine below the wind threshold).
   */
  [[nodiscard]] RoutePlan plan_route(const RoutePlanningConfig& request) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  const sailroute::core::IForecastProvider& provider_;
  sailroute::polar::SailConfigAdvisor advisor_;
  DaylightValidator daylight_;
  Config config_{};
};

/**
 * @brief Angle between wind direction and course folded into [0,180].
 */
[[nodiscard]] double true_wind_angle(double wind_direction_deg, double course_deg);

/**
 * @brief Forecast of the corridor point nearest to `at` in planar lat/lon distance; earliest wins ties.
 */
[[nodiscard]] std::optional<sailroute::core::WindForecast> nearest_forecast(
    const sailroute::weather::RouteCorridorWeather& corridor, const sailroute::core::Coordinates& at);

}  // namespace sailroute::planner
