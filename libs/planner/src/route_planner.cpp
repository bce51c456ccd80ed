/**
 * @file route_planner.cpp
 * @brief Route planning implementation.
 * @author Watosn
 */

#include "sailroute/planner/route_planner.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/core/constants.hpp"
#include "sailroute/core/time.hpp"
#include "sailroute/geo/geo_math.hpp"

namespace sailroute::planner {
namespace {

using sailroute::core::Coordinates;
using sailroute::core::Epoch;
using sailroute::core::SailingMode;
using sailroute::core::Status;
namespace constants = sailroute::core::constants;

RoutePlan reject(const RoutePlanningConfig& request, std::string message) {
  spdlog::error("route planning rejected: {}", message);
  RoutePlan out{};
  out.corridor.start = request.start_point;
  out.corridor.end = request.destination;
  out.status = Status::InvalidInput;
  out.message = std::move(message);
  return out;
}

std::string waypoint_name(std::size_t i, std::size_t n) {
  if (i == 0U) {
    return "Start";
  }
  if (i + 1U == n) {
    return "Destination";
  }
  return fmt::format("Waypoint {}", i);
}

}  // namespace

double true_wind_angle(double wind_direction_deg, double course_deg) {
  const double d = std::fmod(std::abs(wind_direction_deg - course_deg), 360.0);
  return d > 180.0 ? 360.0 - d : d;
}

std::optional<sailroute::core::WindForecast> nearest_forecast(const sailroute::weather::RouteCorridorWeather& corridor,
                                                              const Coordinates& at) {
  const sailroute::weather::CorridorWeatherPoint* best = nullptr;
  double best_d2 = std::numeric_limits<double>::infinity();
  for (const auto& wp : corridor.weather_points) {
    const double dlat = wp.coordinates.lat_deg - at.lat_deg;
    const double dlon = wp.coordinates.lon_deg - at.lon_deg;
    const double d2 = dlat * dlat + dlon * dlon;
    if (d2 < best_d2) {
      best_d2 = d2;
      best = &wp;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return best->forecast;
}

RoutePlanner::RoutePlanner(const sailroute::core::IForecastProvider& provider,
                           const sailroute::polar::PolarDiagram& polar,
                           const Config& config)
    : provider_(provider), advisor_(polar), daylight_(config.daylight), config_(config) {}

RoutePlan RoutePlanner::plan_route(const RoutePlanningConfig& request) const {
  if (!sailroute::geo::is_valid(request.start_point)) {
    return reject(request, "Invalid start coordinates");
  }
  if (!sailroute::geo::is_valid(request.destination)) {
    return reject(request, "Invalid destination coordinates");
  }
  if (!std::isfinite(request.preferred_waypoint_interval_nm) || request.preferred_waypoint_interval_nm <= 0.0) {
    return reject(request, "Waypoint interval must be positive");
  }
  if (!std::isfinite(request.wind_threshold_kt) || request.wind_threshold_kt < 0.0) {
    return reject(request, "Engine wind threshold must be non-negative");
  }
  if (!std::isfinite(request.max_daily_distance_nm) || request.max_daily_distance_nm <= 0.0) {
    return reject(request, "Maximum daily distance must be positive");
  }
  if (!(config_.nominal_speed_kt > 0.0)) {
    return reject(request, "Nominal speed must be positive");
  }

  RoutePlan plan{};
  plan.total_distance_nm = sailroute::geo::distance_nm(request.start_point, request.destination);
  plan.initial_bearing_deg = sailroute::geo::bearing_deg(request.start_point, request.destination);
  plan.estimated_duration_h = plan.total_distance_nm / config_.nominal_speed_kt;

  const sailroute::weather::WeatherCorridorSampler sampler(provider_);
  plan.corridor = sampler.sample(request.start_point, request.destination, request.preferred_waypoint_interval_nm);
  if (plan.corridor.status != Status::Ok) {
    return reject(request, plan.corridor.message);
  }
  if (plan.corridor.weather_points.empty()) {
    plan.warnings.push_back("No corridor forecasts available; waypoint weather is unknown");
    spdlog::warn("{}", plan.warnings.back());
  }

  const double daily_run_nm = std::min(plan.total_distance_nm, config_.nominal_speed_kt * 24.0);
  if (daily_run_nm > request.max_daily_distance_nm) {
    plan.warnings.push_back(fmt::format("Daily run of {:.1f} nm exceeds the maximum daily distance of {:.1f} nm",
                                        daily_run_nm, request.max_daily_distance_nm));
    spdlog::warn("{}", plan.warnings.back());
  }

  const Epoch now = sailroute::core::now_utc();
  Epoch departure = request.preferred_departure.value_or(now);
  if (request.ensure_daytime_arrival) {
    const DepartureSolution solution =
        daylight_.required_departure(request.destination, plan.estimated_duration_h, departure);
    if (solution.adjusted) {
      spdlog::info("{}", solution.message);
    }
    departure = solution.departure_time;
    plan.departure = solution;
  }

  const std::size_t n = std::max<std::size_t>(
      2U, sailroute::weather::corridor_sample_count(plan.total_distance_nm, request.preferred_waypoint_interval_nm));

  auto& route = plan.route;
  route.id = fmt::format("route-{}", static_cast<long long>(now.utc_seconds));
  route.name = fmt::format("Route to {:.2f}°, {:.2f}°", request.destination.lat_deg, request.destination.lon_deg);
  route.created_at = now;
  route.updated_at = now;
  route.start_date = departure;
  route.waypoints.reserve(n);

  double elapsed_h = 0.0;
  double from_start_nm = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double fraction = static_cast<double>(i) / static_cast<double>(n - 1U);
    sailroute::core::Waypoint wp{};
    wp.id = fmt::format("waypoint-{}", i + 1U);
    wp.name = waypoint_name(i, n);
    wp.order = static_cast<int>(i) + 1;
    wp.coordinates = sailroute::geo::intermediate_point(request.start_point, request.destination, fraction);
    wp.cog_deg = plan.initial_bearing_deg;
    if (i > 0U) {
      const auto& prev = route.waypoints.back().coordinates;
      wp.leg_distance_nm = sailroute::geo::distance_nm(prev, wp.coordinates);
      wp.cog_deg = sailroute::geo::bearing_deg(prev, wp.coordinates);
    }
    wp.leg_time_h = wp.leg_distance_nm / config_.nominal_speed_kt;
    elapsed_h += wp.leg_time_h;
    from_start_nm += wp.leg_distance_nm;
    wp.elapsed_time_h = elapsed_h;
    wp.distance_from_start_nm = from_start_nm;
    wp.sog_kt = config_.nominal_speed_kt;
    wp.estimated_arrival = departure + elapsed_h * constants::kSecondsPerHour;
    wp.weather_forecast = nearest_forecast(plan.corridor, wp.coordinates);

    if (wp.weather_forecast) {
      const auto& f = *wp.weather_forecast;
      if (f.wind_speed_kt < request.wind_threshold_kt) {
        wp.sail_plan = sailroute::core::EngineDrive{};
      } else {
        const SailingMode mode = (request.avoid_storms && f.wind_speed_kt > config_.storm_wind_kt)
                                     ? SailingMode::Comfort
                                     : request.sailing_mode;
        const auto rec = advisor_.recommend(f.wind_speed_kt, true_wind_angle(f.wind_direction_deg, wp.cog_deg), mode);
        if (rec.status == Status::Ok) {
          wp.sail_plan = rec.configuration;
        } else {
          plan.warnings.push_back(fmt::format("{}: unusable forecast, sail plan left at default", wp.name));
          spdlog::warn("{}", plan.warnings.back());
        }
      }
    }

    if (request.ensure_daytime_arrival) {
      const auto check = daylight_.validate_arrival(wp);
      if (!check.is_valid) {
        plan.warnings.push_back(fmt::format("{}: {}", wp.name, check.message));
        spdlog::warn("{}", plan.warnings.back());
      }
    }
    route.waypoints.push_back(std::move(wp));
  }

  plan.message = fmt::format("{} waypoints over {:.1f} nm", route.waypoints.size(), plan.total_distance_nm);
  return plan;
}

}  // namespace sailroute::planner
