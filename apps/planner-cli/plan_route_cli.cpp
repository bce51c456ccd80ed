/**
 * @file plan_route_cli.cpp
 * @brief Passage planning CLI: waypoints, ETAs and sail plans for a start/destination pair.
 * @author Watosn
 */

#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/core/time.hpp"
#include "sailroute/geo/coordinate_parser.hpp"
#include "sailroute/planner/route_planner.hpp"
#include "sailroute/polar/lagoon440.hpp"
#include "sailroute/polar/polar_csv.hpp"
#include "sailroute/weather/csv_forecast_provider.hpp"
#include "sailroute/weather/static_provider.hpp"

namespace {

sailroute::core::SailingMode parse_mode(const std::string& name) {
  if (name == "speed") {
    return sailroute::core::SailingMode::Speed;
  }
  if (name == "comfort") {
    return sailroute::core::SailingMode::Comfort;
  }
  return sailroute::core::SailingMode::Mixed;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 10) {
    spdlog::error(
        "usage: plan_route_cli <start> <destination> [mode] [interval_nm] [departure_utc_s] [daylight:0|1] "
        "[engine_below_kt] [forecast_csv] [polar_csv]");
    spdlog::error("positions: \"25.7617, -80.1918\" | \"25 45.702 N, 80 11.508 W\" | DMS");
    spdlog::error("modes: speed | comfort | mixed");
    return 1;
  }

  const auto start = sailroute::geo::parse_coordinates(argv[1]);
  const auto dest = sailroute::geo::parse_coordinates(argv[2]);
  if (start.status != sailroute::core::Status::Ok || dest.status != sailroute::core::Status::Ok) {
    spdlog::error("could not parse start '{}' or destination '{}'", argv[1], argv[2]);
    return 1;
  }

  sailroute::planner::RoutePlanningConfig request{
      .start_point = start.coordinates,
      .destination = dest.coordinates,
      .sailing_mode = parse_mode((argc >= 4) ? argv[3] : "mixed"),
  };
  if (argc >= 5) {
    request.preferred_waypoint_interval_nm = std::atof(argv[4]);
  }
  if (argc >= 6) {
    request.preferred_departure = sailroute::core::Epoch{std::atof(argv[5])};
  }
  request.ensure_daytime_arrival = (argc >= 7) ? (std::atoi(argv[6]) != 0) : false;
  if (argc >= 8) {
    request.wind_threshold_kt = std::atof(argv[7]);
  }
  const std::string forecast_csv = (argc >= 9) ? argv[8] : "";
  const std::string polar_csv = (argc >= 10) ? argv[9] : "";

  std::unique_ptr<sailroute::core::IForecastProvider> forecasts{};
  if (!forecast_csv.empty()) {
    auto grid = sailroute::weather::CsvForecastProvider::Create(
        sailroute::weather::CsvForecastProvider::Config{.csv_file = forecast_csv, .valid_time = sailroute::core::now_utc()});
    spdlog::info("forecast grid: {} node(s)", grid->size());
    forecasts = std::move(grid);
  } else {
    const sailroute::core::WindForecast trade{.timestamp = sailroute::core::now_utc(),
                                              .wind_speed_kt = 15.0,
                                              .wind_direction_deg = 120.0,
                                              .gust_speed_kt = 19.0,
                                              .wave_height_m = 1.5};
    forecasts = std::make_unique<sailroute::weather::StaticForecastProvider>(trade);
  }

  sailroute::polar::PolarDiagram polar = sailroute::polar::lagoon440();
  if (!polar_csv.empty()) {
    auto loaded = sailroute::polar::load_polar_csv(polar_csv);
    if (loaded.status != sailroute::core::Status::Ok) {
      spdlog::error("polar load failed: {}", loaded.message);
      return 2;
    }
    polar = std::move(loaded.diagram);
  }

  const sailroute::planner::RoutePlanner planner(*forecasts, polar);
  const auto plan = planner.plan_route(request);
  if (plan.status != sailroute::core::Status::Ok) {
    spdlog::error("planning failed: {}", plan.message);
    return 3;
  }

  const double offset = sailroute::planner::DaylightValidator{}.utc_offset_hours(request.destination);
  fmt::print("route={} distance_nm={:.1f} bearing_deg={:.1f} duration_h={:.1f}\n", plan.route.name,
             plan.total_distance_nm, plan.initial_bearing_deg, plan.estimated_duration_h);
  if (plan.route.start_date) {
    fmt::print("departure={} ({})\n", sailroute::core::to_iso8601(*plan.route.start_date),
               sailroute::core::to_local_string(*plan.route.start_date, offset));
  }
  if (plan.departure && plan.departure->adjusted) {
    fmt::print("departure_note={}\n", plan.departure->message);
  }
  fmt::print("corridor samples={}/{} wind_avg_kt={:.1f} wind_max_kt={:.1f} wave_avg_m={:.1f} wave_max_m={:.1f}\n",
             plan.corridor.weather_points.size(), plan.corridor.samples_requested, plan.corridor.average_wind_speed_kt,
             plan.corridor.max_wind_speed_kt, plan.corridor.average_wave_height_m, plan.corridor.max_wave_height_m);

  fmt::print("{:>3} {:<14} {:<28} {:>8} {:>6} {:>7} {:<22} {}\n", "#", "name", "position", "leg_nm", "cog", "elapsed",
             "eta_utc", "sails");
  for (const auto& wp : plan.route.waypoints) {
    const std::string eta = wp.estimated_arrival ? sailroute::core::to_iso8601(*wp.estimated_arrival) : "-";
    std::string wind = "wind=unknown";
    if (wp.weather_forecast) {
      wind = fmt::format("wind={:.0f}kt@{:.0f}", wp.weather_forecast->wind_speed_kt,
                         wp.weather_forecast->wind_direction_deg);
    }
    fmt::print("{:>3} {:<14} {:<28} {:>8.1f} {:>6.1f} {:>7.1f} {:<22} {} {}\n", wp.order, wp.name,
               sailroute::geo::format_ddm(wp.coordinates), wp.leg_distance_nm, wp.cog_deg, wp.elapsed_time_h, eta,
               sailroute::core::sail_plan_label(wp.sail_plan), wind);
  }
  for (const auto& warning : plan.warnings) {
    fmt::print("warning: {}\n", warning);
  }
  return 0;
}
