/**
 * @file simulate_cli.cpp
 * @brief Weather replay CLI: plans a passage and runs the keyframe simulation against it.
 * @author Watosn
 */

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "sailroute/core/time.hpp"
#include "sailroute/geo/coordinate_parser.hpp"
#include "sailroute/planner/route_planner.hpp"
#include "sailroute/polar/lagoon440.hpp"
#include "sailroute/simulation/manual_position_source.hpp"
#include "sailroute/simulation/simulation_engine.hpp"
#include "sailroute/weather/static_provider.hpp"

namespace {

namespace sim = sailroute::simulation;

class PrintingObserver final : public sim::ISimulationObserver {
 public:
  explicit PrintingObserver(sim::ManualPositionSource& gps) : gps_(gps) {}

  void on_weather_update(const sim::SimulatedWeather& w) override {
    fmt::print("hour={:.0f} wind_kt={:.1f} dir_deg={:.0f} gust_kt={:.1f} wave_m={:.1f} sea={} storm={} squalls={}\n",
               w.hour, w.wind_speed_kt, w.wind_direction_deg, w.gust_speed_kt, w.wave_height_m,
               sim::to_string(w.conditions), w.has_storm ? "yes" : "no", w.squalls.size());
    if (w.boat_position) {
      (void)gps_.push(*w.boat_position);
    }
  }

  void on_storm_alert(const sim::StormAlert& alert) override {
    fmt::print("  alert id={} type={} severity={} waypoints={} \"{}\"\n", alert.id, sim::to_string(alert.type),
               sim::to_string(alert.severity), alert.affected_waypoints.size(), alert.message);
  }

  void on_route_deviation(const sailroute::core::Route& route) override {
    fmt::print("  deviation route=\"{}\" waypoints={}\n", route.name, route.waypoints.size());
  }

 private:
  sim::ManualPositionSource& gps_;
};

}  // namespace

int main(int argc, char** argv) {
  if (argc < 3 || argc > 6) {
    spdlog::error("usage: simulate_cli <start> <destination> [ticks] [tick_ms] [interval_nm]");
    return 1;
  }

  const auto start = sailroute::geo::parse_coordinates(argv[1]);
  const auto dest = sailroute::geo::parse_coordinates(argv[2]);
  if (start.status != sailroute::core::Status::Ok || dest.status != sailroute::core::Status::Ok) {
    spdlog::error("could not parse start '{}' or destination '{}'", argv[1], argv[2]);
    return 1;
  }
  const int ticks = (argc >= 4) ? std::atoi(argv[3]) : 8;
  const int tick_ms = (argc >= 5) ? std::atoi(argv[4]) : 250;
  const double interval_nm = (argc >= 6) ? std::atof(argv[5]) : 50.0;
  if (ticks <= 0 || tick_ms <= 0) {
    spdlog::error("ticks and tick_ms must be positive");
    return 1;
  }

  const sailroute::weather::StaticForecastProvider forecasts(sailroute::core::WindForecast{
      .timestamp = sailroute::core::now_utc(), .wind_speed_kt = 15.0, .wind_direction_deg = 120.0,
      .gust_speed_kt = 19.0, .wave_height_m = 1.5});
  const sailroute::planner::RoutePlanner planner(forecasts, sailroute::polar::lagoon440());
  const auto plan = planner.plan_route(sailroute::planner::RoutePlanningConfig{
      .start_point = start.coordinates,
      .destination = dest.coordinates,
      .preferred_waypoint_interval_nm = interval_nm,
  });
  if (plan.status != sailroute::core::Status::Ok) {
    spdlog::error("planning failed: {}", plan.message);
    return 2;
  }
  spdlog::info("simulating '{}' with {} waypoint(s)", plan.route.name, plan.route.waypoints.size());

  sim::ManualPositionSource gps;
  auto fixes = gps.watch([](const sailroute::core::Coordinates& c) {
    fmt::print("  fix {}\n", sailroute::geo::format_ddm(c));
  });

  sim::SteadyTickScheduler scheduler;
  sim::SimulationEngine::Config config{};
  config.tick_period = std::chrono::milliseconds(tick_ms);
  sim::SimulationEngine engine(scheduler, config);
  PrintingObserver observer(gps);

  engine.start(plan.route, observer);
  while (engine.is_running() && engine.tick_count() < static_cast<std::uint64_t>(ticks)) {
    std::this_thread::sleep_until(scheduler.next_due());
    scheduler.poll();
  }
  engine.stop();
  fixes.unsubscribe();
  fmt::print("ticks={} final_hour={:.0f}\n", engine.tick_count(), engine.current_hour());
  return 0;
}
