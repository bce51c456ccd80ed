/**
 * @file test_hazard_detector.cpp
 * @brief Storm, squall, wind and wave alert tests plus storm rerouting.
 * @author Watosn
 */

#include <string>

#include <spdlog/spdlog.h>

#include "sailroute/simulation/hazard_detector.hpp"

namespace {

sailroute::core::Waypoint named(const char* name, double lat, double lon) {
  return sailroute::core::Waypoint{.name = name, .coordinates = {.lat_deg = lat, .lon_deg = lon}};
}

}  // namespace

int main() {
  namespace sim = sailroute::simulation;
  using sailroute::core::Coordinates;

  const sailroute::core::Route route{
      .name = "Passage",
      .waypoints = {named("Start", 27.0, -80.0), named("Eye", 28.5, -70.0), named("Destination", 30.0, -60.0)}};
  const sailroute::core::Epoch now{1767225600.0};

  sim::SimulatedWeather storm{.wind_speed_kt = 35.0,
                              .wind_direction_deg = 160.0,
                              .wave_height_m = 4.0,
                              .gust_speed_kt = 45.0,
                              .has_storm = true,
                              .storm_location = Coordinates{28.5, -70.0},
                              .storm_radius_nm = 50.0,
                              .squalls = {sim::Squall{Coordinates{28.5, -70.1}, 12.0, 40.0},
                                          sim::Squall{Coordinates{10.0, 10.0}, 5.0, 50.0}}};

  const auto alerts = sim::detect_hazards(storm, route, now, 7);
  if (alerts.size() != 3U || alerts[0].id != "squall-7-1" || alerts[1].id != "storm-7" || alerts[2].id != "wave-7") {
    spdlog::error("expected squall, storm and wave alerts, got {}", alerts.size());
    return 1;
  }
  if (alerts[0].severity != sim::AlertSeverity::Warning || alerts[0].affected_waypoints.size() != 1U ||
      alerts[0].affected_waypoints.front() != "Eye" || alerts[0].message.find("Near waypoints: Eye") == std::string::npos) {
    spdlog::error("squall alert content mismatch: {}", alerts[0].message);
    return 2;
  }
  if (alerts[1].type != sim::AlertType::Storm || alerts[1].severity != sim::AlertSeverity::Warning ||
      alerts[1].location.lat_deg != 28.5 || !(alerts[1].timestamp == now)) {
    spdlog::error("storm alert content mismatch");
    return 3;
  }
  if (alerts[2].severity != sim::AlertSeverity::Advisory || alerts[2].location.lat_deg != 27.0) {
    spdlog::error("4.0 m waves are an advisory located at the start");
    return 4;
  }

  sim::SimulatedWeather breezy{.wind_speed_kt = 28.0, .wave_height_m = 1.0, .gust_speed_kt = 34.0};
  const auto wind = sim::detect_hazards(breezy, route, now, 1);
  breezy.wind_speed_kt = 36.0;
  const auto gale = sim::detect_hazards(breezy, route, now, 2);
  if (wind.size() != 1U || wind[0].id != "wind-1" || wind[0].severity != sim::AlertSeverity::Advisory ||
      gale.size() != 1U || gale[0].severity != sim::AlertSeverity::Warning ||
      sim::to_string(gale[0].type) != "high_wind") {
    spdlog::error("high wind alert mismatch");
    return 5;
  }
  storm.wind_speed_kt = 25.0;
  const auto watch = sim::detect_hazards(storm, route, now, 3);
  if (watch.size() != 3U || watch[1].severity != sim::AlertSeverity::Watch) {
    spdlog::error("moderate storm should be a watch");
    return 6;
  }
  if (!sim::detect_hazards(storm, sailroute::core::Route{}, now, 4).empty()) {
    spdlog::error("empty route has no hazards");
    return 7;
  }

  const auto deviated = sim::make_deviated_route(route, storm, now);
  if (deviated.waypoints.size() != 4U || deviated.name != "Passage (Storm Avoidance)" || !(deviated.updated_at == now)) {
    spdlog::error("storm reroute not inserted");
    return 8;
  }
  const auto& detour = deviated.waypoints[1];
  if (detour.name != "Storm Avoidance" || detour.coordinates.lat_deg != 30.0 || detour.coordinates.lon_deg != -68.0 ||
      detour.order != 2 || deviated.waypoints[2].order != 3 || deviated.waypoints[3].order != 4 ||
      !detour.estimated_arrival || *detour.estimated_arrival - now != 16.0 * 3600.0 ||
      !deviated.waypoints[2].estimated_arrival || *deviated.waypoints[2].estimated_arrival - now != 24.0 * 3600.0 ||
      !detour.weather_forecast || detour.weather_forecast->wind_speed_kt != 20.0 ||
      sailroute::core::sail_plan_label(detour.sail_plan) != "Main+Jib") {
    spdlog::error("detour waypoint mismatch");
    return 9;
  }

  const auto calm = sim::make_deviated_route(route, breezy, now);
  sim::SimulatedWeather elsewhere = storm;
  elsewhere.storm_location = Coordinates{0.0, 0.0};
  const auto missed = sim::make_deviated_route(route, elsewhere, now);
  if (calm.waypoints.size() != 3U || missed.waypoints.size() != 3U || missed.name != "Passage") {
    spdlog::error("routes clear of the storm must be unchanged");
    return 10;
  }

  sim::SimulatedWeather polar = storm;
  polar.storm_location = Coordinates{89.5, 179.0};
  const sailroute::core::Route high{.name = "High", .waypoints = {named("Pole", 89.6, 179.0)}};
  const auto wrapped = sim::make_deviated_route(high, polar, now);
  if (wrapped.waypoints.size() != 2U || wrapped.waypoints[0].coordinates.lat_deg != 90.0 ||
      wrapped.waypoints[0].coordinates.lon_deg != -179.0) {
    spdlog::error("detour must clamp latitude and wrap longitude");
    return 11;
  }

  return 0;
}
