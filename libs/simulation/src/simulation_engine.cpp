/**
 * @file simulation_engine.cpp
 * @brief Simulation engine implementation.
 * @author Watosn
 */

#include "sailroute/simulation/simulation_engine.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "sailroute/core/constants.hpp"
#include "sailroute/core/time.hpp"
#include "sailroute/geo/geo_math.hpp"

namespace sailroute::simulation {

namespace constants = sailroute::core::constants;

SimulationEngine::SimulationEngine(ITickScheduler& scheduler, Config config)
    : scheduler_(scheduler), config_(std::move(config)), rng_(config_.seed) {}

SimulationEngine::~SimulationEngine() { stop(); }

void SimulationEngine::start(sailroute::core::Route route, ISimulationObserver& observer) {
  if (running_) {
    stop();
  }

  ++run_;
  const std::uint64_t run = run_;
  route_ = std::move(route);
  observer_ = &observer;
  origin_ = route_.start_date.value_or(sailroute::core::now_utc());
  hour_ = 0.0;
  ticks_ = 0;
  deviation_reported_ = false;
  rng_.seed(config_.seed);
  running_ = true;
  spdlog::info("simulation started: route '{}', {} waypoint(s), {} ms per {:.0f} h", route_.name,
               route_.waypoints.size(), config_.tick_period.count(), config_.hours_per_tick);

  const SimulatedWeather initial = tick_weather(hour_);
  observer_->on_weather_update(initial);
  if (run_ != run) {
    return;
  }
  timer_ = scheduler_.schedule_every(config_.tick_period, [this]() { on_tick(); });
}

void SimulationEngine::stop() {
  ++run_;
  if (timer_) {
    scheduler_.cancel(*timer_);
    timer_.reset();
  }
  observer_ = nullptr;
  if (running_) {
    running_ = false;
    spdlog::info("simulation stopped at hour {:.0f} after {} tick(s)", hour_, ticks_);
  }
}

sailroute::core::Epoch SimulationEngine::virtual_time() const {
  return origin_ + static_cast<double>(ticks_) * config_.hours_per_tick * constants::kSecondsPerHour;
}

SimulatedWeather SimulationEngine::weather_at(double hour) const {
  SimulatedWeather weather = interpolate_keyframes(config_.keyframes, hour, config_.storm_visibility_fraction);
  if (const auto fix = boat_position(route_, hour, config_.voyage_hours)) {
    weather.boat_position = fix->position;
    weather.current_leg_index = fix->leg_index;
  }
  return weather;
}

SimulatedWeather SimulationEngine::tick_weather(double hour) {
  SimulatedWeather weather = weather_at(hour);
  if (config_.squall_jitter_deg > 0.0) {
    std::uniform_real_distribution<double> jitter(-config_.squall_jitter_deg, config_.squall_jitter_deg);
    for (auto& squall : weather.squalls) {
      squall.location.lat_deg += jitter(rng_);
      squall.location.lon_deg = sailroute::geo::wrap_longitude(squall.location.lon_deg + jitter(rng_));
    }
  }
  return weather;
}

void SimulationEngine::on_tick() {
  if (!running_ || observer_ == nullptr) {
    return;
  }
  // A callback may stop or restart the engine; the rest of this tick belongs to the old run.
  const std::uint64_t run = run_;
  ++ticks_;
  hour_ += config_.hours_per_tick;
  const sailroute::core::Epoch now = virtual_time();

  const SimulatedWeather weather = tick_weather(hour_);
  observer_->on_weather_update(weather);
  if (run_ != run) {
    return;
  }

  for (const auto& alert : detect_hazards(weather, route_, now, ticks_, config_.thresholds)) {
    spdlog::warn("[{}/{}] {}", to_string(alert.type), to_string(alert.severity), alert.message);
    observer_->on_storm_alert(alert);
    if (run_ != run) {
      return;
    }
  }

  if (!weather.has_storm) {
    deviation_reported_ = false;
  } else if (!deviation_reported_) {
    const sailroute::core::Route deviated = make_deviated_route(route_, weather, now, config_.deviation);
    if (deviated.waypoints.size() != route_.waypoints.size()) {
      deviation_reported_ = true;
      spdlog::info("storm avoidance reroute proposed: '{}'", deviated.name);
      observer_->on_route_deviation(deviated);
      if (run_ != run) {
        return;
      }
    }
  }

  if (hour_ >= config_.loop_hour) {
    hour_ = 0.0;
  }
}

}  // namespace sailroute::simulation
