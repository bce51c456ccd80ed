/**
 * @file simulation_engine.hpp
 * @brief Tick-driven weather replay over a route with hazard alerts and reroutes.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

#include "sailroute/core/types.hpp"
#include "sailroute/simulation/hazard_detector.hpp"
#include "sailroute/simulation/tick_scheduler.hpp"
#include "sailroute/simulation/weather_keyframes.hpp"

namespace sailroute::simulation {

/**
 * @brief Receiver of simulation events. Callbacks may call `SimulationEngine::stop()`.
 */
class ISimulationObserver {
 public:
  virtual ~ISimulationObserver() = default;
  virtual void on_weather_update(const SimulatedWeather& weather) = 0;
  virtual void on_storm_alert(const StormAlert& alert) = 0;
  virtual void on_route_deviation(const sailroute::core::Route& route) = 0;
};

/**
 * @brief One simulation run at a time, advanced by a tick scheduler.
 *
 * Each tick advances virtual time by `hours_per_tick`, interpolates the keyframe
 * story, moves the boat along the route, reports hazards and proposes at most one
 * storm reroute per storm episode. Virtual time loops back to 0 at `loop_hour`.
 */
class SimulationEngine {
 public:
  struct Config {
    std::chrono::milliseconds tick_period{5000};
    double hours_per_tick{12.0};
    double loop_hour{84.0};
    double voyage_hours{96.0};
    double storm_visibility_fraction{0.5};
    double squall_jitter_deg{0.1};  ///< squall centers move up to this much per tick; 0 disables
    std::uint32_t seed{5489U};
    std::vector<WeatherKeyframe> keyframes{default_keyframes()};
    HazardThresholds thresholds{};
    DeviationConfig deviation{};
  };

  /**
   * @param scheduler Timer source; must outlive the engine.
   */
  explicit SimulationEngine(ITickScheduler& scheduler) : SimulationEngine(scheduler, Config{}) {}
  SimulationEngine(ITickScheduler& scheduler, Config config);
  ~SimulationEngine();

  SimulationEngine(const SimulationEngine&) = delete;
  SimulationEngine& operator=(const SimulationEngine&) = delete;

  /**
   * @brief Begin a run, stopping any previous one first.
   *
   * Emits the hour-0 weather immediately, then arms the tick timer.
   * @param observer Event sink; must stay valid until `stop()` or destruction.
   */
  void start(sailroute::core::Route route, ISimulationObserver& observer);

  /**
   * @brief Cancel the timer and drop the observer. Idempotent; no callback fires afterwards.
   */
  void stop();

  [[nodiscard]] bool is_running() const { return running_; }
  [[nodiscard]] double current_hour() const { return hour_; }
  [[nodiscard]] std::uint64_t tick_count() const { return ticks_; }
  [[nodiscard]] const sailroute::core::Route& route() const { return route_; }
  [[nodiscard]] const Config& config() const { return config_; }

  /**
   * @brief Keyframe weather at `hour` with the boat placed on the current route.
   *
   * Squall jitter is applied only to tick weather, so queries leave the run's random stream untouched.
   */
  [[nodiscard]] SimulatedWeather weather_at(double hour) const;

 private:
  void on_tick();
  [[nodiscard]] SimulatedWeather tick_weather(double hour);
  [[nodiscard]] sailroute::core::Epoch virtual_time() const;

  ITickScheduler& scheduler_;
  Config config_{};
  std::mt19937 rng_{};
  sailroute::core::Route route_{};
  ISimulationObserver* observer_{};
  std::optional<TimerId> timer_{};
  sailroute::core::Epoch origin_{};
  double hour_{};
  std::uint64_t ticks_{};
  std::uint64_t run_{};  ///< bumped by start() and stop()
  bool running_{};
  bool deviation_reported_{};
};

}  // namespace sailroute::simulation
