/**
 * @file types.hpp
 * @brief Core domain types for sailroute.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace sailroute::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotImplemented, DataUnavailable, NumericalError };

/**
 * @brief Sailing style requested by the skipper.
 */
enum class SailingMode : std::uint8_t { Speed, Comfort, Mixed };

/**
 * @brief UTC epoch expressed as seconds since Unix epoch.
 */
struct Epoch {
  double utc_seconds{};
};

inline Epoch operator+(const Epoch& e, double seconds) { return Epoch{e.utc_seconds + seconds}; }
inline Epoch operator-(const Epoch& e, double seconds) { return Epoch{e.utc_seconds - seconds}; }
inline double operator-(const Epoch& a, const Epoch& b) { return a.utc_seconds - b.utc_seconds; }
inline bool operator<(const Epoch& a, const Epoch& b) { return a.utc_seconds < b.utc_seconds; }
inline bool operator<=(const Epoch& a, const Epoch& b) { return a.utc_seconds <= b.utc_seconds; }
inline bool operator==(const Epoch& a, const Epoch& b) { return a.utc_seconds == b.utc_seconds; }

/**
 * @brief Point on the Earth surface in decimal degrees.
 */
struct Coordinates {
  double lat_deg{};
  double lon_deg{};
};

/**
 * @brief Point-in-time weather sample. Wind direction is where the wind blows FROM.
 */
struct WindForecast {
  Epoch timestamp{};
  double wind_speed_kt{};
  double wind_direction_deg{};
  double gust_speed_kt{};
  double wave_height_m{};
};

/**
 * @brief Which sails are set.
 */
struct SailConfiguration {
  bool main_sail{};
  bool jib{};
  bool asymmetrical{};
  bool spinnaker{};
  bool code_zero{};
  bool storm_jib{};
};

/**
 * @brief Motoring marker for legs sailed under engine.
 */
struct EngineDrive {};

/**
 * @brief Propulsion decided for one leg: engine or a set of sails.
 */
using SailPlan = std::variant<EngineDrive, SailConfiguration>;

[[nodiscard]] inline bool any_sail_set(const SailConfiguration& c) {
  return c.main_sail || c.jib || c.asymmetrical || c.spinnaker || c.code_zero || c.storm_jib;
}

/**
 * @brief Compact label for a set of sails, e.g. "Main+Jib". Falls back to "Main+Jib" when nothing is set.
 */
[[nodiscard]] inline std::string sail_label(const SailConfiguration& c) {
  if (!any_sail_set(c)) {
    return "Main+Jib";
  }
  std::string out;
  const auto append = [&out](bool set, const char* name) {
    if (!set) {
      return;
    }
    if (!out.empty()) {
      out += '+';
    }
    out += name;
  };
  append(c.main_sail, "Main");
  append(c.jib, "Jib");
  append(c.asymmetrical, "Asym");
  append(c.spinnaker, "Spinnaker");
  append(c.code_zero, "Code0");
  append(c.storm_jib, "StormJib");
  return out;
}

/**
 * @brief Display label for a sail plan; "Engine" for motoring legs.
 */
[[nodiscard]] inline std::string sail_plan_label(const SailPlan& plan) {
  return std::visit(
      [](const auto& p) -> std::string {
        if constexpr (std::is_same_v<std::decay_t<decltype(p)>, EngineDrive>) {
          return "Engine";
        } else {
          return sail_label(p);
        }
      },
      plan);
}

[[nodiscard]] inline bool uses_engine(const SailPlan& plan) { return std::holds_alternative<EngineDrive>(plan); }

/**
 * @brief One route vertex with its planned timing and conditions.
 *
 * An absent `weather_forecast` means the conditions are unknown, not calm.
 */
struct Waypoint {
  std::string id{};
  std::string name{};
  Coordinates coordinates{};
  int order{};
  SailPlan sail_plan{SailConfiguration{}};
  std::optional<WindForecast> weather_forecast{};
  std::optional<Epoch> estimated_arrival{};
  double elapsed_time_h{};
  double leg_time_h{};
  double distance_from_start_nm{};
  double leg_distance_nm{};
  double cog_deg{};
  double sog_kt{};
};

/**
 * @brief Ordered passage plan. First waypoint is the start, last the destination.
 */
struct Route {
  std::string id{};
  std::string name{};
  std::vector<Waypoint> waypoints{};
  Epoch created_at{};
  Epoch updated_at{};
  std::optional<Epoch> start_date{};
};

}  // namespace sailroute::core
