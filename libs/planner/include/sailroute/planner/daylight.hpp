/**
 * @file daylight.hpp
 * @brief Daylight tests and departure-time solving for daytime landfall.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "sailroute/core/types.hpp"

namespace sailroute::planner {

/**
 * @brief How sunrise and sunset are obtained.
 */
enum class SunModel : std::uint8_t {
  FixedClock,    ///< constant local sunrise/sunset hours
  Astronomical,  ///< USNO almanac algorithm
};

enum class SunState : std::uint8_t { Normal, AlwaysDay, AlwaysNight };

/**
 * @brief Sunrise and sunset of the local day containing a query instant.
 */
struct SunTimes {
  sailroute::core::Epoch sunrise{};
  sailroute::core::Epoch sunset{};
  double utc_offset_hours{};
  SunState state{SunState::Normal};
};

struct DepartureSolution {
  sailroute::core::Epoch departure_time{};
  sailroute::core::Epoch estimated_arrival{};
  bool adjusted{};
  std::string message{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

struct ArrivalValidation {
  bool is_valid{};
  std::optional<sailroute::core::Epoch> sunrise{};
  std::optional<sailroute::core::Epoch> sunset{};
  std::string message{};
};

/**
 * @brief Decides whether instants fall in daylight and when to leave to land in daylight.
 */
class DaylightValidator {
 public:
  struct Config {
    SunModel sun_model{SunModel::FixedClock};
    /// Local clock offset; defaults to the nautical zone round(lon / 15).
    std::optional<double> utc_offset_hours{};
    double sunrise_hour{6.0};
    double sunset_hour{18.0};
    /// Arrivals are placed this far inside the daylight window.
    double arrival_margin_h{1.0};
    /// Advancing a departure earlier than this local hour delays to the next morning instead.
    double earliest_departure_hour{4.0};
  };

  DaylightValidator() = default;
  explicit DaylightValidator(const Config& config) : config_(config) {}

  [[nodiscard]] double utc_offset_hours(const sailroute::core::Coordinates& coordinates) const;

  [[nodiscard]] SunTimes sun_times(const sailroute::core::Coordinates& coordinates,
                                   const sailroute::core::Epoch& instant) const;

  /**
   * @brief True when sunrise <= instant <= sunset at the location.
   */
  [[nodiscard]] bool is_daylight(const sailroute::core::Epoch& instant,
                                 const sailroute::core::Coordinates& coordinates) const;

  /**
   * @brief Departure time that lands at `destination` in daylight after `total_hours` under way.
   *
   * A night arrival before sunrise delays the departure to arrive at sunrise plus the margin.
   * An arrival after sunset advances it to arrive at sunset minus the margin, unless that
   * departure would leave before the earliest departure hour or on an earlier local day; then
   * the arrival moves to the next sunrise plus the margin.
   */
  [[nodiscard]] DepartureSolution required_departure(const sailroute::core::Coordinates& destination,
                                                     double total_hours,
                                                     const sailroute::core::Epoch& preferred_departure) const;

  /**
   * @brief Daylight check of a waypoint ETA at the waypoint position.
   */
  [[nodiscard]] ArrivalValidation validate_arrival(const sailroute::core::Waypoint& waypoint) const;

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace sailroute::planner
