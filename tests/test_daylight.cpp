/**
 * @file test_daylight.cpp
 * @brief Daylight arrival solver and sun time tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "sailroute/core/time.hpp"
#include "sailroute/planner/daylight.hpp"
#include "sailroute/planner/sun_calculator.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

bool at(const sailroute::core::Epoch& t, int y, unsigned m, unsigned d, int hour, int minute = 0) {
  return approx(t.utc_seconds, sailroute::core::epoch_from_civil(y, m, d, hour, minute).utc_seconds, 1e-6);
}

}  // namespace

int main() {
  namespace planner = sailroute::planner;
  using sailroute::core::Coordinates;
  using sailroute::core::epoch_from_civil;

  const planner::DaylightValidator utc({.utc_offset_hours = 0.0});
  const Coordinates harbour{.lat_deg = 25.0, .lon_deg = -77.4};

  // Daylight arrival needs no change.
  const auto noon = utc.required_departure(harbour, 4.0, epoch_from_civil(2026, 3, 1, 8));
  if (noon.adjusted || !at(noon.departure_time, 2026, 3, 1, 8) || !at(noon.estimated_arrival, 2026, 3, 1, 12) ||
      noon.status != sailroute::core::Status::Ok) {
    spdlog::error("daylight arrival must not be adjusted");
    return 1;
  }

  // 22:00 arrival: leave five hours earlier to arrive at sunset minus the margin.
  const auto advanced = utc.required_departure(harbour, 12.0, epoch_from_civil(2026, 3, 1, 10));
  if (!advanced.adjusted || !at(advanced.departure_time, 2026, 3, 1, 5) ||
      !at(advanced.estimated_arrival, 2026, 3, 1, 17)) {
    spdlog::error("evening arrival should advance the departure: {}", sailroute::core::to_iso8601(advanced.departure_time));
    return 2;
  }

  // Advancing would mean a 01:00 start; arrive after the next sunrise instead.
  const auto next_morning = utc.required_departure(harbour, 16.0, epoch_from_civil(2026, 3, 1, 6));
  if (!next_morning.adjusted || !at(next_morning.departure_time, 2026, 3, 1, 15) ||
      !at(next_morning.estimated_arrival, 2026, 3, 2, 7)) {
    spdlog::error("early start should roll to the next morning: {}",
                  sailroute::core::to_iso8601(next_morning.departure_time));
    return 3;
  }

  // 03:00 arrival: wait four hours to arrive at sunrise plus the margin.
  const auto delayed = utc.required_departure(harbour, 7.0, epoch_from_civil(2026, 3, 1, 20));
  if (!delayed.adjusted || !at(delayed.departure_time, 2026, 3, 2, 0) || !at(delayed.estimated_arrival, 2026, 3, 2, 7)) {
    spdlog::error("pre-dawn arrival should delay the departure");
    return 4;
  }
  if (delayed.message.empty() || advanced.message.empty()) {
    spdlog::error("adjustments must explain themselves");
    return 5;
  }

  if (utc.required_departure(harbour, -1.0, epoch_from_civil(2026, 3, 1, 8)).status !=
      sailroute::core::Status::InvalidInput) {
    spdlog::error("negative passage must be rejected");
    return 6;
  }

  const planner::DaylightValidator nautical;
  if (nautical.utc_offset_hours(Coordinates{.lat_deg = 25.8, .lon_deg = -80.2}) != -5.0 ||
      nautical.utc_offset_hours(Coordinates{.lat_deg = 0.0, .lon_deg = 7.4}) != 0.0) {
    spdlog::error("nautical zone offset mismatch");
    return 7;
  }

  sailroute::core::Waypoint wp{.name = "Waypoint 1", .coordinates = harbour};
  const auto unset = utc.validate_arrival(wp);
  if (unset.is_valid || unset.message != "No estimated arrival time set") {
    spdlog::error("missing ETA must be reported");
    return 8;
  }
  wp.estimated_arrival = epoch_from_civil(2026, 3, 1, 12);
  const auto ok = utc.validate_arrival(wp);
  wp.estimated_arrival = epoch_from_civil(2026, 3, 1, 20);
  const auto dark = utc.validate_arrival(wp);
  if (!ok.is_valid || !ok.sunrise || !at(*ok.sunrise, 2026, 3, 1, 6) || dark.is_valid || dark.message.empty()) {
    spdlog::error("arrival validation mismatch");
    return 9;
  }

  // Almanac sun times at the equator near the equinox.
  const auto equinox = planner::usno_sun_events(0.0, 0.0, 80);
  if (equinox.never_rises || equinox.never_sets || !approx(equinox.sunrise_utc_h, 6.1, 0.3) ||
      !approx(equinox.sunset_utc_h, 18.1, 0.3)) {
    spdlog::error("equinox sun times mismatch: {} {}", equinox.sunrise_utc_h, equinox.sunset_utc_h);
    return 10;
  }

  const planner::DaylightValidator almanac({.sun_model = planner::SunModel::Astronomical, .utc_offset_hours = 0.0});
  const Coordinates svalbard{.lat_deg = 78.2, .lon_deg = 15.6};
  const auto midsummer = epoch_from_civil(2026, 6, 21, 23);
  const auto midwinter = epoch_from_civil(2026, 12, 21, 12);
  if (almanac.sun_times(svalbard, midsummer).state != planner::SunState::AlwaysDay ||
      !almanac.is_daylight(midsummer, svalbard) ||
      almanac.sun_times(svalbard, midwinter).state != planner::SunState::AlwaysNight ||
      almanac.is_daylight(midwinter, svalbard)) {
    spdlog::error("polar day/night handling mismatch");
    return 11;
  }
  const auto polar_night = almanac.required_departure(svalbard, 10.0, epoch_from_civil(2026, 12, 21, 0));
  if (polar_night.adjusted || polar_night.message.empty() || !at(polar_night.departure_time, 2026, 12, 21, 0)) {
    spdlog::error("polar night must leave the departure unchanged with a note");
    return 12;
  }

  const auto equator = almanac.sun_times(Coordinates{.lat_deg = 0.0, .lon_deg = 0.0}, epoch_from_civil(2026, 3, 21, 12));
  const double rise_h = sailroute::core::local_hour_of_day(equator.sunrise, 0.0);
  const double set_h = sailroute::core::local_hour_of_day(equator.sunset, 0.0);
  if (equator.state != planner::SunState::Normal || !approx(rise_h, 6.1, 0.3) || !approx(set_h, 18.1, 0.3)) {
    spdlog::error("astronomical sun times mismatch: {} {}", rise_h, set_h);
    return 13;
  }

  return 0;
}
