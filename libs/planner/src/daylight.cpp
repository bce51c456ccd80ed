/**
 * @file daylight.cpp
 * @brief Daylight validation implementation.
 * @author Watosn
 */

#include "sailroute/planner/daylight.hpp"

#include <cmath>

#include <fmt/format.h>

#include "sailroute/core/constants.hpp"
#include "sailroute/core/time.hpp"
#include "sailroute/geo/geo_math.hpp"
#include "sailroute/planner/sun_calculator.hpp"

namespace sailroute::planner {
namespace {

using sailroute::core::Epoch;
using sailroute::core::Status;
namespace constants = sailroute::core::constants;

double wrap_hours(double h) {
  h = std::fmod(h, 24.0);
  return h < 0.0 ? h + 24.0 : h;
}

std::string clock_text(const Epoch& t, double utc_offset_hours) {
  const auto c = sailroute::core::civil_from_epoch(t, utc_offset_hours);
  return fmt::format("{:02d}:{:02d}", c.hour, c.minute);
}

}  // namespace

double DaylightValidator::utc_offset_hours(const sailroute::core::Coordinates& coordinates) const {
  if (config_.utc_offset_hours) {
    return *config_.utc_offset_hours;
  }
  return std::round(coordinates.lon_deg / 15.0);
}

SunTimes DaylightValidator::sun_times(const sailroute::core::Coordinates& coordinates, const Epoch& instant) const {
  const double offset = utc_offset_hours(coordinates);
  const Epoch day_start = sailroute::core::local_day_start(instant, offset);
  SunTimes out{.utc_offset_hours = offset};

  if (config_.sun_model == SunModel::FixedClock) {
    out.sunrise = day_start + config_.sunrise_hour * constants::kSecondsPerHour;
    out.sunset = day_start + config_.sunset_hour * constants::kSecondsPerHour;
    return out;
  }

  const auto civil = sailroute::core::civil_from_epoch(instant, offset);
  const SunEvents ev = usno_sun_events(coordinates.lat_deg, coordinates.lon_deg, civil.day_of_year);
  if (ev.never_rises || ev.never_sets) {
    out.state = ev.never_sets ? SunState::AlwaysDay : SunState::AlwaysNight;
    out.sunrise = day_start;
    out.sunset = ev.never_sets ? day_start + constants::kSecondsPerDay : day_start;
    return out;
  }
  const double rise_local = wrap_hours(ev.sunrise_utc_h + offset);
  double set_local = wrap_hours(ev.sunset_utc_h + offset);
  if (set_local < rise_local) {
    set_local += 24.0;
  }
  out.sunrise = day_start + rise_local * constants::kSecondsPerHour;
  out.sunset = day_start + set_local * constants::kSecondsPerHour;
  return out;
}

bool DaylightValidator::is_daylight(const Epoch& instant, const sailroute::core::Coordinates& coordinates) const {
  const SunTimes sun = sun_times(coordinates, instant);
  switch (sun.state) {
    case SunState::AlwaysDay:
      return true;
    case SunState::AlwaysNight:
      return false;
    case SunState::Normal:
      break;
  }
  return sun.sunrise <= instant && instant <= sun.sunset;
}

DepartureSolution DaylightValidator::required_departure(const sailroute::core::Coordinates& destination,
                                                        double total_hours,
                                                        const Epoch& preferred_departure) const {
  if (!sailroute::geo::is_valid(destination) || !std::isfinite(total_hours) || total_hours < 0.0) {
    return DepartureSolution{.departure_time = preferred_departure,
                             .message = "Invalid destination or passage duration",
                             .status = Status::InvalidInput};
  }

  const double margin_s = config_.arrival_margin_h * constants::kSecondsPerHour;
  const double passage_s = total_hours * constants::kSecondsPerHour;
  const Epoch arrival = preferred_departure + passage_s;
  DepartureSolution out{.departure_time = preferred_departure, .estimated_arrival = arrival};

  const SunTimes sun = sun_times(destination, arrival);
  if (sun.state == SunState::AlwaysNight) {
    out.message = "No daylight at the destination on the arrival date";
    return out;
  }
  if (is_daylight(arrival, destination)) {
    return out;
  }

  const double offset = sun.utc_offset_hours;
  if (arrival < sun.sunrise) {
    const double delay_s = (sun.sunrise + margin_s) - arrival;
    out.departure_time = preferred_departure + delay_s;
    out.estimated_arrival = arrival + delay_s;
    out.adjusted = true;
    out.message = fmt::format("Departure delayed {:.1f} h to arrive after sunrise ({})",
                              delay_s / constants::kSecondsPerHour, clock_text(sun.sunrise, offset));
    return out;
  }

  const double advance_s = arrival - (sun.sunset - margin_s);
  const Epoch advanced = preferred_departure - advance_s;
  const bool same_day =
      sailroute::core::local_day_start(advanced, offset) == sailroute::core::local_day_start(preferred_departure, offset);
  if (same_day && sailroute::core::local_hour_of_day(advanced, offset) >= config_.earliest_departure_hour) {
    out.departure_time = advanced;
    out.estimated_arrival = arrival - advance_s;
    out.adjusted = true;
    out.message = fmt::format("Departure advanced {:.1f} h to arrive before sunset ({})",
                              advance_s / constants::kSecondsPerHour, clock_text(sun.sunset, offset));
    return out;
  }

  const Epoch next_day = sailroute::core::local_day_start(arrival, offset) + 1.5 * constants::kSecondsPerDay;
  const SunTimes tomorrow = sun_times(destination, next_day);
  const Epoch target = tomorrow.sunrise + margin_s;
  out.departure_time = target - passage_s;
  out.estimated_arrival = target;
  out.adjusted = true;
  out.message = fmt::format("Departure moved to {} to arrive after next sunrise ({})",
                            sailroute::core::to_local_string(out.departure_time, offset),
                            clock_text(tomorrow.sunrise, offset));
  return out;
}

ArrivalValidation DaylightValidator::validate_arrival(const sailroute::core::Waypoint& waypoint) const {
  if (!waypoint.estimated_arrival) {
    return ArrivalValidation{.is_valid = false, .message = "No estimated arrival time set"};
  }
  const Epoch eta = *waypoint.estimated_arrival;
  const SunTimes sun = sun_times(waypoint.coordinates, eta);
  ArrivalValidation out{.is_valid = is_daylight(eta, waypoint.coordinates), .sunrise = sun.sunrise, .sunset = sun.sunset};
  if (!out.is_valid) {
    out.message = fmt::format("Arrival at {} is outside daylight hours ({} - {})",
                              sailroute::core::to_local_string(eta, sun.utc_offset_hours),
                              clock_text(sun.sunrise, sun.utc_offset_hours), clock_text(sun.sunset, sun.utc_offset_hours));
  }
  return out;
}

}  // namespace sailroute::planner
