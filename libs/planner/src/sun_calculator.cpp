/**
 * @file sun_calculator.cpp
 * @brief USNO sunrise/sunset implementation.
 * @author Watosn
 */

#include "sailroute/planner/sun_calculator.hpp"

#include <cmath>

#include "sailroute/core/constants.hpp"

namespace sailroute::planner {
namespace {

namespace constants = sailroute::core::constants;

struct SunPosition {
  double sin_dec{};
  double cos_dec{};
  double ra_h{};
};

double wrap(double x, double period) {
  x = std::fmod(x, period);
  return x < 0.0 ? x + period : x;
}

// Steps 3-6: mean anomaly, true longitude, right ascension and declination.
SunPosition sun_position(double t) {
  const double m = 0.9856 * t - 3.289;
  const double l = wrap(m + 1.916 * std::sin(m * constants::kDegToRad) + 0.020 * std::sin(2.0 * m * constants::kDegToRad) +
                            282.634,
                        360.0);
  double ra = wrap(constants::kRadToDeg * std::atan(0.91764 * std::tan(l * constants::kDegToRad)), 360.0);
  // Same quadrant as L.
  ra += std::floor(l / 90.0) * 90.0 - std::floor(ra / 90.0) * 90.0;

  SunPosition out{};
  out.ra_h = ra / 15.0;
  out.sin_dec = 0.39782 * std::sin(l * constants::kDegToRad);
  out.cos_dec = std::cos(std::asin(out.sin_dec));
  return out;
}

}  // namespace

SunEvents usno_sun_events(double lat_deg, double lon_deg, int day_of_year, double zenith_deg) {
  const double lng_hour = lon_deg / 15.0;
  const double t_rise = day_of_year + (6.0 - lng_hour) / 24.0;
  const double t_set = day_of_year + (18.0 - lng_hour) / 24.0;
  const SunPosition rise = sun_position(t_rise);
  const SunPosition set = sun_position(t_set);

  const double cos_zenith = std::cos(zenith_deg * constants::kDegToRad);
  const double sin_lat = std::sin(lat_deg * constants::kDegToRad);
  const double cos_lat = std::cos(lat_deg * constants::kDegToRad);
  const double cos_h_rise = (cos_zenith - rise.sin_dec * sin_lat) / (rise.cos_dec * cos_lat);
  const double cos_h_set = (cos_zenith - set.sin_dec * sin_lat) / (set.cos_dec * cos_lat);

  SunEvents out{};
  // cos H > 1: the sun stays below the zenith circle all day; < -1: it stays above.
  if (cos_h_rise > 1.0 || cos_h_set > 1.0) {
    out.never_rises = true;
    return out;
  }
  if (cos_h_rise < -1.0 || cos_h_set < -1.0) {
    out.never_sets = true;
    return out;
  }

  const double h_rise = (360.0 - constants::kRadToDeg * std::acos(cos_h_rise)) / 15.0;
  const double h_set = constants::kRadToDeg * std::acos(cos_h_set) / 15.0;
  const double local_rise = h_rise + rise.ra_h - 0.06571 * t_rise - 6.622;
  const double local_set = h_set + set.ra_h - 0.06571 * t_set - 6.622;
  out.sunrise_utc_h = wrap(local_rise - lng_hour, 24.0);
  out.sunset_utc_h = wrap(local_set - lng_hour, 24.0);
  return out;
}

}  // namespace sailroute::planner
