/**
 * @file sun_calculator.hpp
 * @brief Sunrise and sunset from the US Naval Observatory almanac algorithm.
 * @author Watosn
 */
#pragma once

namespace sailroute::planner {

/**
 * @brief Sun zenith angles used for rise/set events, in degrees.
 */
inline constexpr double kZenithOfficial = 90.0 + 50.0 / 60.0;
inline constexpr double kZenithCivil = 96.0;
inline constexpr double kZenithNautical = 102.0;

/**
 * @brief Rise and set times in UTC hours [0,24) for one day of year.
 *
 * When the sun never rises (polar night) or never sets (midnight sun) the matching
 * flag is set and the hour value is meaningless.
 */
struct SunEvents {
  double sunrise_utc_h{};
  double sunset_utc_h{};
  bool never_rises{};
  bool never_sets{};
};

/**
 * @brief Almanac for Computers (1990) sunrise/sunset.
 * @param lat_deg Latitude, positive north.
 * @param lon_deg Longitude, positive east.
 * @param day_of_year 1-based day of year.
 * @param zenith_deg Zenith defining the event; official is 90 deg 50'.
 */
[[nodiscard]] SunEvents usno_sun_events(double lat_deg, double lon_deg, int day_of_year,
                                        double zenith_deg = kZenithOfficial);

}  // namespace sailroute::planner
