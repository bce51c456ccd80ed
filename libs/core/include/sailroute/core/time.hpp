/**
 * @file time.hpp
 * @brief Civil calendar conversions for UTC epochs and local clocks.
 * @author Watosn
 */
#pragma once

#include <string>

#include "sailroute/core/types.hpp"

namespace sailroute::core {

/**
 * @brief Broken-down calendar time.
 */
struct CivilTime {
  int year{1970};
  unsigned month{1};
  unsigned day{1};
  int hour{};
  int minute{};
  double second{};
  int day_of_year{1};
};

/**
 * @brief Days since 1970-01-01 for a proleptic Gregorian date.
 */
[[nodiscard]] int days_from_civil(int y, unsigned m, unsigned d);

/**
 * @brief Epoch for a UTC calendar date and time.
 */
[[nodiscard]] Epoch epoch_from_civil(int y, unsigned m, unsigned d, int hour = 0, int minute = 0, double second = 0.0);

/**
 * @brief Break an epoch down on a clock offset from UTC by `utc_offset_hours`.
 */
[[nodiscard]] CivilTime civil_from_epoch(const Epoch& epoch, double utc_offset_hours = 0.0);

/**
 * @brief Hours since local midnight on a clock offset from UTC.
 */
[[nodiscard]] double local_hour_of_day(const Epoch& epoch, double utc_offset_hours);

/**
 * @brief UTC epoch of the local midnight that starts the local day containing `epoch`.
 */
[[nodiscard]] Epoch local_day_start(const Epoch& epoch, double utc_offset_hours);

/**
 * @brief Current wall-clock time.
 */
[[nodiscard]] Epoch now_utc();

/**
 * @brief ISO-8601 text, e.g. 2026-03-01T06:00:00Z.
 */
[[nodiscard]] std::string to_iso8601(const Epoch& epoch);

/**
 * @brief Local clock text with offset, e.g. 2026-03-01 02:00 (UTC-4).
 */
[[nodiscard]] std::string to_local_string(const Epoch& epoch, double utc_offset_hours);

}  // namespace sailroute::core
