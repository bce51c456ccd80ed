/**
 * @file time.cpp
 * @brief Civil calendar conversion implementation.
 * @author Watosn
 */

#include "sailroute/core/time.hpp"

#include <chrono>
#include <cmath>

#include <fmt/format.h>

#include "sailroute/core/constants.hpp"

namespace sailroute::core {
namespace {

struct Ymd {
  int y{};
  unsigned m{};
  unsigned d{};
};

Ymd civil_from_days(int z) {
  z += 719468;
  const int era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460U + doe / 36524U - doe / 146096U) / 365U;
  const int y = static_cast<int>(yoe) + era * 400;
  const unsigned doy = doe - (365U * yoe + yoe / 4U - yoe / 100U);
  const unsigned mp = (5U * doy + 2U) / 153U;
  const unsigned d = doy - (153U * mp + 2U) / 5U + 1U;
  const unsigned m = mp < 10U ? mp + 3U : mp - 9U;
  return Ymd{.y = y + static_cast<int>(m <= 2U), .m = m, .d = d};
}

std::string offset_label(double utc_offset_hours) {
  if (utc_offset_hours == 0.0) {
    return "UTC";
  }
  if (std::floor(utc_offset_hours) == utc_offset_hours) {
    return fmt::format("UTC{:+d}", static_cast<int>(utc_offset_hours));
  }
  return fmt::format("UTC{:+.1f}", utc_offset_hours);
}

}  // namespace

int days_from_civil(int y, unsigned m, unsigned d) {
  y -= static_cast<int>(m <= 2);
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153U * (m + (m > 2 ? -3U : 9U)) + 2U) / 5U + d - 1U;
  const unsigned doe = yoe * 365U + yoe / 4U - yoe / 100U + doy;
  return era * 146097 + static_cast<int>(doe) - 719468;
}

Epoch epoch_from_civil(int y, unsigned m, unsigned d, int hour, int minute, double second) {
  const double day_seconds = static_cast<double>(days_from_civil(y, m, d)) * constants::kSecondsPerDay;
  return Epoch{day_seconds + hour * constants::kSecondsPerHour + minute * 60.0 + second};
}

CivilTime civil_from_epoch(const Epoch& epoch, double utc_offset_hours) {
  const double local = epoch.utc_seconds + utc_offset_hours * constants::kSecondsPerHour;
  const double days = std::floor(local / constants::kSecondsPerDay);
  double sod = local - days * constants::kSecondsPerDay;
  const auto ymd = civil_from_days(static_cast<int>(days));

  CivilTime out{};
  out.year = ymd.y;
  out.month = ymd.m;
  out.day = ymd.d;
  out.hour = static_cast<int>(sod / constants::kSecondsPerHour);
  sod -= out.hour * constants::kSecondsPerHour;
  out.minute = static_cast<int>(sod / 60.0);
  out.second = sod - out.minute * 60.0;
  out.day_of_year = static_cast<int>(days) - days_from_civil(ymd.y, 1U, 1U) + 1;
  return out;
}

double local_hour_of_day(const Epoch& epoch, double utc_offset_hours) {
  const double local = epoch.utc_seconds + utc_offset_hours * constants::kSecondsPerHour;
  const double sod = local - std::floor(local / constants::kSecondsPerDay) * constants::kSecondsPerDay;
  return sod / constants::kSecondsPerHour;
}

Epoch local_day_start(const Epoch& epoch, double utc_offset_hours) {
  const double offset_s = utc_offset_hours * constants::kSecondsPerHour;
  const double local = epoch.utc_seconds + offset_s;
  return Epoch{std::floor(local / constants::kSecondsPerDay) * constants::kSecondsPerDay - offset_s};
}

Epoch now_utc() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return Epoch{std::chrono::duration<double>(since_epoch).count()};
}

std::string to_iso8601(const Epoch& epoch) {
  const auto t = civil_from_epoch(epoch, 0.0);
  return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z", t.year, t.month, t.day, t.hour, t.minute,
                     static_cast<int>(t.second));
}

std::string to_local_string(const Epoch& epoch, double utc_offset_hours) {
  const auto t = civil_from_epoch(epoch, utc_offset_hours);
  return fmt::format("{:04d}-{:02d}-{:02d} {:02d}:{:02d} ({})", t.year, t.month, t.day, t.hour, t.minute,
                     offset_label(utc_offset_hours));
}

}  // namespace sailroute::core
