/**
 * @file constants.hpp
 * @brief Shared physical and unit constants.
 * @author Watosn
 */
#pragma once

namespace sailroute::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kDegToRad = kPi / 180.0;
inline constexpr double kRadToDeg = 180.0 / kPi;
inline constexpr double kEarthRadiusNm = 3440.065;
inline constexpr double kKnotsPerMps = 1.94384;
inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kSecondsPerDay = 86400.0;

}  // namespace sailroute::core::constants
