/**
 * @file geo_math.hpp
 * @brief Great-circle distance, bearing and interpolation on a spherical Earth.
 * @author Watosn
 */
#pragma once

#include "sailroute/core/types.hpp"

namespace sailroute::geo {

/**
 * @brief True when both components are finite and inside [-90,90] x [-180,180].
 */
[[nodiscard]] bool is_valid(const sailroute::core::Coordinates& c);

/**
 * @brief Haversine great-circle distance in nautical miles (R = 3440.065 nm).
 */
[[nodiscard]] double distance_nm(const sailroute::core::Coordinates& a, const sailroute::core::Coordinates& b);

/**
 * @brief Initial bearing from `a` to `b` in [0,360).
 * @note Returns 0 for identical or antipodal points, where the course is undefined.
 */
[[nodiscard]] double bearing_deg(const sailroute::core::Coordinates& a, const sailroute::core::Coordinates& b);

/**
 * @brief Point at `fraction` of the great circle from `a` to `b`.
 *
 * Fractions are clamped to [0,1]; the endpoints are returned exactly. Identical
 * endpoints return `a`. For antipodal endpoints the great circle is not unique and
 * the nearer endpoint is returned.
 */
[[nodiscard]] sailroute::core::Coordinates intermediate_point(const sailroute::core::Coordinates& a,
                                                              const sailroute::core::Coordinates& b,
                                                              double fraction);

/**
 * @brief Wrap a longitude into [-180,180).
 */
[[nodiscard]] double wrap_longitude(double lon_deg);

/**
 * @brief Wrap an angle into [0,360).
 */
[[nodiscard]] double wrap_360(double angle_deg);

}  // namespace sailroute::geo
