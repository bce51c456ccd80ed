/**
 * @file geo_math.cpp
 * @brief Great-circle math implementation.
 * @author Watosn
 */

#include "sailroute/geo/geo_math.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "sailroute/core/constants.hpp"

namespace sailroute::geo {
namespace {

using sailroute::core::Coordinates;
namespace constants = sailroute::core::constants;

constexpr double kDegenerateSine = 1e-12;

Eigen::Vector3d to_unit_vector(const Coordinates& c) {
  const double lat = c.lat_deg * constants::kDegToRad;
  const double lon = c.lon_deg * constants::kDegToRad;
  return Eigen::Vector3d(std::cos(lat) * std::cos(lon), std::cos(lat) * std::sin(lon), std::sin(lat));
}

Coordinates from_unit_vector(const Eigen::Vector3d& v) {
  const double lat = std::atan2(v.z(), std::hypot(v.x(), v.y()));
  const double lon = std::atan2(v.y(), v.x());
  return Coordinates{.lat_deg = lat * constants::kRadToDeg, .lon_deg = lon * constants::kRadToDeg};
}

}  // namespace

bool is_valid(const Coordinates& c) {
  return std::isfinite(c.lat_deg) && std::isfinite(c.lon_deg) && c.lat_deg >= -90.0 && c.lat_deg <= 90.0 &&
         c.lon_deg >= -180.0 && c.lon_deg <= 180.0;
}

double distance_nm(const Coordinates& a, const Coordinates& b) {
  const double lat1 = a.lat_deg * constants::kDegToRad;
  const double lat2 = b.lat_deg * constants::kDegToRad;
  const double dlat = (b.lat_deg - a.lat_deg) * constants::kDegToRad;
  const double dlon = (b.lon_deg - a.lon_deg) * constants::kDegToRad;

  const double s_lat = std::sin(dlat / 2.0);
  const double s_lon = std::sin(dlon / 2.0);
  const double h = std::clamp(s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon, 0.0, 1.0);
  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
  return constants::kEarthRadiusNm * c;
}

double bearing_deg(const Coordinates& a, const Coordinates& b) {
  const double lat1 = a.lat_deg * constants::kDegToRad;
  const double lat2 = b.lat_deg * constants::kDegToRad;
  const double dlon = (b.lon_deg - a.lon_deg) * constants::kDegToRad;

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  if (std::hypot(x, y) < kDegenerateSine) {
    return 0.0;
  }
  const double sep = to_unit_vector(a).dot(to_unit_vector(b));
  if (sep <= -1.0 + kDegenerateSine) {
    return 0.0;
  }
  const double bearing = wrap_360(std::atan2(y, x) * constants::kRadToDeg);
  return std::isfinite(bearing) ? bearing : 0.0;
}

Coordinates intermediate_point(const Coordinates& a, const Coordinates& b, double fraction) {
  if (!(fraction > 0.0)) {
    return a;
  }
  if (fraction >= 1.0) {
    return b;
  }

  const Eigen::Vector3d pa = to_unit_vector(a);
  const Eigen::Vector3d pb = to_unit_vector(b);
  const double sin_d = pa.cross(pb).norm();
  const double cos_d = pa.dot(pb);
  if (sin_d < kDegenerateSine) {
    if (cos_d > 0.0) {
      return a;
    }
    return fraction < 0.5 ? a : b;
  }

  const double d = std::atan2(sin_d, cos_d);
  const double wa = std::sin((1.0 - fraction) * d) / sin_d;
  const double wb = std::sin(fraction * d) / sin_d;
  return from_unit_vector(wa * pa + wb * pb);
}

double wrap_longitude(double lon_deg) {
  double lon = std::fmod(lon_deg + 180.0, 360.0);
  if (lon < 0.0) {
    lon += 360.0;
  }
  return lon - 180.0;
}

double wrap_360(double angle_deg) {
  double a = std::fmod(angle_deg, 360.0);
  if (a < 0.0) {
    a += 360.0;
  }
  if (a >= 360.0) {
    a = 0.0;
  }
  return a;
}

}  // namespace sailroute::geo
