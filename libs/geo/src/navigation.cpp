/**
 * @file navigation.cpp
 * @brief Dead-reckoning helper implementation.
 * @author Watosn
 */

#include "sailroute/geo/navigation.hpp"

#include <cmath>

#include <Eigen/Dense>

#include "sailroute/core/constants.hpp"
#include "sailroute/geo/geo_math.hpp"

namespace sailroute::geo {
namespace {

namespace constants = sailroute::core::constants;

// East/north components of a polar vector given as (speed, direction toward).
Eigen::Vector2d en_vector(double speed, double direction_deg) {
  const double a = direction_deg * constants::kDegToRad;
  return Eigen::Vector2d(speed * std::sin(a), speed * std::cos(a));
}

}  // namespace

double eta_minutes(double distance_nm, double speed_kt) {
  if (!(speed_kt > 0.0)) {
    return 0.0;
  }
  return (distance_nm / speed_kt) * 60.0;
}

CurrentCorrection course_with_current(double course_deg,
                                      double boat_speed_kt,
                                      double current_speed_kt,
                                      double current_direction_deg) {
  const Eigen::Vector2d ground = en_vector(boat_speed_kt, course_deg) + en_vector(current_speed_kt, current_direction_deg);
  return CurrentCorrection{
      .course_over_ground_deg = wrap_360(std::atan2(ground.x(), ground.y()) * constants::kRadToDeg),
      .speed_over_ground_kt = ground.norm(),
  };
}

}  // namespace sailroute::geo
