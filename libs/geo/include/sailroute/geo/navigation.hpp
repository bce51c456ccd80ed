/**
 * @file navigation.hpp
 * @brief Dead-reckoning helpers: ETA and course made good through a current.
 * @author Watosn
 */
#pragma once

namespace sailroute::geo {

/**
 * @brief Course and speed over ground after adding a current to the boat vector.
 */
struct CurrentCorrection {
  double course_over_ground_deg{};
  double speed_over_ground_kt{};
};

/**
 * @brief Time to cover `distance_nm` at `speed_kt`, in minutes. Returns 0 when speed <= 0.
 */
[[nodiscard]] double eta_minutes(double distance_nm, double speed_kt);

/**
 * @brief Vector sum of boat velocity and current set/drift.
 * @param course_deg Boat heading through the water.
 * @param boat_speed_kt Speed through the water.
 * @param current_speed_kt Current drift.
 * @param current_direction_deg Direction the current flows TOWARD.
 */
[[nodiscard]] CurrentCorrection course_with_current(double course_deg,
                                                    double boat_speed_kt,
                                                    double current_speed_kt,
                                                    double current_direction_deg);

}  // namespace sailroute::geo
