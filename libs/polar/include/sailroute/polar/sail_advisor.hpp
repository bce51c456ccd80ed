/**
 * @file sail_advisor.hpp
 * @brief Rule-based sail configuration advice from wind and sailing mode.
 * @author Watosn
 */
#pragma once

#include <string>

#include "sailroute/core/types.hpp"
#include "sailroute/polar/polar.hpp"

namespace sailroute::polar {

/**
 * @brief Recommended sails with the polar speed they are expected to make.
 */
struct SailRecommendation {
  sailroute::core::SailConfiguration configuration{};
  double expected_speed_kt{};
  double speed_multiplier{1.0};
  std::string description{};
  std::string polar_config{};
  int confidence{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

/**
 * @brief Polar configuration name for a set of sails.
 *
 * Priority: storm jib, code zero, spinnaker, asymmetrical; anything else maps to "Main + Jib".
 */
[[nodiscard]] std::string polar_config_name(const sailroute::core::SailConfiguration& configuration);

/**
 * @brief Maps wind conditions to a sail plan using fixed wind bands.
 */
class SailConfigAdvisor {
 public:
  /**
   * @brief Advisor bound to the bundled Lagoon 440 polar.
   */
  SailConfigAdvisor();

  /**
   * @brief Advisor bound to a caller-owned polar; it must outlive the advisor.
   */
  explicit SailConfigAdvisor(const PolarDiagram& polar) : polar_(&polar) {}

  /**
   * @brief Recommend sails for true wind speed and angle.
   * @param wind_speed_kt True wind speed, must be finite and >= 0.
   * @param twa_deg True wind angle; folded onto [0,180].
   * @param mode Speed mode unlocks downwind sails; other modes prefer main + jib.
   */
  [[nodiscard]] SailRecommendation recommend(double wind_speed_kt, double twa_deg, sailroute::core::SailingMode mode) const;

  /**
   * @brief Best upwind/downwind angles for the given wind on the advisor's polar.
   */
  [[nodiscard]] OptimalVmg optimal_angles(double wind_speed_kt, std::string_view sail_config = {}) const;

  [[nodiscard]] const PolarDiagram& polar() const { return *polar_; }

 private:
  const PolarDiagram* polar_{};
};

}  // namespace sailroute::polar
