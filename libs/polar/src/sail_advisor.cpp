/**
 * @file sail_advisor.cpp
 * @brief Sail configuration advice implementation.
 * @author Watosn
 */

#include "sailroute/polar/sail_advisor.hpp"

#include <cmath>

#include "sailroute/polar/lagoon440.hpp"

namespace sailroute::polar {
namespace {

using sailroute::core::SailConfiguration;
using sailroute::core::SailingMode;
using sailroute::core::Status;

constexpr double kStormWindKt = 35.0;
constexpr double kHeavyWindKt = 25.0;
constexpr double kModerateWindKt = 15.0;
constexpr double kLightWindKt = 8.0;
constexpr double kVeryLightWindKt = 4.0;
constexpr int kConfidence = 85;
constexpr int kLowWindConfidence = 65;

struct Choice {
  SailConfiguration sails{};
  const char* description{};
  double multiplier{1.0};
};

constexpr SailConfiguration kMainJib{.main_sail = true, .jib = true};
constexpr SailConfiguration kMainAsym{.main_sail = true, .asymmetrical = true};
constexpr SailConfiguration kMainSpinnaker{.main_sail = true, .spinnaker = true};
constexpr SailConfiguration kCodeZero{.code_zero = true};
constexpr SailConfiguration kStorm{.main_sail = true, .storm_jib = true};

Choice choose(double tws, double twa, SailingMode mode) {
  const bool speed = mode == SailingMode::Speed;
  if (tws > kStormWindKt) {
    return {kStorm, "Storm conditions: Deep reefed main + storm jib", 0.6};
  }
  if (tws > kHeavyWindKt) {
    if (twa < 90.0) {
      return {kMainJib, "Heavy wind upwind: Reefed main + reefed jib", 0.8};
    }
    return {kMainJib, "Heavy wind downwind: Reefed main + jib", 0.85};
  }
  if (tws > kModerateWindKt) {
    if (twa < 60.0) {
      return {kMainJib, "Close hauled: Full main + jib", 1.0};
    }
    if (twa < 90.0) {
      return {kMainJib, "Close reach: Full main + jib", 1.0};
    }
    if (twa < 120.0) {
      return {kMainJib, "Beam reach: Full main + jib", 1.0};
    }
    if (twa < 150.0) {
      return speed ? Choice{kMainAsym, "Broad reach: Asymmetrical spinnaker", 1.15}
                   : Choice{kMainJib, "Broad reach: Main + jib (comfort mode)", 0.95};
    }
    return speed ? Choice{kMainSpinnaker, "Running: Spinnaker", 1.1}
                 : Choice{kMainJib, "Running: Wing-on-wing main + jib", 0.9};
  }
  if (tws > kLightWindKt) {
    if (twa < 90.0) {
      return {kMainJib, "Moderate upwind: Full main + jib", 1.0};
    }
    if (twa < 120.0) {
      return {kMainJib, "Moderate reaching: Full main + jib", 1.0};
    }
    return speed ? Choice{kMainAsym, "Moderate downwind: Asymmetrical spinnaker", 1.2}
                 : Choice{kMainJib, "Moderate downwind: Main + jib", 0.95};
  }
  if (tws > kVeryLightWindKt) {
    if (twa < 90.0) {
      return {kMainJib, "Light wind upwind: Full main + jib", 1.0};
    }
    return speed ? Choice{kCodeZero, "Light wind downwind: Code Zero", 1.25}
                 : Choice{kMainJib, "Light wind downwind: Full main + jib", 1.0};
  }
  return {kCodeZero, "Very light wind: Code Zero only", 1.2};
}

}  // namespace

std::string polar_config_name(const SailConfiguration& configuration) {
  if (configuration.storm_jib) {
    return "Storm Jib + Reefed Main";
  }
  if (configuration.code_zero) {
    return "Code Zero";
  }
  if (configuration.spinnaker) {
    return "Main + Spinnaker";
  }
  if (configuration.asymmetrical) {
    return "Main + Asymmetrical";
  }
  return "Main + Jib";
}

SailConfigAdvisor::SailConfigAdvisor() : polar_(&lagoon440()) {}

SailRecommendation SailConfigAdvisor::recommend(double wind_speed_kt, double twa_deg, SailingMode mode) const {
  if (!std::isfinite(wind_speed_kt) || wind_speed_kt < 0.0 || !std::isfinite(twa_deg)) {
    return SailRecommendation{.status = Status::InvalidInput};
  }
  const double twa = normalize_twa(twa_deg);
  const Choice choice = choose(wind_speed_kt, twa, mode);
  const std::string config_name = polar_config_name(choice.sails);
  const double base = speed(*polar_, wind_speed_kt, twa, config_name);

  return SailRecommendation{
      .configuration = choice.sails,
      .expected_speed_kt = std::round(base * choice.multiplier * 10.0) / 10.0,
      .speed_multiplier = choice.multiplier,
      .description = choice.description,
      .polar_config = config_name,
      .confidence = wind_speed_kt > kVeryLightWindKt ? kConfidence : kLowWindConfidence,
      .status = Status::Ok,
  };
}

OptimalVmg SailConfigAdvisor::optimal_angles(double wind_speed_kt, std::string_view sail_config) const {
  return find_optimal_vmg(*polar_, wind_speed_kt, sail_config);
}

}  // namespace sailroute::polar
