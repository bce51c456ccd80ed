/**
 * @file test_sail_advisor.cpp
 * @brief Sail configuration recommendation tests.
 * @author Watosn
 */

#include <cmath>

#include <spdlog/spdlog.h>

#include "sailroute/polar/sail_advisor.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  namespace polar = sailroute::polar;
  using sailroute::core::SailingMode;
  using sailroute::core::Status;
  const polar::SailConfigAdvisor advisor;

  const auto storm = advisor.recommend(40.0, 90.0, SailingMode::Speed);
  if (storm.status != Status::Ok || !storm.configuration.storm_jib || !storm.configuration.main_sail ||
      storm.polar_config != "Storm Jib + Reefed Main" || !approx(storm.speed_multiplier, 0.6, 1e-12) ||
      !approx(storm.expected_speed_kt, 4.9, 1e-9) || storm.confidence != 85) {
    spdlog::error("storm recommendation mismatch: {} {}", storm.polar_config, storm.expected_speed_kt);
    return 1;
  }

  const auto drifting = advisor.recommend(2.0, 90.0, SailingMode::Comfort);
  if (!drifting.configuration.code_zero || drifting.configuration.main_sail || drifting.polar_config != "Code Zero" ||
      drifting.description != "Very light wind: Code Zero only" || !approx(drifting.expected_speed_kt, 8.3, 1e-9) ||
      drifting.confidence != 65) {
    spdlog::error("very light wind recommendation mismatch: {}", drifting.expected_speed_kt);
    return 2;
  }

  const auto fast = advisor.recommend(12.0, 135.0, SailingMode::Speed);
  const auto comfy = advisor.recommend(12.0, -135.0, SailingMode::Comfort);
  if (!fast.configuration.asymmetrical || fast.polar_config != "Main + Asymmetrical" ||
      !approx(fast.speed_multiplier, 1.2, 1e-12) || comfy.configuration.asymmetrical || !comfy.configuration.jib ||
      comfy.description != "Moderate downwind: Main + jib" || !approx(comfy.expected_speed_kt, 6.7, 1e-9)) {
    spdlog::error("mode dependent downwind advice mismatch");
    return 3;
  }

  const auto close_hauled = advisor.recommend(20.0, 45.0, SailingMode::Mixed);
  if (close_hauled.description != "Close hauled: Full main + jib" || !approx(close_hauled.expected_speed_kt, 8.3, 1e-9)) {
    spdlog::error("close hauled advice mismatch");
    return 4;
  }
  const auto running = advisor.recommend(18.0, 170.0, SailingMode::Speed);
  if (!running.configuration.spinnaker || running.polar_config != "Main + Spinnaker") {
    spdlog::error("running advice mismatch");
    return 5;
  }

  if (advisor.recommend(-1.0, 90.0, SailingMode::Mixed).status != Status::InvalidInput ||
      advisor.recommend(10.0, std::nan(""), SailingMode::Mixed).status != Status::InvalidInput) {
    spdlog::error("invalid wind input must be rejected");
    return 6;
  }

  if (polar::polar_config_name(sailroute::core::SailConfiguration{}) != "Main + Jib" ||
      polar::polar_config_name(sailroute::core::SailConfiguration{.main_sail = true, .storm_jib = true}) !=
          "Storm Jib + Reefed Main") {
    spdlog::error("polar configuration naming mismatch");
    return 7;
  }

  const auto angles = advisor.optimal_angles(10.0);
  if (angles.status != Status::Ok || !(angles.upwind.twa_deg < 90.0) || !(angles.downwind.twa_deg > 90.0)) {
    spdlog::error("optimal angles mismatch");
    return 8;
  }

  return 0;
}
