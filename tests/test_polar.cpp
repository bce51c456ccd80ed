/**
 * @file test_polar.cpp
 * @brief Polar interpolation, VMG search and validation tests.
 * @author Watosn
 */

#include <cmath>
#include <limits>

#include <spdlog/spdlog.h>

#include "sailroute/polar/lagoon440.hpp"
#include "sailroute/polar/polar.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  namespace polar = sailroute::polar;
  using sailroute::core::Status;
  const auto& boat = polar::lagoon440();

  const auto beam = polar::evaluate(boat, 10.0, 90.0, "Main + Jib");
  if (beam.status != Status::Ok || !approx(beam.speed_kt, 7.5, 1e-12) || !approx(beam.vmg_kt, 0.0, 1e-9) ||
      beam.sail_config != "Main + Jib") {
    spdlog::error("tabulated point lookup failed: {}", beam.speed_kt);
    return 1;
  }
  if (!approx(polar::speed(boat, 11.0, 90.0), 7.9, 1e-12) || !approx(polar::speed(boat, 10.0, 100.0), 7.35, 1e-12)) {
    spdlog::error("bilinear interpolation mismatch");
    return 2;
  }

  // Outside the table clamps to the boundary curve and point.
  if (!approx(polar::speed(boat, 3.0, 90.0), 5.5, 1e-12) || !approx(polar::speed(boat, 30.0, 90.0), 10.6, 1e-12) ||
      !approx(polar::speed(boat, 10.0, 20.0), 5.8, 1e-12)) {
    spdlog::error("boundary clamping mismatch");
    return 3;
  }
  if (!approx(polar::speed(boat, 10.0, 270.0), 7.5, 1e-12) || !approx(polar::speed(boat, 10.0, -90.0), 7.5, 1e-12) ||
      !approx(polar::normalize_twa(-135.0), 135.0, 1e-12) || !approx(polar::normalize_twa(540.0), 180.0, 1e-12)) {
    spdlog::error("port/starboard symmetry mismatch");
    return 4;
  }

  // Unknown configuration names fall back to the first configuration.
  if (polar::evaluate(boat, 10.0, 90.0, "Twin Headsails").sail_config != boat.polar_data.front().sail_config) {
    spdlog::error("unknown configuration fallback failed");
    return 5;
  }
  if (!approx(polar::speed(boat, 40.0, 90.0, "Storm Jib + Reefed Main"), 8.1, 1e-12)) {
    spdlog::error("named configuration lookup failed");
    return 6;
  }

  const auto best = polar::find_optimal_vmg(boat, 10.0, "Main + Jib");
  if (best.status != Status::Ok || !(best.upwind.twa_deg >= 43.0 && best.upwind.twa_deg <= 54.0) ||
      !(best.downwind.twa_deg >= 129.0 && best.downwind.twa_deg <= 156.0) || !(best.upwind.vmg_kt > 4.3) ||
      !(best.downwind.vmg_kt > 4.9)) {
    spdlog::error("optimal vmg out of range: up {} down {}", best.upwind.twa_deg, best.downwind.twa_deg);
    return 7;
  }

  const auto perf = polar::performance(boat, 10.0, 90.0, 6.0);
  if (perf.status != Status::Ok || !approx(perf.target_speed_kt, 7.5, 1e-12) || !approx(perf.performance_pct, 80.0, 1e-9) ||
      !approx(perf.speed_difference_kt, -1.5, 1e-12)) {
    spdlog::error("performance ratio mismatch");
    return 8;
  }

  const polar::PolarDiagram empty{};
  if (polar::evaluate(empty, 10.0, 90.0).status != Status::DataUnavailable || polar::speed(empty, 10.0, 90.0) != 0.0 ||
      polar::find_optimal_vmg(empty, 10.0).status != Status::DataUnavailable) {
    spdlog::error("empty diagram must report missing data");
    return 9;
  }
  if (polar::evaluate(boat, std::numeric_limits<double>::quiet_NaN(), 90.0).status != Status::InvalidInput) {
    spdlog::error("non-finite wind must be rejected");
    return 10;
  }

  if (polar::validate(boat).status != Status::Ok || polar::validate(empty).status != Status::InvalidInput) {
    spdlog::error("structural validation mismatch");
    return 11;
  }
  polar::PolarDiagram repeated{.polar_data = {polar::SailConfigPolar{
                                   .sail_config = "Main + Jib",
                                   .curves = {polar::PolarCurve{.tws_kt = 10.0,
                                                                .points = {{.twa_deg = 90.0, .speed_kt = 7.0},
                                                                           {.twa_deg = 90.0, .speed_kt = 7.2}}}}}}};
  if (polar::validate(repeated).status != Status::InvalidInput) {
    spdlog::error("repeated TWA must fail validation");
    return 12;
  }

  return 0;
}
