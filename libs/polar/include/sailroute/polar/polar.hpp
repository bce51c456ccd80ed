/**
 * @file polar.hpp
 * @brief Boat polar diagrams and speed/VMG interpolation.
 * @author Watosn
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "sailroute/core/types.hpp"

namespace sailroute::polar {

/**
 * @brief One tabulated polar point at a fixed TWS.
 */
struct PolarPoint {
  double twa_deg{};
  double speed_kt{};
  double vmg_kt{};
};

/**
 * @brief Boat speed versus TWA at one TWS.
 */
struct PolarCurve {
  double tws_kt{};
  std::vector<PolarPoint> points{};
};

/**
 * @brief Curve set for one named sail configuration, e.g. "Main + Jib".
 */
struct SailConfigPolar {
  std::string sail_config{};
  std::string description{};
  double wind_min_kt{};
  double wind_max_kt{};
  std::vector<PolarCurve> curves{};
};

/**
 * @brief Sail areas in square meters; zero when the sail is not carried.
 */
struct SailArea {
  double main_m2{};
  double jib_m2{};
  double genoa_m2{};
  double spinnaker_m2{};
  double asymmetrical_m2{};
  double code_zero_m2{};
};

/**
 * @brief Full performance model for one boat and sail wardrobe.
 */
struct PolarDiagram {
  std::string id{};
  std::string name{};
  std::string boat_type{};
  std::string boat_model{};
  std::string description{};
  double length_m{};
  double beam_m{};
  double displacement_t{};
  SailArea sail_area{};
  std::vector<SailConfigPolar> polar_data{};
};

/**
 * @brief Interpolated speed at (TWS, TWA).
 */
struct PolarSample {
  double speed_kt{};
  double vmg_kt{};
  std::string sail_config{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

struct VmgPoint {
  double twa_deg{};
  double speed_kt{};
  double vmg_kt{};
};

/**
 * @brief Best upwind and downwind VMG angles. Downwind VMG is reported as a magnitude.
 */
struct OptimalVmg {
  VmgPoint upwind{.twa_deg = 45.0};
  VmgPoint downwind{.twa_deg = 135.0};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

/**
 * @brief Measured boat speed against the polar target.
 */
struct PolarPerformance {
  double target_speed_kt{};
  double actual_speed_kt{};
  double performance_pct{};
  double speed_difference_kt{};
  sailroute::core::Status status{sailroute::core::Status::Ok};
};

struct PolarValidation {
  sailroute::core::Status status{sailroute::core::Status::Ok};
  std::string message{};
};

/**
 * @brief Fold any angle onto [0,180]; polars are symmetric port/starboard.
 */
[[nodiscard]] double normalize_twa(double twa_deg);

/**
 * @brief Velocity made good toward the wind: speed * cos(twa).
 */
[[nodiscard]] double vmg(double speed_kt, double twa_deg);

/**
 * @brief Curve set for `sail_config`, falling back to the first configuration when the name is unknown.
 * @return nullptr only for a diagram without configurations.
 */
[[nodiscard]] const SailConfigPolar* find_config(const PolarDiagram& diagram, std::string_view sail_config);

/**
 * @brief Double linear interpolation of boat speed over TWS then TWA.
 *
 * TWS and TWA outside the tabulated range clamp to the boundary curve/point.
 * Zero-width brackets use weight 0.
 */
[[nodiscard]] PolarSample evaluate(const PolarDiagram& diagram, double tws_kt, double twa_deg,
                                   std::string_view sail_config = {});

/**
 * @brief Convenience wrapper returning only the interpolated speed (0 when the diagram is empty).
 */
[[nodiscard]] double speed(const PolarDiagram& diagram, double tws_kt, double twa_deg, std::string_view sail_config = {});

/**
 * @brief 1-degree scan of TWA 30..180 for the best upwind (TWA < 90) and downwind (TWA > 90) VMG.
 */
[[nodiscard]] OptimalVmg find_optimal_vmg(const PolarDiagram& diagram, double tws_kt, std::string_view sail_config = {});

[[nodiscard]] PolarPerformance performance(const PolarDiagram& diagram, double tws_kt, double twa_deg,
                                           double actual_speed_kt, std::string_view sail_config = {});

/**
 * @brief Structural checks: configurations present, curves non-empty, TWA strictly increasing.
 */
[[nodiscard]] PolarValidation validate(const PolarDiagram& diagram);

}  // namespace sailroute::polar
