/**
 * @file wind_conversions.hpp
 * @brief Conversion of gridded u/v wind components to sailing conventions.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <vector>

#include "sailroute/core/types.hpp"

namespace sailroute::weather {

/**
 * @brief Raw model output for one time step, SI units.
 */
struct WindComponents {
  sailroute::core::Epoch timestamp{};
  double u_mps{};  ///< eastward component
  double v_mps{};  ///< northward component
  std::optional<double> gust_mps{};
  double wave_height_m{};
};

/**
 * @brief Convert u/v components to a forecast in knots with a FROM direction.
 *
 * Speed and gust are rounded to 0.1 kt, direction to the whole degree in [0,360).
 * A missing gust falls back to the mean wind.
 */
[[nodiscard]] sailroute::core::WindForecast to_forecast(const WindComponents& c);

[[nodiscard]] std::vector<sailroute::core::WindForecast> to_forecasts(const std::vector<WindComponents>& series);

/**
 * @brief Direction the wind blows FROM for components pointing where it blows TO.
 */
[[nodiscard]] double direction_from_deg(double u_mps, double v_mps);

}  // namespace sailroute::weather
