/**
 * @file static_provider.hpp
 * @brief Forecast provider returning one fixed sample everywhere.
 * @author Watosn
 */
#pragma once

#include "sailroute/core/interfaces.hpp"

namespace sailroute::weather {

/**
 * @brief Returns the same forecast for any location.
 */
class StaticForecastProvider final : public sailroute::core::IForecastProvider {
 public:
  explicit StaticForecastProvider(const sailroute::core::WindForecast& forecast) : forecast_(forecast) {}

  [[nodiscard]] sailroute::core::ForecastResult current_conditions(
      const sailroute::core::Coordinates& /*coordinates*/) const override {
    return sailroute::core::ForecastResult{.forecast = forecast_};
  }

 private:
  sailroute::core::WindForecast forecast_{};
};

}  // namespace sailroute::weather
