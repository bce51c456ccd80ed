/**
 * @file keyed_provider.hpp
 * @brief Guard for forecast backends that need an API key.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <string>

#include "sailroute/core/interfaces.hpp"

namespace sailroute::weather {

/**
 * @brief Explicit provider credentials, passed in rather than read from global state.
 */
struct ForecastProviderConfig {
  std::string api_key{};
};

/**
 * @brief True when the key looks usable: longer than 10 characters and not the placeholder.
 */
[[nodiscard]] bool is_api_key_configured(const ForecastProviderConfig& config);

/**
 * @brief Forwards queries to a keyed backend only when a key is configured.
 *
 * Without a key every query fails with "Forecast API key not configured" and
 * `Status::DataUnavailable`; the backend is never called.
 */
class KeyedForecastProvider final : public sailroute::core::IForecastProvider {
 public:
  KeyedForecastProvider(ForecastProviderConfig config, std::shared_ptr<const sailroute::core::IForecastProvider> backend);

  [[nodiscard]] sailroute::core::ForecastResult current_conditions(
      const sailroute::core::Coordinates& coordinates) const override;

  [[nodiscard]] bool configured() const { return configured_; }

 private:
  ForecastProviderConfig config_{};
  std::shared_ptr<const sailroute::core::IForecastProvider> backend_{};
  bool configured_{};
};

}  // namespace sailroute::weather
