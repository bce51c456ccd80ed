/**
 * @file keyed_provider.cpp
 * @brief API-key guard implementation.
 * @author Watosn
 */

#include "sailroute/weather/keyed_provider.hpp"

#include <utility>

namespace sailroute::weather {
namespace {

constexpr std::size_t kMinKeyLength = 10;
constexpr const char* kPlaceholderKey = "YOUR_WINDY_API_KEY";

}  // namespace

bool is_api_key_configured(const ForecastProviderConfig& config) {
  return config.api_key.size() > kMinKeyLength && config.api_key != kPlaceholderKey;
}

KeyedForecastProvider::KeyedForecastProvider(ForecastProviderConfig config,
                                             std::shared_ptr<const sailroute::core::IForecastProvider> backend)
    : config_(std::move(config)), backend_(std::move(backend)), configured_(is_api_key_configured(config_)) {}

sailroute::core::ForecastResult KeyedForecastProvider::current_conditions(
    const sailroute::core::Coordinates& coordinates) const {
  if (!configured_) {
    return sailroute::core::ForecastResult{.error = "Forecast API key not configured",
                                           .status = sailroute::core::Status::DataUnavailable};
  }
  if (!backend_) {
    return sailroute::core::ForecastResult{.error = "No forecast backend",
                                           .status = sailroute::core::Status::DataUnavailable};
  }
  return backend_->current_conditions(coordinates);
}

}  // namespace sailroute::weather
