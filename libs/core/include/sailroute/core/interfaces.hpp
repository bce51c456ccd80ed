/**
 * @file interfaces.hpp
 * @brief Core interfaces for forecast and position collaborators.
 * @author Watosn
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>

#include "sailroute/core/types.hpp"

namespace sailroute::core {

/**
 * @brief Outcome of one point-forecast query. Holds a forecast or an error, never both.
 */
struct ForecastResult {
  std::optional<WindForecast> forecast{};
  std::string error{};
  Status status{Status::Ok};
};

/**
 * @brief Interface for point-forecast providers.
 */
class IForecastProvider {
 public:
  virtual ~IForecastProvider() = default;
  /**
   * @brief Return current conditions at a location.
   * @param coordinates Query point.
   * @return Forecast or an error message with `status` set.
   */
  [[nodiscard]] virtual ForecastResult current_conditions(const Coordinates& coordinates) const = 0;
};

using PositionCallback = std::function<void(const Coordinates&)>;

/**
 * @brief Handle to a position watch. Unsubscribes on destruction.
 */
class PositionSubscription {
 public:
  PositionSubscription() = default;
  explicit PositionSubscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
  PositionSubscription(const PositionSubscription&) = delete;
  PositionSubscription& operator=(const PositionSubscription&) = delete;
  PositionSubscription(PositionSubscription&& other) noexcept : cancel_(std::exchange(other.cancel_, nullptr)) {}
  PositionSubscription& operator=(PositionSubscription&& other) noexcept {
    if (this != &other) {
      unsubscribe();
      cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
  }
  ~PositionSubscription() { unsubscribe(); }

  void unsubscribe() {
    if (cancel_) {
      auto cancel = std::exchange(cancel_, nullptr);
      cancel();
    }
  }
  [[nodiscard]] bool active() const noexcept { return static_cast<bool>(cancel_); }

 private:
  std::function<void()> cancel_{};
};

/**
 * @brief Interface for GPS-like position sources.
 */
class IPositionSource {
 public:
  virtual ~IPositionSource() = default;
  /**
   * @brief Latest known position, if any sample has been received.
   */
  [[nodiscard]] virtual std::optional<Coordinates> current_position() const = 0;
  /**
   * @brief Register a callback invoked for every new position sample.
   */
  [[nodiscard]] virtual PositionSubscription watch(PositionCallback callback) = 0;
};

}  // namespace sailroute::core
