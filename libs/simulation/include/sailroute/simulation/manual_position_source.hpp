/**
 * @file manual_position_source.hpp
 * @brief Position source fed by explicit samples (replayed tracks, simulated boats).
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>

#include "sailroute/core/interfaces.hpp"

namespace sailroute::simulation {

/**
 * @brief Pushes caller-supplied fixes to watchers.
 *
 * Subscriptions may outlive the source; unsubscribing afterwards is a no-op.
 */
class ManualPositionSource final : public sailroute::core::IPositionSource {
 public:
  ManualPositionSource();

  [[nodiscard]] std::optional<sailroute::core::Coordinates> current_position() const override;
  [[nodiscard]] sailroute::core::PositionSubscription watch(sailroute::core::PositionCallback callback) override;

  /**
   * @brief Record a fix and notify watchers. Invalid coordinates are dropped.
   * @return false when the fix was rejected.
   */
  bool push(const sailroute::core::Coordinates& position);

  [[nodiscard]] std::size_t watcher_count() const;

 private:
  struct State {
    std::optional<sailroute::core::Coordinates> last{};
    std::map<std::uint64_t, sailroute::core::PositionCallback> watchers{};
    std::uint64_t next_id{1};
  };

  std::shared_ptr<State> state_;
};

}  // namespace sailroute::simulation
