/**
 * @file manual_position_source.cpp
 * @brief Manual position source implementation.
 * @author Watosn
 */

#include "sailroute/simulation/manual_position_source.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "sailroute/geo/geo_math.hpp"

namespace sailroute::simulation {

ManualPositionSource::ManualPositionSource() : state_(std::make_shared<State>()) {}

std::optional<sailroute::core::Coordinates> ManualPositionSource::current_position() const { return state_->last; }

sailroute::core::PositionSubscription ManualPositionSource::watch(sailroute::core::PositionCallback callback) {
  const std::uint64_t id = state_->next_id++;
  state_->watchers.emplace(id, std::move(callback));
  std::weak_ptr<State> weak = state_;
  return sailroute::core::PositionSubscription([weak, id]() {
    if (auto state = weak.lock()) {
      state->watchers.erase(id);
    }
  });
}

bool ManualPositionSource::push(const sailroute::core::Coordinates& position) {
  if (!sailroute::geo::is_valid(position)) {
    spdlog::warn("position fix ({}, {}) rejected", position.lat_deg, position.lon_deg);
    return false;
  }
  state_->last = position;
  // Snapshot ids: watchers may unsubscribe from inside their callback.
  std::vector<std::uint64_t> ids;
  ids.reserve(state_->watchers.size());
  for (const auto& entry : state_->watchers) {
    ids.push_back(entry.first);
  }
  for (const auto id : ids) {
    const auto it = state_->watchers.find(id);
    if (it == state_->watchers.end()) {
      continue;
    }
    const auto callback = it->second;
    if (callback) {
      callback(position);
    }
  }
  return true;
}

std::size_t ManualPositionSource::watcher_count() const { return state_->watchers.size(); }

}  // namespace sailroute::simulation
