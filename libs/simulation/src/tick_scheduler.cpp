/**
 * @file tick_scheduler.cpp
 * @brief Timer source implementations.
 * @author Watosn
 */

#include "sailroute/simulation/tick_scheduler.hpp"

#include <algorithm>
#include <utility>

namespace sailroute::simulation {
namespace {

// Smallest due time not later than `limit`; ties resolve to the lowest id.
template <typename Timers, typename Due>
typename Timers::iterator earliest_due(Timers& timers, const Due& limit) {
  auto best = timers.end();
  for (auto it = timers.begin(); it != timers.end(); ++it) {
    if (it->second.next_due <= limit && (best == timers.end() || it->second.next_due < best->second.next_due)) {
      best = it;
    }
  }
  return best;
}

}  // namespace

TimerId ManualTickScheduler::schedule_every(std::chrono::milliseconds period, TickCallback callback) {
  const TimerId id = next_id_++;
  period = std::max(period, std::chrono::milliseconds{1});
  timers_.emplace(id, Timer{.period = period, .next_due = now_ + period, .callback = std::move(callback)});
  return id;
}

void ManualTickScheduler::cancel(TimerId id) { timers_.erase(id); }

void ManualTickScheduler::advance(std::chrono::milliseconds duration) {
  const auto target = now_ + std::max(duration, std::chrono::milliseconds{0});
  for (auto it = earliest_due(timers_, target); it != timers_.end(); it = earliest_due(timers_, target)) {
    now_ = it->second.next_due;
    it->second.next_due += it->second.period;
    // Copy: the callback may cancel its own timer.
    const TickCallback callback = it->second.callback;
    if (callback) {
      callback();
    }
  }
  now_ = target;
}

TimerId SteadyTickScheduler::schedule_every(std::chrono::milliseconds period, TickCallback callback) {
  const TimerId id = next_id_++;
  period = std::max(period, std::chrono::milliseconds{1});
  timers_.emplace(id, Timer{.period = period, .next_due = Clock::now() + period, .callback = std::move(callback)});
  return id;
}

void SteadyTickScheduler::cancel(TimerId id) { timers_.erase(id); }

std::size_t SteadyTickScheduler::poll() {
  const auto now = Clock::now();
  std::size_t fired = 0;
  for (auto it = earliest_due(timers_, now); it != timers_.end(); it = earliest_due(timers_, now)) {
    // Late timers fire once and realign rather than bursting to catch up.
    auto next = it->second.next_due + it->second.period;
    if (next <= now) {
      next = now + it->second.period;
    }
    it->second.next_due = next;
    const TickCallback callback = it->second.callback;
    ++fired;
    if (callback) {
      callback();
    }
  }
  return fired;
}

SteadyTickScheduler::Clock::time_point SteadyTickScheduler::next_due() const {
  auto due = Clock::time_point::max();
  for (const auto& entry : timers_) {
    due = std::min(due, entry.second.next_due);
  }
  return due;
}

}  // namespace sailroute::simulation
