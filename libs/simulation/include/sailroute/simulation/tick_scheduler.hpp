/**
 * @file tick_scheduler.hpp
 * @brief Periodic timer sources for the simulation engine.
 * @author Watosn
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace sailroute::simulation {

using TimerId = std::uint64_t;
using TickCallback = std::function<void()>;

/**
 * @brief Source of repeating timers. Single-threaded: callbacks run inside advance/poll.
 */
class ITickScheduler {
 public:
  virtual ~ITickScheduler() = default;
  /**
   * @brief Arm a timer firing every `period`, first after one period.
   * @return Handle for `cancel`; never 0.
   */
  virtual TimerId schedule_every(std::chrono::milliseconds period, TickCallback callback) = 0;
  /**
   * @brief Disarm a timer. Unknown or already cancelled ids are ignored.
   */
  virtual void cancel(TimerId id) = 0;
  [[nodiscard]] virtual std::size_t active_timers() const = 0;
};

/**
 * @brief Virtual-time scheduler advanced explicitly, for tests and batch runs.
 */
class ManualTickScheduler final : public ITickScheduler {
 public:
  TimerId schedule_every(std::chrono::milliseconds period, TickCallback callback) override;
  void cancel(TimerId id) override;
  [[nodiscard]] std::size_t active_timers() const override { return timers_.size(); }

  /**
   * @brief Move virtual time forward, firing due timers in due-time order (ties by id).
   *
   * Timers cancelled by a callback do not fire again, even when already due.
   */
  void advance(std::chrono::milliseconds duration);

  [[nodiscard]] std::chrono::milliseconds now() const { return now_; }

 private:
  struct Timer {
    std::chrono::milliseconds period{};
    std::chrono::milliseconds next_due{};
    TickCallback callback{};
  };

  std::map<TimerId, Timer> timers_{};
  std::chrono::milliseconds now_{0};
  TimerId next_id_{1};
};

/**
 * @brief Wall-clock scheduler; the owner calls `poll()` from its loop.
 */
class SteadyTickScheduler final : public ITickScheduler {
 public:
  using Clock = std::chrono::steady_clock;

  TimerId schedule_every(std::chrono::milliseconds period, TickCallback callback) override;
  void cancel(TimerId id) override;
  [[nodiscard]] std::size_t active_timers() const override { return timers_.size(); }

  /**
   * @brief Fire every timer whose due time has passed. Returns the number of callbacks run.
   */
  std::size_t poll();

  /**
   * @brief Earliest due time among armed timers, or `Clock::time_point::max()` when idle.
   */
  [[nodiscard]] Clock::time_point next_due() const;

 private:
  struct Timer {
    std::chrono::milliseconds period{};
    Clock::time_point next_due{};
    TickCallback callback{};
  };

  std::map<TimerId, Timer> timers_{};
  TimerId next_id_{1};
};

}  // namespace sailroute::simulation
