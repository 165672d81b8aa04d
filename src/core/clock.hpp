#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

/**
 * @brief Latched cancellation flag that sleeping loops can wait on
 *
 * A loop sleeping in wait_until() wakes as soon as request_stop() is called,
 * so cancellation takes effect before its next tick begins.
 */
class StopSignal {
private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool stopped_{false};

public:
  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopped_ = true;
    }
    cv_.notify_all();
  }

  bool stop_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
  }

  /**
   * @brief Sleep until @p deadline or until stop is requested
   * @return true if stop was requested
   */
  template<class Clock, class Duration>
  bool wait_until(const std::chrono::time_point<Clock, Duration>& deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_until(lock, deadline, [this] { return stopped_; });
  }

  template<class Rep, class Period>
  bool wait_for(const std::chrono::duration<Rep, Period>& d) {
    return wait_until(std::chrono::steady_clock::now() + d);
  }
};

/**
 * @brief Periodic clock for fixed-interval control loops
 *
 * Wake times are derived from the start time plus multiples of the period,
 * so sleep overshoot does not accumulate into drift. If a tick overruns a
 * whole period the schedule is re-based on the current time instead of
 * firing a burst of late ticks.
 *
 * tick() reports the measured time since the previous tick; loops that
 * integrate a rate use it instead of the nominal period.
 */
struct PeriodicClock {
  using clock = std::chrono::steady_clock;

  std::chrono::nanoseconds period;
  clock::time_point next;
  clock::time_point last_tick;
  std::uint64_t overruns{0};

  explicit PeriodicClock(std::chrono::nanoseconds p)
      : period(p), next(clock::now() + p), last_tick(clock::now()) {}

  /**
   * @brief Wait for the next tick unless @p stop fires first
   * @return false if stop was requested
   */
  bool wait_next(StopSignal& stop) {
    auto now = clock::now();
    if (next <= now) {
      overruns++;
      next = now;
    }
    if (stop.wait_until(next)) {
      return false;
    }
    next += period;
    return true;
  }

  /**
   * @brief Seconds elapsed since the previous call (or construction)
   */
  double tick() {
    auto now = clock::now();
    double dt = std::chrono::duration<double>(now - last_tick).count();
    last_tick = now;
    return dt;
  }

  std::chrono::nanoseconds get_period() const { return period; }
};
