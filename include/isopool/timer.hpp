/**
 * @file timer.hpp
 * @brief Periodic callback on a background thread, stoppable at once.
 *
 * The thread waits on a condition variable until the next deadline, so
 * Stop() returns without waiting out the remainder of a period.
 *
 * Non-copyable, non-movable.
 */

#ifndef ISOPOOL_TIMER_HPP_
#define ISOPOOL_TIMER_HPP_

#include "isopool/platform.hpp"
#include "isopool/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace isopool {

class PeriodicTimer final {
 public:
  using Callback = std::function<void()>;

  PeriodicTimer() = default;
  ~PeriodicTimer() { Stop(); }

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

  /**
   * @brief Fire @p fn every @p period_ms, first time one period from now.
   *
   * @return kInvalidPeriod if period_ms == 0, kAlreadyRunning if started.
   */
  expected<void, TimerError> Start(uint32_t period_ms, Callback fn) {
    if (period_ms == 0U) return expected<void, TimerError>::error(TimerError::kInvalidPeriod);

    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    running_ = true;
    period_ = std::chrono::milliseconds(period_ms);
    fn_ = std::move(fn);
    thread_ = std::thread(&PeriodicTimer::Loop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the thread and join it. A callback already running finishes
   * first. Safe to call when not running. Must not be called from the
   * callback itself.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  uint64_t FireCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fire_count_;
  }

 private:
  void Loop() {
    auto next = std::chrono::steady_clock::now() + period_;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
      if (cv_.wait_until(lock, next, [this] { return !running_; })) break;

      ++fire_count_;
      lock.unlock();
      fn_();
      lock.lock();

      // Skip missed periods instead of firing in a burst.
      auto now = std::chrono::steady_clock::now();
      next += period_;
      while (next <= now) next += period_;
    }
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
  Callback fn_;
  std::chrono::milliseconds period_{0};
  uint64_t fire_count_ = 0;
  bool running_ = false;
};

}  // namespace isopool

#endif  // ISOPOOL_TIMER_HPP_
