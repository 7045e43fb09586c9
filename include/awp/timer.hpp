/**
 * @file timer.hpp
 * @brief Periodic timer task scheduler driven by one background thread.
 *
 * Callbacks are plain function pointers with an opaque context and run on
 * the scheduler thread. Missed periods are coalesced into a single firing.
 * Stop() wakes the thread immediately instead of waiting out the sleep.
 *
 * All public methods are thread-safe.
 */

#ifndef AWP_TIMER_HPP_
#define AWP_TIMER_HPP_

#include "awp/platform.hpp"
#include "awp/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace awp {

/**
 * @brief Callback invoked by the scheduler on each period tick.
 * @param ctx  User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Fixed-capacity periodic timer scheduler.
 *
 *   awp::TimerScheduler sched(4);
 *   sched.Add(30000, &OnTick, this);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 8U) : slots_(max_tasks > 0U ? max_tasks : 1U) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a periodic task. The first firing happens one period
   *        after registration.
   *
   * @return kInvalidPeriod if period_ms == 0, kSlotsFull if no slot is free.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn, void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active) {
        continue;
      }
      slot.fn = fn;
      slot.ctx = ctx;
      slot.period_ns = static_cast<uint64_t>(period_ms) * 1000000ULL;
      slot.next_fire_ns = SteadyNowNs() + slot.period_ns;
      slot.id = next_id_++;
      slot.active = true;
      cv_.notify_all();
      return expected<TimerTaskId, TimerError>::success(TimerTaskId(slot.id));
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  /** @return kAlreadyRunning on double start, kSpawnFailed if no thread. */
  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    stop_requested_ = false;
    // std::thread reports resource exhaustion by throwing std::system_error.
    try {
      worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    } catch (const std::system_error&) {
      return expected<void, TimerError>::error(TimerError::kSpawnFailed);
    }
    running_ = true;
    return expected<void, TimerError>::success();
  }

  /** Blocks until the scheduler thread exits. Safe when not running. */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
      cv_.notify_all();
    }
    if (worker_.joinable()) {
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }

  bool IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) {
        ++count;
      }
    }
    return count;
  }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ns = 0U;
    uint64_t next_fire_ns = 0U;
    uint32_t id = 0U;
    bool active = false;
  };

  /**
   * Fires due tasks outside the lock so that a callback may call Add() or
   * Remove(), then sleeps until the nearest deadline or Stop().
   */
  void ScheduleLoop() {
    std::vector<TaskSlot> due;
    due.reserve(slots_.size());

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
      const uint64_t now = SteadyNowNs();
      uint64_t next_wake = UINT64_MAX;
      due.clear();

      for (auto& slot : slots_) {
        if (!slot.active) {
          continue;
        }
        if (now >= slot.next_fire_ns) {
          due.push_back(slot);
          do {
            slot.next_fire_ns += slot.period_ns;
          } while (slot.next_fire_ns <= now);
        }
        if (slot.next_fire_ns < next_wake) {
          next_wake = slot.next_fire_ns;
        }
      }

      if (!due.empty()) {
        lock.unlock();
        for (const auto& task : due) {
          task.fn(task.ctx);
        }
        lock.lock();
        continue;
      }

      if (next_wake == UINT64_MAX) {
        cv_.wait(lock);
      } else {
        cv_.wait_for(lock, std::chrono::nanoseconds(next_wake - now));
      }
    }
  }

  std::vector<TaskSlot> slots_;
  uint32_t next_id_ = 1U;
  bool running_ = false;
  bool stop_requested_ = false;
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace awp

#endif  // AWP_TIMER_HPP_
