/**
 * @file timer.hpp
 * @brief Header-only one-shot delayed task scheduler.
 *
 * A background thread fires registered callbacks once their delay has
 * elapsed. Uses std::chrono::steady_clock for monotonic deadlines and a
 * condition variable so the thread sleeps exactly until the earliest
 * deadline (or until a new, earlier task is added).
 *
 * All public methods are thread-safe. Callbacks run on the scheduler thread
 * with the internal mutex released, so a callback may Add().
 */

#ifndef SBENCH_TIMER_HPP_
#define SBENCH_TIMER_HPP_

#include "sbench/platform.hpp"
#include "sbench/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace sbench {

// ============================================================================
// TimerTaskFn - Callback type for timer tasks
// ============================================================================

using TimerTaskFn = std::function<void()>;

// ============================================================================
// TimerScheduler - One-shot timer task scheduler
// ============================================================================

/**
 * @brief One-shot timer scheduler driven by a background thread.
 *
 * Pending tasks are kept in a min-heap ordered by deadline, ties broken by
 * insertion order. With @p max_tasks == 0 the number of pending tasks is
 * unbounded; otherwise Add() fails with kSlotsFull once the limit is hit.
 *
 * Typical usage:
 *
 *   sbench::TimerScheduler sched;
 *   sched.Start();
 *   sched.Add(1000, [] { ... });
 *   sched.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 0U) : max_tasks_(max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Register a task that fires once after @p delay_ms milliseconds.
   *
   * @return TimerTaskId on success, or TimerError on failure:
   *         - kInvalidPeriod if delay_ms == 0 or fn is empty.
   *         - kSlotsFull     if a limit is set and already reached.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t delay_ms, TimerTaskFn fn) {
    if (delay_ms == 0U || !fn) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (max_tasks_ != 0U && heap_.size() >= max_tasks_) {
      return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
    }
    const uint64_t id = next_id_++;
    const uint64_t deadline =
        SteadyNowNs() + static_cast<uint64_t>(delay_ms) * 1000000ULL;
    heap_.push_back(Pending{deadline, id, std::move(fn)});
    std::push_heap(heap_.begin(), heap_.end(), Later());
    cv_.notify_one();
    return expected<TimerTaskId, TimerError>::success(TimerTaskId(id));
  }

  // --------------------------------------------------------------------------
  // Scheduler Lifecycle
  // --------------------------------------------------------------------------

  expected<void, TimerError> Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the scheduler thread (blocks until the thread exits).
   *
   * Pending tasks are dropped without firing. Safe to call when stopped.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
      cv_.notify_all();
    }
    if (worker_.joinable()) {
      worker_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    heap_.clear();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(heap_.size());
  }

 private:
  struct Pending {
    uint64_t when_ns;  ///< Absolute fire time (monotonic ns).
    uint64_t id;       ///< Insertion order for equal deadlines.
    TimerTaskFn fn;
  };

  /// Heap comparator: the earliest deadline ends up at the front.
  struct Later {
    bool operator()(const Pending& a, const Pending& b) const noexcept {
      return a.when_ns != b.when_ns ? a.when_ns > b.when_ns : a.id > b.id;
    }
  };

  /**
   * @brief Pop expired tasks under the lock, fire them unlocked, then wait
   *        until the next earliest deadline.
   */
  void ScheduleLoop() {
    std::vector<TimerTaskFn> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowNs();
      while (!heap_.empty() && heap_.front().when_ns <= now) {
        std::pop_heap(heap_.begin(), heap_.end(), Later());
        due.push_back(std::move(heap_.back().fn));
        heap_.pop_back();
      }

      if (!due.empty()) {
        lock.unlock();
        for (auto& fn : due) {
          fn();
        }
        due.clear();
        lock.lock();
        continue;
      }

      if (heap_.empty()) {
        cv_.wait(lock);
      } else {
        cv_.wait_for(lock,
                     std::chrono::nanoseconds(heap_.front().when_ns - now));
      }
    }
  }

  const uint32_t max_tasks_;                  ///< 0: unbounded.
  uint64_t next_id_ = 1;                      ///< Next task id.
  std::vector<Pending> heap_;                 ///< Earliest deadline first.
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;                  ///< Guards all above.
  std::condition_variable cv_;                ///< Add()/Stop() wakeup.
};

}  // namespace sbench

#endif  // SBENCH_TIMER_HPP_
