/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file sbench/dispatch.hpp
 * @brief DispatchPool - serial dispatch queues multiplexed on a worker pool.
 *
 * Architecture:
 *   DispatchQueue::Post() -> queue task list
 *                               | (first task schedules the queue)
 *                         pool ready list (mutex + condition_variable)
 *                               |
 *                    Worker[0..N-1] -> DispatchQueue::Drain()
 *
 *   DispatchQueue::After() -> TimerScheduler -> Post() when due
 *
 * A queue sits in the ready list at most once and is drained by at most one
 * worker at a time, so its tasks run one after another in FIFO order while
 * different queues run in parallel. A worker drains a bounded batch before
 * re-queueing, keeping busy queues from starving the rest.
 *
 * Usage:
 *   sbench::DispatchPoolConfig cfg;
 *   cfg.name = "clients";
 *   cfg.worker_num = 4;
 *
 *   sbench::DispatchPool pool(cfg);
 *   pool.Start();
 *   auto q = pool.CreateQueue("producer-0");
 *   q->Post([] { ... });
 *   q->After(100, [] { ... });
 *   pool.Shutdown();
 */

#ifndef SBENCH_DISPATCH_HPP_
#define SBENCH_DISPATCH_HPP_

#include "sbench/log.hpp"
#include "sbench/platform.hpp"
#include "sbench/timer.hpp"
#include "sbench/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace sbench {

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDispatchBatch = 64U;

/**
 * @brief DispatchPool configuration.
 */
struct DispatchPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t worker_num{1U};
  uint32_t max_timers{0U};  ///< Pending After() tasks; 0: unbounded.
  int32_t priority{0};
};

class DispatchQueue;

namespace detail {

/**
 * @brief State shared by the pool and every queue it created.
 *
 * Queues keep the core alive so that a Post() racing with pool teardown is
 * dropped instead of touching a destroyed pool.
 */
struct DispatchCore {
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<std::shared_ptr<DispatchQueue>> ready;
  bool stopped{false};

  explicit DispatchCore(uint32_t max_timers) : timer(max_timers) {}

  TimerScheduler timer;
};

inline const DispatchQueue*& CurrentQueueRef() noexcept {
  thread_local const DispatchQueue* current = nullptr;
  return current;
}

}  // namespace detail

// ============================================================================
// DispatchQueue
// ============================================================================

/**
 * @brief Serial execution context. Created by DispatchPool::CreateQueue().
 */
class DispatchQueue final : public std::enable_shared_from_this<DispatchQueue> {
 public:
  using Task = std::function<void()>;

  DispatchQueue(const DispatchQueue&) = delete;
  DispatchQueue& operator=(const DispatchQueue&) = delete;

  /**
   * @brief Enqueue @p task for execution on this queue.
   * @return false when the owning pool has been shut down (task dropped).
   */
  bool Post(Task task) {
    bool schedule = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      tasks_.push_back(std::move(task));
      if (!scheduled_) {
        scheduled_ = true;
        schedule = true;
      }
    }
    if (!schedule) {
      return true;
    }
    {
      std::lock_guard<std::mutex> lk(core_->mtx);
      if (!core_->stopped) {
        core_->ready.push_back(shared_from_this());
        core_->cv.notify_one();
        return true;
      }
    }
    std::lock_guard<std::mutex> lk(mtx_);
    tasks_.clear();
    scheduled_ = false;
    return false;
  }

  /**
   * @brief Post @p task after @p delay_ms milliseconds.
   *
   * A zero delay posts immediately. The pending task does not keep the
   * queue alive; it is dropped if the queue is gone when it fires.
   *
   * @return TimerError::kSlotsFull when the pool was given a max_timers
   *         limit and it is reached.
   */
  expected<void, TimerError> After(uint32_t delay_ms, Task task) {
    if (delay_ms == 0U) {
      (void)Post(std::move(task));
      return expected<void, TimerError>::success();
    }
    std::weak_ptr<DispatchQueue> weak = shared_from_this();
    auto r = core_->timer.Add(delay_ms, [weak, task]() {
      if (auto q = weak.lock()) {
        (void)q->Post(task);
      }
    });
    if (!r.has_value()) {
      return expected<void, TimerError>::error(r.get_error());
    }
    return expected<void, TimerError>::success();
  }

  /// True when the calling thread is currently running this queue's task.
  bool IsExecuting() const noexcept {
    return detail::CurrentQueueRef() == this;
  }

  /// Abort if the caller is not running on this queue.
  void AssertExecuting() const noexcept { SBENCH_CHECK(IsExecuting()); }

  const char* label() const noexcept { return label_.c_str(); }

 private:
  friend class DispatchPool;

  DispatchQueue(std::shared_ptr<detail::DispatchCore> core, const char* label)
      : core_(std::move(core)), label_(label != nullptr ? label : "") {}

  /// Run up to kDispatchBatch tasks; reschedule if more remain.
  void Drain() {
    const DispatchQueue* prev = detail::CurrentQueueRef();
    detail::CurrentQueueRef() = this;
    for (uint32_t i = 0U; i < kDispatchBatch; ++i) {
      Task task;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        if (tasks_.empty()) {
          break;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      task();
    }
    detail::CurrentQueueRef() = prev;

    bool more = false;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      more = !tasks_.empty();
      scheduled_ = more;
    }
    if (more) {
      std::lock_guard<std::mutex> lk(core_->mtx);
      if (!core_->stopped) {
        core_->ready.push_back(shared_from_this());
        core_->cv.notify_one();
      }
    }
  }

  std::shared_ptr<detail::DispatchCore> core_;
  std::string label_;
  std::mutex mtx_;
  std::deque<Task> tasks_;
  bool scheduled_{false};
};

// ============================================================================
// DispatchPool
// ============================================================================

class DispatchPool final {
 public:
  explicit DispatchPool(const DispatchPoolConfig& cfg)
      : name_(cfg.name),
        worker_num_(cfg.worker_num > 0U ? cfg.worker_num : 1U),
        priority_(cfg.priority),
        core_(std::make_shared<detail::DispatchCore>(cfg.max_timers)) {}

  ~DispatchPool() {
    if (running_.load(std::memory_order_acquire)) {
      Shutdown();
    }
  }

  DispatchPool(const DispatchPool&) = delete;
  DispatchPool& operator=(const DispatchPool&) = delete;
  DispatchPool(DispatchPool&&) = delete;
  DispatchPool& operator=(DispatchPool&&) = delete;

  // ======================== Lifecycle ========================

  void Start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lk(core_->mtx);
      core_->stopped = false;
    }
    auto r = core_->timer.Start();
    if (!r.has_value()) {
      SBENCH_LOG_WARN("DISPATCH", "%s: timer already running", name_.c_str());
    }
    workers_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      workers_.emplace_back(&DispatchPool::WorkerLoop, this);
    }
    SBENCH_LOG_DEBUG("DISPATCH", "%s: started %u workers", name_.c_str(),
                     worker_num_);
  }

  /**
   * @brief Stop the timer, then the workers. Tasks still queued are dropped.
   */
  void Shutdown() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    const uint32_t dropped = core_->timer.TaskCount();
    if (dropped != 0U) {
      SBENCH_LOG_DEBUG("DISPATCH", "%s: dropping %u pending timers",
                       name_.c_str(), dropped);
    }
    core_->timer.Stop();
    {
      std::lock_guard<std::mutex> lk(core_->mtx);
      core_->stopped = true;
      core_->cv.notify_all();
    }
    for (auto& t : workers_) {
      if (t.joinable()) {
        t.join();
      }
    }
    workers_.clear();
    std::lock_guard<std::mutex> lk(core_->mtx);
    core_->ready.clear();
  }

  std::shared_ptr<DispatchQueue> CreateQueue(const char* label) {
    return std::shared_ptr<DispatchQueue>(new DispatchQueue(core_, label));
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

 private:
  void WorkerLoop() {
    SetThreadPriority(priority_);
    for (;;) {
      std::shared_ptr<DispatchQueue> q;
      {
        std::unique_lock<std::mutex> lk(core_->mtx);
        core_->cv.wait(lk, [this] {
          return core_->stopped || !core_->ready.empty();
        });
        if (core_->stopped) {
          return;
        }
        q = std::move(core_->ready.front());
        core_->ready.pop_front();
      }
      q->Drain();
    }
  }

  static void SetThreadPriority(int32_t prio) noexcept {
#ifdef __linux__
    if (prio > 0) {
      struct sched_param param{};
      param.sched_priority = (prio > 99) ? 99 : prio;
      (void)pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
    } else if (prio < 0) {
      struct sched_param param{};
      param.sched_priority = 0;
      (void)pthread_setschedparam(pthread_self(), SCHED_IDLE, &param);
    }
#else
    (void)prio;
#endif
  }

  FixedString<32> name_;
  const uint32_t worker_num_;
  const int32_t priority_;
  std::shared_ptr<detail::DispatchCore> core_;
  std::atomic<bool> running_{false};
  std::vector<std::thread> workers_;
};

}  // namespace sbench

#endif  // SBENCH_DISPATCH_HPP_
