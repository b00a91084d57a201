/**
 * @file counters.hpp
 * @brief Process-wide load counters and the shared done flag.
 *
 * Each counter sits on its own cache line so that producers, consumers and
 * the error path do not contend on one line.
 */

#ifndef SBENCH_COUNTERS_HPP_
#define SBENCH_COUNTERS_HPP_

#include "sbench/platform.hpp"

#include <atomic>
#include <cstdint>

namespace sbench {

struct CounterSnapshot {
  uint64_t produced{0U};
  uint64_t consumed{0U};
  uint64_t errors{0U};
};

class LoadCounters final {
 public:
  LoadCounters() = default;
  LoadCounters(const LoadCounters&) = delete;
  LoadCounters& operator=(const LoadCounters&) = delete;

  void AddProduced(uint64_t n = 1U) noexcept {
    produced_.fetch_add(n, std::memory_order_relaxed);
  }
  void AddConsumed(uint64_t n = 1U) noexcept {
    consumed_.fetch_add(n, std::memory_order_relaxed);
  }
  void AddError(uint64_t n = 1U) noexcept {
    errors_.fetch_add(n, std::memory_order_relaxed);
  }

  uint64_t Produced() const noexcept {
    return produced_.load(std::memory_order_relaxed);
  }
  uint64_t Consumed() const noexcept {
    return consumed_.load(std::memory_order_relaxed);
  }
  uint64_t Errors() const noexcept {
    return errors_.load(std::memory_order_relaxed);
  }

  CounterSnapshot Snapshot() const noexcept {
    CounterSnapshot s;
    s.produced = Produced();
    s.consumed = Consumed();
    s.errors = Errors();
    return s;
  }

  /// Set once by the orchestrator; read by every client at loop boundaries.
  void SetDone() noexcept { done_.store(true, std::memory_order_release); }
  bool Done() const noexcept { return done_.load(std::memory_order_acquire); }

 private:
  alignas(kCacheLineSize) std::atomic<uint64_t> produced_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> consumed_{0U};
  alignas(kCacheLineSize) std::atomic<uint64_t> errors_{0U};
  alignas(kCacheLineSize) std::atomic<bool> done_{false};
};

}  // namespace sbench

#endif  // SBENCH_COUNTERS_HPP_
