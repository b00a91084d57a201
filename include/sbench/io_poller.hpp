/**
 * @file io_poller.hpp
 * @brief Edge-triggered epoll wrapper keyed by caller-chosen 64-bit tokens.
 *
 * Header-only, C++17. Tokens let the reactor map readiness back to a
 * channel without trusting that a file descriptor number has not been
 * reused by a newer socket.
 */

#ifndef SBENCH_IO_POLLER_HPP_
#define SBENCH_IO_POLLER_HPP_

#include "sbench/platform.hpp"
#include "sbench/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <array>
#include <unistd.h>

#include <sys/epoll.h>

namespace sbench {

// ============================================================================
// Error Enum
// ============================================================================

enum class PollerError : uint8_t {
  kCreateFailed,
  kAddFailed,
  kModifyFailed,
  kRemoveFailed,
  kWaitFailed
};

// ============================================================================
// Event Types
// ============================================================================

enum class IoEvent : uint8_t {
  kReadable = 0x01,
  kWritable = 0x02,
  kError    = 0x04,
  kHangup   = 0x08
};

inline constexpr uint8_t operator|(IoEvent a, IoEvent b) {
  return static_cast<uint8_t>(a) | static_cast<uint8_t>(b);
}

inline constexpr bool HasEvent(uint8_t events, IoEvent e) {
  return (events & static_cast<uint8_t>(e)) != 0U;
}

struct PollResult {
  uint64_t token;
  uint8_t events;  // bitmask of IoEvent
};

#ifndef SBENCH_IO_POLLER_MAX_EVENTS
#define SBENCH_IO_POLLER_MAX_EVENTS 128U
#endif

// ============================================================================
// IoPoller
// ============================================================================

class IoPoller {
 public:
  IoPoller() noexcept : poller_fd_(::epoll_create1(EPOLL_CLOEXEC)) {}

  ~IoPoller() {
    if (poller_fd_ >= 0) {
      (void)::close(poller_fd_);
    }
  }

  IoPoller(const IoPoller&) = delete;
  IoPoller& operator=(const IoPoller&) = delete;

  bool IsValid() const noexcept { return poller_fd_ >= 0; }

  /** @brief Monitor @p fd for @p events; readiness reports carry @p token. */
  expected<void, PollerError> Add(int32_t fd, uint64_t token, uint8_t events) {
    struct epoll_event ev {};
    ev.events = ToEpoll(events);
    ev.data.u64 = token;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_ADD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kAddFailed);
    }
    return expected<void, PollerError>::success();
  }

  expected<void, PollerError> Modify(int32_t fd, uint64_t token,
                                     uint8_t events) {
    struct epoll_event ev {};
    ev.events = ToEpoll(events);
    ev.data.u64 = token;
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_MOD, fd, &ev) != 0) {
      return expected<void, PollerError>::error(PollerError::kModifyFailed);
    }
    return expected<void, PollerError>::success();
  }

  expected<void, PollerError> Remove(int32_t fd) {
    if (::epoll_ctl(poller_fd_, EPOLL_CTL_DEL, fd, nullptr) != 0) {
      return expected<void, PollerError>::error(PollerError::kRemoveFailed);
    }
    return expected<void, PollerError>::success();
  }

  /**
   * @brief Wait for events.
   * @param timeout_ms  -1 for infinite, 0 for non-blocking.
   * @return Number of entries available through Results().
   */
  expected<uint32_t, PollerError> Wait(int32_t timeout_ms = -1) {
    struct epoll_event raw[SBENCH_IO_POLLER_MAX_EVENTS];
    int32_t n = ::epoll_wait(poller_fd_, raw,
                             static_cast<int32_t>(SBENCH_IO_POLLER_MAX_EVENTS),
                             timeout_ms);
    if (n < 0) {
      if (errno == EINTR) {
        return expected<uint32_t, PollerError>::success(0U);
      }
      return expected<uint32_t, PollerError>::error(PollerError::kWaitFailed);
    }
    const auto count = static_cast<uint32_t>(n);
    for (uint32_t i = 0; i < count; ++i) {
      results_[i].token = raw[i].data.u64;
      results_[i].events = FromEpoll(raw[i].events);
    }
    return expected<uint32_t, PollerError>::success(count);
  }

  const PollResult* Results() const noexcept { return results_.data(); }

 private:
  static uint32_t ToEpoll(uint8_t events) noexcept {
    uint32_t ep = EPOLLET | EPOLLRDHUP;
    if (HasEvent(events, IoEvent::kReadable)) {
      ep |= EPOLLIN;
    }
    if (HasEvent(events, IoEvent::kWritable)) {
      ep |= EPOLLOUT;
    }
    return ep;
  }

  static uint8_t FromEpoll(uint32_t ep) noexcept {
    uint8_t ev = 0;
    if ((ep & EPOLLIN) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kReadable);
    }
    if ((ep & EPOLLOUT) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kWritable);
    }
    if ((ep & EPOLLERR) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kError);
    }
    if ((ep & (EPOLLHUP | EPOLLRDHUP)) != 0U) {
      ev |= static_cast<uint8_t>(IoEvent::kHangup);
    }
    return ev;
  }

  int32_t poller_fd_;
  std::array<PollResult, SBENCH_IO_POLLER_MAX_EVENTS> results_{};
};

}  // namespace sbench

#endif  // SBENCH_IO_POLLER_HPP_
