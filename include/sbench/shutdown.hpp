/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the load generator.
 *
 * The signal handler only stores a flag and writes one byte to a pipe, which
 * wakes the thread blocked in WaitForShutdown(). That thread then runs the
 * registered stop callbacks, newest first.
 */

#ifndef SBENCH_SHUTDOWN_HPP_
#define SBENCH_SHUTDOWN_HPP_

#include "sbench/platform.hpp"
#include "sbench/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <unistd.h>

namespace sbench {

enum class ShutdownError : uint8_t {
  kCallbacksFull = 0,
  kPipeCreationFailed,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

/// Stop callback. Receives the signal number, 0 for Quit().
using ShutdownFn = void (*)(int signo);

class ShutdownManager;

namespace detail {

inline ShutdownManager*& ShutdownInstanceRef() {
  static ShutdownManager* ptr = nullptr;
  return ptr;
}

}  // namespace detail

/**
 * @brief Process-wide stop request. At most one live instance; a second one
 *        is invalid and rejects every call.
 *
 * @code
 *   sbench::ShutdownManager mgr;
 *   mgr.Register([](int) { g_scenario->RequestStop(); });
 *   mgr.InstallSignalHandlers();
 *   mgr.WaitForShutdown();
 * @endcode
 */
class ShutdownManager final {
 public:
  static constexpr uint32_t kMaxCallbacks = 8;

  ShutdownManager() noexcept {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::ShutdownInstanceRef() != nullptr) {
      return;
    }
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    detail::ShutdownInstanceRef() = this;
    valid_ = true;
  }

  ~ShutdownManager() {
    if (detail::ShutdownInstanceRef() == this) {
      detail::ShutdownInstanceRef() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownManager(const ShutdownManager&) = delete;
  ShutdownManager& operator=(const ShutdownManager&) = delete;

  bool IsValid() const noexcept { return valid_; }

  expected<void, ShutdownError> Register(ShutdownFn fn) noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    if (fn == nullptr || callback_count_ >= kMaxCallbacks) {
      return expected<void, ShutdownError>::error(ShutdownError::kCallbacksFull);
    }
    callbacks_[callback_count_++] = fn;
    return expected<void, ShutdownError>::success();
  }

  /// SIGINT and SIGTERM via sigaction(2) with SA_RESTART.
  expected<void, ShutdownError> InstallSignalHandlers() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownManager::SignalHandler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// Request shutdown from code. Only the first request is recorded.
  void Quit(int signo = 0) noexcept { Trigger(signo); }

  /// Block until Quit() or a signal, then run the callbacks newest first.
  void WaitForShutdown() noexcept {
    if (pipe_fd_[0] >= 0 && !requested_.load(std::memory_order_acquire)) {
      uint8_t buf = 0;
      while (::read(pipe_fd_[0], &buf, 1) < 0 && errno == EINTR) {
      }
    }
    const int signo = signo_.load(std::memory_order_relaxed);
    for (uint32_t i = callback_count_; i > 0U; --i) {
      callbacks_[i - 1U](signo);
    }
  }

  bool IsShutdownRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  int Signal() const noexcept { return signo_.load(std::memory_order_relaxed); }

 private:
  void Trigger(int signo) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      if (pipe_fd_[1] >= 0) {
        const uint8_t byte = 1;
        // A full pipe already holds a wakeup byte.
        (void)::write(pipe_fd_[1], &byte, 1);
      }
    }
  }

  // Async-signal-safe: atomics and write(2) only.
  static void SignalHandler(int signo) {
    ShutdownManager* self = detail::ShutdownInstanceRef();
    if (self != nullptr) {
      const int saved_errno = errno;
      self->Trigger(signo);
      errno = saved_errno;
    }
  }

  ShutdownFn callbacks_[kMaxCallbacks] = {};
  uint32_t callback_count_{0U};
  std::atomic<bool> requested_{false};
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_{false};
};

}  // namespace sbench

#endif  // SBENCH_SHUTDOWN_HPP_
