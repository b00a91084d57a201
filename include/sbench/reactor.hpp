/**
 * @file reactor.hpp
 * @brief Single poll thread forwarding socket readiness onto dispatch queues.
 *
 * Each registered channel names the DispatchQueue it belongs to. When epoll
 * reports readiness the reactor posts IoChannel::OnIoEvent() onto that queue,
 * so all socket reads and writes happen on the owning client's serial
 * context and need no locking. The reactor holds channels and queues weakly;
 * events for a channel that is gone are dropped.
 */

#ifndef SBENCH_REACTOR_HPP_
#define SBENCH_REACTOR_HPP_

#include "sbench/dispatch.hpp"
#include "sbench/io_poller.hpp"
#include "sbench/log.hpp"
#include "sbench/vocabulary.hpp"

#include <sys/eventfd.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace sbench {

/**
 * @brief Receiver of readiness notifications, invoked on its own queue.
 */
class IoChannel {
 public:
  virtual ~IoChannel() = default;
  virtual void OnIoEvent(uint8_t events) = 0;
};

class Reactor final {
 public:
  Reactor() noexcept : wake_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {}

  ~Reactor() {
    Stop();
    if (wake_fd_ >= 0) {
      (void)::close(wake_fd_);
    }
  }

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  expected<void, PollerError> Start() {
    if (!poller_.IsValid() || wake_fd_ < 0) {
      return expected<void, PollerError>::error(PollerError::kCreateFailed);
    }
    if (running_.exchange(true, std::memory_order_acq_rel)) {
      return expected<void, PollerError>::success();
    }
    auto r = poller_.Add(wake_fd_, kWakeToken,
                         static_cast<uint8_t>(IoEvent::kReadable));
    if (!r.has_value()) {
      running_.store(false, std::memory_order_release);
      return r;
    }
    thread_ = std::thread(&Reactor::PollLoop, this);
    return expected<void, PollerError>::success();
  }

  void Stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
      return;
    }
    const uint64_t one = 1U;
    (void)::write(wake_fd_, &one, sizeof(one));
    if (thread_.joinable()) {
      thread_.join();
    }
    (void)poller_.Remove(wake_fd_);
    std::lock_guard<std::mutex> lk(mtx_);
    channels_.clear();
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  /**
   * @brief Start watching @p fd for readable and writable edges.
   * @return Token identifying the registration, passed to Unregister().
   */
  expected<uint64_t, PollerError> Register(
      int32_t fd, const std::shared_ptr<IoChannel>& channel,
      const std::shared_ptr<DispatchQueue>& queue) {
    const uint64_t token = next_token_.fetch_add(1U, std::memory_order_relaxed);
    {
      std::lock_guard<std::mutex> lk(mtx_);
      channels_[token] = Entry{channel, queue};
    }
    auto r = poller_.Add(fd, token, IoEvent::kReadable | IoEvent::kWritable);
    if (!r.has_value()) {
      std::lock_guard<std::mutex> lk(mtx_);
      channels_.erase(token);
      return expected<uint64_t, PollerError>::error(r.get_error());
    }
    return expected<uint64_t, PollerError>::success(token);
  }

  /// Stop watching @p fd. Call before closing the descriptor.
  void Unregister(int32_t fd, uint64_t token) {
    auto r = poller_.Remove(fd);
    if (!r.has_value()) {
      SBENCH_LOG_DEBUG("REACTOR", "epoll remove failed for fd %d", fd);
    }
    std::lock_guard<std::mutex> lk(mtx_);
    channels_.erase(token);
  }

  size_t ChannelCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return channels_.size();
  }

 private:
  static constexpr uint64_t kWakeToken = 0U;

  struct Entry {
    std::weak_ptr<IoChannel> channel;
    std::weak_ptr<DispatchQueue> queue;
  };

  void PollLoop() {
    while (running_.load(std::memory_order_acquire)) {
      auto r = poller_.Wait(-1);
      if (!r.has_value()) {
        SBENCH_LOG_ERROR("REACTOR", "epoll_wait failed (errno=%d)", errno);
        return;
      }
      const PollResult* results = poller_.Results();
      for (uint32_t i = 0; i < r.value(); ++i) {
        if (results[i].token == kWakeToken) {
          uint64_t drained = 0U;
          (void)::read(wake_fd_, &drained, sizeof(drained));
          continue;
        }
        Dispatch(results[i].token, results[i].events);
      }
    }
  }

  void Dispatch(uint64_t token, uint8_t events) {
    std::shared_ptr<DispatchQueue> queue;
    std::weak_ptr<IoChannel> channel;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = channels_.find(token);
      if (it == channels_.end()) {
        return;
      }
      queue = it->second.queue.lock();
      channel = it->second.channel;
    }
    if (!queue) {
      return;
    }
    (void)queue->Post([channel, events]() {
      if (auto ch = channel.lock()) {
        ch->OnIoEvent(events);
      }
    });
  }

  IoPoller poller_;
  int32_t wake_fd_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> next_token_{1U};
  std::thread thread_;
  mutable std::mutex mtx_;
  std::unordered_map<uint64_t, Entry> channels_;
};

}  // namespace sbench

#endif  // SBENCH_REACTOR_HPP_
