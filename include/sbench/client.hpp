/**
 * @file client.hpp
 * @brief Per-client connection lifecycle state machine.
 *
 * States (exactly one active, replaced wholesale on every transition):
 *
 *   INIT -> DISCONNECTED -> CONNECTING -> CONNECTED -> CLOSING -> DISCONNECTED
 *                  ^             |                                    |
 *                  +-------------+ (close / failure)                  |
 *                  +--------------------------------------------------+
 *
 * Every transition, timer and transport completion runs on the client's own
 * DispatchQueue. Each state instance is tagged with a sequence number; a
 * delayed action or late completion captures the number at schedule time
 * and is dropped at fire time unless that very instance is still current.
 *
 * DISCONNECTED is the only decision point: on entry the client either
 * signals shutdown completion (done flag set) or runs its reconnect action.
 * Transport failures are counted and answered by closing and reconnecting
 * after a fixed backoff; they are never fatal.
 */

#ifndef SBENCH_CLIENT_HPP_
#define SBENCH_CLIENT_HPP_

#include "sbench/connection.hpp"
#include "sbench/counters.hpp"
#include "sbench/dispatch.hpp"
#include "sbench/log.hpp"
#include "sbench/platform.hpp"
#include "sbench/stomp_frame.hpp"
#include "sbench/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace sbench {

static constexpr uint32_t kDefaultReconnectBackoffMs = 1000U;

// ============================================================================
// Options
// ============================================================================

/**
 * @brief Settings shared by every client of a scenario.
 */
struct ClientOptions {
  ConnectParams broker;
  bool display_errors{false};
  uint32_t reconnect_backoff_ms{kDefaultReconnectBackoffMs};
};

/// Magnitude of a configured delay, saturated at UINT32_MAX milliseconds.
inline uint32_t AbsDelayMs(int64_t ms) noexcept {
  const uint64_t mag = ms < 0 ? 0U - static_cast<uint64_t>(ms)
                              : static_cast<uint64_t>(ms);
  return mag > UINT32_MAX ? UINT32_MAX : static_cast<uint32_t>(mag);
}

// ============================================================================
// States
// ============================================================================

struct StateInit {};

struct StateConnecting {
  std::string host;
  uint16_t port{0};
  std::function<void()> on_complete;
};

struct StateConnected {
  std::shared_ptr<Connection> connection;
};

struct StateClosing {
  std::shared_ptr<Connection> connection;
};

struct StateDisconnected {};

using ClientState = std::variant<StateInit, StateConnecting, StateConnected,
                                 StateClosing, StateDisconnected>;

enum class ClientPhase : uint8_t {
  kInit = 0,
  kConnecting,
  kConnected,
  kClosing,
  kDisconnected,
};

inline const char* ClientPhaseName(ClientPhase p) noexcept {
  switch (p) {
    case ClientPhase::kInit: return "INIT";
    case ClientPhase::kConnecting: return "CONNECTING";
    case ClientPhase::kConnected: return "CONNECTED";
    case ClientPhase::kClosing: return "CLOSING";
    case ClientPhase::kDisconnected: return "DISCONNECTED";
    default: return "?";
  }
}

/// Point-in-time view of a client, taken on its queue.
struct ClientStatus {
  ClientPhase phase{ClientPhase::kInit};
  uint64_t state_seq{0U};
  uint64_t message_counter{0U};
  uint32_t reconnect_delay_ms{0U};
  bool shutdown_signaled{false};
};

// ============================================================================
// Client
// ============================================================================

class Client : public std::enable_shared_from_this<Client> {
 public:
  Client(uint32_t id, std::string name, std::shared_ptr<DispatchQueue> queue,
         Connector& connector, LoadCounters& counters,
         const ClientOptions& options)
      : id_(id),
        name_(std::move(name)),
        queue_(std::move(queue)),
        connector_(connector),
        counters_(counters),
        options_(options),
        shutdown_done_(shutdown_promise_.get_future().share()) {}

  virtual ~Client() = default;

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /// Enter DISCONNECTED on the client's queue, which starts the first cycle.
  void Start() {
    auto self = shared_from_this();
    (void)queue_->Post([self]() {
      if (std::holds_alternative<StateInit>(self->state_)) {
        self->SetState(StateDisconnected{});
      }
    });
  }

  /**
   * @brief Close the client and block until it reaches DISCONNECTED with
   *        the done flag observed.
   *
   * The done flag must already be set. Must not be called from the client's
   * own queue.
   */
  void Shutdown() {
    SBENCH_CHECK(counters_.Done());
    SBENCH_CHECK(!queue_->IsExecuting());
    auto self = shared_from_this();
    (void)queue_->Post([self]() {
      switch (self->Phase()) {
        case ClientPhase::kInit:
          self->SetState(StateDisconnected{});
          break;
        case ClientPhase::kDisconnected:
          self->SignalShutdown();
          break;
        default:
          self->Close();
          break;
      }
    });
    shutdown_done_.wait();
  }

  /// Snapshot taken on the client's queue. Blocks the caller.
  ClientStatus Inspect() const {
    SBENCH_CHECK(!queue_->IsExecuting());
    auto promise = std::make_shared<std::promise<ClientStatus>>();
    auto result = promise->get_future();
    auto self = shared_from_this();
    (void)queue_->Post([self, promise]() {
      ClientStatus s;
      s.phase = self->Phase();
      s.state_seq = self->state_seq_;
      s.message_counter = self->message_counter_;
      s.reconnect_delay_ms = self->reconnect_delay_ms_;
      s.shutdown_signaled = self->shutdown_signaled_;
      promise->set_value(s);
    });
    return result.get();
  }

  uint32_t id() const noexcept { return id_; }
  const std::string& name() const noexcept { return name_; }
  const std::shared_ptr<DispatchQueue>& queue() const noexcept { return queue_; }

 protected:
  // --------------------------------------------------------------------------
  // Lifecycle primitives (all must run on the client's queue)
  // --------------------------------------------------------------------------

  /**
   * @brief DISCONNECTED -> CONNECTING. The attempt starts immediately, or
   *        after the reconnect delay once a failure has been seen.
   */
  void Open(const std::string& host, uint16_t port,
            std::function<void()> on_complete) {
    queue_->AssertExecuting();
    SBENCH_CHECK(std::holds_alternative<StateDisconnected>(state_));
    SetState(StateConnecting{host, port, std::move(on_complete)});
    const uint64_t seq = state_seq_;
    if (reconnect_delay_ms_ == 0U) {
      AttemptConnect(seq);
      return;
    }
    SBENCH_LOG_DEBUG("CLIENT", "%s: reconnecting in %u ms", name_.c_str(),
                     reconnect_delay_ms_);
    AfterIfCurrent(reconnect_delay_ms_, seq,
                   [this, seq]() { AttemptConnect(seq); });
  }

  /// Open against the configured broker unless the done flag is set.
  void Connect(std::function<void()> on_complete) {
    queue_->AssertExecuting();
    if (counters_.Done()) {
      return;
    }
    Open(options_.broker.host, options_.broker.port, std::move(on_complete));
  }

  /**
   * @brief CONNECTING -> DISCONNECTED, or CONNECTED -> CLOSING and, once the
   *        transport is released, DISCONNECTED. No-op otherwise.
   */
  void Close() {
    queue_->AssertExecuting();
    if (std::holds_alternative<StateConnecting>(state_)) {
      SetState(StateDisconnected{});
      return;
    }
    if (auto* connected = std::get_if<StateConnected>(&state_)) {
      std::shared_ptr<Connection> conn = std::move(connected->connection);
      SetState(StateClosing{conn});
      const uint64_t seq = state_seq_;
      std::weak_ptr<Client> weak = shared_from_this();
      conn->Close([weak, seq]() {
        auto self = weak.lock();
        if (self && self->state_seq_ == seq) {
          self->SetState(StateDisconnected{});
        }
      });
    }
  }

  /// Fire-and-forget send; @p on_complete runs once the frame is written.
  void Send(const Frame& frame, std::function<void()> on_complete) {
    queue_->AssertExecuting();
    auto* connected = std::get_if<StateConnected>(&state_);
    if (connected == nullptr) {
      return;
    }
    const uint64_t seq = state_seq_;
    std::weak_ptr<Client> weak = shared_from_this();
    connected->connection->Send(
        frame, [weak, seq, on_complete](expected<void, TransportFailure> r) {
          auto self = weak.lock();
          if (!self) {
            return;
          }
          if (!r.has_value()) {
            self->OnFailure(r.get_error(), seq);
            return;
          }
          if (self->state_seq_ == seq && on_complete) {
            on_complete();
          }
        });
  }

  /// Receipted send; @p on_reply runs with the broker's RECEIPT.
  void Request(const Frame& frame, std::function<void(const Frame&)> on_reply) {
    queue_->AssertExecuting();
    auto* connected = std::get_if<StateConnected>(&state_);
    if (connected == nullptr) {
      return;
    }
    const uint64_t seq = state_seq_;
    std::weak_ptr<Client> weak = shared_from_this();
    connected->connection->Request(
        frame, [weak, seq, on_reply](expected<Frame, TransportFailure> r) {
          auto self = weak.lock();
          if (!self) {
            return;
          }
          if (!r.has_value()) {
            self->OnFailure(r.get_error(), seq);
            return;
          }
          if (self->state_seq_ == seq && on_reply) {
            on_reply(r.value());
          }
        });
  }

  void SuspendInbound() {
    queue_->AssertExecuting();
    if (auto* connected = std::get_if<StateConnected>(&state_)) {
      connected->connection->Suspend();
    }
  }

  void ResumeInbound() {
    queue_->AssertExecuting();
    if (auto* connected = std::get_if<StateConnected>(&state_)) {
      connected->connection->Resume();
    }
  }

  /**
   * @brief Run @p fn after @p delay_ms on this queue, only if the state
   *        instance current now is still current then.
   */
  void AfterCurrent(uint32_t delay_ms, std::function<void()> fn) {
    queue_->AssertExecuting();
    AfterIfCurrent(delay_ms, state_seq_, std::move(fn));
  }

  bool Done() const noexcept { return counters_.Done(); }
  LoadCounters& counters() noexcept { return counters_; }
  const ClientOptions& options() const noexcept { return options_; }

  /// Client-specific behavior on DISCONNECTED entry while not done.
  virtual void ReconnectAction() = 0;

  /// Inbound MESSAGE on the current connection.
  virtual void OnReceive(const Frame& /*frame*/) {}

  uint64_t message_counter_{0U};

 private:
  ClientPhase Phase() const noexcept {
    return static_cast<ClientPhase>(state_.index());
  }

  /// Replace the state; DISCONNECTED entry is evaluated in a fresh task.
  void SetState(ClientState next) {
    state_ = std::move(next);
    const uint64_t seq = ++state_seq_;
    if (!std::holds_alternative<StateDisconnected>(state_)) {
      return;
    }
    std::weak_ptr<Client> weak = shared_from_this();
    (void)queue_->Post([weak, seq]() {
      auto self = weak.lock();
      if (self && self->state_seq_ == seq) {
        self->OnDisconnectedEntry();
      }
    });
  }

  void OnDisconnectedEntry() {
    if (counters_.Done()) {
      SignalShutdown();
    } else {
      ReconnectAction();
    }
  }

  void SignalShutdown() {
    if (shutdown_signaled_) {
      return;
    }
    shutdown_signaled_ = true;
    SBENCH_LOG_DEBUG("CLIENT", "%s: shut down", name_.c_str());
    shutdown_promise_.set_value();
  }

  void AttemptConnect(uint64_t seq) {
    auto* connecting = std::get_if<StateConnecting>(&state_);
    if (connecting == nullptr || state_seq_ != seq) {
      return;
    }
    ConnectParams params = options_.broker;
    params.host = connecting->host;
    params.port = connecting->port;
    std::weak_ptr<Client> weak = shared_from_this();
    connector_.Connect(
        params, queue_,
        [weak, seq](expected<std::shared_ptr<Connection>, TransportFailure> r) {
          auto self = weak.lock();
          if (!self) {
            if (r.has_value()) {
              r.value()->Close(nullptr);
            }
            return;
          }
          if (r.has_value()) {
            self->OnConnectSuccess(seq, std::move(r).value());
          } else {
            self->OnFailure(r.get_error(), seq);
          }
        });
  }

  void OnConnectSuccess(uint64_t seq, std::shared_ptr<Connection> conn) {
    auto* connecting = std::get_if<StateConnecting>(&state_);
    if (connecting == nullptr || state_seq_ != seq) {
      // Abandoned attempt.
      conn->Close(nullptr);
      return;
    }
    std::function<void()> on_complete = std::move(connecting->on_complete);
    SetState(StateConnected{conn});
    const uint64_t cseq = state_seq_;
    SBENCH_LOG_DEBUG("CLIENT", "%s: connected", name_.c_str());

    std::weak_ptr<Client> weak = shared_from_this();
    conn->Receive(
        [weak, cseq](const Frame& frame) {
          auto self = weak.lock();
          if (self && self->state_seq_ == cseq) {
            self->OnReceive(frame);
          }
        },
        [weak, cseq](const TransportFailure& failure) {
          if (auto self = weak.lock()) {
            self->OnFailure(failure, cseq);
          }
        });

    if (on_complete) {
      on_complete();
    }
    if (state_seq_ == cseq) {
      conn->Resume();
    }
  }

  /// Count, report, back off and close. Only for the current attempt or
  /// connection.
  void OnFailure(const TransportFailure& failure, uint64_t seq) {
    if (state_seq_ != seq) {
      return;
    }
    if (!std::holds_alternative<StateConnecting>(state_) &&
        !std::holds_alternative<StateConnected>(state_)) {
      return;
    }
    counters_.AddError();
    if (options_.display_errors) {
      SBENCH_LOG_ERROR("CLIENT", "%s: %s (%s, errno=%d)", name_.c_str(),
                       TransportErrorName(failure.code),
                       failure.detail.c_str(), failure.sys_errno);
    } else {
      SBENCH_LOG_DEBUG("CLIENT", "%s: %s (%s, errno=%d)", name_.c_str(),
                       TransportErrorName(failure.code),
                       failure.detail.c_str(), failure.sys_errno);
    }
    reconnect_delay_ms_ = options_.reconnect_backoff_ms;
    Close();
  }

  /// A pool with a timer limit may refuse the delay; the work then runs
  /// without it and the refusal is counted as an error.
  void AfterIfCurrent(uint32_t delay_ms, uint64_t seq,
                      std::function<void()> fn) {
    std::weak_ptr<Client> weak = shared_from_this();
    std::function<void()> guarded = [weak, seq, fn]() {
      auto self = weak.lock();
      if (self && self->state_seq_ == seq) {
        fn();
      }
    };
    auto r = queue_->After(delay_ms, guarded);
    if (!r.has_value()) {
      counters_.AddError();
      SBENCH_LOG_WARN("CLIENT", "%s: %u ms delay refused, running now",
                      name_.c_str(), delay_ms);
      (void)queue_->Post(std::move(guarded));
    }
  }

  const uint32_t id_;
  const std::string name_;
  std::shared_ptr<DispatchQueue> queue_;
  Connector& connector_;
  LoadCounters& counters_;
  const ClientOptions options_;

  ClientState state_{StateInit{}};
  uint64_t state_seq_{0U};
  uint32_t reconnect_delay_ms_{0U};

  std::promise<void> shutdown_promise_;
  std::shared_future<void> shutdown_done_;
  bool shutdown_signaled_{false};
};

}  // namespace sbench

#endif  // SBENCH_CLIENT_HPP_
