/**
 * @file connection.hpp
 * @brief Transport seam between clients and the broker connection.
 *
 * Every callback is invoked on the DispatchQueue passed to
 * Connector::Connect(), never re-entrantly from inside the call that
 * registered it.
 */

#ifndef SBENCH_CONNECTION_HPP_
#define SBENCH_CONNECTION_HPP_

#include "sbench/dispatch.hpp"
#include "sbench/stomp_frame.hpp"
#include "sbench/vocabulary.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sbench {

// ============================================================================
// Failures
// ============================================================================

enum class TransportError : uint8_t {
  kConnectFailed = 0,
  kIoFailed,
  kPeerClosed,
  kProtocol,
  kBrokerError,
  kClosed,
};

inline const char* TransportErrorName(TransportError e) noexcept {
  switch (e) {
    case TransportError::kConnectFailed: return "connect failed";
    case TransportError::kIoFailed: return "i/o failed";
    case TransportError::kPeerClosed: return "peer closed";
    case TransportError::kProtocol: return "protocol error";
    case TransportError::kBrokerError: return "broker error";
    case TransportError::kClosed: return "connection closed";
    default: return "unknown";
  }
}

struct TransportFailure {
  TransportError code{TransportError::kIoFailed};
  int32_t sys_errno{0};
  std::string detail;

  TransportFailure() = default;
  TransportFailure(TransportError c, int32_t err, std::string d)
      : code(c), sys_errno(err), detail(std::move(d)) {}
};

// ============================================================================
// Connection
// ============================================================================

class Connection;

using CompletionFn = std::function<void(expected<void, TransportFailure>)>;
using ReplyFn = std::function<void(expected<Frame, TransportFailure>)>;
using FrameFn = std::function<void(const Frame&)>;
using FailureFn = std::function<void(const TransportFailure&)>;
using ConnectFn =
    std::function<void(expected<std::shared_ptr<Connection>, TransportFailure>)>;

/**
 * @brief A live broker session. Operations after Close() fail with kClosed.
 */
class Connection {
 public:
  virtual ~Connection() = default;

  /// Write @p frame; @p done fires once the bytes have been handed to the
  /// transport, in issue order.
  virtual void Send(const Frame& frame, CompletionFn done) = 0;

  /// Write @p frame with a receipt request; @p reply fires with the
  /// matching RECEIPT.
  virtual void Request(const Frame& frame, ReplyFn reply) = 0;

  /// Install the inbound handlers. @p on_frame is called once per received
  /// MESSAGE while not suspended; @p on_failure at most once.
  virtual void Receive(FrameFn on_frame, FailureFn on_failure) = 0;

  /// Inbound flow control. Both are idempotent.
  virtual void Suspend() = 0;
  virtual void Resume() = 0;

  /// Release the session; @p done fires once the transport is released.
  virtual void Close(std::function<void()> done) = 0;
};

// ============================================================================
// Connector
// ============================================================================

struct ConnectParams {
  std::string host;
  uint16_t port{0};
  std::string login;
  std::string passcode;
};

class Connector {
 public:
  virtual ~Connector() = default;

  /// Open a new session; @p done is invoked on @p queue.
  virtual void Connect(const ConnectParams& params,
                       const std::shared_ptr<DispatchQueue>& queue,
                       ConnectFn done) = 0;
};

}  // namespace sbench

#endif  // SBENCH_CONNECTION_HPP_
