/**
 * @file stomp_connection.hpp
 * @brief Non-blocking STOMP client session over TCP.
 *
 * StompConnector opens the socket, registers it with the Reactor and runs
 * the CONNECT/CONNECTED handshake. StompConnection then implements the
 * Connection interface. All socket work runs on the owning client's
 * DispatchQueue, driven by readiness events the Reactor posts there.
 *
 * Flow control: a suspended connection stops reading the socket, so the
 * broker is throttled by TCP. Frames already decoded stay in the decoder and
 * are delivered after Resume().
 */

#ifndef SBENCH_STOMP_CONNECTION_HPP_
#define SBENCH_STOMP_CONNECTION_HPP_

#include "sbench/connection.hpp"
#include "sbench/dispatch.hpp"
#include "sbench/log.hpp"
#include "sbench/reactor.hpp"
#include "sbench/socket.hpp"
#include "sbench/stomp_frame.hpp"
#include "sbench/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sbench {

static constexpr size_t kReadChunk = 16U * 1024U;

class StompConnection;

/**
 * @brief Owns connections whose handshake has not resolved yet.
 *
 * Shared between a StompConnector and the connections it starts, so that a
 * connect that never completes is still released when the connector drops
 * its pending set.
 */
class PendingHandshakes {
 public:
  void Add(std::shared_ptr<StompConnection> conn) {
    const StompConnection* key = conn.get();
    std::lock_guard<std::mutex> lk(mtx_);
    conns_[key] = std::move(conn);
  }

  void Release(const StompConnection* conn) {
    std::shared_ptr<StompConnection> dropped;
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = conns_.find(conn);
    if (it != conns_.end()) {
      dropped = std::move(it->second);
      conns_.erase(it);
    }
  }

  /// Drop every pending connection; returns how many were dropped.
  size_t Clear() {
    std::unordered_map<const StompConnection*, std::shared_ptr<StompConnection>>
        dropped;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      dropped.swap(conns_);
    }
    return dropped.size();
  }

  size_t Count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return conns_.size();
  }

 private:
  mutable std::mutex mtx_;
  std::unordered_map<const StompConnection*, std::shared_ptr<StompConnection>>
      conns_;
};

// ============================================================================
// StompConnection
// ============================================================================

class StompConnection final : public Connection,
                              public IoChannel,
                              public std::enable_shared_from_this<StompConnection> {
 public:
  StompConnection(std::shared_ptr<DispatchQueue> queue, Reactor& reactor,
                  TcpSocket socket, ConnectParams params, ConnectFn on_connect,
                  std::shared_ptr<PendingHandshakes> pending)
      : queue_(std::move(queue)),
        reactor_(reactor),
        socket_(std::move(socket)),
        params_(std::move(params)),
        on_connect_(std::move(on_connect)),
        pending_(std::move(pending)),
        read_buf_(kReadChunk) {}

  ~StompConnection() override { ReleaseSocket(); }

  StompConnection(const StompConnection&) = delete;
  StompConnection& operator=(const StompConnection&) = delete;

  /**
   * @brief Register with the reactor and start the TCP connect.
   *
   * Must run on the owning queue. The pending set keeps the connection
   * alive until the handshake resolves or the set is cleared.
   */
  void Begin(const SocketAddress& addr) {
    queue_->AssertExecuting();
    pending_->Add(shared_from_this());
    auto reg = reactor_.Register(socket_.Fd(), shared_from_this(), queue_);
    if (!reg.has_value()) {
      PostConnectFailure(TransportFailure(TransportError::kConnectFailed, errno,
                                          "reactor registration failed"));
      return;
    }
    token_ = reg.value();
    auto r = socket_.Connect(addr);
    if (!r.has_value() && r.get_error() != SocketError::kInProgress) {
      PostConnectFailure(TransportFailure(TransportError::kConnectFailed, errno,
                                          "connect failed"));
    }
    // Immediate or in-progress: the first writable edge continues the
    // handshake.
  }

  // --------------------------------------------------------------------------
  // Connection
  // --------------------------------------------------------------------------

  void Send(const Frame& frame, CompletionFn done) override {
    queue_->AssertExecuting();
    if (phase_ != Phase::kOpen) {
      PostCompletion(std::move(done), ClosedError());
      return;
    }
    Enqueue(frame, std::move(done));
    Flush();
  }

  void Request(const Frame& frame, ReplyFn reply) override {
    queue_->AssertExecuting();
    if (phase_ != Phase::kOpen) {
      (void)queue_->Post([reply]() {
        reply(expected<Frame, TransportFailure>::error(TransportFailure(
            TransportError::kClosed, 0, "connection closed")));
      });
      return;
    }
    std::string receipt = "r-" + std::to_string(next_receipt_++);
    Frame req = frame;
    req.SetHeader("receipt", receipt);
    receipts_.emplace(std::move(receipt), std::move(reply));
    Enqueue(req, nullptr);
    Flush();
  }

  void Receive(FrameFn on_frame, FailureFn on_failure) override {
    queue_->AssertExecuting();
    on_frame_ = std::move(on_frame);
    on_failure_ = std::move(on_failure);
    if (pending_failure_) {
      TransportFailure f = std::move(*pending_failure_);
      pending_failure_.reset();
      PostFailure(std::move(f));
    }
  }

  void Suspend() override {
    queue_->AssertExecuting();
    suspended_ = true;
  }

  void Resume() override {
    queue_->AssertExecuting();
    if (!suspended_) {
      return;
    }
    suspended_ = false;
    if (drain_posted_ || phase_ != Phase::kOpen) {
      return;
    }
    drain_posted_ = true;
    std::weak_ptr<StompConnection> weak = shared_from_this();
    (void)queue_->Post([weak]() {
      if (auto self = weak.lock()) {
        self->drain_posted_ = false;
        self->DrainInbound();
        // Edge-triggered: pick up whatever arrived while suspended.
        if (self->phase_ == Phase::kOpen && !self->suspended_) {
          self->ReadAvailable();
        }
      }
    });
  }

  void Close(std::function<void()> done) override {
    queue_->AssertExecuting();
    if (phase_ == Phase::kOpen) {
      // Best effort: one non-blocking write attempt.
      Enqueue(Frame(stomp::kDisconnect), nullptr);
      Flush();
    }
    phase_ = Phase::kClosed;
    ReleaseSocket();
    receipts_.clear();
    completions_.clear();
    on_frame_ = nullptr;
    on_failure_ = nullptr;
    if (done) {
      (void)queue_->Post(std::move(done));
    }
  }

  // --------------------------------------------------------------------------
  // IoChannel
  // --------------------------------------------------------------------------

  void OnIoEvent(uint8_t events) override {
    if (phase_ == Phase::kClosed || phase_ == Phase::kFailed) {
      return;
    }
    if (phase_ == Phase::kConnecting) {
      if (!HasEvent(events, IoEvent::kWritable) &&
          !HasEvent(events, IoEvent::kError) &&
          !HasEvent(events, IoEvent::kHangup)) {
        return;
      }
      const int32_t err = socket_.TakeError();
      if (err != 0) {
        FailConnect(TransportFailure(TransportError::kConnectFailed, err,
                                     std::strerror(err)));
        return;
      }
      phase_ = Phase::kHandshake;
      SendConnectFrame();
      if (phase_ != Phase::kHandshake) {
        return;
      }
    }
    if (HasEvent(events, IoEvent::kWritable)) {
      Flush();
    }
    if (phase_ == Phase::kHandshake || phase_ == Phase::kOpen) {
      ReadAvailable();
    }
  }

 private:
  enum class Phase : uint8_t { kConnecting, kHandshake, kOpen, kFailed, kClosed };

  struct PendingWrite {
    uint64_t end_offset;  ///< Stream offset at which this frame is written.
    CompletionFn done;
  };

  static expected<void, TransportFailure> ClosedError() {
    return expected<void, TransportFailure>::error(
        TransportFailure(TransportError::kClosed, 0, "connection closed"));
  }

  void SendConnectFrame() {
    Frame connect(stomp::kConnect);
    connect.AddHeader("accept-version", "1.0,1.1");
    connect.AddHeader("host", params_.host);
    if (!params_.login.empty()) {
      connect.AddHeader("login", params_.login);
    }
    if (!params_.passcode.empty()) {
      connect.AddHeader("passcode", params_.passcode);
    }
    Enqueue(connect, nullptr);
    Flush();
  }

  void Enqueue(const Frame& frame, CompletionFn done) {
    const size_t before = out_.size();
    frame.EncodeTo(out_);
    queued_total_ += out_.size() - before;
    if (done) {
      completions_.push_back(PendingWrite{queued_total_, std::move(done)});
    }
  }

  void Flush() {
    while (out_pos_ < out_.size() && socket_.IsValid()) {
      auto r = socket_.Send(out_.data() + out_pos_, out_.size() - out_pos_);
      if (!r.has_value()) {
        if (r.get_error() == SocketError::kWouldBlock) {
          break;
        }
        Fail(TransportFailure(TransportError::kIoFailed, errno,
                              SocketErrorName(r.get_error())));
        return;
      }
      out_pos_ += static_cast<size_t>(r.value());
      written_total_ += static_cast<uint64_t>(r.value());
    }
    if (out_pos_ == out_.size()) {
      out_.clear();
      out_pos_ = 0;
    }
    while (!completions_.empty() &&
           completions_.front().end_offset <= written_total_) {
      PostCompletion(std::move(completions_.front().done),
                     expected<void, TransportFailure>::success());
      completions_.pop_front();
    }
  }

  void ReadAvailable() {
    while (socket_.IsValid()) {
      if (phase_ == Phase::kOpen && suspended_) {
        return;
      }
      auto r = socket_.Recv(read_buf_.data(), read_buf_.size());
      if (!r.has_value()) {
        if (r.get_error() != SocketError::kWouldBlock) {
          Fail(TransportFailure(TransportError::kIoFailed, errno,
                                SocketErrorName(r.get_error())));
        }
        return;
      }
      if (r.value() == 0) {
        Fail(TransportFailure(TransportError::kPeerClosed, 0,
                              "connection closed by broker"));
        return;
      }
      decoder_.Feed(read_buf_.data(), static_cast<size_t>(r.value()));
      DrainInbound();
    }
  }

  /// Hand decoded frames to their consumers until suspended or empty.
  void DrainInbound() {
    while (phase_ == Phase::kHandshake ||
           (phase_ == Phase::kOpen && !suspended_)) {
      Frame frame;
      auto r = decoder_.Next(frame);
      if (!r.has_value()) {
        Fail(TransportFailure(TransportError::kProtocol, 0,
                              FrameErrorName(r.get_error())));
        return;
      }
      if (!r.value()) {
        break;
      }
      HandleFrame(frame);
    }
  }

  void HandleFrame(const Frame& frame) {
    if (phase_ == Phase::kHandshake) {
      if (frame.command == stomp::kConnected) {
        phase_ = Phase::kOpen;
        const std::string* version = frame.FindHeader("version");
        SBENCH_LOG_DEBUG("STOMP", "%s: connected (version %s)", queue_->label(),
                         version != nullptr ? version->c_str() : "1.0");
        ConnectFn cb = std::move(on_connect_);
        on_connect_ = nullptr;
        std::shared_ptr<StompConnection> self = shared_from_this();
        pending_->Release(this);
        if (cb) {
          cb(expected<std::shared_ptr<Connection>, TransportFailure>::success(
              std::static_pointer_cast<Connection>(self)));
        }
        return;
      }
      FailConnect(BrokerFailure(frame));
      return;
    }

    if (frame.command == stomp::kMessage) {
      if (on_frame_) {
        on_frame_(frame);
      }
    } else if (frame.command == stomp::kReceipt) {
      const std::string* id = frame.FindHeader("receipt-id");
      if (id == nullptr) {
        return;
      }
      auto it = receipts_.find(*id);
      if (it == receipts_.end()) {
        return;
      }
      ReplyFn reply = std::move(it->second);
      receipts_.erase(it);
      reply(expected<Frame, TransportFailure>::success(frame));
    } else if (frame.command == stomp::kError) {
      Fail(BrokerFailure(frame));
    }
  }

  static TransportFailure BrokerFailure(const Frame& frame) {
    const std::string* msg = frame.FindHeader("message");
    std::string detail = frame.command;
    if (msg != nullptr) {
      detail += ": " + *msg;
    }
    return TransportFailure(frame.command == stomp::kError
                                ? TransportError::kBrokerError
                                : TransportError::kProtocol,
                            0, std::move(detail));
  }

  /// Session failure: report once, stop all I/O.
  void Fail(TransportFailure failure) {
    if (phase_ == Phase::kConnecting || phase_ == Phase::kHandshake) {
      FailConnect(std::move(failure));
      return;
    }
    if (phase_ != Phase::kOpen) {
      return;
    }
    phase_ = Phase::kFailed;
    ReleaseSocket();
    receipts_.clear();
    completions_.clear();
    if (on_failure_) {
      PostFailure(std::move(failure));
    } else {
      pending_failure_ = std::make_unique<TransportFailure>(std::move(failure));
    }
  }

  void FailConnect(TransportFailure failure) {
    phase_ = Phase::kFailed;
    ReleaseSocket();
    ConnectFn cb = std::move(on_connect_);
    on_connect_ = nullptr;
    std::shared_ptr<StompConnection> self = shared_from_this();
    pending_->Release(this);
    if (cb) {
      cb(expected<std::shared_ptr<Connection>, TransportFailure>::error(
          std::move(failure)));
    }
  }

  void PostConnectFailure(TransportFailure failure) {
    std::weak_ptr<StompConnection> weak = shared_from_this();
    (void)queue_->Post([weak, failure]() {
      if (auto self = weak.lock()) {
        self->FailConnect(failure);
      }
    });
  }

  void PostFailure(TransportFailure failure) {
    FailureFn handler = on_failure_;
    on_failure_ = nullptr;
    (void)queue_->Post([handler, failure]() { handler(failure); });
  }

  void PostCompletion(CompletionFn done,
                      expected<void, TransportFailure> result) {
    if (!done) {
      return;
    }
    (void)queue_->Post([done, result]() { done(result); });
  }

  void ReleaseSocket() {
    if (socket_.IsValid()) {
      if (token_ != 0U) {
        reactor_.Unregister(socket_.Fd(), token_);
        token_ = 0U;
      }
      socket_.Close();
    }
  }

  std::shared_ptr<DispatchQueue> queue_;
  Reactor& reactor_;
  TcpSocket socket_;
  ConnectParams params_;
  ConnectFn on_connect_;
  std::shared_ptr<PendingHandshakes> pending_;
  uint64_t token_ = 0U;
  Phase phase_ = Phase::kConnecting;

  std::string out_;
  size_t out_pos_ = 0;
  uint64_t queued_total_ = 0;
  uint64_t written_total_ = 0;
  std::deque<PendingWrite> completions_;

  FrameDecoder decoder_;
  std::vector<char> read_buf_;
  bool suspended_ = true;
  bool drain_posted_ = false;

  uint64_t next_receipt_ = 1;
  std::unordered_map<std::string, ReplyFn> receipts_;
  FrameFn on_frame_;
  FailureFn on_failure_;
  std::unique_ptr<TransportFailure> pending_failure_;
};

// ============================================================================
// StompConnector
// ============================================================================

class StompConnector final : public Connector {
 public:
  explicit StompConnector(Reactor& reactor)
      : reactor_(reactor), pending_(std::make_shared<PendingHandshakes>()) {}

  ~StompConnector() override { (void)DropPending(); }

  StompConnector(const StompConnector&) = delete;
  StompConnector& operator=(const StompConnector&) = delete;

  /**
   * @brief Resolve and cache the broker address. Blocking; call at startup.
   */
  expected<void, SocketError> Prepare(const std::string& host, uint16_t port) {
    auto r = ResolveIpv4(host.c_str(), port);
    if (!r.has_value()) {
      return expected<void, SocketError>::error(r.get_error());
    }
    std::lock_guard<std::mutex> lk(mtx_);
    cache_[Key(host, port)] = r.value();
    return expected<void, SocketError>::success();
  }

  void Connect(const ConnectParams& params,
               const std::shared_ptr<DispatchQueue>& queue,
               ConnectFn done) override {
    queue->AssertExecuting();
    auto addr = Lookup(params.host, params.port);
    if (!addr.has_value()) {
      PostError(queue, std::move(done),
                TransportFailure(TransportError::kConnectFailed, 0,
                                 "cannot resolve " + params.host));
      return;
    }
    auto sock = TcpSocket::Create();
    if (!sock.has_value()) {
      PostError(queue, std::move(done),
                TransportFailure(TransportError::kConnectFailed, errno,
                                 "socket() failed"));
      return;
    }
    TcpSocket socket = std::move(sock).value();
    if (!socket.SetNonBlocking(true).has_value()) {
      PostError(queue, std::move(done),
                TransportFailure(TransportError::kConnectFailed, errno,
                                 "fcntl(O_NONBLOCK) failed"));
      return;
    }
    (void)socket.SetNoDelay(true);

    auto conn = std::make_shared<StompConnection>(queue, reactor_,
                                                  std::move(socket), params,
                                                  std::move(done), pending_);
    conn->Begin(addr.value());
  }

  /// Connections still waiting for CONNECTED.
  size_t PendingCount() const { return pending_->Count(); }

  /**
   * @brief Release every unresolved handshake without completing it.
   *
   * For teardown, once the queues that would run the completions are gone.
   * The sockets are closed and unregistered from the reactor.
   */
  size_t DropPending() {
    const size_t n = pending_->Clear();
    if (n != 0U) {
      SBENCH_LOG_DEBUG("STOMP", "dropped %zu pending handshakes", n);
    }
    return n;
  }

 private:
  static std::string Key(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
  }

  expected<SocketAddress, SocketError> Lookup(const std::string& host,
                                              uint16_t port) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = cache_.find(Key(host, port));
      if (it != cache_.end()) {
        return expected<SocketAddress, SocketError>::success(it->second);
      }
    }
    // Only literal addresses are accepted unprepared; never block a queue.
    return SocketAddress::FromIpv4(host.c_str(), port);
  }

  static void PostError(const std::shared_ptr<DispatchQueue>& queue,
                        ConnectFn done, TransportFailure failure) {
    (void)queue->Post([done, failure]() {
      done(expected<std::shared_ptr<Connection>, TransportFailure>::error(
          failure));
    });
  }

  Reactor& reactor_;
  std::shared_ptr<PendingHandshakes> pending_;
  std::mutex mtx_;
  std::unordered_map<std::string, SocketAddress> cache_;
};

}  // namespace sbench

#endif  // SBENCH_STOMP_CONNECTION_HPP_
