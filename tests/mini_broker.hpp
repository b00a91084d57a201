/**
 * @file mini_broker.hpp
 * @brief Loopback STOMP broker for transport tests.
 *
 * One thread accepts, one blocking thread per session. Every received frame
 * is recorded; CONNECT is answered with CONNECTED (or ERROR when rejecting)
 * and any frame carrying a receipt header gets its RECEIPT. The broker speaks
 * STOMP 1.1, so an ACK must name a known subscription or it is answered with
 * ERROR. With RouteSends() each SEND is delivered as a MESSAGE to every
 * subscription on the same destination.
 */

#ifndef SBENCH_TESTS_MINI_BROKER_HPP_
#define SBENCH_TESTS_MINI_BROKER_HPP_

#include "sbench/socket.hpp"
#include "sbench/stomp_frame.hpp"

#include <sys/socket.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sbench_test {

class MiniBroker {
 public:
  MiniBroker() {
    auto l = sbench::TcpListener::Create();
    if (!l.has_value()) {
      return;
    }
    listener_ = std::move(l).value();
    auto addr = sbench::SocketAddress::FromIpv4("127.0.0.1", 0U);
    if (!addr.has_value() || !listener_.Bind(addr.value()).has_value() ||
        !listener_.Listen().has_value()) {
      listener_.Close();
      return;
    }
    auto port = listener_.LocalPort();
    if (port.has_value()) {
      port_ = port.value();
    }
    acceptor_ = std::thread(&MiniBroker::AcceptLoop, this);
  }

  ~MiniBroker() { Stop(); }

  MiniBroker(const MiniBroker&) = delete;
  MiniBroker& operator=(const MiniBroker&) = delete;

  bool IsValid() const noexcept { return port_ != 0U; }
  uint16_t port() const noexcept { return port_; }

  /// Answer CONNECT with ERROR instead of CONNECTED.
  void RejectConnects(bool reject) { reject_.store(reject); }

  /// Stop answering receipts (RECEIPT frames are withheld).
  void WithholdReceipts(bool withhold) { withhold_.store(withhold); }

  void RouteSends(bool route) { route_.store(route); }

  size_t SessionCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return sessions_.size();
  }

  std::vector<sbench::Frame> Received() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return received_;
  }

  size_t ReceivedCount(const char* command) const {
    std::lock_guard<std::mutex> lk(mtx_);
    size_t n = 0U;
    for (const auto& f : received_) {
      if (f.command == command) {
        ++n;
      }
    }
    return n;
  }

  /// Write raw bytes to session @p index.
  bool Push(size_t index, const std::string& bytes) {
    std::shared_ptr<Session> s = SessionAt(index);
    return s != nullptr && WriteAll(*s, bytes);
  }

  bool Push(size_t index, const sbench::Frame& frame) {
    return Push(index, frame.Encode());
  }

  /// Close session @p index from the broker side.
  void Drop(size_t index) {
    std::shared_ptr<Session> s = SessionAt(index);
    if (s != nullptr) {
      (void)::shutdown(s->sock.Fd(), SHUT_RDWR);
    }
  }

  /// True once session @p index has seen end-of-stream from the client.
  bool SessionEnded(size_t index) const {
    std::shared_ptr<Session> s = SessionAt(index);
    return s != nullptr && s->ended.load();
  }

  void Stop() {
    if (stopped_.exchange(true)) {
      return;
    }
    listener_.ShutdownRead();
    if (acceptor_.joinable()) {
      acceptor_.join();
    }
    std::vector<std::shared_ptr<Session>> sessions;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      sessions = sessions_;
    }
    for (auto& s : sessions) {
      (void)::shutdown(s->sock.Fd(), SHUT_RDWR);
      if (s->reader.joinable()) {
        s->reader.join();
      }
    }
    listener_.Close();
  }

 private:
  struct Session {
    sbench::TcpSocket sock;
    std::thread reader;
    std::mutex write_mtx;
    std::atomic<bool> ended{false};
  };

  struct Subscription {
    Session* session;
    std::string id;
    std::string destination;
  };

  std::shared_ptr<Session> SessionAt(size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return index < sessions_.size() ? sessions_[index] : nullptr;
  }

  void AcceptLoop() {
    while (!stopped_.load()) {
      auto r = listener_.Accept();
      if (!r.has_value()) {
        return;
      }
      auto s = std::make_shared<Session>();
      s->sock = std::move(r).value();
      std::lock_guard<std::mutex> lk(mtx_);
      sessions_.push_back(s);
      s->reader = std::thread(&MiniBroker::ReadLoop, this, s.get());
    }
  }

  void ReadLoop(Session* s) {
    sbench::FrameDecoder decoder;
    char buf[4096];
    while (true) {
      auto r = s->sock.Recv(buf, sizeof(buf));
      if (!r.has_value()) {
        if (r.get_error() == sbench::SocketError::kWouldBlock) {
          continue;
        }
        break;
      }
      if (r.value() == 0) {
        break;
      }
      decoder.Feed(buf, static_cast<size_t>(r.value()));
      sbench::Frame frame;
      while (true) {
        auto next = decoder.Next(frame);
        if (!next.has_value() || !next.value()) {
          break;
        }
        Handle(*s, frame);
      }
    }
    s->ended.store(true);
  }

  void Handle(Session& s, const sbench::Frame& frame) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      received_.push_back(frame);
    }
    if (frame.command == sbench::stomp::kConnect) {
      if (reject_.load()) {
        sbench::Frame err(sbench::stomp::kError);
        err.AddHeader("message", "access denied");
        (void)WriteAll(s, err.Encode());
      } else {
        sbench::Frame ok(sbench::stomp::kConnected);
        ok.AddHeader("version", "1.1");
        (void)WriteAll(s, ok.Encode());
      }
      return;
    }
    if (frame.command == sbench::stomp::kSubscribe) {
      Subscribe(s, frame);
    } else if (frame.command == sbench::stomp::kSend && route_.load()) {
      Route(frame);
    } else if (frame.command == sbench::stomp::kAck && !KnownSubscription(frame)) {
      sbench::Frame err(sbench::stomp::kError);
      err.AddHeader("message", "ACK without a valid subscription header");
      (void)WriteAll(s, err.Encode());
      return;
    }
    const std::string* receipt = frame.FindHeader("receipt");
    if (receipt != nullptr && !withhold_.load()) {
      sbench::Frame ack(sbench::stomp::kReceipt);
      ack.AddHeader("receipt-id", *receipt);
      (void)WriteAll(s, ack.Encode());
    }
  }

  void Subscribe(Session& s, const sbench::Frame& frame) {
    const std::string* id = frame.FindHeader("id");
    const std::string* dest = frame.FindHeader("destination");
    if (id == nullptr || dest == nullptr) {
      return;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    subscriptions_.push_back(Subscription{&s, *id, *dest});
  }

  bool KnownSubscription(const sbench::Frame& ack) const {
    const std::string* sub = ack.FindHeader("subscription");
    if (sub == nullptr) {
      return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);
    for (const auto& s : subscriptions_) {
      if (s.id == *sub) {
        return true;
      }
    }
    return false;
  }

  void Route(const sbench::Frame& send) {
    const std::string* dest = send.FindHeader("destination");
    if (dest == nullptr) {
      return;
    }
    std::vector<Subscription> targets;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      for (const auto& s : subscriptions_) {
        if (s.destination == *dest) {
          targets.push_back(s);
        }
      }
    }
    for (const auto& t : targets) {
      sbench::Frame msg(sbench::stomp::kMessage);
      msg.AddHeader("destination", *dest);
      msg.AddHeader("subscription", t.id);
      msg.AddHeader("message-id",
                    "m-" + std::to_string(next_message_id_.fetch_add(1U)));
      msg.body = send.body;
      (void)WriteAll(*t.session, msg.Encode());
    }
  }

  static bool WriteAll(Session& s, const std::string& bytes) {
    std::lock_guard<std::mutex> lk(s.write_mtx);
    size_t off = 0U;
    while (off < bytes.size()) {
      auto r = s.sock.Send(bytes.data() + off, bytes.size() - off);
      if (!r.has_value()) {
        if (r.get_error() == sbench::SocketError::kWouldBlock) {
          continue;
        }
        return false;
      }
      off += static_cast<size_t>(r.value());
    }
    return true;
  }

  sbench::TcpListener listener_;
  uint16_t port_ = 0U;
  std::thread acceptor_;
  std::atomic<bool> stopped_{false};
  std::atomic<bool> reject_{false};
  std::atomic<bool> withhold_{false};
  std::atomic<bool> route_{false};
  std::atomic<uint64_t> next_message_id_{1U};

  mutable std::mutex mtx_;
  std::vector<std::shared_ptr<Session>> sessions_;
  std::vector<sbench::Frame> received_;
  std::vector<Subscription> subscriptions_;
};

}  // namespace sbench_test

#endif  // SBENCH_TESTS_MINI_BROKER_HPP_
