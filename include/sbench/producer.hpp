/**
 * @file producer.hpp
 * @brief Producer client: connect, then send one fixed frame in a loop.
 */

#ifndef SBENCH_PRODUCER_HPP_
#define SBENCH_PRODUCER_HPP_

#include "sbench/client.hpp"
#include "sbench/log.hpp"
#include "sbench/stomp_frame.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sbench {

struct ProducerOptions {
  std::string destination;
  uint32_t message_size{1024U};
  bool persistent{false};
  Frame::Header persistent_header{"persistent", "true"};
  bool sync_send{false};
  std::vector<Frame::Header> headers;
  int64_t messages_per_connection{-1};  ///< <= 0 disables the limit.
  int64_t sleep_ms{0};                  ///< Absolute value is used.
};

/**
 * @brief Body of exactly @p size bytes: "Message from <name>\n" followed by
 *        the a..z pattern indexed by byte position, truncated.
 */
inline std::string MessageBody(const std::string& name, uint32_t size) {
  std::string body = "Message from " + name + "\n";
  body.reserve(body.size() > size ? body.size() : size);
  for (size_t i = body.size(); i < size; ++i) {
    body.push_back(static_cast<char>('a' + (i % 26U)));
  }
  if (body.size() > size) {
    body.resize(size);
  }
  return body;
}

class Producer final : public Client {
 public:
  Producer(uint32_t id, std::shared_ptr<DispatchQueue> queue,
           Connector& connector, LoadCounters& counters,
           const ClientOptions& options, const ProducerOptions& producer)
      : Client(id, "producer " + std::to_string(id), std::move(queue),
               connector, counters, options),
        producer_(producer),
        sleep_ms_(AbsDelayMs(producer.sleep_ms)),
        frame_(BuildFrame(name(), producer)) {}

  /// The immutable frame sent on every iteration.
  const Frame& message_frame() const noexcept { return frame_; }

  static Frame BuildFrame(const std::string& name, const ProducerOptions& p) {
    Frame f(stomp::kSend);
    f.AddHeader("destination", p.destination);
    if (p.persistent) {
      f.AddHeader(p.persistent_header.first, p.persistent_header.second);
    }
    if (p.sync_send) {
      // Replaced by a unique id on every request.
      f.AddHeader("receipt", "xxx");
    }
    for (const auto& h : p.headers) {
      f.AddHeader(h.first, h.second);
    }
    f.body = MessageBody(name, p.message_size);
    return f;
  }

 protected:
  void ReconnectAction() override {
    Connect([this]() { WriteAction(); });
  }

 private:
  void WriteAction() {
    if (Done()) {
      Close();
      return;
    }
    if (producer_.sync_send) {
      Request(frame_, [this](const Frame& /*receipt*/) { OnWritten(); });
    } else {
      Send(frame_, [this]() { OnWritten(); });
    }
  }

  void OnWritten() {
    counters().AddProduced();
    ++message_counter_;
    if (Done()) {
      Close();
      return;
    }
    if (sleep_ms_ != 0U) {
      AfterCurrent(sleep_ms_, [this]() { WriteCompleted(); });
    } else {
      WriteCompleted();
    }
  }

  void WriteCompleted() {
    if (producer_.messages_per_connection > 0 &&
        message_counter_ >=
            static_cast<uint64_t>(producer_.messages_per_connection)) {
      SBENCH_LOG_DEBUG("PRODUCER", "%s: %llu messages sent, cycling connection",
                       name().c_str(),
                       static_cast<unsigned long long>(message_counter_));
      message_counter_ = 0U;
      Close();
    } else {
      WriteAction();
    }
  }

  const ProducerOptions producer_;
  const uint32_t sleep_ms_;
  const Frame frame_;
};

}  // namespace sbench

#endif  // SBENCH_PRODUCER_HPP_
