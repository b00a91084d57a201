/**
 * @file consumer.hpp
 * @brief Consumer client: subscribe on connect, count (and ack) messages,
 *        optionally holding each one for a fixed delay.
 */

#ifndef SBENCH_CONSUMER_HPP_
#define SBENCH_CONSUMER_HPP_

#include "sbench/client.hpp"
#include "sbench/log.hpp"
#include "sbench/stomp_frame.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace sbench {

enum class AckMode : uint8_t { kAuto = 0, kClient };

inline const char* AckModeName(AckMode m) noexcept {
  return m == AckMode::kClient ? "client" : "auto";
}

struct ConsumerOptions {
  std::string destination;
  AckMode ack{AckMode::kAuto};
  bool durable{false};
  std::string selector;          ///< Empty: no selector header.
  std::string consumer_prefix{"consumer-"};
  int64_t sleep_ms{0};           ///< Absolute value is used.
};

class Consumer final : public Client {
 public:
  Consumer(uint32_t id, std::shared_ptr<DispatchQueue> queue,
           Connector& connector, LoadCounters& counters,
           const ClientOptions& options, const ConsumerOptions& consumer)
      : Client(id, "consumer " + std::to_string(id), std::move(queue),
               connector, counters, options),
        consumer_(consumer),
        sleep_ms_(AbsDelayMs(consumer.sleep_ms)) {}

  std::string SubscriptionId() const {
    return consumer_.consumer_prefix + std::to_string(id());
  }

  Frame BuildSubscribe() const {
    Frame sub(stomp::kSubscribe);
    sub.AddHeader("id", SubscriptionId());
    sub.AddHeader("ack", AckModeName(consumer_.ack));
    sub.AddHeader("destination", consumer_.destination);
    if (consumer_.durable) {
      sub.AddHeader("persistent", "true");
    }
    if (!consumer_.selector.empty()) {
      sub.AddHeader("selector", consumer_.selector);
    }
    return sub;
  }

 protected:
  void ReconnectAction() override {
    Connect([this]() {
      SBENCH_LOG_DEBUG("CONSUMER", "%s: subscribing to %s", name().c_str(),
                       consumer_.destination.c_str());
      Send(BuildSubscribe(), nullptr);
    });
  }

  void OnReceive(const Frame& frame) override {
    if (sleep_ms_ == 0U) {
      Process(frame);
      return;
    }
    const bool auto_ack = consumer_.ack == AckMode::kAuto;
    if (auto_ack) {
      SuspendInbound();
    }
    AfterCurrent(sleep_ms_, [this, frame, auto_ack]() {
      if (auto_ack) {
        ResumeInbound();
      }
      Process(frame);
    });
  }

 private:
  // STOMP 1.1 brokers require the subscription on ACK; 1.0 ignores it.
  void Process(const Frame& frame) {
    if (consumer_.ack == AckMode::kClient) {
      Frame ack(stomp::kAck);
      const std::string* id = frame.FindHeader("message-id");
      const std::string* sub = frame.FindHeader("subscription");
      ack.AddHeader("message-id", id != nullptr ? *id : std::string());
      ack.AddHeader("subscription", sub != nullptr ? *sub : SubscriptionId());
      Send(ack, [this]() { counters().AddConsumed(); });
    } else {
      counters().AddConsumed();
    }
  }

  const ConsumerOptions consumer_;
  const uint32_t sleep_ms_;
};

}  // namespace sbench

#endif  // SBENCH_CONSUMER_HPP_
