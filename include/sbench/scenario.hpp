/**
 * @file scenario.hpp
 * @brief One load run: build the clients, sample the shared counters at a
 *        fixed interval, then stop every client and report.
 */

#ifndef SBENCH_SCENARIO_HPP_
#define SBENCH_SCENARIO_HPP_

#include "sbench/client.hpp"
#include "sbench/consumer.hpp"
#include "sbench/counters.hpp"
#include "sbench/dispatch.hpp"
#include "sbench/log.hpp"
#include "sbench/producer.hpp"
#include "sbench/reactor.hpp"
#include "sbench/scenario_config.hpp"
#include "sbench/stomp_connection.hpp"
#include "sbench/vocabulary.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sbench {

enum class ScenarioError : uint8_t {
  kReactorFailed = 0,
  kResolveFailed,
  kAlreadyRan,
};

inline const char* ScenarioErrorName(ScenarioError e) noexcept {
  switch (e) {
    case ScenarioError::kReactorFailed: return "reactor start failed";
    case ScenarioError::kResolveFailed: return "broker address not resolvable";
    case ScenarioError::kAlreadyRan:    return "scenario already ran";
  }
  return "unknown";
}

/// Per-interval rates in messages per second.
struct RateSample {
  double produced{0.0};
  double consumed{0.0};
  double errors{0.0};
};

struct ScenarioSummary {
  CounterSnapshot totals;
  uint32_t samples{0U};
  RateSample mean;
};

class Scenario final {
 public:
  /**
   * @param connector Transport to use; nullptr selects the STOMP/TCP
   *        connector driven by the scenario's own reactor.
   */
  explicit Scenario(const ScenarioConfig& cfg, Connector* connector = nullptr)
      : cfg_(cfg),
        pool_(MakePoolConfig(cfg)),
        stomp_connector_(reactor_),
        connector_(connector != nullptr ? *connector : stomp_connector_),
        use_stomp_(connector == nullptr) {}

  Scenario(const Scenario&) = delete;
  Scenario& operator=(const Scenario&) = delete;

  /**
   * @brief Run until sample_count samples were kept or RequestStop() is
   *        called. Blocks the calling thread.
   */
  expected<ScenarioSummary, ScenarioError> Run() {
    using R = expected<ScenarioSummary, ScenarioError>;
    if (ran_) {
      return R::error(ScenarioError::kAlreadyRan);
    }
    ran_ = true;

    if (use_stomp_) {
      auto rs = reactor_.Start();
      if (!rs.has_value()) {
        SBENCH_LOG_ERROR("SCENARIO", "reactor start failed (%u)",
                         static_cast<unsigned>(rs.get_error()));
        return R::error(ScenarioError::kReactorFailed);
      }
      auto rp = stomp_connector_.Prepare(cfg_.host, cfg_.port);
      if (!rp.has_value()) {
        SBENCH_LOG_ERROR("SCENARIO", "cannot resolve %s:%u: %s",
                         cfg_.host.c_str(), cfg_.port,
                         SocketErrorName(rp.get_error()));
        reactor_.Stop();
        return R::error(ScenarioError::kResolveFailed);
      }
    }
    pool_.Start();

    SBENCH_LOG_INFO("SCENARIO",
                    "%u producers, %u consumers on %s:%u, %u workers, "
                    "destination %s x%u",
                    cfg_.producers, cfg_.consumers, cfg_.host.c_str(),
                    cfg_.port, pool_.WorkerCount(),
                    DestinationTypeName(cfg_.destination_type),
                    cfg_.destination_count);

    CreateClients();
    // Subscriptions first so early messages have somewhere to go.
    for (auto& c : consumers_) {
      c->Start();
    }
    for (auto& p : producers_) {
      p->Start();
    }

    SampleLoop();

    counters_.SetDone();
    SBENCH_LOG_INFO("SCENARIO", "stopping %zu clients",
                    consumers_.size() + producers_.size());
    for (auto& p : producers_) {
      p->Shutdown();
    }
    for (auto& c : consumers_) {
      c->Shutdown();
    }
    if (use_stomp_) {
      reactor_.Stop();
    }
    pool_.Shutdown();
    (void)stomp_connector_.DropPending();

    ScenarioSummary summary = Summarize();
    SBENCH_LOG_INFO("SCENARIO",
                    "total produced=%llu consumed=%llu errors=%llu over %u "
                    "samples; mean %.1f/%.1f/%.1f msg/s",
                    static_cast<unsigned long long>(summary.totals.produced),
                    static_cast<unsigned long long>(summary.totals.consumed),
                    static_cast<unsigned long long>(summary.totals.errors),
                    summary.samples, summary.mean.produced,
                    summary.mean.consumed, summary.mean.errors);
    return R::success(summary);
  }

  /// Thread-safe; ends the sampling loop at its next wakeup.
  void RequestStop() {
    std::lock_guard<std::mutex> lk(stop_mtx_);
    stop_requested_ = true;
    stop_cv_.notify_all();
  }

  /// Samples kept after warmup. Valid once Run() returned.
  const std::vector<RateSample>& Samples() const noexcept { return samples_; }

  const LoadCounters& counters() const noexcept { return counters_; }

 private:
  static DispatchPoolConfig MakePoolConfig(const ScenarioConfig& cfg) {
    DispatchPoolConfig pc;
    pc.name = FixedString<32>(TruncateToCapacity, "clients");
    uint32_t workers = cfg.worker_threads;
    if (workers == 0U) {
      workers = std::thread::hardware_concurrency();
    }
    pc.worker_num = workers > 0U ? workers : 1U;
    return pc;
  }

  void CreateClients() {
    const ClientOptions options = cfg_.MakeClientOptions();
    producers_.reserve(cfg_.producers);
    consumers_.reserve(cfg_.consumers);
    for (uint32_t i = 0U; i < cfg_.consumers; ++i) {
      auto queue = pool_.CreateQueue("consumer");
      consumers_.push_back(std::make_shared<Consumer>(
          i, std::move(queue), connector_, counters_, options,
          cfg_.MakeConsumerOptions(i)));
    }
    for (uint32_t i = 0U; i < cfg_.producers; ++i) {
      auto queue = pool_.CreateQueue("producer");
      producers_.push_back(std::make_shared<Producer>(
          i, std::move(queue), connector_, counters_, options,
          cfg_.MakeProducerOptions(i)));
    }
  }

  void SampleLoop() {
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::milliseconds(cfg_.sample_interval_ms);
    uint32_t warmup_left = cfg_.warmup_samples;
    CounterSnapshot prev = counters_.Snapshot();
    auto prev_time = Clock::now();
    auto deadline = prev_time + interval;

    for (;;) {
      {
        std::unique_lock<std::mutex> lk(stop_mtx_);
        if (stop_cv_.wait_until(lk, deadline, [this] { return stop_requested_; })) {
          SBENCH_LOG_INFO("SCENARIO", "stop requested");
          return;
        }
      }
      const auto now = Clock::now();
      const CounterSnapshot cur = counters_.Snapshot();
      const double secs =
          std::chrono::duration<double>(now - prev_time).count();
      RateSample s;
      if (secs > 0.0) {
        s.produced = static_cast<double>(cur.produced - prev.produced) / secs;
        s.consumed = static_cast<double>(cur.consumed - prev.consumed) / secs;
        s.errors = static_cast<double>(cur.errors - prev.errors) / secs;
      }
      prev = cur;
      prev_time = now;
      deadline += interval;

      if (warmup_left > 0U) {
        --warmup_left;
        SBENCH_LOG_INFO("SCENARIO",
                        "warmup: produced %.1f msg/s, consumed %.1f msg/s, "
                        "errors %.1f/s",
                        s.produced, s.consumed, s.errors);
        continue;
      }
      samples_.push_back(s);
      SBENCH_LOG_INFO("SCENARIO",
                      "produced %.1f msg/s, consumed %.1f msg/s, errors %.1f/s",
                      s.produced, s.consumed, s.errors);
      if (cfg_.sample_count > 0U && samples_.size() >= cfg_.sample_count) {
        return;
      }
    }
  }

  ScenarioSummary Summarize() const {
    ScenarioSummary summary;
    summary.totals = counters_.Snapshot();
    summary.samples = static_cast<uint32_t>(samples_.size());
    if (!samples_.empty()) {
      for (const RateSample& s : samples_) {
        summary.mean.produced += s.produced;
        summary.mean.consumed += s.consumed;
        summary.mean.errors += s.errors;
      }
      const double n = static_cast<double>(samples_.size());
      summary.mean.produced /= n;
      summary.mean.consumed /= n;
      summary.mean.errors /= n;
    }
    return summary;
  }

  const ScenarioConfig cfg_;
  LoadCounters counters_;
  DispatchPool pool_;
  Reactor reactor_;
  StompConnector stomp_connector_;
  Connector& connector_;
  const bool use_stomp_;
  bool ran_{false};

  std::vector<std::shared_ptr<Producer>> producers_;
  std::vector<std::shared_ptr<Consumer>> consumers_;
  std::vector<RateSample> samples_;

  std::mutex stop_mtx_;
  std::condition_variable stop_cv_;
  bool stop_requested_{false};
};

}  // namespace sbench

#endif  // SBENCH_SCENARIO_HPP_
