/**
 * @file scenario_config.hpp
 * @brief Load scenario parameters: defaults, INI sections, --key=value
 *        overrides, and the per-client option builders.
 *
 * Every field has one key name. The INI file groups the keys in sections
 * ([broker], [load], [producer], [consumer], [report]); the command line
 * uses the same key names without a section.
 */

#ifndef SBENCH_SCENARIO_CONFIG_HPP_
#define SBENCH_SCENARIO_CONFIG_HPP_

#include "sbench/client.hpp"
#include "sbench/config.hpp"
#include "sbench/consumer.hpp"
#include "sbench/log.hpp"
#include "sbench/producer.hpp"
#include "sbench/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

namespace sbench {

// ============================================================================
// DestinationType
// ============================================================================

enum class DestinationType : uint8_t { kQueue = 0, kTopic, kRawQueue, kRawTopic };

inline const char* DestinationTypeName(DestinationType t) noexcept {
  switch (t) {
    case DestinationType::kQueue:    return "queue";
    case DestinationType::kTopic:    return "topic";
    case DestinationType::kRawQueue: return "raw_queue";
    case DestinationType::kRawTopic: return "raw_topic";
  }
  return "unknown";
}

inline bool ParseDestinationType(const char* s, DestinationType& out) noexcept {
  static constexpr DestinationType kAll[] = {
      DestinationType::kQueue, DestinationType::kTopic,
      DestinationType::kRawQueue, DestinationType::kRawTopic};
  for (DestinationType t : kAll) {
    if (std::strcmp(s, DestinationTypeName(t)) == 0) {
      out = t;
      return true;
    }
  }
  return false;
}

// ============================================================================
// ScenarioConfig
// ============================================================================

struct ScenarioConfig {
  // [broker]
  std::string host{"127.0.0.1"};
  uint16_t port{61613U};
  std::string login;
  std::string passcode;
  uint32_t reconnect_backoff_ms{kDefaultReconnectBackoffMs};
  bool display_errors{false};
  // [load]
  uint32_t producers{1U};
  uint32_t consumers{1U};
  DestinationType destination_type{DestinationType::kQueue};
  std::string destination_name{"load"};
  uint32_t destination_count{1U};
  uint32_t worker_threads{0U};  ///< 0: hardware concurrency.
  // [producer]
  uint32_t message_size{1024U};
  bool persistent{false};
  Frame::Header persistent_header{"persistent", "true"};
  bool sync_send{false};
  std::vector<std::vector<Frame::Header>> headers;
  int64_t messages_per_connection{-1};
  int64_t producer_sleep_ms{0};
  // [consumer]
  AckMode ack{AckMode::kAuto};
  bool durable{false};
  std::string selector;
  std::string consumer_prefix{"consumer-"};
  int64_t consumer_sleep_ms{0};
  // [report]
  uint32_t sample_interval_ms{1000U};
  uint32_t sample_count{0U};  ///< 0: run until stopped.
  uint32_t warmup_samples{0U};
  log::Level log_level{log::Level::kInfo};

  /// "/queue/<name>-<i % count>", "/topic/<name>-<i % count>", or the raw name.
  std::string Destination(uint32_t i) const {
    const std::string suffix =
        "-" + std::to_string(i % (destination_count == 0U ? 1U : destination_count));
    switch (destination_type) {
      case DestinationType::kQueue: return "/queue/" + destination_name + suffix;
      case DestinationType::kTopic: return "/topic/" + destination_name + suffix;
      case DestinationType::kRawQueue:
      case DestinationType::kRawTopic: break;
    }
    return destination_name;
  }

  std::vector<Frame::Header> HeadersFor(uint32_t i) const {
    if (headers.empty()) {
      return {};
    }
    return headers[i % headers.size()];
  }

  ClientOptions MakeClientOptions() const {
    ClientOptions o;
    o.broker.host = host;
    o.broker.port = port;
    o.broker.login = login;
    o.broker.passcode = passcode;
    o.display_errors = display_errors;
    o.reconnect_backoff_ms = reconnect_backoff_ms;
    return o;
  }

  ProducerOptions MakeProducerOptions(uint32_t i) const {
    ProducerOptions p;
    p.destination = Destination(i);
    p.message_size = message_size;
    p.persistent = persistent;
    p.persistent_header = persistent_header;
    p.sync_send = sync_send;
    p.headers = HeadersFor(i);
    p.messages_per_connection = messages_per_connection;
    p.sleep_ms = producer_sleep_ms;
    return p;
  }

  ConsumerOptions MakeConsumerOptions(uint32_t i) const {
    ConsumerOptions c;
    c.destination = Destination(i);
    c.ack = ack;
    c.durable = durable;
    c.selector = selector;
    c.consumer_prefix = consumer_prefix;
    c.sleep_ms = consumer_sleep_ms;
    return c;
  }
};

// ============================================================================
// Value parsing
// ============================================================================

namespace detail {

inline bool ParseInt64(const std::string& s, int64_t& out) noexcept {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno != 0 || end == s.c_str() || *end != '\0') return false;
  out = static_cast<int64_t>(v);
  return true;
}

inline bool ParseUint32(const std::string& s, uint32_t min_val, uint32_t& out) noexcept {
  int64_t v = 0;
  if (!ParseInt64(s, v) || v < static_cast<int64_t>(min_val) ||
      v > static_cast<int64_t>(UINT32_MAX)) {
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

/// A signed delay whose magnitude fits in uint32_t milliseconds.
inline bool ParseDelayMs(const std::string& s, int64_t& out) noexcept {
  int64_t v = 0;
  if (!ParseInt64(s, v) || v < -static_cast<int64_t>(UINT32_MAX) ||
      v > static_cast<int64_t>(UINT32_MAX)) {
    return false;
  }
  out = v;
  return true;
}

inline bool ParseFlag(const std::string& s, bool& out) noexcept {
  return ConfigStore::ParseBool(s, out);
}

/// "key:value" split on the first ':'. Both halves must be non-empty.
inline bool ParseHeader(const std::string& s, Frame::Header& out) {
  const size_t colon = s.find(':');
  if (colon == std::string::npos || colon == 0U || colon + 1U >= s.size()) {
    return false;
  }
  out.first = s.substr(0, colon);
  out.second = s.substr(colon + 1U);
  return true;
}

inline std::vector<std::string> Split(const std::string& s, char sep) {
  std::vector<std::string> parts;
  size_t start = 0U;
  while (true) {
    const size_t pos = s.find(sep, start);
    parts.push_back(s.substr(start, pos - start));
    if (pos == std::string::npos) break;
    start = pos + 1U;
  }
  return parts;
}

}  // namespace detail

/**
 * @brief Parse per-client header lists: clients separated by ';', headers by
 *        ','. An empty client entry yields an empty list.
 */
inline bool ParseHeaderLists(const std::string& text,
                             std::vector<std::vector<Frame::Header>>& out) {
  std::vector<std::vector<Frame::Header>> lists;
  if (!text.empty()) {
    for (const std::string& client : detail::Split(text, ';')) {
      std::vector<Frame::Header> list;
      if (!client.empty()) {
        for (const std::string& item : detail::Split(client, ',')) {
          Frame::Header h;
          if (!detail::ParseHeader(item, h)) return false;
          list.push_back(std::move(h));
        }
      }
      lists.push_back(std::move(list));
    }
  }
  out = std::move(lists);
  return true;
}

// ============================================================================
// Field table
// ============================================================================

struct ScenarioKey {
  const char* section;
  const char* key;
};

inline constexpr ScenarioKey kScenarioKeys[] = {
    {"broker", "host"},
    {"broker", "port"},
    {"broker", "login"},
    {"broker", "passcode"},
    {"broker", "reconnect_backoff_ms"},
    {"broker", "display_errors"},
    {"load", "producers"},
    {"load", "consumers"},
    {"load", "destination_type"},
    {"load", "destination_name"},
    {"load", "destination_count"},
    {"load", "worker_threads"},
    {"producer", "message_size"},
    {"producer", "persistent"},
    {"producer", "persistent_header"},
    {"producer", "sync_send"},
    {"producer", "headers"},
    {"producer", "messages_per_connection"},
    {"producer", "producer_sleep_ms"},
    {"consumer", "ack"},
    {"consumer", "durable"},
    {"consumer", "selector"},
    {"consumer", "consumer_prefix"},
    {"consumer", "consumer_sleep_ms"},
    {"report", "sample_interval_ms"},
    {"report", "sample_count"},
    {"report", "warmup_samples"},
    {"report", "log_level"},
};

/**
 * @brief Assign one field by key name.
 * @return kInvalidValue for an unknown key or a value that does not parse.
 *         The field is left unchanged on error.
 */
inline expected<void, ConfigError> ApplyField(ScenarioConfig& cfg,
                                              const std::string& key,
                                              const std::string& value) {
  using R = expected<void, ConfigError>;
  bool ok = false;
  uint32_t u = 0U;
  int64_t i = 0;
  bool b = false;

  if (key == "host") {
    ok = !value.empty();
    if (ok) cfg.host = value;
  } else if (key == "port") {
    ok = detail::ParseUint32(value, 1U, u) && u <= 65535U;
    if (ok) cfg.port = static_cast<uint16_t>(u);
  } else if (key == "login") {
    cfg.login = value;
    ok = true;
  } else if (key == "passcode") {
    cfg.passcode = value;
    ok = true;
  } else if (key == "reconnect_backoff_ms") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.reconnect_backoff_ms = u;
  } else if (key == "display_errors") {
    ok = detail::ParseFlag(value, b);
    if (ok) cfg.display_errors = b;
  } else if (key == "producers") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.producers = u;
  } else if (key == "consumers") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.consumers = u;
  } else if (key == "destination_type") {
    ok = ParseDestinationType(value.c_str(), cfg.destination_type);
  } else if (key == "destination_name") {
    ok = !value.empty();
    if (ok) cfg.destination_name = value;
  } else if (key == "destination_count") {
    ok = detail::ParseUint32(value, 1U, u);
    if (ok) cfg.destination_count = u;
  } else if (key == "worker_threads") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.worker_threads = u;
  } else if (key == "message_size") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.message_size = u;
  } else if (key == "persistent") {
    ok = detail::ParseFlag(value, b);
    if (ok) cfg.persistent = b;
  } else if (key == "persistent_header") {
    Frame::Header h;
    ok = detail::ParseHeader(value, h);
    if (ok) cfg.persistent_header = h;
  } else if (key == "sync_send") {
    ok = detail::ParseFlag(value, b);
    if (ok) cfg.sync_send = b;
  } else if (key == "headers") {
    ok = ParseHeaderLists(value, cfg.headers);
  } else if (key == "messages_per_connection") {
    ok = detail::ParseInt64(value, i);
    if (ok) cfg.messages_per_connection = i;
  } else if (key == "producer_sleep_ms") {
    ok = detail::ParseDelayMs(value, i);
    if (ok) cfg.producer_sleep_ms = i;
  } else if (key == "ack") {
    if (value == "auto") {
      cfg.ack = AckMode::kAuto;
      ok = true;
    } else if (value == "client") {
      cfg.ack = AckMode::kClient;
      ok = true;
    }
  } else if (key == "durable") {
    ok = detail::ParseFlag(value, b);
    if (ok) cfg.durable = b;
  } else if (key == "selector") {
    cfg.selector = value;
    ok = true;
  } else if (key == "consumer_prefix") {
    cfg.consumer_prefix = value;
    ok = true;
  } else if (key == "consumer_sleep_ms") {
    ok = detail::ParseDelayMs(value, i);
    if (ok) cfg.consumer_sleep_ms = i;
  } else if (key == "sample_interval_ms") {
    ok = detail::ParseUint32(value, 1U, u);
    if (ok) cfg.sample_interval_ms = u;
  } else if (key == "sample_count") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.sample_count = u;
  } else if (key == "warmup_samples") {
    ok = detail::ParseUint32(value, 0U, u);
    if (ok) cfg.warmup_samples = u;
  } else if (key == "log_level") {
    ok = log::ParseLevel(value.c_str(), cfg.log_level);
  } else {
    SBENCH_LOG_ERROR("CONFIG", "unknown key '%s'", key.c_str());
    return R::error(ConfigError::kInvalidValue);
  }

  if (!ok) {
    SBENCH_LOG_ERROR("CONFIG", "invalid value for '%s': '%s'", key.c_str(),
                     value.c_str());
    return R::error(ConfigError::kInvalidValue);
  }
  return R::success();
}

/**
 * @brief Apply every entry of @p store to @p cfg, in file order.
 * @return kInvalidValue for the first key that is unknown, sits in the wrong
 *         section, or carries a value that does not parse.
 */
inline expected<void, ConfigError> ApplyConfig(const ConfigStore& store,
                                               ScenarioConfig& cfg) {
  for (const ConfigStore::Entry& e : store.entries()) {
    bool known = false;
    for (const ScenarioKey& k : kScenarioKeys) {
      if (detail::CaseEqual(e.section, k.section) &&
          detail::CaseEqual(e.key, k.key)) {
        known = true;
        auto r = ApplyField(cfg, k.key, e.value);
        if (!r.has_value()) return r;
        break;
      }
    }
    if (!known) {
      SBENCH_LOG_ERROR("CONFIG", "unknown key '%s' in section [%s]",
                       e.key.c_str(), e.section.c_str());
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
  }
  return expected<void, ConfigError>::success();
}

/**
 * @brief Load an INI file into @p cfg. Missing keys keep their current value.
 */
inline expected<void, ConfigError> LoadScenarioConfig(const char* path,
                                                      ScenarioConfig& cfg) {
  IniConfig ini;
  auto r = ini.LoadFile(path);
  if (!r.has_value()) {
    SBENCH_LOG_ERROR("CONFIG", "cannot load '%s' (error %u)", path,
                     static_cast<unsigned>(r.get_error()));
    return r;
  }
  SBENCH_LOG_INFO("CONFIG", "loaded configuration from '%s' (%zu entries)",
                  path, ini.EntryCount());
  return ApplyConfig(ini, cfg);
}

/**
 * @brief Apply one "--key=value" command-line override.
 */
inline expected<void, ConfigError> ApplyArgument(const char* arg,
                                                 ScenarioConfig& cfg) {
  if (arg == nullptr || std::strncmp(arg, "--", 2) != 0) {
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  const char* eq = std::strchr(arg + 2, '=');
  if (eq == nullptr || eq == arg + 2) {
    SBENCH_LOG_ERROR("CONFIG", "expected --key=value, got '%s'", arg);
    return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return ApplyField(cfg, std::string(arg + 2, eq), std::string(eq + 1));
}

/// Scan argv for "--config <path>" and return the path, or nullptr.
inline const char* FindConfigArg(int argc, char* argv[]) {
  for (int i = 1; i < argc - 1; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      return argv[i + 1];
    }
  }
  return nullptr;
}

}  // namespace sbench

#endif  // SBENCH_SCENARIO_CONFIG_HPP_
