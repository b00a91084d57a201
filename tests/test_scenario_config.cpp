/**
 * @file test_scenario_config.cpp
 * @brief Tests for scenario_config.hpp
 */

#include "sbench/scenario_config.hpp"

#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

using sbench::ConfigError;
using sbench::DestinationType;
using sbench::Frame;
using sbench::ScenarioConfig;

// ============================================================================
// Defaults and derived values
// ============================================================================

TEST_CASE("ScenarioConfig defaults", "[scenario_config]") {
  ScenarioConfig cfg;
  REQUIRE(cfg.host == "127.0.0.1");
  REQUIRE(cfg.port == 61613U);
  REQUIRE(cfg.reconnect_backoff_ms == 1000U);
  REQUIRE(cfg.producers == 1U);
  REQUIRE(cfg.consumers == 1U);
  REQUIRE(cfg.destination_type == DestinationType::kQueue);
  REQUIRE(cfg.message_size == 1024U);
  REQUIRE(cfg.persistent_header == Frame::Header("persistent", "true"));
  REQUIRE(cfg.messages_per_connection == -1);
  REQUIRE(cfg.ack == sbench::AckMode::kAuto);
  REQUIRE(cfg.consumer_prefix == "consumer-");
  REQUIRE(cfg.sample_interval_ms == 1000U);
  REQUIRE(cfg.sample_count == 0U);
  REQUIRE(cfg.log_level == sbench::log::Level::kInfo);
}

TEST_CASE("ScenarioConfig Destination spreads clients over destinations", "[scenario_config]") {
  ScenarioConfig cfg;
  cfg.destination_name = "orders";
  cfg.destination_count = 3U;

  REQUIRE(cfg.Destination(0U) == "/queue/orders-0");
  REQUIRE(cfg.Destination(4U) == "/queue/orders-1");

  cfg.destination_type = DestinationType::kTopic;
  REQUIRE(cfg.Destination(2U) == "/topic/orders-2");
  REQUIRE(cfg.Destination(3U) == "/topic/orders-0");

  cfg.destination_type = DestinationType::kRawQueue;
  cfg.destination_name = "jms.queue.orders";
  REQUIRE(cfg.Destination(5U) == "jms.queue.orders");
  cfg.destination_type = DestinationType::kRawTopic;
  REQUIRE(cfg.Destination(0U) == "jms.queue.orders");
}

TEST_CASE("ScenarioConfig HeadersFor cycles the header lists", "[scenario_config]") {
  ScenarioConfig cfg;
  REQUIRE(cfg.HeadersFor(0U).empty());

  REQUIRE(sbench::ParseHeaderLists("a:1,b:2;;c:3", cfg.headers));
  REQUIRE(cfg.headers.size() == 3U);
  REQUIRE(cfg.HeadersFor(0U).size() == 2U);
  REQUIRE(cfg.HeadersFor(1U).empty());
  REQUIRE(cfg.HeadersFor(2U)[0] == Frame::Header("c", "3"));
  REQUIRE(cfg.HeadersFor(3U)[1] == Frame::Header("b", "2"));
}

TEST_CASE("ParseHeaderLists rejects malformed headers", "[scenario_config]") {
  std::vector<std::vector<Frame::Header>> out{{{"keep", "me"}}};
  REQUIRE(!sbench::ParseHeaderLists("a:1,novalue", out));
  REQUIRE(!sbench::ParseHeaderLists(":x", out));
  REQUIRE(!sbench::ParseHeaderLists("x:", out));
  REQUIRE(out.size() == 1U);

  REQUIRE(sbench::ParseHeaderLists("url:http://h:80/p", out));
  REQUIRE(out[0][0] == Frame::Header("url", "http://h:80/p"));

  REQUIRE(sbench::ParseHeaderLists("", out));
  REQUIRE(out.empty());
}

TEST_CASE("ScenarioConfig builds per-client options", "[scenario_config]") {
  ScenarioConfig cfg;
  cfg.host = "mq";
  cfg.port = 1234U;
  cfg.login = "u";
  cfg.passcode = "p";
  cfg.reconnect_backoff_ms = 50U;
  cfg.display_errors = true;
  cfg.destination_count = 2U;
  cfg.message_size = 10U;
  cfg.sync_send = true;
  cfg.messages_per_connection = 100;
  cfg.producer_sleep_ms = -5;
  cfg.ack = sbench::AckMode::kClient;
  cfg.selector = "x = 1";
  cfg.consumer_sleep_ms = 20;
  REQUIRE(sbench::ParseHeaderLists("h:0;h:1", cfg.headers));

  const sbench::ClientOptions o = cfg.MakeClientOptions();
  REQUIRE(o.broker.host == "mq");
  REQUIRE(o.broker.port == 1234U);
  REQUIRE(o.broker.login == "u");
  REQUIRE(o.broker.passcode == "p");
  REQUIRE(o.reconnect_backoff_ms == 50U);
  REQUIRE(o.display_errors);

  const sbench::ProducerOptions p = cfg.MakeProducerOptions(1U);
  REQUIRE(p.destination == "/queue/load-1");
  REQUIRE(p.message_size == 10U);
  REQUIRE(p.sync_send);
  REQUIRE(p.messages_per_connection == 100);
  REQUIRE(p.sleep_ms == -5);
  REQUIRE(p.headers.size() == 1U);
  REQUIRE(p.headers[0] == Frame::Header("h", "1"));

  const sbench::ConsumerOptions c = cfg.MakeConsumerOptions(2U);
  REQUIRE(c.destination == "/queue/load-0");
  REQUIRE(c.ack == sbench::AckMode::kClient);
  REQUIRE(c.selector == "x = 1");
  REQUIRE(c.sleep_ms == 20);
}

// ============================================================================
// Overrides
// ============================================================================

TEST_CASE("ApplyArgument assigns known keys", "[scenario_config]") {
  ScenarioConfig cfg;
  REQUIRE(sbench::ApplyArgument("--producers=16", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--destination_type=raw_topic", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--persistent=yes", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--persistent_header=JMSDeliveryMode:2", cfg)
              .has_value());
  REQUIRE(sbench::ApplyArgument("--consumer_sleep_ms=-30", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--ack=client", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--log_level=error", cfg).has_value());
  REQUIRE(sbench::ApplyArgument("--login=", cfg).has_value());

  REQUIRE(cfg.producers == 16U);
  REQUIRE(cfg.destination_type == DestinationType::kRawTopic);
  REQUIRE(cfg.persistent);
  REQUIRE(cfg.persistent_header == Frame::Header("JMSDeliveryMode", "2"));
  REQUIRE(cfg.consumer_sleep_ms == -30);
  REQUIRE(cfg.ack == sbench::AckMode::kClient);
  REQUIRE(cfg.log_level == sbench::log::Level::kError);
  REQUIRE(cfg.login.empty());
}

TEST_CASE("ApplyArgument rejects malformed arguments", "[scenario_config]") {
  ScenarioConfig cfg;
  REQUIRE(!sbench::ApplyArgument("producers=2", cfg).has_value());
  REQUIRE(!sbench::ApplyArgument("--producers", cfg).has_value());
  REQUIRE(!sbench::ApplyArgument("--=2", cfg).has_value());
  REQUIRE(!sbench::ApplyArgument(nullptr, cfg).has_value());
  REQUIRE(cfg.producers == 1U);
}

TEST_CASE("ApplyField rejects unknown keys and bad values", "[scenario_config]") {
  ScenarioConfig cfg;
  const std::vector<std::pair<std::string, std::string>> bad = {
      {"no_such_key", "1"},
      {"port", "0"},
      {"port", "65536"},
      {"port", "http"},
      {"producers", "-1"},
      {"destination_count", "0"},
      {"destination_type", "mailbox"},
      {"destination_name", ""},
      {"host", ""},
      {"sample_interval_ms", "0"},
      {"ack", "client-individual"},
      {"durable", "maybe"},
      {"persistent_header", "novalue"},
      {"messages_per_connection", "10x"},
      {"log_level", "verbose"},
  };
  for (const auto& kv : bad) {
    INFO(kv.first << "=" << kv.second);
    auto r = sbench::ApplyField(cfg, kv.first, kv.second);
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == ConfigError::kInvalidValue);
  }
  // Nothing was modified.
  const ScenarioConfig fresh;
  REQUIRE(cfg.port == fresh.port);
  REQUIRE(cfg.destination_count == fresh.destination_count);
  REQUIRE(cfg.destination_type == fresh.destination_type);
  REQUIRE(cfg.destination_name == fresh.destination_name);
  REQUIRE(cfg.host == fresh.host);
}

TEST_CASE("ApplyField bounds sleep delays to 32-bit milliseconds", "[scenario_config]") {
  ScenarioConfig cfg;
  REQUIRE(sbench::ApplyField(cfg, "producer_sleep_ms", "4294967295").has_value());
  REQUIRE(cfg.producer_sleep_ms == 4294967295LL);
  REQUIRE(sbench::ApplyField(cfg, "consumer_sleep_ms", "-4294967295").has_value());
  REQUIRE(cfg.consumer_sleep_ms == -4294967295LL);

  const std::vector<std::string> too_big = {
      "4294967296", "-4294967296", "9223372036854775807",
      "-9223372036854775808"};
  for (const std::string& v : too_big) {
    INFO(v);
    REQUIRE(!sbench::ApplyField(cfg, "producer_sleep_ms", v).has_value());
    REQUIRE(!sbench::ApplyField(cfg, "consumer_sleep_ms", v).has_value());
  }
  REQUIRE(cfg.producer_sleep_ms == 4294967295LL);
  REQUIRE(cfg.consumer_sleep_ms == -4294967295LL);
}

TEST_CASE("AbsDelayMs takes the magnitude and saturates", "[scenario_config]") {
  REQUIRE(sbench::AbsDelayMs(0) == 0U);
  REQUIRE(sbench::AbsDelayMs(250) == 250U);
  REQUIRE(sbench::AbsDelayMs(-250) == 250U);
  REQUIRE(sbench::AbsDelayMs(-4294967295LL) == UINT32_MAX);
  REQUIRE(sbench::AbsDelayMs(4294967296LL) == UINT32_MAX);
  REQUIRE(sbench::AbsDelayMs(INT64_MIN) == UINT32_MAX);
}

TEST_CASE("Every table key is accepted by ApplyField", "[scenario_config]") {
  for (const sbench::ScenarioKey& k : sbench::kScenarioKeys) {
    ScenarioConfig cfg;
    std::string value = "1";
    const std::string key = k.key;
    if (key == "destination_type") value = "topic";
    if (key == "ack") value = "auto";
    if (key == "persistent_header") value = "k:v";
    if (key == "headers") value = "k:v";
    if (key == "log_level") value = "info";
    if (key == "host" || key == "destination_name") value = "x";
    INFO(key);
    REQUIRE(sbench::ApplyField(cfg, key, value).has_value());
  }
}

TEST_CASE("ApplyConfig reads sectioned keys from a store", "[scenario_config]") {
  sbench::IniConfig store;
  store.Set("broker", "host", "10.1.1.1");
  store.Set("Broker", "PORT", "61000");
  store.Set("load", "consumers", "4");
  store.Set("producer", "headers", "a:1;b:2");
  store.Set("report", "sample_count", "12");

  ScenarioConfig cfg;
  REQUIRE(sbench::ApplyConfig(store, cfg).has_value());
  REQUIRE(cfg.host == "10.1.1.1");
  REQUIRE(cfg.port == 61000U);
  REQUIRE(cfg.consumers == 4U);
  REQUIRE(cfg.headers.size() == 2U);
  REQUIRE(cfg.sample_count == 12U);
  REQUIRE(cfg.producers == 1U);
}

TEST_CASE("ApplyConfig stops at the first invalid value", "[scenario_config]") {
  sbench::IniConfig store;
  store.Set("load", "producers", "6");
  store.Set("broker", "port", "99999");
  store.Set("load", "consumers", "6");
  ScenarioConfig cfg;
  auto r = sbench::ApplyConfig(store, cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kInvalidValue);
  REQUIRE(cfg.producers == 6U);
  REQUIRE(cfg.consumers == 1U);
}

TEST_CASE("ApplyConfig rejects unknown and misplaced keys", "[scenario_config]") {
  ScenarioConfig cfg;

  sbench::IniConfig misplaced;
  misplaced.Set("load", "port", "1");
  REQUIRE(!sbench::ApplyConfig(misplaced, cfg).has_value());
  REQUIRE(cfg.port == 61613U);

  sbench::IniConfig unknown;
  unknown.Set("broker", "hostname", "x");
  REQUIRE(!sbench::ApplyConfig(unknown, cfg).has_value());
}

TEST_CASE("FindConfigArg locates --config", "[scenario_config]") {
  char prog[] = "stomp_bench";
  char flag[] = "--config";
  char path[] = "bench.ini";
  char other[] = "--producers=2";

  char* with[] = {prog, other, flag, path};
  REQUIRE(std::string(sbench::FindConfigArg(4, with)) == "bench.ini");

  char* dangling[] = {prog, other, flag};
  REQUIRE(sbench::FindConfigArg(3, dangling) == nullptr);

  char* without[] = {prog, other};
  REQUIRE(sbench::FindConfigArg(2, without) == nullptr);
}

#ifdef SBENCH_CONFIG_INI_ENABLED

TEST_CASE("LoadScenarioConfig reads an INI file", "[scenario_config][ini]") {
  const char* path = "/tmp/__sbench_scenario__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f,
               "[broker]\nport = 61999\n"
               "[load]\ndestination_type = topic\nproducers = 3\n"
               "[consumer]\nack = client\n");
  std::fclose(f);

  ScenarioConfig cfg;
  REQUIRE(sbench::LoadScenarioConfig(path, cfg).has_value());
  REQUIRE(cfg.port == 61999U);
  REQUIRE(cfg.destination_type == DestinationType::kTopic);
  REQUIRE(cfg.producers == 3U);
  REQUIRE(cfg.ack == sbench::AckMode::kClient);
  std::remove(path);
}

TEST_CASE("LoadScenarioConfig rejects a malformed file", "[scenario_config][ini]") {
  const char* path = "/tmp/__sbench_scenario_bad__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[broker\nport = 61999\n");
  std::fclose(f);

  ScenarioConfig cfg;
  auto r = sbench::LoadScenarioConfig(path, cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kParseError);
  std::remove(path);
}

TEST_CASE("LoadScenarioConfig reports a missing file", "[scenario_config][ini]") {
  ScenarioConfig cfg;
  auto r = sbench::LoadScenarioConfig("/tmp/__sbench_missing__.ini", cfg);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kFileNotFound);
}

#endif  // SBENCH_CONFIG_INI_ENABLED
