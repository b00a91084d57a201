/**
 * @file main.cpp
 * @brief stomp_bench: drive producers and consumers against a STOMP broker
 *        and report message rates.
 *
 * Usage:
 *   stomp_bench [--config stomp_bench.ini] [--key=value ...]
 */

#include "sbench/log.hpp"
#include "sbench/scenario.hpp"
#include "sbench/scenario_config.hpp"
#include "sbench/shutdown.hpp"

#include <cstdio>
#include <cstring>
#include <thread>

namespace {

sbench::Scenario* g_scenario = nullptr;

void PrintUsage(const char* prog) {
  std::printf("Usage: %s [--config <file.ini>] [--key=value ...]\n\n", prog);
  std::printf("Keys (INI section in brackets):\n");
  const char* section = "";
  for (const sbench::ScenarioKey& k : sbench::kScenarioKeys) {
    if (std::strcmp(section, k.section) != 0) {
      section = k.section;
      std::printf("  [%s]\n", section);
    }
    std::printf("    --%s=...\n", k.key);
  }
}

void StopScenario(int signo) {
  if (g_scenario != nullptr) {
    if (signo != 0) {
      SBENCH_LOG_INFO("SCENARIO", "signal %d received", signo);
    }
    g_scenario->RequestStop();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  sbench::ScenarioConfig cfg;

  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    }
  }

  const char* ini_path = sbench::FindConfigArg(argc, argv);
  if (ini_path != nullptr) {
    auto r = sbench::LoadScenarioConfig(ini_path, cfg);
    if (!r.has_value()) {
      return 2;
    }
  }
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0) {
      ++i;
      continue;
    }
    if (!sbench::ApplyArgument(argv[i], cfg).has_value()) {
      std::fprintf(stderr, "invalid argument '%s' (see --help)\n", argv[i]);
      return 2;
    }
  }

  sbench::log::SetLevel(cfg.log_level);
  sbench::log::Init();

  sbench::ShutdownManager shutdown;
  if (!shutdown.InstallSignalHandlers().has_value()) {
    SBENCH_LOG_WARN("SCENARIO", "signal handlers not installed");
  }
  (void)shutdown.Register(&StopScenario);

  sbench::Scenario scenario(cfg);
  g_scenario = &scenario;

  int exit_code = 0;
  std::thread runner([&scenario, &shutdown, &exit_code]() {
    auto r = scenario.Run();
    if (!r.has_value()) {
      SBENCH_LOG_ERROR("SCENARIO", "%s", sbench::ScenarioErrorName(r.get_error()));
      exit_code = 1;
    }
    shutdown.Quit(0);
  });

  shutdown.WaitForShutdown();
  runner.join();
  g_scenario = nullptr;

  sbench::log::Shutdown();
  return exit_code;
}
