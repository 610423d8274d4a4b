// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/dashboard_config.hpp"
#include "discovery/device_grouping.hpp"
#include "discovery/discovery_engine.hpp"
#include "discovery/platform.hpp"
#include "discovery/prober.hpp"
#include "discovery/result_json.hpp"
#include "discovery/topology.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

void PrintUsage(const char* program_name) {
  std::cout << "netdash discovery - find the devices on the local network\n\n"
            << "Usage: " << program_name << " [options]\n\n"
            << "Options:\n"
            << "  --config=<path>      Configuration file (default: $NETDASH_CONFIG or ./config.json)\n"
            << "  --fresh              Ignore the cached result and the neighbor snapshot\n"
            << "  --fast               Small sweep, no port probing, no reverse DNS\n"
            << "  --no-cache           Do not read or store cached results\n"
            << "  --loglevel=<level>   trace, debug, info, warn, error (default: warn)\n"
            << "  --watch=<seconds>    Refresh in the background every <seconds> and print each result\n"
            << "  --stub               Print the configured devices without running discovery\n"
            << "  --help               Show this help message\n"
            << std::endl;
}

void PrintResult(const netdash::discovery::DiscoveryResult& result, const std::vector<std::string>& warnings) {
  nlohmann::json out = netdash::discovery::ToJson(result);
  if (!warnings.empty()) {
    out["meta"]["config_warnings"] = warnings;
  }
  std::cout << out.dump(2) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace netdash;

  try {
    std::string config_path;
    std::string log_level = "warn";
    bool fresh = false;
    bool fast = false;
    bool no_cache = false;
    bool stub = false;
    int64_t watch_interval = 0;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg.starts_with("--config=")) {
        config_path = arg.substr(9);
        if (config_path.empty()) {
          std::cerr << "Error: --config requires a non-empty path\n";
          return 1;
        }
      } else if (arg == "--fresh") {
        fresh = true;
      } else if (arg == "--fast") {
        fast = true;
      } else if (arg == "--no-cache") {
        no_cache = true;
      } else if (arg == "--stub") {
        stub = true;
      } else if (arg.starts_with("--loglevel=")) {
        log_level = arg.substr(11);
      } else if (arg.starts_with("--watch=")) {
        auto seconds = util::SafeParseInt(arg.substr(8), 1, 86400);
        if (!seconds) {
          std::cerr << "Error: --watch expects a number of seconds between 1 and 86400\n";
          return 1;
        }
        watch_interval = *seconds;
      } else {
        std::cerr << "Error: Unknown option: " << arg << "\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    if (watch_interval > 0 && no_cache) {
      std::cerr << "Error: --watch cannot be combined with --no-cache\n";
      return 1;
    }

    util::LogManager::Initialize(log_level, false, "");

    const config::DashboardConfig cfg = config::LoadConfig(config::ResolveConfigPath(config_path));

    discovery::SystemPlatform platform;
    if (stub) {
      const auto host = discovery::LoadHostIdentity(platform);
      nlohmann::json out = nlohmann::json::array();
      for (const auto& group : discovery::BuildKnownStub(cfg.devices, host)) {
        out.push_back(discovery::ToJson(group));
      }
      std::cout << out.dump(2) << std::endl;
      return 0;
    }

    discovery::EngineOptions options = discovery::EngineOptions::FromEnvironment();
    if (no_cache) {
      options.cache_disabled = true;
    }
    discovery::SystemProber prober(platform, options.concurrency.dns);
    discovery::DiscoveryEngine engine(platform, prober, options);

    if (watch_interval == 0) {
      PrintResult(engine.Discover(cfg, fresh, fast), cfg.warnings);
      util::LogManager::Shutdown();
      return 0;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    // First cycle honors --fresh; later ones rely on the cache TTL and the
    // fingerprint check.
    bool force = fresh;
    int64_t last_printed = 0;
    while (!g_stop_requested) {
      // The loop itself paces the refreshes
      engine.Kick(cfg, force, 0, fast);
      force = false;
      for (int64_t waited = 0; waited < watch_interval * 10 && !g_stop_requested; ++waited) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        if (!engine.IsRunning()) {
          auto cached = engine.GetCached();
          if (cached && cached->meta.completed_at != last_printed) {
            last_printed = cached->meta.completed_at;
            PrintResult(*cached, cfg.warnings);
          }
        }
      }
    }

    engine.WaitForBackground();
    util::LogManager::Shutdown();
    return 0;

  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
