// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Dashboard configuration

 JSON file:
   {
     "devices": [
       {"name": "Printer", "match": {"ip": "192.168.1.50", "mac": "AA:BB:.."},
        "ports": [9100], "notes": "upstairs"}
     ],
     "discovery": {"mode": "bounded_sweep", "max_sweep_hosts": 256,
                   "ping_timeout_ms": 900, "default_ports": [22, 80, 443, 3389]}
   }

 Loading never fails: problems are reported in DashboardConfig::warnings and
 the affected values fall back to their defaults.
*/

#include "discovery/types.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace netdash {
namespace config {

struct DiscoveryConfig {
  static constexpr const char* MODE_BOUNDED_SWEEP = "bounded_sweep";
  static constexpr const char* MODE_NEIGHBORS_ONLY = "neighbors_only";
  static constexpr int MAX_SWEEP_WARN_THRESHOLD = 1024;

  std::string mode{MODE_BOUNDED_SWEEP};
  int max_sweep_hosts{256};
  int ping_timeout_ms{900};
  std::vector<uint16_t> default_ports{22, 80, 443, 3389};

  bool IsBoundedSweep() const { return mode == MODE_BOUNDED_SWEEP; }
};

struct DashboardConfig {
  std::vector<discovery::KnownDevice> devices;
  DiscoveryConfig discovery;
  std::vector<std::string> warnings;

  // Configured match IPs
  std::set<std::string> KnownIps() const;
  // Configured match IPs in declaration order, without duplicates
  std::vector<std::string> KnownIpsOrdered() const;
};

// Parse JSON text. Never throws.
DashboardConfig ParseConfig(const std::string& text);

// Read and parse a file. A missing or unreadable file yields an empty
// configuration with a warning.
DashboardConfig LoadConfig(const std::string& path);

// --config value if given, else $NETDASH_CONFIG, else ./config.json
std::string ResolveConfigPath(const std::string& cli_path);

// NETDASH_DISABLE_CACHE
bool CacheDisabled();
// NETDASH_DISABLE_NEIGHBOR_SNAPSHOT
bool NeighborSnapshotDisabled();

}  // namespace config
}  // namespace netdash
