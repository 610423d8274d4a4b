// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/dashboard_config.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace netdash {
namespace config {

std::set<std::string> DashboardConfig::KnownIps() const {
  std::set<std::string> out;
  for (const auto& d : devices) {
    if (d.match_ip) {
      out.insert(*d.match_ip);
    }
  }
  return out;
}

std::vector<std::string> DashboardConfig::KnownIpsOrdered() const {
  std::vector<std::string> out;
  for (const auto& d : devices) {
    if (d.match_ip && std::find(out.begin(), out.end(), *d.match_ip) == out.end()) {
      out.push_back(*d.match_ip);
    }
  }
  return out;
}

namespace {

// Trimmed string value of obj[key]; "" when absent, null or not a string.
std::string StringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return "";
  }
  return util::Trim(it->get<std::string>());
}

std::vector<uint16_t> ParsePorts(const json& value, const std::string& owner, std::vector<std::string>& warnings) {
  std::vector<uint16_t> ports;
  if (!value.is_array()) {
    warnings.push_back(owner + ": ports must be a list");
    return ports;
  }
  for (const auto& p : value) {
    if (p.is_number_integer()) {
      const int64_t port = p.get<int64_t>();
      if (port >= 1 && port <= 65535) {
        ports.push_back(static_cast<uint16_t>(port));
        continue;
      }
    }
    warnings.push_back(owner + ": ignoring invalid port " + p.dump());
  }
  return ports;
}

void ParseDevices(const json& root, DashboardConfig& cfg) {
  auto it = root.find("devices");
  if (it == root.end() || it->is_null()) {
    cfg.warnings.push_back("Missing 'devices' section; no known devices configured");
    return;
  }
  if (!it->is_array()) {
    cfg.warnings.push_back("'devices' must be a list");
    return;
  }

  size_t index = 0;
  for (const auto& entry : *it) {
    ++index;
    if (!entry.is_object()) {
      cfg.warnings.push_back("Device #" + std::to_string(index) + " is not an object; skipped");
      continue;
    }

    discovery::KnownDevice dev;
    dev.name = StringField(entry, "name");
    if (dev.name.empty()) {
      dev.name = "Unnamed";
    }
    dev.notes = StringField(entry, "notes");

    auto match = entry.find("match");
    if (match != entry.end() && match->is_object()) {
      const std::string ip = StringField(*match, "ip");
      const std::string mac = StringField(*match, "mac");
      if (!ip.empty()) {
        if (!util::IsValidIPv4(ip)) {
          cfg.warnings.push_back("Device '" + dev.name + "': match.ip '" + ip + "' is not an IPv4 address");
        }
        dev.match_ip = ip;
      }
      if (!mac.empty()) {
        if (!util::IsValidMac(mac)) {
          cfg.warnings.push_back("Device '" + dev.name + "': match.mac '" + mac + "' is not a MAC address");
        }
        dev.match_mac = util::NormalizeMac(mac);
      }
    }
    if (!dev.match_ip && !dev.match_mac) {
      cfg.warnings.push_back("Device '" + dev.name + "' has no match.ip or match.mac; it can never be observed");
    }

    auto ports = entry.find("ports");
    if (ports != entry.end() && !ports->is_null()) {
      dev.ports = ParsePorts(*ports, "Device '" + dev.name + "'", cfg.warnings);
    }
    cfg.devices.push_back(std::move(dev));
  }
}

void ParseDiscovery(const json& root, DashboardConfig& cfg) {
  auto it = root.find("discovery");
  if (it == root.end() || it->is_null()) {
    cfg.warnings.push_back("Missing 'discovery' section; using defaults");
    return;
  }
  if (!it->is_object()) {
    cfg.warnings.push_back("'discovery' must be an object; using defaults");
    return;
  }
  const json& disc = *it;
  DiscoveryConfig& out = cfg.discovery;

  if (auto mode = disc.find("mode"); mode != disc.end() && mode->is_string()) {
    out.mode = mode->get<std::string>();
    if (out.mode != DiscoveryConfig::MODE_BOUNDED_SWEEP && out.mode != DiscoveryConfig::MODE_NEIGHBORS_ONLY) {
      cfg.warnings.push_back("Unknown discovery mode '" + out.mode + "'; sweep disabled");
    }
  }

  if (auto max = disc.find("max_sweep_hosts"); max != disc.end()) {
    if (!max->is_number_integer() || max->get<int64_t>() <= 0) {
      cfg.warnings.push_back("discovery.max_sweep_hosts must be a positive integer; using 256");
    } else {
      const int64_t value = max->get<int64_t>();
      if (value > DiscoveryConfig::MAX_SWEEP_WARN_THRESHOLD) {
        cfg.warnings.push_back("discovery.max_sweep_hosts=" + std::to_string(value) +
                               " is unusually large; discovery may be slow");
      }
      out.max_sweep_hosts = static_cast<int>(std::min<int64_t>(value, 1 << 20));
    }
  }

  if (auto timeout = disc.find("ping_timeout_ms"); timeout != disc.end()) {
    if (!timeout->is_number_integer() || timeout->get<int64_t>() <= 0) {
      cfg.warnings.push_back("discovery.ping_timeout_ms must be a positive integer; using 900");
    } else {
      out.ping_timeout_ms = static_cast<int>(std::min<int64_t>(timeout->get<int64_t>(), 60000));
    }
  }

  if (auto ports = disc.find("default_ports"); ports != disc.end() && !ports->is_null()) {
    out.default_ports = ParsePorts(*ports, "discovery.default_ports", cfg.warnings);
  }
}

}  // namespace

DashboardConfig ParseConfig(const std::string& text) {
  DashboardConfig cfg;
  json root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    cfg.warnings.push_back("Configuration is not valid JSON; using an empty configuration");
    return cfg;
  }
  if (root.is_null()) {
    root = json::object();
  }
  if (!root.is_object()) {
    cfg.warnings.push_back("Configuration root must be an object; using an empty configuration");
    return cfg;
  }

  try {
    ParseDevices(root, cfg);
    ParseDiscovery(root, cfg);
  } catch (const json::exception& e) {
    cfg.warnings.push_back(std::string("Configuration error: ") + e.what());
  }

  for (const auto& w : cfg.warnings) {
    LOG_CONFIG_WARN("{}", w);
  }
  LOG_CONFIG_DEBUG("Loaded {} known devices (mode={}, max_sweep_hosts={})", cfg.devices.size(), cfg.discovery.mode,
                   cfg.discovery.max_sweep_hosts);
  return cfg;
}

DashboardConfig LoadConfig(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    DashboardConfig cfg;
    cfg.warnings.push_back("Configuration file '" + path + "' not found or unreadable; using an empty configuration");
    LOG_CONFIG_WARN("{}", cfg.warnings.back());
    return cfg;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseConfig(buffer.str());
}

std::string ResolveConfigPath(const std::string& cli_path) {
  if (!cli_path.empty()) {
    return cli_path;
  }
  if (const char* env = std::getenv("NETDASH_CONFIG"); env && *env) {
    return env;
  }
  return "./config.json";
}

bool CacheDisabled() {
  return util::EnvFlag("NETDASH_DISABLE_CACHE");
}

bool NeighborSnapshotDisabled() {
  return util::EnvFlag("NETDASH_DISABLE_NEIGHBOR_SNAPSHOT");
}

}  // namespace config
}  // namespace netdash
