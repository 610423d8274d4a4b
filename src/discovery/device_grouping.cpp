// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/device_grouping.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <mutex>
#include <regex>

namespace netdash {
namespace discovery {

std::string BaseName(const std::string& name) {
  static const std::regex kDomainSuffix(R"(\.(local|lan|home|directory|tail[a-f0-9]{5}\.ts\.net)$)",
                                        std::regex::icase);
  static const std::regex kAnnotation(R"(\s*[\(\[].*?[\)\]])");
  // en/em dashes are multi-byte, so they are alternatives rather than class members
  static const std::regex kVpnWord("(?:\\s|-|–|—)*\\b(tailscale|ts)\\b(?:\\s|-|–|—)*",
                                   std::regex::icase);
  static const std::regex kSpaces(R"(\s{2,})");

  std::string out = std::regex_replace(name, kDomainSuffix, "");
  out = std::regex_replace(out, kAnnotation, "");
  out = std::regex_replace(out, kVpnWord, " ");
  out = std::regex_replace(out, kSpaces, " ");
  return util::Trim(out);
}

namespace {

bool IsDottedQuad(const std::string& s) {
  static const std::regex re(R"(^\d+\.\d+\.\d+\.\d+$)");
  return std::regex_match(s, re);
}

std::optional<std::string> NormalizedOptionalMac(const std::optional<std::string>& mac) {
  if (!mac) {
    return std::nullopt;
  }
  std::string norm = util::NormalizeMac(*mac);
  if (norm.empty()) {
    return std::nullopt;
  }
  return norm;
}

}  // namespace

DeviceGrouper::DeviceGrouper(const std::vector<KnownDevice>& known, const HostIdentity& host) : host_(host) {
  for (const auto& kd : known) {
    const std::string bn = BaseName(kd.name);
    const auto mac = NormalizedOptionalMac(kd.match_mac);

    DeviceGroup seed;
    seed.name = bn;
    seed.mac = mac;
    seed.known = true;
    seed.notes = kd.notes;
    if ((kd.match_ip && host_.OwnsIp(*kd.match_ip)) || (mac && host_.OwnsMac(*mac))) {
      seed.is_host = true;
    }

    if (kd.match_ip) {
      const bool is_host_ip = host_.OwnsIp(*kd.match_ip);
      DeviceInterface iface;
      iface.ip = *kd.match_ip;
      iface.mac = mac;
      iface.ping = is_host_ip;
      for (uint16_t port : kd.ports) {
        iface.ports[port] = false;
      }
      iface.up = is_host_ip;
      iface.kind = InterfaceKindForIp(*kd.match_ip);
      iface.original_name = kd.name;
      // The host can always reach its own addresses
      iface.missing = !is_host_ip;
      seed.interfaces.push_back(std::move(iface));
    }
    seed.Recompute();

    if (groups_.count(bn)) {
      groups_.at(bn).MergeFrom(seed);
    } else {
      GroupFor(bn) = std::move(seed);
    }

    if (mac) {
      known_by_mac_[*mac] = bn;
    }
    known_by_name_[bn] = bn;
    if (kd.match_ip) {
      known_by_ip_[*kd.match_ip] = bn;
    }
  }

  host_key_ = HOST_FALLBACK_KEY;
  for (const auto& key : order_) {
    if (groups_.at(key).is_host) {
      host_key_ = key;
      break;
    }
  }
}

DeviceGroup& DeviceGrouper::GroupFor(const std::string& key) {
  auto it = groups_.find(key);
  if (it != groups_.end()) {
    return it->second;
  }
  order_.push_back(key);
  return groups_[key];
}

void DeviceGrouper::ProbeHostInterfaces(Prober& prober, util::ConcurrencyLimiter& conn_limiter) {
  struct Task {
    DeviceInterface* iface;
    std::vector<uint16_t> ports;
  };
  std::vector<Task> tasks;
  for (const auto& key : order_) {
    DeviceGroup& group = groups_.at(key);
    if (!group.is_host) {
      continue;
    }
    for (auto& iface : group.interfaces) {
      if (!host_.OwnsIp(iface.ip) || iface.ports.empty()) {
        continue;
      }
      Task task{&iface, {}};
      for (const auto& [port, open] : iface.ports) {
        task.ports.push_back(port);
      }
      tasks.push_back(std::move(task));
    }
  }
  if (tasks.empty()) {
    return;
  }

  std::mutex mutex;
  util::RunBounded(tasks.size(), tasks.size(), [&](size_t i) {
    auto status = CheckPorts(prober, tasks[i].iface->ip, tasks[i].ports, conn_limiter);
    const bool any_open = std::any_of(status.begin(), status.end(), [](const auto& kv) { return kv.second; });
    std::lock_guard<std::mutex> lock(mutex);
    tasks[i].iface->ports = std::move(status);
    if (any_open) {
      tasks[i].iface->up = true;
    }
  });

  for (auto& [key, group] : groups_) {
    group.Recompute();
  }
}

std::optional<std::string> DeviceGrouper::KnownKeyFor(const DiscoveredDevice& device, const std::string& base_name,
                                                      const std::optional<std::string>& mac) const {
  if (device.is_host) {
    return host_key_;
  }
  if (mac) {
    if (auto it = known_by_mac_.find(*mac); it != known_by_mac_.end()) {
      return it->second;
    }
  }
  if (auto it = known_by_name_.find(base_name); it != known_by_name_.end()) {
    return it->second;
  }
  if (auto it = known_by_ip_.find(device.ip); it != known_by_ip_.end()) {
    return it->second;
  }
  return std::nullopt;
}

void DeviceGrouper::Fold(const DiscoveredDevice& device, const std::optional<std::string>& gateway_ip) {
  const auto mac = NormalizedOptionalMac(device.mac);
  const std::string ip = device.ip.empty() ? "Unknown IP" : device.ip;
  const bool is_gateway = gateway_ip && ip == *gateway_ip;
  const std::string base_name = is_gateway ? device.name : BaseName(device.name);

  std::string key;
  if (auto known_key = KnownKeyFor(device, base_name, mac)) {
    key = *known_key;
  } else if (mac) {
    key = *mac;
  } else if (!base_name.empty() && !IsDottedQuad(base_name)) {
    key = base_name;
  } else {
    key = ip;
  }

  const bool created = groups_.find(key) == groups_.end();
  DeviceGroup& group = GroupFor(key);
  if (created) {
    group.name = key == HOST_FALLBACK_KEY ? host_.hostname : base_name;
    group.is_host = key == HOST_FALLBACK_KEY;
  }

  DeviceGroup update;
  update.known = device.known;
  update.is_host = device.is_host;
  update.mac = mac;
  update.notes = device.notes;

  DeviceInterface iface;
  iface.ip = ip;
  iface.mac = device.mac;
  iface.ping = device.ping;
  iface.ports = device.ports;
  iface.up = device.up;
  iface.kind = InterfaceKindForIp(ip);
  iface.original_name = device.name;
  iface.conn_type = device.conn_type;
  iface.iface = device.iface;
  iface.missing = false;
  update.interfaces.push_back(std::move(iface));

  group.MergeFrom(update);
}

GroupedDevices DeviceGrouper::Finish() const {
  GroupedDevices out;

  // Known groups whose names only differ in case or decoration collapse into
  // the first one seen
  std::map<std::string, size_t> known_index;
  for (const auto& key : order_) {
    const DeviceGroup& group = groups_.at(key);
    if (group.known) {
      const std::string merge_key = util::ToLower(BaseName(group.name));
      auto it = known_index.find(merge_key);
      if (it == known_index.end()) {
        known_index.emplace(merge_key, out.known_devices.size());
        out.known_devices.push_back(group);
      } else {
        out.known_devices[it->second].MergeFrom(group);
      }
    } else if (!group.interfaces.empty()) {
      out.discovered_devices.push_back(group);
    }
  }

  std::stable_sort(out.known_devices.begin(), out.known_devices.end(),
                   [](const DeviceGroup& a, const DeviceGroup& b) { return util::ToLower(a.name) < util::ToLower(b.name); });
  std::stable_sort(out.discovered_devices.begin(), out.discovered_devices.end(),
                   [](const DeviceGroup& a, const DeviceGroup& b) {
                     if (a.up != b.up) {
                       return a.up;
                     }
                     return util::ToLower(a.name) < util::ToLower(b.name);
                   });
  return out;
}

std::vector<DeviceGroup> BuildKnownStub(const std::vector<KnownDevice>& known, const HostIdentity& host) {
  return DeviceGrouper(known, host).Finish().known_devices;
}

std::vector<std::string> SubnetMismatches(const std::vector<KnownDevice>& known,
                                          const std::optional<util::Ipv4Network>& sweep_network) {
  std::vector<std::string> out;
  if (!sweep_network) {
    return out;
  }
  for (const auto& kd : known) {
    if (!kd.match_ip || InterfaceKindForIp(*kd.match_ip) == InterfaceKind::Overlay) {
      continue;
    }
    auto ip = util::ParseIPv4(*kd.match_ip);
    if (ip && !sweep_network->Contains(*ip)) {
      out.push_back(kd.name + ": " + *kd.match_ip);
    }
  }
  return out;
}

bool GatewayOutsideSweep(const std::optional<std::string>& gateway_ip,
                         const std::optional<util::Ipv4Network>& sweep_network) {
  if (!gateway_ip || !sweep_network) {
    return false;
  }
  auto ip = util::ParseIPv4(*gateway_ip);
  return ip && !sweep_network->Contains(*ip);
}

}  // namespace discovery
}  // namespace netdash
