// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Device grouping and merge

 Folds enriched hosts and the configured known devices into logical device
 groups. A group is keyed by the normalized base name of a known device, or,
 for everything else, by MAC, base name or IP.

 Fold priority for a discovered device:
   1. it is this machine           -> the host group
   2. its MAC belongs to a known   -> that known group
   3. its base name is a known one -> that known group
   4. its IP belongs to a known    -> that known group
   5. otherwise                    -> synthetic group (MAC, else base name
                                      unless a bare dotted quad, else IP)

 All merging goes through DeviceGroup::MergeFrom / UpsertInterface, so the
 order in which devices are folded does not change flags or interfaces.
*/

#include "discovery/prober.hpp"
#include "discovery/types.hpp"
#include "util/concurrency.hpp"
#include "util/netaddress.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

// Strip a local domain suffix (.local, .lan, .home, .directory,
// .tailXXXXX.ts.net), parenthesized/bracketed annotations and mesh VPN
// decoration words, then collapse whitespace.
std::string BaseName(const std::string& name);

struct GroupedDevices {
  // Sorted by name, case-insensitive
  std::vector<DeviceGroup> known_devices;
  // Sorted up first, then by name
  std::vector<DeviceGroup> discovered_devices;
};

class DeviceGrouper {
public:
  // Fallback key of the host group when no known device is this machine
  static constexpr const char* HOST_FALLBACK_KEY = "Host machine";

  // Seeds one group per distinct base name of the known devices.
  DeviceGrouper(const std::vector<KnownDevice>& known, const HostIdentity& host);

  // Configured interfaces owned by this machine are never candidates, so
  // their ports are probed here. An open port marks the interface up.
  void ProbeHostInterfaces(Prober& prober, util::ConcurrencyLimiter& conn_limiter);

  void Fold(const DiscoveredDevice& device, const std::optional<std::string>& gateway_ip);

  // Merge near-duplicate known groups, partition and sort.
  GroupedDevices Finish() const;

  const std::string& host_group_key() const { return host_key_; }

private:
  DeviceGroup& GroupFor(const std::string& key);
  std::optional<std::string> KnownKeyFor(const DiscoveredDevice& device, const std::string& base_name,
                                         const std::optional<std::string>& mac) const;

  HostIdentity host_;
  // Insertion order of group keys
  std::vector<std::string> order_;
  std::map<std::string, DeviceGroup> groups_;
  std::map<std::string, std::string> known_by_mac_;
  std::map<std::string, std::string> known_by_name_;
  std::map<std::string, std::string> known_by_ip_;
  std::string host_key_;
};

// The seeded known groups alone, for display before the first cycle ends.
std::vector<DeviceGroup> BuildKnownStub(const std::vector<KnownDevice>& known, const HostIdentity& host);

// "name: ip" for every configured non-overlay IP outside the sweep network.
std::vector<std::string> SubnetMismatches(const std::vector<KnownDevice>& known,
                                          const std::optional<util::Ipv4Network>& sweep_network);

bool GatewayOutsideSweep(const std::optional<std::string>& gateway_ip,
                         const std::optional<util::Ipv4Network>& sweep_network);

}  // namespace discovery
}  // namespace netdash
