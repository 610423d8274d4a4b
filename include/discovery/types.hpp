// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Discovery data model

 Lifetimes
 - KnownDevice: parsed from configuration, immutable until the next reload
 - NeighborEntry / CandidateSet / DiscoveredDevice: built and discarded within
   one discovery cycle
 - DeviceGroup / DiscoveryResult: the cached output of a cycle, replaced
   wholesale by the next successful cycle

 All MAC strings held by these types are normalized lowercase colon-hex.
*/

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

using PortStatus = std::map<uint16_t, bool>;

struct KnownDevice {
  std::string name;
  std::optional<std::string> match_ip;
  std::optional<std::string> match_mac;
  std::vector<uint16_t> ports;
  std::string notes;
};

enum class NeighborState { REACHABLE, STALE, DELAY, PROBE, FAILED, INCOMPLETE, UNKNOWN };

NeighborState ParseNeighborState(const std::string& token);
std::string NeighborStateName(NeighborState state);

struct NeighborEntry {
  std::string ip;
  std::string mac;
  NeighborState state{NeighborState::UNKNOWN};
  std::string iface;

  // FAILED/INCOMPLETE entries carry link-layer data but the host is not
  // currently present.
  bool IsPresent() const { return state != NeighborState::FAILED && state != NeighborState::INCOMPLETE; }

  bool operator==(const NeighborEntry&) const = default;
};

// One IPv4 address bound to a local interface.
struct InterfaceAddress {
  std::string name;
  std::string address;
  std::string netmask;  // dotted; empty if the OS did not report one
  bool is_up{false};
  bool is_loopback{false};
};

// Link-layer address of a local interface.
struct InterfaceLink {
  std::string name;
  std::string mac;
};

// Addresses and MACs that belong to the machine running discovery.
struct HostIdentity {
  std::set<std::string> ips;   // every local IPv4 plus 127.0.0.1
  std::set<std::string> macs;  // normalized
  std::string hostname;

  bool OwnsIp(const std::string& ip) const { return ips.count(ip) > 0; }
  bool OwnsMac(const std::string& mac) const { return macs.count(mac) > 0; }
};

// IPs under consideration in the current cycle plus whatever link-layer data
// was learned for them. A missing mac_by_ip entry, or an entry holding
// nullopt, both mean "no MAC learned".
struct CandidateSet {
  std::set<std::string> ips;
  std::map<std::string, std::optional<std::string>> mac_by_ip;
  std::map<std::string, std::optional<std::string>> iface_by_ip;

  bool Contains(const std::string& ip) const { return ips.count(ip) > 0; }
  std::optional<std::string> MacFor(const std::string& ip) const;
  std::optional<std::string> IfaceFor(const std::string& ip) const;
};

enum class ConnectionType { Wired, Wireless };
std::string ConnectionTypeName(ConnectionType type);

// Local LAN address, or an address on a mesh VPN overlay (100.64.0.0/10).
enum class InterfaceKind { Local, Overlay };
std::string InterfaceKindName(InterfaceKind kind);
InterfaceKind InterfaceKindForIp(const std::string& ip);

struct DiscoveredDevice {
  std::string ip;
  std::string name;
  std::optional<std::string> mac;
  bool known{false};
  std::string notes;
  bool ping{false};
  PortStatus ports;
  bool up{false};
  std::optional<std::string> iface;
  ConnectionType conn_type{ConnectionType::Wired};
  bool is_host{false};
};

// One observed (or configured) address of a logical device.
struct DeviceInterface {
  std::string ip;
  std::optional<std::string> mac;
  bool ping{false};
  PortStatus ports;
  bool up{false};
  InterfaceKind kind{InterfaceKind::Local};
  std::string original_name;
  ConnectionType conn_type{ConnectionType::Wired};
  std::optional<std::string> iface;
  // Configured but not (yet) observed on the network.
  bool missing{true};

  // Combine two records for the same IP. Booleans OR (missing ANDs), port
  // maps merge by OR per port, scalars keep the first non-empty value.
  void MergeFrom(const DeviceInterface& other);
};

struct DeviceGroup {
  std::string name;
  std::optional<std::string> mac;
  bool known{false};
  std::string notes;
  std::vector<DeviceInterface> interfaces;
  // Derived from interfaces; see Recompute().
  bool up{false};
  bool missing{true};
  bool is_host{false};
  bool has_overlay{false};

  // Insert or merge by IP, then Recompute().
  void UpsertInterface(const DeviceInterface& iface);

  // Fold another group into this one: OR on flags, first-non-empty on mac and
  // notes, upsert on interfaces.
  void MergeFrom(const DeviceGroup& other);

  // up = OR(interfaces.up); missing = AND(interfaces.missing) (true if none);
  // has_overlay also set by any overlay interface.
  void Recompute();
};

struct DiscoveryMeta {
  std::string neighbor_source;
  size_t sweep_size{0};
  size_t ping_hits{0};
  size_t port_only_hits{0};
  bool transparent_proxy_detected{false};
  int64_t duration_ms{0};
  int64_t completed_at{0};
  std::optional<std::string> gateway_ip;
  std::optional<std::string> gateway_mac;
  bool gateway_outside_sweep{false};
  std::optional<std::string> sweep_network;
  std::vector<std::string> host_ips;
  std::vector<std::string> subnet_mismatches;
};

struct DiscoveryResult {
  std::vector<std::string> networks;
  size_t neighbors_count{0};
  std::string mode;
  std::vector<DeviceGroup> known_devices;
  std::vector<DeviceGroup> discovered_devices;
  DiscoveryMeta meta;
};

}  // namespace discovery
}  // namespace netdash
