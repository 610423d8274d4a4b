// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Topology resolver

 Works out where the machine currently sits on the network:
 - local IPv4 networks (optionally only up, non-tunnel interfaces)
 - the addresses and MACs owned by this machine
 - the default gateway and its MAC
 - a best-effort Wi-Fi identity
 - the one network the bounded sweep will cover
 - a fingerprint of all of the above, used to detect roaming

 Helpers taking an address list are pure; ResolveTopology() does the OS
 queries through Platform.
*/

#include "discovery/platform.hpp"
#include "discovery/types.hpp"
#include "util/netaddress.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

struct TopologySnapshot {
  std::vector<InterfaceAddress> addresses;
  // Active, non-tunnel networks in interface order
  std::vector<util::Ipv4Network> networks;
  // Addresses of active, non-tunnel interfaces (no loopback, no overlay)
  std::vector<std::string> host_ips;
  std::optional<std::string> gateway_ip;
  std::optional<std::string> gateway_mac;
  std::string wifi;
  std::optional<util::Ipv4Network> sweep_network;
  std::string fingerprint;
};

// Networks of every non-loopback IPv4 address. A missing netmask is treated as
// 255.255.255.0. De-duplicated, first occurrence wins.
std::vector<util::Ipv4Network> LocalIpv4Networks(const std::vector<InterfaceAddress>& addresses, bool active_only,
                                                 bool exclude_tunnel);

// Addresses of up, non-tunnel interfaces excluding 127.* and 100.*.
std::vector<std::string> ActiveHostIps(const std::vector<InterfaceAddress>& addresses);

// Every local IPv4 (plus 127.0.0.1 and the hostname's address) and every
// interface MAC.
HostIdentity LoadHostIdentity(Platform& platform);

/**
 * Choose the network to sweep
 *
 * 1. The first valid host IP: the network containing it, tightened to its /24;
 *    host/24 if no detected network contains it. Later host IPs are not
 *    considered.
 * 2. Otherwise the gateway, same rules.
 * 3. Otherwise the smallest detected network.
 */
std::optional<util::Ipv4Network> PreferredSweepNetwork(const std::vector<util::Ipv4Network>& networks,
                                                       const std::optional<std::string>& gateway_ip,
                                                       const std::vector<std::string>& host_ips);

// Networks as shown to the user: anything wider than /24 becomes the /24 of
// the first host IP inside it, else network_address/24.
std::vector<std::string> DisplayNetworks(const std::vector<util::Ipv4Network>& networks,
                                         const std::vector<std::string>& host_ips);

// Canonical JSON of the identity inputs (keys sorted, lists sorted).
std::string FingerprintPayload(const std::vector<InterfaceAddress>& addresses,
                               const std::optional<std::string>& gateway_ip,
                               const std::optional<std::string>& gateway_mac, const std::string& wifi);

// SipHash of FingerprintPayload(), 16 hex digits.
std::string ComputeFingerprint(const std::vector<InterfaceAddress>& addresses,
                               const std::optional<std::string>& gateway_ip,
                               const std::optional<std::string>& gateway_mac, const std::string& wifi);

// Query the platform and assemble a snapshot, fingerprint included.
TopologySnapshot ResolveTopology(Platform& platform);

}  // namespace discovery
}  // namespace netdash
