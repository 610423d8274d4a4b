// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/topology.hpp"

#include "util/logging.hpp"
#include "util/siphash.hpp"

#include <algorithm>
#include <set>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace netdash {
namespace discovery {

namespace {

// Fixed key; the fingerprint only has to be stable, not secret.
constexpr uint64_t FINGERPRINT_K0 = 0x6e65746461736801ULL;
constexpr uint64_t FINGERPRINT_K1 = 0x746f706f6c6f6779ULL;

bool IsActiveLan(const InterfaceAddress& a) {
  return a.is_up && !IsTunnelInterface(a.name);
}

}  // namespace

std::vector<util::Ipv4Network> LocalIpv4Networks(const std::vector<InterfaceAddress>& addresses, bool active_only,
                                                 bool exclude_tunnel) {
  std::vector<util::Ipv4Network> out;
  for (const auto& a : addresses) {
    if (active_only && !a.is_up) {
      continue;
    }
    if (exclude_tunnel && IsTunnelInterface(a.name)) {
      continue;
    }
    auto ip = util::ParseIPv4(a.address);
    if (!ip || util::IsIPv4Loopback(*ip)) {
      continue;
    }
    auto net = util::Ipv4Network::FromAddressAndMask(a.address, a.netmask);
    if (!net) {
      continue;
    }
    if (std::find(out.begin(), out.end(), *net) == out.end()) {
      out.push_back(*net);
    }
  }
  return out;
}

std::vector<std::string> ActiveHostIps(const std::vector<InterfaceAddress>& addresses) {
  std::vector<std::string> out;
  for (const auto& a : addresses) {
    if (!IsActiveLan(a) || a.address.empty()) {
      continue;
    }
    if (a.address.starts_with("127.") || a.address.starts_with("100.")) {
      continue;
    }
    out.push_back(a.address);
  }
  return out;
}

HostIdentity LoadHostIdentity(Platform& platform) {
  HostIdentity host;
  for (const auto& a : platform.ListInterfaceAddresses()) {
    if (!a.address.empty()) {
      host.ips.insert(a.address);
    }
  }
  for (const auto& link : platform.ListInterfaceLinks()) {
    const std::string mac = util::NormalizeMac(link.mac);
    if (!mac.empty()) {
      host.macs.insert(mac);
    }
  }
  host.ips.insert("127.0.0.1");
  if (auto addr = platform.HostnameAddress()) {
    host.ips.insert(*addr);
  }
  host.hostname = platform.Hostname();
  return host;
}

std::optional<util::Ipv4Network> PreferredSweepNetwork(const std::vector<util::Ipv4Network>& networks,
                                                       const std::optional<std::string>& gateway_ip,
                                                       const std::vector<std::string>& host_ips) {
  auto containing = [&](uint32_t ip) -> util::Ipv4Network {
    for (const auto& net : networks) {
      if (net.Contains(ip)) {
        return net.Tighten24(ip);
      }
    }
    return util::Ipv4Network(ip, 24);
  };

  for (const auto& host : host_ips) {
    if (auto ip = util::ParseIPv4(host)) {
      return containing(*ip);
    }
  }

  if (gateway_ip) {
    if (auto gw = util::ParseIPv4(*gateway_ip)) {
      return containing(*gw);
    }
  }

  if (networks.empty()) {
    return std::nullopt;
  }
  return *std::min_element(networks.begin(), networks.end(),
                           [](const auto& a, const auto& b) { return a.NumAddresses() < b.NumAddresses(); });
}

std::vector<std::string> DisplayNetworks(const std::vector<util::Ipv4Network>& networks,
                                         const std::vector<std::string>& host_ips) {
  std::vector<std::string> out;
  for (const auto& net : networks) {
    if (net.prefix() >= 24) {
      out.push_back(net.ToString());
      continue;
    }
    std::optional<util::Ipv4Network> tightened;
    for (const auto& host : host_ips) {
      auto ip = util::ParseIPv4(host);
      if (ip && net.Contains(*ip)) {
        tightened = util::Ipv4Network(*ip, 24);
        break;
      }
    }
    out.push_back(tightened.value_or(util::Ipv4Network(net.network(), 24)).ToString());
  }
  return out;
}

std::string FingerprintPayload(const std::vector<InterfaceAddress>& addresses,
                               const std::optional<std::string>& gateway_ip,
                               const std::optional<std::string>& gateway_mac, const std::string& wifi) {
  std::vector<std::string> nets;
  for (const auto& net : LocalIpv4Networks(addresses, true, true)) {
    nets.push_back(net.ToString());
  }
  std::sort(nets.begin(), nets.end());

  std::vector<std::string> addrs;
  for (const auto& a : addresses) {
    if (!IsActiveLan(a) || a.address.empty() || a.address.starts_with("127.")) {
      continue;
    }
    addrs.push_back(a.name + ":" + a.address + "/" + a.netmask);
  }
  std::sort(addrs.begin(), addrs.end());

  // nlohmann::json objects keep keys sorted
  json payload;
  payload["nets"] = nets;
  payload["addrs"] = addrs;
  payload["gateway"] = gateway_ip.value_or("");
  payload["gateway_mac"] = gateway_mac.value_or("");
  payload["wifi"] = wifi;
  return payload.dump();
}

std::string ComputeFingerprint(const std::vector<InterfaceAddress>& addresses,
                               const std::optional<std::string>& gateway_ip,
                               const std::optional<std::string>& gateway_mac, const std::string& wifi) {
  const std::string raw = FingerprintPayload(addresses, gateway_ip, gateway_mac, wifi);
  return util::SipHasher(FINGERPRINT_K0, FINGERPRINT_K1).Write(raw).HexDigest();
}

TopologySnapshot ResolveTopology(Platform& platform) {
  TopologySnapshot topo;
  topo.addresses = platform.ListInterfaceAddresses();
  topo.networks = LocalIpv4Networks(topo.addresses, true, true);
  topo.host_ips = ActiveHostIps(topo.addresses);
  topo.gateway_ip = platform.DefaultGateway();
  if (topo.gateway_ip) {
    topo.gateway_mac = platform.GatewayMac(*topo.gateway_ip);
  }
  topo.wifi = platform.WifiIdentity();
  topo.fingerprint = ComputeFingerprint(topo.addresses, topo.gateway_ip, topo.gateway_mac, topo.wifi);
  topo.sweep_network = PreferredSweepNetwork(topo.networks, topo.gateway_ip, topo.host_ips);

  LOG_DISC_DEBUG("topology: {} networks, gateway={}, sweep={}, fingerprint={}", topo.networks.size(),
                 topo.gateway_ip.value_or("none"), topo.sweep_network ? topo.sweep_network->ToString() : "none",
                 topo.fingerprint);
  return topo;
}

}  // namespace discovery
}  // namespace netdash
