// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/enricher.hpp"

#include "util/concurrency.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>

namespace netdash {
namespace discovery {

const KnownDevice* MatchKnown(const std::vector<KnownDevice>& known, const std::string& ip,
                              const std::optional<std::string>& mac) {
  const std::string mac_n = mac ? util::NormalizeMac(*mac) : std::string();
  for (const auto& k : known) {
    if (k.match_ip && *k.match_ip == ip) {
      return &k;
    }
    if (k.match_mac && !mac_n.empty() && util::NormalizeMac(*k.match_mac) == mac_n) {
      return &k;
    }
  }
  return nullptr;
}

ConnectionType ClassifyConnection(const std::optional<std::string>& iface, OsFamily os) {
  if (!iface || iface->empty()) {
    return ConnectionType::Wired;
  }
  const std::string name = util::ToLower(*iface);
  if (name.starts_with("w") || name.find("air") != std::string::npos ||
      name.find("wireless") != std::string::npos) {
    return ConnectionType::Wireless;
  }
  if (name == "en0" && os == OsFamily::MacOS) {
    return ConnectionType::Wireless;
  }
  return ConnectionType::Wired;
}

std::vector<DiscoveredDevice> EnrichCandidates(Prober& prober, const CandidateSet& candidates,
                                               const std::map<std::string, bool>& ping_results,
                                               const std::vector<KnownDevice>& known, const HostIdentity& host,
                                               const EnrichOptions& options, const ConcurrencySettings& concurrency) {
  const std::vector<std::string> ips(candidates.ips.begin(), candidates.ips.end());
  std::vector<DiscoveredDevice> devices(ips.size());

  util::ConcurrencyLimiter conn_limiter(concurrency.port_conn);
  util::ConcurrencyLimiter dns_limiter(concurrency.dns);

  util::RunBounded(ips.size(), concurrency.enrich, [&](size_t i) {
    const std::string& ip = ips[i];
    DiscoveredDevice dev;
    dev.ip = ip;
    dev.mac = candidates.MacFor(ip);
    if (dev.mac && dev.mac->empty()) {
      dev.mac.reset();
    }
    dev.iface = candidates.IfaceFor(ip);

    const KnownDevice* kd = MatchKnown(known, ip, dev.mac);

    std::optional<std::string> dns_name;
    if (!options.fast) {
      util::ConcurrencyLimiter::Slot slot(dns_limiter);
      dns_name = prober.ReverseDns(ip);
    }
    dev.name = kd ? kd->name : dns_name.value_or(ip);
    dev.known = kd != nullptr;
    dev.notes = kd ? kd->notes : "";

    const std::vector<uint16_t>& ports = (kd && !kd->ports.empty()) ? kd->ports : options.default_ports;
    auto swept = ping_results.find(ip);

    if (options.fast) {
      dev.ping = swept != ping_results.end() && swept->second;
      dev.up = dev.ping;
    } else {
      if (!ports.empty()) {
        dev.ports = CheckPorts(prober, ip, ports, conn_limiter);
      }
      dev.ping = swept != ping_results.end() ? swept->second : prober.Ping(ip, options.ping_timeout_ms);
      dev.up = dev.ping || std::any_of(dev.ports.begin(), dev.ports.end(), [](const auto& kv) { return kv.second; });
    }

    dev.conn_type = ClassifyConnection(dev.iface, options.os);
    if (options.gateway_ip && ip == *options.gateway_ip) {
      dev.name = "Gateway (" + ip + ")";
    }
    dev.is_host = host.OwnsIp(ip) || ip == "127.0.0.1";

    devices[i] = std::move(dev);
  });

  // A worker that failed leaves its slot default-constructed
  devices.erase(std::remove_if(devices.begin(), devices.end(), [](const auto& d) { return d.ip.empty(); }),
                devices.end());

  LOG_DISC_DEBUG("Enriched {} candidates ({} up)", devices.size(),
                 std::count_if(devices.begin(), devices.end(), [](const auto& d) { return d.up; }));
  return devices;
}

}  // namespace discovery
}  // namespace netdash
