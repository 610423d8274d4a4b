// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/platform.hpp"
#include "discovery/prober.hpp"
#include "discovery/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

// First configured device, in declaration order, whose match IP equals `ip`
// or whose match MAC equals `mac`. Each device is tested on IP before MAC.
const KnownDevice* MatchKnown(const std::vector<KnownDevice>& known, const std::string& ip,
                              const std::optional<std::string>& mac);

// Wireless when the interface name starts with 'w' or contains "air" or
// "wireless", or is en0 on macOS. Wired otherwise, including when unknown.
ConnectionType ClassifyConnection(const std::optional<std::string>& iface, OsFamily os);

struct EnrichOptions {
  bool fast{false};
  int ping_timeout_ms{900};
  std::vector<uint16_t> default_ports;
  std::optional<std::string> gateway_ip;
  OsFamily os{OsFamily::Linux};
};

/**
 * Turn each candidate IP into a DiscoveredDevice
 *
 * name    known device name, else reverse DNS (skipped in fast mode), else IP;
 *         the gateway is always "Gateway (<ip>)"
 * ports   the known device's ports, else the defaults; not probed in fast mode
 * ping    the sweep result when the IP was swept, else a fresh ping (fast
 *         mode never pings)
 * up      ping || any open port
 *
 * Candidates are processed in sorted order under the enrich limit; the
 * result is sorted by IP.
 */
std::vector<DiscoveredDevice> EnrichCandidates(Prober& prober, const CandidateSet& candidates,
                                               const std::map<std::string, bool>& ping_results,
                                               const std::vector<KnownDevice>& known, const HostIdentity& host,
                                               const EnrichOptions& options, const ConcurrencySettings& concurrency);

}  // namespace discovery
}  // namespace netdash
