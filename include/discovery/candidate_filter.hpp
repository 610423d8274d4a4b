// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Candidate aggregation and heuristic filtering

 Builds the set of IPs worth enriching from the neighbor table, the gateway
 and a bounded sweep of the preferred network, and strips artifacts of
 devices that answer on behalf of addresses that do not exist.

 Stages, in the order AggregateCandidates() runs them:

   1. FilterProxyArp           one MAC behind many IPs -> drop its entries
   2. SeedCandidates           gateway + in-network neighbors
   3. BuildSweepList           unused hosts of the sweep network (bounded)
   4. PingSweep                sweep hits become candidates
   5. AdmitNeighbors           neighbors learned during the sweep
   6. ProbeNonResponders       TCP probe of silent sweep IPs, sampled first
   7. ConfirmTransparentProxy  purge port-only hits that look intercepted
   8. ApplyFallback            nothing found -> admit the head of the sweep

 Each stage is usable on its own; the thresholds are plain data so callers
 and tests can tune them.
*/

#include "discovery/platform.hpp"
#include "discovery/prober.hpp"
#include "discovery/types.hpp"
#include "util/concurrency.hpp"
#include "util/netaddress.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

struct HeuristicThresholds {
  // A MAC answering for at least this many IPs is treated as proxy ARP
  size_t proxy_arp_min_ips{10};
  // Non-responders sampled before committing to a full port probe
  size_t sample_size{20};
  // Sample hit fraction above which the rest is not probed
  double sample_hit_ratio{0.8};
  // Port-only hits must exceed this fraction of the sweep...
  double port_proxy_sweep_ratio{0.5};
  // ...and this absolute count to flag a transparent proxy
  size_t port_proxy_min_hits{20};
  // Fraction of MAC-less, ping-less candidates that confirms the purge
  double no_mac_ratio{0.8};
  // Sweep IPs admitted when nothing else was found
  size_t fallback_limit{64};
};

struct ProxyArpResult {
  std::vector<NeighborEntry> kept;
  std::set<std::string> proxy_macs;
};

// Entries whose MAC backs >= threshold distinct IPs are removed, except the
// entry for the gateway IP.
ProxyArpResult FilterProxyArp(const std::vector<NeighborEntry>& neighbors,
                              const std::optional<std::string>& gateway_ip, size_t threshold);

/**
 * Admit neighbor entries into the candidate set
 *
 * Skipped: invalid host IPs, IPs outside `sweep_network` (the gateway is
 * exempt), entries without a MAC (except on Windows, whose fallback tools can
 * omit it), entries seen on tunnel interfaces, and entries whose MAC is in
 * `excluded_macs` (again the gateway is exempt).
 *
 * FAILED/INCOMPLETE entries are not admitted but their MAC and interface are
 * still recorded.
 */
void AdmitNeighbors(CandidateSet& candidates, const std::vector<NeighborEntry>& neighbors,
                    const std::optional<std::string>& gateway_ip,
                    const std::optional<util::Ipv4Network>& sweep_network, OsFamily os,
                    const std::set<std::string>& excluded_macs = {});

// The gateway (when a valid host IP, with its MAC) plus AdmitNeighbors().
CandidateSet SeedCandidates(const std::vector<NeighborEntry>& neighbors, const std::optional<std::string>& gateway_ip,
                            const std::optional<std::string>& gateway_mac,
                            const std::optional<util::Ipv4Network>& sweep_network, OsFamily os);

// Hosts of `sweep_network` in address order that are not already candidates,
// stopping at max_hosts.
std::vector<std::string> BuildSweepList(const std::optional<util::Ipv4Network>& sweep_network,
                                        const CandidateSet& candidates, size_t max_hosts);

struct SweepOutcome {
  std::map<std::string, bool> ping_results;
  size_t ping_hits{0};
};

SweepOutcome PingSweep(Prober& prober, const std::vector<std::string>& sweep_ips, int timeout_ms,
                       size_t concurrency, CandidateSet& candidates);

struct PortProbeOutcome {
  size_t port_only_hits{0};
  bool transparent_proxy_detected{false};
  // IPs that actually had their ports probed
  std::vector<std::string> probed;
};

// Probe default ports on IPs that ignored ping. Above 2 * sample_size IPs, an
// evenly spaced sample goes first; a sample hit rate above sample_hit_ratio
// flags a transparent proxy and the remainder is skipped. Responders are
// admitted without a MAC.
PortProbeOutcome ProbeNonResponders(Prober& prober, const std::vector<std::string>& non_responders,
                                    const std::vector<uint16_t>& ports, CandidateSet& candidates,
                                    const HeuristicThresholds& thresholds, size_t host_concurrency,
                                    util::ConcurrencyLimiter& conn_limiter);

// Flags a transparent proxy when port-only hits dominate the sweep; when
// flagged and most candidates have neither MAC nor ping, keeps only
// candidates with one of them (plus the gateway) and zeroes the hit count.
// Returns the number of candidates removed.
size_t ConfirmTransparentProxy(CandidateSet& candidates, PortProbeOutcome& outcome, size_t sweep_size,
                               const std::map<std::string, bool>& ping_results,
                               const std::optional<std::string>& gateway_ip, const HeuristicThresholds& thresholds);

// Empty candidate set and non-empty sweep -> admit the first `limit` sweep
// IPs. Returns the number admitted.
size_t ApplyFallback(CandidateSet& candidates, const std::vector<std::string>& sweep_ips, size_t limit);

struct AggregationInput {
  std::vector<NeighborEntry> neighbors;
  std::optional<std::string> gateway_ip;
  std::optional<std::string> gateway_mac;
  std::optional<util::Ipv4Network> sweep_network;
  // At least one local network was detected
  bool have_networks{false};
  bool bounded_sweep{true};
  size_t max_hosts{256};
  int ping_timeout_ms{900};
  std::vector<uint16_t> default_ports;
  bool fast{false};
};

struct AggregationResult {
  CandidateSet candidates;
  std::vector<std::string> sweep_ips;
  std::map<std::string, bool> ping_results;
  std::set<std::string> proxy_macs;
  // Neighbor entries left after proxy-ARP filtering
  size_t neighbors_kept{0};
  size_t ping_hits{0};
  size_t port_only_hits{0};
  bool transparent_proxy_detected{false};
};

// Run stages 1-8. The platform is consulted again after the sweep for
// neighbor entries the sweep itself produced.
AggregationResult AggregateCandidates(Platform& platform, Prober& prober, const AggregationInput& input,
                                      const ConcurrencySettings& concurrency,
                                      const HeuristicThresholds& thresholds = HeuristicThresholds{});

}  // namespace discovery
}  // namespace netdash
