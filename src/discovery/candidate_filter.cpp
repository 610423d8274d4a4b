// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/candidate_filter.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

namespace netdash {
namespace discovery {

ProxyArpResult FilterProxyArp(const std::vector<NeighborEntry>& neighbors,
                              const std::optional<std::string>& gateway_ip, size_t threshold) {
  std::map<std::string, std::set<std::string>> ips_by_mac;
  for (const auto& n : neighbors) {
    if (!n.mac.empty() && !n.ip.empty()) {
      ips_by_mac[n.mac].insert(n.ip);
    }
  }

  ProxyArpResult result;
  for (const auto& [mac, ips] : ips_by_mac) {
    if (ips.size() >= threshold) {
      result.proxy_macs.insert(mac);
      LOG_DISC_WARN("Detected proxy ARP: MAC {} has {} IPs (filtering)", mac, ips.size());
    }
  }

  for (const auto& n : neighbors) {
    if (result.proxy_macs.count(n.mac) && !(gateway_ip && n.ip == *gateway_ip)) {
      continue;
    }
    result.kept.push_back(n);
  }
  if (result.kept.size() != neighbors.size()) {
    LOG_DISC_INFO("Filtered {} proxy ARP neighbor entries", neighbors.size() - result.kept.size());
  }
  return result;
}

void AdmitNeighbors(CandidateSet& candidates, const std::vector<NeighborEntry>& neighbors,
                    const std::optional<std::string>& gateway_ip,
                    const std::optional<util::Ipv4Network>& sweep_network, OsFamily os,
                    const std::set<std::string>& excluded_macs) {
  for (const auto& n : neighbors) {
    if (n.ip.empty() || !util::IsValidHostIP(n.ip)) {
      continue;
    }
    const bool is_gateway = gateway_ip && n.ip == *gateway_ip;
    if (sweep_network && !is_gateway && !sweep_network->Contains(n.ip)) {
      continue;
    }
    if (!is_gateway && !n.mac.empty() && excluded_macs.count(n.mac)) {
      continue;
    }
    if (os != OsFamily::Windows && n.mac.empty()) {
      continue;
    }
    if (!n.iface.empty() && IsTunnelInterface(n.iface)) {
      continue;
    }
    if (n.IsPresent()) {
      candidates.ips.insert(n.ip);
    }
    if (!n.mac.empty()) {
      candidates.mac_by_ip[n.ip] = n.mac;
    }
    if (!n.iface.empty()) {
      candidates.iface_by_ip[n.ip] = n.iface;
    }
  }
}

CandidateSet SeedCandidates(const std::vector<NeighborEntry>& neighbors, const std::optional<std::string>& gateway_ip,
                            const std::optional<std::string>& gateway_mac,
                            const std::optional<util::Ipv4Network>& sweep_network, OsFamily os) {
  CandidateSet candidates;
  // The gateway is always a candidate, even outside the sweep network
  if (gateway_ip && util::IsValidHostIP(*gateway_ip)) {
    candidates.ips.insert(*gateway_ip);
    if (gateway_mac && !gateway_mac->empty()) {
      candidates.mac_by_ip[*gateway_ip] = *gateway_mac;
    }
  }
  AdmitNeighbors(candidates, neighbors, gateway_ip, sweep_network, os);
  return candidates;
}

std::vector<std::string> BuildSweepList(const std::optional<util::Ipv4Network>& sweep_network,
                                        const CandidateSet& candidates, size_t max_hosts) {
  std::vector<std::string> sweep;
  if (!sweep_network || max_hosts == 0) {
    return sweep;
  }
  const auto [first, last] = sweep_network->HostRange();
  for (uint64_t a = first; a <= last && sweep.size() < max_hosts; ++a) {
    std::string ip = util::FormatIPv4(static_cast<uint32_t>(a));
    if (!candidates.Contains(ip)) {
      sweep.push_back(std::move(ip));
    }
  }
  return sweep;
}

SweepOutcome PingSweep(Prober& prober, const std::vector<std::string>& sweep_ips, int timeout_ms,
                       size_t concurrency, CandidateSet& candidates) {
  SweepOutcome outcome;
  if (sweep_ips.empty()) {
    return outcome;
  }

  LOG_DISC_DEBUG("Starting sweep of {} IPs", sweep_ips.size());
  const size_t before = candidates.ips.size();
  std::mutex mutex;
  util::RunBounded(sweep_ips.size(), concurrency, [&](size_t i) {
    const bool ok = prober.Ping(sweep_ips[i], timeout_ms);
    std::lock_guard<std::mutex> lock(mutex);
    outcome.ping_results[sweep_ips[i]] = ok;
    if (ok) {
      ++outcome.ping_hits;
      candidates.ips.insert(sweep_ips[i]);
    }
  });
  LOG_DISC_DEBUG("Sweep complete. Found {} new active IPs", candidates.ips.size() - before);
  return outcome;
}

PortProbeOutcome ProbeNonResponders(Prober& prober, const std::vector<std::string>& non_responders,
                                    const std::vector<uint16_t>& ports, CandidateSet& candidates,
                                    const HeuristicThresholds& thresholds, size_t host_concurrency,
                                    util::ConcurrencyLimiter& conn_limiter) {
  PortProbeOutcome outcome;
  if (non_responders.empty() || ports.empty()) {
    return outcome;
  }

  std::mutex mutex;
  auto probe_batch = [&](const std::vector<std::string>& batch) -> size_t {
    std::atomic<size_t> hits{0};
    util::RunBounded(batch.size(), host_concurrency, [&](size_t i) {
      const auto status = CheckPorts(prober, batch[i], ports, conn_limiter);
      const bool open = std::any_of(status.begin(), status.end(), [](const auto& kv) { return kv.second; });
      std::lock_guard<std::mutex> lock(mutex);
      outcome.probed.push_back(batch[i]);
      if (open) {
        ++hits;
        candidates.ips.insert(batch[i]);
        candidates.mac_by_ip.emplace(batch[i], std::nullopt);
        candidates.iface_by_ip.emplace(batch[i], std::nullopt);
      }
    });
    return hits.load();
  };

  const size_t sample_size = thresholds.sample_size;
  if (sample_size > 0 && non_responders.size() > sample_size * 2) {
    const size_t step = non_responders.size() / sample_size;
    std::vector<std::string> sample;
    std::set<std::string> sampled;
    for (size_t i = 0; i < sample_size; ++i) {
      sample.push_back(non_responders[i * step]);
      sampled.insert(non_responders[i * step]);
    }

    const size_t sample_hits = probe_batch(sample);
    if (static_cast<double>(sample_hits) > static_cast<double>(sample_size) * thresholds.sample_hit_ratio) {
      LOG_DISC_WARN("Early proxy detection: {}/{} sample IPs responded (skipping full scan)", sample_hits,
                    sample_size);
      outcome.transparent_proxy_detected = true;
      outcome.port_only_hits = sample_hits;
      return outcome;
    }

    std::vector<std::string> remaining;
    for (const auto& ip : non_responders) {
      if (!sampled.count(ip)) {
        remaining.push_back(ip);
      }
    }
    outcome.port_only_hits = sample_hits + probe_batch(remaining);
  } else {
    outcome.port_only_hits = probe_batch(non_responders);
  }

  if (outcome.port_only_hits > 0) {
    LOG_DISC_INFO("Port-only discovery found {} hosts", outcome.port_only_hits);
  }
  return outcome;
}

size_t ConfirmTransparentProxy(CandidateSet& candidates, PortProbeOutcome& outcome, size_t sweep_size,
                               const std::map<std::string, bool>& ping_results,
                               const std::optional<std::string>& gateway_ip, const HeuristicThresholds& thresholds) {
  const double hits = static_cast<double>(outcome.port_only_hits);
  if (hits > static_cast<double>(sweep_size) * thresholds.port_proxy_sweep_ratio &&
      outcome.port_only_hits > thresholds.port_proxy_min_hits) {
    outcome.transparent_proxy_detected = true;
  }
  if (!outcome.transparent_proxy_detected) {
    return 0;
  }

  auto has_mac = [&](const std::string& ip) {
    auto mac = candidates.MacFor(ip);
    return mac && !mac->empty();
  };
  auto pinged = [&](const std::string& ip) {
    auto it = ping_results.find(ip);
    return it != ping_results.end() && it->second;
  };

  size_t no_mac_port_only = 0;
  for (const auto& ip : candidates.ips) {
    if (!has_mac(ip) && !pinged(ip)) {
      ++no_mac_port_only;
    }
  }
  if (static_cast<double>(no_mac_port_only) <= hits * thresholds.no_mac_ratio) {
    return 0;
  }

  LOG_DISC_WARN("Detected transparent proxy: {} port-only hits with no MAC (filtering)", outcome.port_only_hits);
  std::set<std::string> kept;
  for (const auto& ip : candidates.ips) {
    if (has_mac(ip) || pinged(ip)) {
      kept.insert(ip);
    }
  }
  if (gateway_ip) {
    kept.insert(*gateway_ip);
  }
  const size_t removed = candidates.ips.size() > kept.size() ? candidates.ips.size() - kept.size() : 0;
  candidates.ips = std::move(kept);
  outcome.port_only_hits = 0;
  LOG_DISC_INFO("Filtered {} transparent proxy entries", removed);
  return removed;
}

size_t ApplyFallback(CandidateSet& candidates, const std::vector<std::string>& sweep_ips, size_t limit) {
  if (!candidates.ips.empty() || sweep_ips.empty()) {
    return 0;
  }
  const size_t n = std::min(limit, sweep_ips.size());
  candidates.ips.insert(sweep_ips.begin(), sweep_ips.begin() + static_cast<std::ptrdiff_t>(n));
  LOG_DISC_INFO("No neighbors/ping hits; falling back to port-check {} sweep IPs", n);
  return n;
}

AggregationResult AggregateCandidates(Platform& platform, Prober& prober, const AggregationInput& input,
                                      const ConcurrencySettings& concurrency, const HeuristicThresholds& thresholds) {
  AggregationResult result;
  const OsFamily os = platform.Os();

  auto proxy = FilterProxyArp(input.neighbors, input.gateway_ip, thresholds.proxy_arp_min_ips);
  result.proxy_macs = std::move(proxy.proxy_macs);
  result.neighbors_kept = proxy.kept.size();

  result.candidates = SeedCandidates(proxy.kept, input.gateway_ip, input.gateway_mac, input.sweep_network, os);

  if (input.bounded_sweep && input.have_networks) {
    result.sweep_ips = BuildSweepList(input.sweep_network, result.candidates, input.max_hosts);
  } else if (!input.have_networks) {
    LOG_DISC_INFO("No local networks detected; skipping sweep");
  }

  auto sweep = PingSweep(prober, result.sweep_ips, input.ping_timeout_ms, concurrency.ping, result.candidates);
  result.ping_results = std::move(sweep.ping_results);
  result.ping_hits = sweep.ping_hits;

  // Pings populate the neighbor table; pick up what they taught the OS
  AdmitNeighbors(result.candidates, platform.EnumerateNeighbors(), input.gateway_ip, input.sweep_network, os,
                 result.proxy_macs);

  std::vector<std::string> non_responders;
  for (const auto& ip : result.sweep_ips) {
    if (!result.candidates.Contains(ip)) {
      non_responders.push_back(ip);
    }
  }

  if (!non_responders.empty() && !input.fast && !input.default_ports.empty()) {
    util::ConcurrencyLimiter conn_limiter(concurrency.port_conn);
    auto outcome = ProbeNonResponders(prober, non_responders, input.default_ports, result.candidates, thresholds,
                                      concurrency.port_probe, conn_limiter);
    ConfirmTransparentProxy(result.candidates, outcome, result.sweep_ips.size(), result.ping_results,
                            input.gateway_ip, thresholds);
    result.port_only_hits = outcome.port_only_hits;
    result.transparent_proxy_detected = outcome.transparent_proxy_detected;
  }

  ApplyFallback(result.candidates, result.sweep_ips, thresholds.fallback_limit);
  return result;
}

}  // namespace discovery
}  // namespace netdash
