// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_engine.hpp"

#include "discovery/device_grouping.hpp"
#include "discovery/enricher.hpp"
#include "discovery/neighbor_collector.hpp"
#include "discovery/topology.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <chrono>

namespace netdash {
namespace discovery {

EngineOptions EngineOptions::FromEnvironment() {
  EngineOptions options;
  options.cache_disabled = config::CacheDisabled();
  options.snapshot_disabled = config::NeighborSnapshotDisabled();
  options.concurrency = ConcurrencySettings::FromEnvironment();
  return options;
}

DiscoveryEngine::DiscoveryEngine(Platform& platform, Prober& prober, EngineOptions options)
    : platform_(platform), prober_(prober), options_(std::move(options)) {}

DiscoveryEngine::~DiscoveryEngine() {
  WaitForBackground();
}

bool DiscoveryEngine::IsRateLimited(int64_t window_sec) const {
  return cache_.IsRateLimited(util::GetTime(), window_sec);
}

void DiscoveryEngine::WaitForBackground() {
  std::lock_guard<std::mutex> lock(kick_mutex_);
  if (background_.joinable()) {
    background_.join();
  }
}

bool DiscoveryEngine::Kick(const config::DashboardConfig& cfg, bool force_refresh, int64_t min_interval_sec,
                           bool fast) {
  std::lock_guard<std::mutex> lock(kick_mutex_);
  if (running_.load()) {
    return false;
  }
  if (!force_refresh && IsRateLimited(min_interval_sec)) {
    return false;
  }
  // The previous cycle has finished; reap its thread before starting another
  if (background_.joinable()) {
    background_.join();
  }

  running_.store(true);
  background_ = std::thread([this, cfg, force_refresh, fast]() {
    const auto started = std::chrono::steady_clock::now();
    LOG_DISC_INFO("Background discovery started (fast={})", fast);
    try {
      Discover(cfg, force_refresh, fast);
      const auto elapsed =
          std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
      LOG_DISC_INFO("Background discovery finished in {} ms", elapsed.count());
    } catch (const std::exception& e) {
      LOG_DISC_ERROR("Background discovery failed: {}", e.what());
    } catch (...) {
      LOG_DISC_ERROR("Background discovery failed: unknown exception");
    }
    running_.store(false);
  });
  return true;
}

DiscoveryResult DiscoveryEngine::Discover(const config::DashboardConfig& cfg, bool force_refresh, bool fast) {
  std::lock_guard<std::mutex> lock(cycle_mutex_);
  return RunCycle(cfg, force_refresh, fast);
}

DiscoveryResult DiscoveryEngine::RunCycle(const config::DashboardConfig& cfg, bool force_refresh, bool fast) {
  const auto started = util::GetSteadyTime();
  const int64_t now = util::GetTime();

  TopologySnapshot topo = ResolveTopology(platform_);
  cache_.InvalidateIfChanged(topo.fingerprint);

  if (!force_refresh && !options_.cache_disabled && cache_.IsFresh(topo.fingerprint, now)) {
    if (auto cached = cache_.Get()) {
      const auto up = [](const std::vector<DeviceGroup>& groups) {
        return std::count_if(groups.begin(), groups.end(), [](const DeviceGroup& g) { return g.up; });
      };
      LOG_DISC_DEBUG("Returning cached discovery result (up: {} known, {} discovered)", up(cached->known_devices),
                     up(cached->discovered_devices));
      return *cached;
    }
  }

  const config::DiscoveryConfig& disc = cfg.discovery;
  size_t max_hosts = static_cast<size_t>(std::max(0, disc.max_sweep_hosts));
  std::vector<uint16_t> default_ports = disc.default_ports;
  if (fast) {
    max_hosts = std::min(max_hosts, FAST_MAX_SWEEP_HOSTS);
    default_ports.clear();
  }
  const int ping_timeout_ms = disc.ping_timeout_ms;
  const auto& known = cfg.devices;
  const auto& conc = options_.concurrency;

  // Warm the gateway's neighbor entry
  if (topo.gateway_ip) {
    prober_.Ping(*topo.gateway_ip, std::min(ping_timeout_ms, GATEWAY_WARM_TIMEOUT_MS));
  }

  const HostIdentity host = LoadHostIdentity(platform_);
  std::vector<std::string> host_ips = topo.host_ips;
  if (host_ips.empty()) {
    for (const auto& ip : host.ips) {
      if (!ip.starts_with("127.") && !ip.starts_with("100.")) {
        host_ips.push_back(ip);
      }
    }
  }
  const auto sweep_net = PreferredSweepNetwork(topo.networks, topo.gateway_ip, host_ips);

  // Neighbor table
  NeighborRequest request;
  request.gateway_ip = topo.gateway_ip;
  request.networks = topo.networks;
  request.known_ips = cfg.KnownIpsOrdered();
  request.ping_timeout_ms = ping_timeout_ms;
  request.seed_concurrency = conc.seed_ping;
  request.snapshot_allowed = !options_.snapshot_disabled && !force_refresh;
  request.fingerprint = topo.fingerprint;
  request.now = now;

  NeighborCollection collection = CollectNeighbors(platform_, prober_, request, cache_.GetNeighborSnapshot());
  if (collection.new_snapshot) {
    cache_.PutNeighborSnapshot(*collection.new_snapshot);
  }
  std::vector<NeighborEntry> neighbors = std::move(collection.entries);
  if (!neighbors.empty() && !fast) {
    neighbors = ValidateNeighbors(prober_, neighbors, cfg.KnownIps(), ping_timeout_ms, conc.neighbor_validation);
  }

  // Candidates
  AggregationInput input;
  input.neighbors = neighbors;
  input.gateway_ip = topo.gateway_ip;
  input.gateway_mac = topo.gateway_ip ? platform_.GatewayMac(*topo.gateway_ip) : std::nullopt;
  input.sweep_network = sweep_net;
  input.have_networks = !topo.networks.empty();
  input.bounded_sweep = disc.IsBoundedSweep();
  input.max_hosts = max_hosts;
  input.ping_timeout_ms = ping_timeout_ms;
  input.default_ports = default_ports;
  input.fast = fast;
  AggregationResult agg = AggregateCandidates(platform_, prober_, input, conc, options_.thresholds);

  // Enrichment
  EnrichOptions enrich;
  enrich.fast = fast;
  enrich.ping_timeout_ms = ping_timeout_ms;
  enrich.default_ports = default_ports;
  enrich.gateway_ip = topo.gateway_ip;
  enrich.os = platform_.Os();
  const auto devices = EnrichCandidates(prober_, agg.candidates, agg.ping_results, known, host, enrich, conc);

  // Grouping
  DeviceGrouper grouper(known, host);
  if (!fast) {
    util::ConcurrencyLimiter conn_limiter(conc.port_conn);
    grouper.ProbeHostInterfaces(prober_, conn_limiter);
  }
  for (const auto& dev : devices) {
    grouper.Fold(dev, topo.gateway_ip);
  }
  GroupedDevices grouped = grouper.Finish();

  DiscoveryResult result;
  result.networks = DisplayNetworks(topo.networks, host_ips);
  result.neighbors_count = agg.neighbors_kept;
  result.mode = disc.mode;
  result.known_devices = std::move(grouped.known_devices);
  result.discovered_devices = std::move(grouped.discovered_devices);

  DiscoveryMeta& meta = result.meta;
  meta.neighbor_source = NeighborSourceName(collection.source);
  meta.sweep_size = agg.sweep_ips.size();
  meta.ping_hits = agg.ping_hits;
  meta.port_only_hits = agg.port_only_hits;
  meta.transparent_proxy_detected = agg.transparent_proxy_detected;
  meta.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(util::GetSteadyTime() - started).count();
  meta.completed_at = util::GetTime();
  meta.gateway_ip = topo.gateway_ip;
  if (topo.gateway_ip) {
    meta.gateway_mac = agg.candidates.MacFor(*topo.gateway_ip);
  }
  meta.gateway_outside_sweep = GatewayOutsideSweep(topo.gateway_ip, sweep_net);
  if (sweep_net) {
    meta.sweep_network = sweep_net->ToString();
  }
  meta.host_ips = host_ips;
  std::sort(meta.host_ips.begin(), meta.host_ips.end());
  meta.subnet_mismatches = SubnetMismatches(known, sweep_net);

  LOG_DISC_INFO("Discovery complete: {} known, {} discovered ({} ms)", result.known_devices.size(),
                result.discovered_devices.size(), meta.duration_ms);

  if (!options_.cache_disabled) {
    cache_.Put(result, topo.fingerprint, meta.completed_at);
  }
  return result;
}

}  // namespace discovery
}  // namespace netdash
