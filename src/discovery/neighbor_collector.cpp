// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/neighbor_collector.hpp"

#include "util/concurrency.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <map>
#include <mutex>

namespace netdash {
namespace discovery {

std::string NeighborSourceName(NeighborSource source) {
  switch (source) {
  case NeighborSource::Fresh:
    return "fresh";
  case NeighborSource::SeedRepopulated:
    return "seed-repopulated";
  case NeighborSource::Snapshot:
    return "snapshot";
  case NeighborSource::Empty:
    break;
  }
  return "empty";
}

std::vector<std::string> SelectSeedTargets(const std::optional<std::string>& gateway_ip,
                                           const std::vector<util::Ipv4Network>& networks,
                                           const std::vector<std::string>& known_ips, size_t limit) {
  std::vector<std::string> seeds;
  auto add = [&](const std::string& ip) {
    if (!ip.empty() && std::find(seeds.begin(), seeds.end(), ip) == seeds.end()) {
      seeds.push_back(ip);
    }
  };

  if (gateway_ip) {
    add(*gateway_ip);
  }
  for (const auto& net : networks) {
    if (auto first = net.FirstHost()) {
      add(util::FormatIPv4(*first));
    }
  }
  for (const auto& ip : known_ips) {
    add(ip);
  }
  if (seeds.size() > limit) {
    seeds.resize(limit);
  }
  return seeds;
}

bool CanReuseSnapshot(const std::optional<NeighborSnapshot>& snapshot, bool snapshot_allowed,
                      const std::string& fingerprint, int64_t now) {
  if (!snapshot_allowed || !snapshot || snapshot->entries.empty()) {
    return false;
  }
  if (now - snapshot->taken_at >= SNAPSHOT_MAX_AGE_SEC) {
    return false;
  }
  return snapshot->fingerprint == fingerprint;
}

NeighborCollection CollectNeighbors(Platform& platform, Prober& prober, const NeighborRequest& request,
                                    const std::optional<NeighborSnapshot>& stored) {
  NeighborCollection result;
  result.entries = platform.EnumerateNeighbors();

  if (!result.entries.empty()) {
    result.source = NeighborSource::Fresh;
    if (request.snapshot_allowed) {
      result.new_snapshot = NeighborSnapshot{result.entries, request.now, request.fingerprint};
    }
    return result;
  }

  // Provoke the OS neighbor cache with a few cheap pings, then read again
  const auto seeds = SelectSeedTargets(request.gateway_ip, request.networks, request.known_ips);
  if (!seeds.empty()) {
    LOG_DISC_INFO("Neighbor scan empty; pinging {} seeds to repopulate ARP", seeds.size());
    const int timeout = std::min(request.ping_timeout_ms, SEED_PING_TIMEOUT_MS);
    util::RunBounded(seeds.size(), request.seed_concurrency, [&](size_t i) { prober.Ping(seeds[i], timeout); });

    result.entries = platform.EnumerateNeighbors();
    if (!result.entries.empty()) {
      result.source = NeighborSource::SeedRepopulated;
      LOG_DISC_INFO("Neighbor table repopulated after seed pings ({} entries)", result.entries.size());
      return result;
    }
  }

  if (CanReuseSnapshot(stored, request.snapshot_allowed, request.fingerprint, request.now)) {
    LOG_DISC_INFO("Neighbor scan returned empty; reusing last known snapshot ({} entries)", stored->entries.size());
    result.entries = stored->entries;
    result.source = NeighborSource::Snapshot;
    return result;
  }

  LOG_DISC_INFO("Neighbor scan returned empty and {}",
                request.snapshot_allowed ? "no usable snapshot" : "snapshot reuse disabled");
  result.source = NeighborSource::Empty;
  return result;
}

std::vector<NeighborEntry> ValidateNeighbors(Prober& prober, const std::vector<NeighborEntry>& entries,
                                             const std::set<std::string>& known_ips, int ping_timeout_ms,
                                             size_t concurrency) {
  std::vector<std::string> pool;
  for (const auto& e : entries) {
    if (pool.size() >= MAX_VALIDATION_PINGS) {
      break;
    }
    if (e.ip.empty() || !util::IsValidHostIP(e.ip) || known_ips.count(e.ip)) {
      continue;
    }
    pool.push_back(e.ip);
  }
  if (pool.empty()) {
    return entries;
  }

  std::map<std::string, bool> ping_ok;
  std::mutex mutex;
  const int timeout = std::min(ping_timeout_ms, SEED_PING_TIMEOUT_MS);
  util::RunBounded(pool.size(), concurrency, [&](size_t i) {
    const bool ok = prober.Ping(pool[i], timeout);
    std::lock_guard<std::mutex> lock(mutex);
    ping_ok[pool[i]] = ok;
  });

  const bool any_ok = std::any_of(ping_ok.begin(), ping_ok.end(), [](const auto& kv) { return kv.second; });
  if (!any_ok) {
    LOG_DISC_DEBUG("Neighbor validation saw no ping responses; keeping all neighbors");
    return entries;
  }

  std::vector<NeighborEntry> kept;
  for (const auto& e : entries) {
    auto it = ping_ok.find(e.ip);
    if (it == ping_ok.end() || it->second) {
      kept.push_back(e);
    }
  }
  if (kept.size() != entries.size()) {
    LOG_DISC_INFO("Dropped {} stale neighbor entries after validation", entries.size() - kept.size());
  }
  return kept;
}

}  // namespace discovery
}  // namespace netdash
