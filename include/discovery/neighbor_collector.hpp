// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Neighbor table collector

 Reads the OS neighbor table and falls back, in order, to:
 1. pinging a few likely hosts to repopulate the table, then reading again
 2. the last non-empty read, if it is recent and from the same network

 The snapshot itself is owned by the caller (DiscoveryCache); the collector
 only reads it and hands back a replacement.
*/

#include "discovery/platform.hpp"
#include "discovery/prober.hpp"
#include "discovery/types.hpp"
#include "util/netaddress.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

enum class NeighborSource { Fresh, SeedRepopulated, Snapshot, Empty };
std::string NeighborSourceName(NeighborSource source);

struct NeighborSnapshot {
  std::vector<NeighborEntry> entries;
  int64_t taken_at{0};
  std::string fingerprint;
};

struct NeighborRequest {
  std::optional<std::string> gateway_ip;
  std::vector<util::Ipv4Network> networks;
  // Configured device IPs in declaration order
  std::vector<std::string> known_ips;
  int ping_timeout_ms{900};
  size_t seed_concurrency{16};
  // Reuse (and refresh) of the stored snapshot is permitted
  bool snapshot_allowed{true};
  std::string fingerprint;
  int64_t now{0};
};

struct NeighborCollection {
  std::vector<NeighborEntry> entries;
  NeighborSource source{NeighborSource::Empty};
  // Set when a fresh, non-empty read should replace the stored snapshot
  std::optional<NeighborSnapshot> new_snapshot;
};

static constexpr size_t MAX_SEED_PINGS = 12;
static constexpr int SEED_PING_TIMEOUT_MS = 600;
static constexpr int64_t SNAPSHOT_MAX_AGE_SEC = 120;
static constexpr size_t MAX_VALIDATION_PINGS = 8;

// Gateway, first host of each network, then configured IPs; de-duplicated in
// that order and capped at `limit`.
std::vector<std::string> SelectSeedTargets(const std::optional<std::string>& gateway_ip,
                                           const std::vector<util::Ipv4Network>& networks,
                                           const std::vector<std::string>& known_ips, size_t limit = MAX_SEED_PINGS);

// A stored snapshot may stand in for an empty read only when reuse is allowed,
// it is younger than SNAPSHOT_MAX_AGE_SEC and the fingerprint is unchanged.
bool CanReuseSnapshot(const std::optional<NeighborSnapshot>& snapshot, bool snapshot_allowed,
                      const std::string& fingerprint, int64_t now);

NeighborCollection CollectNeighbors(Platform& platform, Prober& prober, const NeighborRequest& request,
                                    const std::optional<NeighborSnapshot>& stored);

/**
 * Drop stale neighbor entries
 *
 * Pings up to MAX_VALIDATION_PINGS neighbors (valid host IPs that are not
 * configured devices). If at least one answers, entries whose ping failed are
 * dropped. If none answers, ICMP is probably filtered and every entry is kept.
 */
std::vector<NeighborEntry> ValidateNeighbors(Prober& prober, const std::vector<NeighborEntry>& entries,
                                             const std::set<std::string>& known_ips, int ping_timeout_ms,
                                             size_t concurrency);

}  // namespace discovery
}  // namespace netdash
