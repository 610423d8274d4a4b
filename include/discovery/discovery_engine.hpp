// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 DiscoveryEngine - runs discovery cycles and owns the result cache

 A cycle:
   1. resolve topology; a changed fingerprint clears the cache
   2. return the cached result if it is fresh (unless forced or disabled)
   3. warm the gateway, read the neighbor table (seed pings / snapshot)
   4. validate neighbors, aggregate and filter candidates
   5. enrich, group, and store the result

 Cycles are serialized: at most one runs at a time. Kick() starts a cycle on
 a background thread so callers can keep serving GetCached() while it runs.
 There is no cancellation; a running cycle always completes.
*/

#include "config/dashboard_config.hpp"
#include "discovery/candidate_filter.hpp"
#include "discovery/discovery_cache.hpp"
#include "discovery/platform.hpp"
#include "discovery/prober.hpp"
#include "discovery/types.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace netdash {
namespace discovery {

struct EngineOptions {
  // No cache reads and no cache writes
  bool cache_disabled{false};
  // Never reuse (or record) neighbor table snapshots
  bool snapshot_disabled{false};
  ConcurrencySettings concurrency;
  HeuristicThresholds thresholds;

  // NETDASH_DISABLE_CACHE, NETDASH_DISABLE_NEIGHBOR_SNAPSHOT and the
  // NETDASH_*_CONCURRENCY overrides.
  static EngineOptions FromEnvironment();
};

class DiscoveryEngine {
public:
  static constexpr int64_t DEFAULT_KICK_INTERVAL_SEC = 30;
  static constexpr int GATEWAY_WARM_TIMEOUT_MS = 400;
  static constexpr size_t FAST_MAX_SWEEP_HOSTS = 64;

  DiscoveryEngine(Platform& platform, Prober& prober, EngineOptions options);
  ~DiscoveryEngine();

  DiscoveryEngine(const DiscoveryEngine&) = delete;
  DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

  // Run (or serve from cache) one cycle on the calling thread. Blocks while
  // another cycle is running. Exceptions from a faulty cycle propagate.
  DiscoveryResult Discover(const config::DashboardConfig& cfg, bool force_refresh = false, bool fast = false);

  // Start a background cycle unless one is already running or, when not
  // forced, a cycle completed within min_interval_sec. Returns true if a cycle
  // was started. Background failures are logged and leave the cache intact.
  bool Kick(const config::DashboardConfig& cfg, bool force_refresh = false,
            int64_t min_interval_sec = DEFAULT_KICK_INTERVAL_SEC, bool fast = false);

  // Last stored result; never blocks on a running cycle.
  std::optional<DiscoveryResult> GetCached() const { return cache_.Get(); }

  bool IsRateLimited(int64_t window_sec = DEFAULT_KICK_INTERVAL_SEC) const;
  bool IsRunning() const { return running_.load(); }

  // Join the background cycle, if any.
  void WaitForBackground();

  DiscoveryCache& cache() { return cache_; }

private:
  DiscoveryResult RunCycle(const config::DashboardConfig& cfg, bool force_refresh, bool fast);

  Platform& platform_;
  Prober& prober_;
  const EngineOptions options_;
  DiscoveryCache cache_;

  // Serializes cycles
  std::mutex cycle_mutex_;

  // Guards background_ and the running_ transition in Kick()
  std::mutex kick_mutex_;
  std::thread background_;
  std::atomic<bool> running_{false};
};

}  // namespace discovery
}  // namespace netdash
