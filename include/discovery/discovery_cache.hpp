// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/neighbor_collector.hpp"
#include "discovery/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace netdash {
namespace discovery {

/**
 * DiscoveryCache - the single slot holding the last discovery result
 *
 * Stores:
 * - the last DiscoveryResult, its completion time and the fingerprint of the
 *   network it was computed on
 * - the last non-empty neighbor table read (NeighborSnapshot)
 *
 * All accessors copy in and out, so callers never share state with the cache.
 * Times are Unix seconds (util::GetTime()).
 *
 * Thread-safety: all methods are thread-safe.
 */
class DiscoveryCache {
public:
  static constexpr int64_t RESULT_TTL_SEC = 60;

  std::optional<DiscoveryResult> Get() const;
  void Put(const DiscoveryResult& result, const std::string& fingerprint, int64_t completed_at);

  // Drop the result, the neighbor snapshot and the completion time. The stored
  // fingerprint is kept until the next Put().
  void Invalidate();

  // Invalidate() when a fingerprint was stored and differs from `fingerprint`.
  // Returns true if the cache was cleared.
  bool InvalidateIfChanged(const std::string& fingerprint);

  // A result exists, is younger than ttl and was computed on this network.
  bool IsFresh(const std::string& fingerprint, int64_t now, int64_t ttl = RESULT_TTL_SEC) const;

  // A cycle completed less than `window` seconds ago.
  bool IsRateLimited(int64_t now, int64_t window) const;

  std::optional<NeighborSnapshot> GetNeighborSnapshot() const;
  void PutNeighborSnapshot(const NeighborSnapshot& snapshot);

  std::string fingerprint() const;
  int64_t last_completed() const;

private:
  mutable std::mutex mutex_;
  std::optional<DiscoveryResult> result_;
  int64_t completed_at_{0};
  std::string fingerprint_;
  std::optional<NeighborSnapshot> neighbors_;
};

}  // namespace discovery
}  // namespace netdash
