// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_cache.hpp"

#include "util/logging.hpp"

namespace netdash {
namespace discovery {

std::optional<DiscoveryResult> DiscoveryCache::Get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_;
}

void DiscoveryCache::Put(const DiscoveryResult& result, const std::string& fingerprint, int64_t completed_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  result_ = result;
  completed_at_ = completed_at;
  fingerprint_ = fingerprint;
}

void DiscoveryCache::Invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  result_.reset();
  completed_at_ = 0;
  neighbors_.reset();
}

bool DiscoveryCache::InvalidateIfChanged(const std::string& fingerprint) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (fingerprint_.empty() || fingerprint_ == fingerprint) {
    return false;
  }
  LOG_DISC_INFO("Network fingerprint changed ({} -> {}); clearing discovery cache", fingerprint_, fingerprint);
  result_.reset();
  completed_at_ = 0;
  neighbors_.reset();
  return true;
}

bool DiscoveryCache::IsFresh(const std::string& fingerprint, int64_t now, int64_t ttl) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return result_.has_value() && (now - completed_at_) < ttl && fingerprint == fingerprint_;
}

bool DiscoveryCache::IsRateLimited(int64_t now, int64_t window) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (completed_at_ <= 0) {
    return false;
  }
  return (now - completed_at_) < window;
}

std::optional<NeighborSnapshot> DiscoveryCache::GetNeighborSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return neighbors_;
}

void DiscoveryCache::PutNeighborSnapshot(const NeighborSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  neighbors_ = snapshot;
}

std::string DiscoveryCache::fingerprint() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fingerprint_;
}

int64_t DiscoveryCache::last_completed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return completed_at_;
}

}  // namespace discovery
}  // namespace netdash
