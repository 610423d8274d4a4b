// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite token bucket used by the *_RL logging macros

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace netdash {
namespace util {

/**
 * RateLimiter - token bucket keyed by log callsite
 *
 * Each callsite starts with a full bucket of tokens_per_period tokens and
 * refills continuously at tokens_per_period / period_seconds. A message is
 * allowed while at least one whole token remains.
 *
 * Neighbor tables on busy or misbehaving networks can contain hundreds of rows
 * that fail to parse, and a discovery cycle runs every 30 seconds. Without a
 * budget a single bad row format would dominate the log.
 */
class RateLimiter {
public:
  // Returns true if the message at callsite_key may be logged now.
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens{0.0};
    std::chrono::steady_clock::time_point last_refill{};
    bool initialized{false};
  };

  std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace netdash
