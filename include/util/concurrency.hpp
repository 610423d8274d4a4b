// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>

namespace netdash {
namespace util {

/**
 * ConcurrencyLimiter - counting semaphore for one class of I/O
 *
 * Each probe class (ping, TCP connect, DNS, enrichment) gets its own limiter
 * so that e.g. port probes issued from inside enrichment workers are bounded
 * across all hosts, not per host.
 */
class ConcurrencyLimiter {
public:
  explicit ConcurrencyLimiter(size_t max_concurrent);

  ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
  ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

  void Acquire();
  // Takes a slot only if one is free right now.
  bool TryAcquire();
  void Release();

  size_t capacity() const { return capacity_; }
  size_t in_use() const;
  // Highest in_use() observed since construction.
  size_t peak() const;

  // RAII slot
  class Slot {
  public:
    explicit Slot(ConcurrencyLimiter& limiter) : limiter_(limiter) { limiter_.Acquire(); }
    ~Slot() { limiter_.Release(); }
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

  private:
    ConcurrencyLimiter& limiter_;
  };

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  size_t in_use_{0};
  size_t peak_{0};
};

// Run fn(0) .. fn(count - 1) on at most `limit` threads and wait for all of
// them. fn must not throw; exceptions escaping fn are logged and dropped.
void RunBounded(size_t count, size_t limit, const std::function<void(size_t)>& fn);

}  // namespace util
}  // namespace netdash
