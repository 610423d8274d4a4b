// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/concurrency.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <atomic>

#include <asio/post.hpp>
#include <asio/thread_pool.hpp>

namespace netdash {
namespace util {

ConcurrencyLimiter::ConcurrencyLimiter(size_t max_concurrent) : capacity_(std::max<size_t>(1, max_concurrent)) {}

void ConcurrencyLimiter::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this]() { return in_use_ < capacity_; });
  ++in_use_;
  peak_ = std::max(peak_, in_use_);
}

bool ConcurrencyLimiter::TryAcquire() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (in_use_ >= capacity_) {
    return false;
  }
  ++in_use_;
  peak_ = std::max(peak_, in_use_);
  return true;
}

void ConcurrencyLimiter::Release() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0)
      --in_use_;
  }
  cv_.notify_one();
}

size_t ConcurrencyLimiter::in_use() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

size_t ConcurrencyLimiter::peak() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return peak_;
}

void RunBounded(size_t count, size_t limit, const std::function<void(size_t)>& fn) {
  if (count == 0) {
    return;
  }
  const size_t workers = std::max<size_t>(1, std::min(count, limit));
  if (workers == 1) {
    for (size_t i = 0; i < count; ++i) {
      try {
        fn(i);
      } catch (const std::exception& e) {
        LOG_ERROR("RunBounded: task {} threw: {}", i, e.what());
      }
    }
    return;
  }

  // Workers pull indices from a shared counter so at most `workers` tasks run
  // at once regardless of how long individual tasks take.
  asio::thread_pool pool(workers);
  std::atomic<size_t> next{0};
  for (size_t w = 0; w < workers; ++w) {
    asio::post(pool, [&]() {
      for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
        try {
          fn(i);
        } catch (const std::exception& e) {
          LOG_ERROR("RunBounded: task {} threw: {}", i, e.what());
        }
      }
    });
  }
  pool.join();
}

}  // namespace util
}  // namespace netdash
