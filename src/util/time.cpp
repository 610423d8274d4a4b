// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>

namespace netdash {
namespace util {

namespace {

// Seconds since epoch; 0 means the real clocks are used.
std::atomic<int64_t> g_mock_time{0};

// Anchor pairing a real steady_clock reading with the mock value current at
// the moment mock time was first consulted. Guarded by g_anchor_mutex.
struct SteadyAnchor {
  std::chrono::steady_clock::time_point real;
  int64_t mock{0};
  bool valid{false};
};

std::mutex g_anchor_mutex;
SteadyAnchor g_anchor;

}  // namespace

int64_t GetTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock * 1000;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  const int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_anchor_mutex);
  if (!g_anchor.valid) {
    g_anchor.real = std::chrono::steady_clock::now();
    g_anchor.mock = mock;
    g_anchor.valid = true;
  }
  return g_anchor.real + std::chrono::seconds(mock - g_anchor.mock);
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Keep the anchor while mock time moves so steady time stays monotonic
  // across SetMockTime calls; drop it once mock time is switched off.
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_anchor_mutex);
    g_anchor.valid = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

std::string FormatTime(int64_t unix_time) {
  const std::chrono::sys_seconds secs{std::chrono::seconds{unix_time}};
  const auto days = std::chrono::floor<std::chrono::days>(secs);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss hms{secs - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << "-" << std::setw(2)
      << static_cast<unsigned>(ymd.month()) << "-" << std::setw(2) << static_cast<unsigned>(ymd.day()) << " "
      << std::setw(2) << hms.hours().count() << ":" << std::setw(2) << hms.minutes().count() << ":" << std::setw(2)
      << hms.seconds().count() << " UTC";
  return oss.str();
}

}  // namespace util
}  // namespace netdash
