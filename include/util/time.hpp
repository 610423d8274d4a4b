// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace netdash {
namespace util {

// Wall-clock seconds since the Unix epoch (or the mock time when set).
int64_t GetTime();

// Wall-clock milliseconds since the Unix epoch. Follows mock time at
// whole-second resolution.
int64_t GetTimeMillis();

// Monotonic clock. While mock time is active it advances with the mock value
// so cache TTLs and refresh windows can be tested without sleeping.
std::chrono::steady_clock::time_point GetSteadyTime();

// 0 disables mock time.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC"
std::string FormatTime(int64_t unix_time);

// Sets mock time for the lifetime of the scope and restores the previous
// value on exit.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace netdash
