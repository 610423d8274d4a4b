// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <vector>

namespace netdash {
namespace util {

struct ProcessResult {
  // Sentinel for spawn failure, timeout or abnormal termination.
  static constexpr int FAILED = 999;

  int exit_code{FAILED};
  std::string out;
  std::string err;

  bool ok() const { return exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with a sanitized environment:
// PATH is inherited (or a default system PATH), LANG/LC_ALL are C.UTF-8, and
// nothing else is passed. stdin is /dev/null. stdout and stderr are captured.
//
// The child is killed with SIGKILL once timeout_seconds elapses; the result is
// then {FAILED, "", "timeout"}. Never throws.
ProcessResult RunProcess(const std::vector<std::string>& argv, int timeout_seconds);

}  // namespace util
}  // namespace netdash
