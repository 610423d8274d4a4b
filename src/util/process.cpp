// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/process.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

namespace netdash {
namespace util {

namespace {

constexpr const char* DEFAULT_PATH = "/usr/bin:/bin:/usr/sbin:/sbin:/usr/local/bin:/opt/homebrew/bin";

// Owns a pipe pair; closes whatever is still open on destruction.
// Both ends are close-on-exec so children spawned concurrently by other
// threads never hold them; the dup2'd copies in our own child are not.
struct Pipe {
  int fds[2]{-1, -1};

  bool open() {
#if defined(__linux__)
    return pipe2(fds, O_CLOEXEC) == 0;
#else
    if (pipe(fds) != 0) {
      return false;
    }
    return fcntl(fds[0], F_SETFD, FD_CLOEXEC) == 0 && fcntl(fds[1], F_SETFD, FD_CLOEXEC) == 0;
#endif
  }
  void close_read() {
    if (fds[0] >= 0) {
      ::close(fds[0]);
      fds[0] = -1;
    }
  }
  void close_write() {
    if (fds[1] >= 0) {
      ::close(fds[1]);
      fds[1] = -1;
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
};

int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return ProcessResult::FAILED;
}

void KillAndReap(pid_t pid) {
  kill(pid, SIGKILL);
  int status = 0;
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
  }
}

}  // namespace

ProcessResult RunProcess(const std::vector<std::string>& argv, int timeout_seconds) {
  ProcessResult result;
  if (argv.empty()) {
    result.err = "empty command";
    return result;
  }

  const char* inherited_path = std::getenv("PATH");
  std::vector<std::string> env_storage = {
      std::string("PATH=") + (inherited_path && *inherited_path ? inherited_path : DEFAULT_PATH),
      "LANG=C.UTF-8",
      "LC_ALL=C.UTF-8",
  };
  std::vector<char*> envp;
  for (auto& e : env_storage)
    envp.push_back(e.data());
  envp.push_back(nullptr);

  std::vector<std::string> arg_storage(argv);
  std::vector<char*> args;
  for (auto& a : arg_storage)
    args.push_back(a.data());
  args.push_back(nullptr);

  Pipe out_pipe;
  Pipe err_pipe;
  if (!out_pipe.open() || !err_pipe.open()) {
    result.err = std::strerror(errno);
    return result;
  }

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);
  posix_spawn_file_actions_addclose(&actions, out_pipe.fds[0]);
  posix_spawn_file_actions_addclose(&actions, err_pipe.fds[0]);
  posix_spawn_file_actions_addclose(&actions, out_pipe.fds[1]);
  posix_spawn_file_actions_addclose(&actions, err_pipe.fds[1]);

  pid_t pid = -1;
  const int rc = posix_spawnp(&pid, args[0], &actions, nullptr, args.data(), envp.data());
  posix_spawn_file_actions_destroy(&actions);

  if (rc != 0) {
    result.err = std::strerror(rc);
    LOG_PROBE_TRACE("spawn of '{}' failed: {}", argv[0], result.err);
    return result;
  }

  out_pipe.close_write();
  err_pipe.close_write();

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
  bool out_open = true;
  bool err_open = true;
  char buf[4096];

  while (out_open || err_open) {
    const auto now = std::chrono::steady_clock::now();
    if (timeout_seconds > 0 && now >= deadline) {
      KillAndReap(pid);
      LOG_PROBE_DEBUG("'{}' timed out after {}s", argv[0], timeout_seconds);
      return ProcessResult{ProcessResult::FAILED, "", "timeout"};
    }
    const int wait_ms =
        timeout_seconds > 0
            ? static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count())
            : -1;

    pollfd pfds[2];
    nfds_t n = 0;
    if (out_open)
      pfds[n++] = pollfd{out_pipe.fds[0], POLLIN, 0};
    if (err_open)
      pfds[n++] = pollfd{err_pipe.fds[0], POLLIN, 0};

    const int ready = poll(pfds, n, std::min(wait_ms < 0 ? 100 : wait_ms, 100));
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      result.err = std::strerror(errno);
      KillAndReap(pid);
      return ProcessResult{ProcessResult::FAILED, "", result.err};
    }

    for (nfds_t i = 0; i < n; ++i) {
      if (!(pfds[i].revents & (POLLIN | POLLHUP | POLLERR)))
        continue;
      const ssize_t got = read(pfds[i].fd, buf, sizeof(buf));
      if (got > 0) {
        (pfds[i].fd == out_pipe.fds[0] ? result.out : result.err).append(buf, static_cast<size_t>(got));
      } else if (got == 0 || (errno != EINTR && errno != EAGAIN)) {
        if (pfds[i].fd == out_pipe.fds[0]) {
          out_pipe.close_read();
          out_open = false;
        } else {
          err_pipe.close_read();
          err_open = false;
        }
      }
    }
  }

  // Output is drained; the child may still be exiting.
  int status = 0;
  for (;;) {
    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      result.exit_code = DecodeWaitStatus(status);
      break;
    }
    if (done < 0 && errno != EINTR) {
      result.exit_code = ProcessResult::FAILED;
      break;
    }
    if (timeout_seconds > 0 && std::chrono::steady_clock::now() >= deadline) {
      KillAndReap(pid);
      return ProcessResult{ProcessResult::FAILED, "", "timeout"};
    }
    usleep(10 * 1000);
  }

  if (result.exit_code < 0 || result.exit_code > 100) {
    LOG_PROBE_DEBUG("'{}' exited with rc={}: {}", argv[0], result.exit_code, result.err);
  }
  return result;
}

}  // namespace util
}  // namespace netdash
