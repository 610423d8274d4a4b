// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/prober.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <future>
#include <memory>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/resource.h>
#include <sys/socket.h>

#include <asio.hpp>

namespace netdash {
namespace discovery {

// ============================================================================
// Ping
// ============================================================================

std::vector<std::string> PingCommand(OsFamily os, const std::string& host, int timeout_ms) {
  if (os == OsFamily::Windows) {
    return {"ping", "-n", "1", "-w", std::to_string(timeout_ms), host};
  }
  const int wait_sec = std::max(1, timeout_ms / 1000);
  return {"ping", "-c", "1", "-W", std::to_string(wait_sec), host};
}

int PingProcessTimeout(OsFamily os, int timeout_ms) {
  if (os == OsFamily::Windows) {
    return std::max(2, timeout_ms / 1000 + 2);
  }
  return 2;
}

SystemProber::SystemProber(Platform& platform, size_t max_lookups, NameLookup lookup)
    : platform_(platform),
      lookup_slots_(std::make_shared<util::ConcurrencyLimiter>(max_lookups)),
      lookup_(std::move(lookup)) {}

bool SystemProber::Ping(const std::string& host, int timeout_ms) {
  const OsFamily os = platform_.Os();
  auto result = platform_.RunProcess(PingCommand(os, host, timeout_ms), PingProcessTimeout(os, timeout_ms));
  LOG_PROBE_TRACE("ping {} -> rc={}", host, result.exit_code);
  return result.exit_code == 0;
}

// ============================================================================
// TCP connect
// ============================================================================

bool SystemProber::TcpConnect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
  try {
    asio::error_code ec;
    auto address = asio::ip::make_address(host, ec);
    if (ec) {
      return false;
    }

    asio::io_context io;
    asio::ip::tcp::socket socket(io);
    bool done = false;
    bool connected = false;

    asio::steady_timer deadline(io, timeout);
    deadline.async_wait([&](const asio::error_code& wait_ec) {
      if (!wait_ec && !done) {
        asio::error_code ignored;
        socket.close(ignored);
      }
    });

    socket.async_connect(asio::ip::tcp::endpoint(address, port), [&](const asio::error_code& connect_ec) {
      done = true;
      connected = !connect_ec;
      deadline.cancel();
    });

    io.run();

    asio::error_code ignored;
    socket.close(ignored);
    LOG_PROBE_TRACE("tcp {}:{} -> {}", host, port, connected ? "open" : "closed");
    return connected;
  } catch (const std::exception& e) {
    LOG_PROBE_TRACE("tcp {}:{} failed: {}", host, port, e.what());
    return false;
  }
}

// ============================================================================
// Reverse DNS
// ============================================================================

std::optional<std::string> LookupHostName(const std::string& ip) {
  struct sockaddr_in sin {};
  sin.sin_family = AF_INET;
  if (inet_pton(AF_INET, ip.c_str(), &sin.sin_addr) != 1) {
    return std::nullopt;
  }
  char host[NI_MAXHOST] = {};
  int rc = getnameinfo(reinterpret_cast<const struct sockaddr*>(&sin), sizeof(sin), host, sizeof(host), nullptr, 0,
                       NI_NAMEREQD);
  if (rc != 0) {
    return std::nullopt;
  }
  return std::string(host);
}

std::optional<std::string> SystemProber::ReverseDns(const std::string& ip) {
  struct in_addr addr {};
  if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
    return std::nullopt;
  }

  // getnameinfo has no timeout. The thread keeps its slot until the call
  // returns, so a hung resolver caps the number of threads left behind.
  if (!lookup_slots_->TryAcquire()) {
    LOG_PROBE_TRACE("reverse dns {} skipped, {} lookups still pending", ip, lookup_slots_->in_use());
    return std::nullopt;
  }

  auto promise = std::make_shared<std::promise<std::optional<std::string>>>();
  auto future = promise->get_future();
  try {
    std::thread([promise, ip, lookup = lookup_, slots = lookup_slots_]() {
      std::optional<std::string> name;
      try {
        name = lookup(ip);
      } catch (const std::exception& e) {
        LOG_PROBE_TRACE("reverse dns {} failed: {}", ip, e.what());
      }
      promise->set_value(std::move(name));
      slots->Release();
    }).detach();
  } catch (const std::system_error& e) {
    lookup_slots_->Release();
    LOG_PROBE_WARN("reverse dns {}: cannot start lookup thread: {}", ip, e.what());
    return std::nullopt;
  }

  if (future.wait_for(DNS_BUDGET) != std::future_status::ready) {
    LOG_PROBE_TRACE("reverse dns {} timed out", ip);
    return std::nullopt;
  }
  return future.get();
}

// ============================================================================
// Port checks
// ============================================================================

PortStatus CheckPorts(Prober& prober, const std::string& ip, const std::vector<uint16_t>& ports,
                      util::ConcurrencyLimiter& limiter, std::chrono::milliseconds timeout) {
  PortStatus status;
  for (uint16_t port : ports) {
    status[port] = false;
  }
  if (ports.empty()) {
    return status;
  }

  std::mutex mutex;
  util::RunBounded(ports.size(), ports.size(), [&](size_t i) {
    bool open = false;
    {
      util::ConcurrencyLimiter::Slot slot(limiter);
      open = prober.TcpConnect(ip, ports[i], timeout);
    }
    std::lock_guard<std::mutex> lock(mutex);
    status[ports[i]] = status[ports[i]] || open;
  });
  return status;
}

// ============================================================================
// Concurrency settings
// ============================================================================

std::optional<uint64_t> SoftFileLimit() {
  struct rlimit rl {};
  if (getrlimit(RLIMIT_NOFILE, &rl) != 0 || rl.rlim_cur == RLIM_INFINITY) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(rl.rlim_cur);
}

ConcurrencySettings ConcurrencySettings::FromEnvironment(OsFamily os, std::optional<uint64_t> fd_limit) {
  ConcurrencySettings s;
  s.ping = util::EnvInt("NETDASH_PING_CONCURRENCY", 96);
  s.port_probe = util::EnvInt("NETDASH_PORT_PROBE_CONCURRENCY", 64);
  s.port_conn = util::EnvInt("NETDASH_PORT_CONN_CONCURRENCY", 128);
  s.enrich = util::EnvInt("NETDASH_ENRICH_CONCURRENCY", 96);
  s.dns = util::EnvInt("NETDASH_DNS_CONCURRENCY", 16);

  if (os == OsFamily::MacOS) {
    s.ping = std::min<size_t>(s.ping, 32);
    s.port_probe = std::min<size_t>(s.port_probe, 32);
    s.port_conn = std::min<size_t>(s.port_conn, 64);
    s.enrich = std::min<size_t>(s.enrich, 48);
    s.dns = std::min<size_t>(s.dns, 8);
    s.seed_ping = std::min<size_t>(s.seed_ping, 8);
    s.neighbor_validation = std::min<size_t>(s.neighbor_validation, 6);
  }

  if (fd_limit && *fd_limit > 0) {
    const size_t cap = std::max<size_t>(1, static_cast<size_t>(*fd_limit / 2));
    for (size_t* value : {&s.ping, &s.port_probe, &s.port_conn, &s.enrich, &s.dns, &s.seed_ping,
                          &s.neighbor_validation}) {
      *value = std::min(*value, cap);
    }
  }

  LOG_PROBE_DEBUG("concurrency: ping={} port_probe={} port_conn={} enrich={} dns={}", s.ping, s.port_probe,
                  s.port_conn, s.enrich, s.dns);
  return s;
}

}  // namespace discovery
}  // namespace netdash
