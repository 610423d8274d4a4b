// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Active prober

 Liveness checks used by the sweep and by enrichment. Every probe returns
 false / nullopt on any failure (tool missing, timeout, refused, unreachable);
 nothing here throws.

 Probe classes and their concurrency ceilings:
   ping        OS ping utility, one echo
   port_probe  hosts probed for open ports at once (sweep non-responders)
   port_conn   TCP connects in flight across all hosts
   enrich      candidates enriched at once
   dns         reverse lookups in flight
*/

#include "discovery/platform.hpp"
#include "discovery/types.hpp"
#include "util/concurrency.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

class Prober {
public:
  virtual ~Prober() = default;

  // One ICMP echo. True only on a reply within timeout_ms.
  virtual bool Ping(const std::string& host, int timeout_ms) = 0;

  // Open and immediately close a TCP connection.
  virtual bool TcpConnect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;

  // PTR lookup within a short budget.
  virtual std::optional<std::string> ReverseDns(const std::string& ip) = 0;
};

// Blocking PTR lookup of a dotted-quad address (getnameinfo, NI_NAMEREQD).
std::optional<std::string> LookupHostName(const std::string& ip);

class SystemProber : public Prober {
public:
  using NameLookup = std::function<std::optional<std::string>(const std::string& ip)>;

  // Pings are run through platform.RunProcess() with arguments for
  // platform.Os(). At most `max_lookups` resolver threads exist at any time,
  // including lookups that outlived DNS_BUDGET and were abandoned.
  explicit SystemProber(Platform& platform, size_t max_lookups = 16, NameLookup lookup = LookupHostName);

  bool Ping(const std::string& host, int timeout_ms) override;
  bool TcpConnect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
  // nullopt without a lookup when every resolver thread is still busy.
  std::optional<std::string> ReverseDns(const std::string& ip) override;

  size_t lookups_in_flight() const { return lookup_slots_->in_use(); }

  static constexpr std::chrono::milliseconds DNS_BUDGET{500};

private:
  Platform& platform_;
  // Shared with the lookup threads, which may outlive the prober
  std::shared_ptr<util::ConcurrencyLimiter> lookup_slots_;
  NameLookup lookup_;
};

// argv for a single ping on the given OS, and the process timeout to use.
std::vector<std::string> PingCommand(OsFamily os, const std::string& host, int timeout_ms);
int PingProcessTimeout(OsFamily os, int timeout_ms);

static constexpr std::chrono::milliseconds TCP_CONNECT_TIMEOUT{600};

// Probe every port of one host concurrently. Each connect holds a slot of
// `limiter` (shared across hosts) while in flight. Returns port -> open.
PortStatus CheckPorts(Prober& prober, const std::string& ip, const std::vector<uint16_t>& ports,
                      util::ConcurrencyLimiter& limiter, std::chrono::milliseconds timeout = TCP_CONNECT_TIMEOUT);

// Soft RLIMIT_NOFILE, if it can be read.
std::optional<uint64_t> SoftFileLimit();

/**
 * Per-class concurrency ceilings
 *
 * Defaults can be raised or lowered through NETDASH_*_CONCURRENCY variables
 * (positive integers only). macOS gets lower caps, and every class is capped
 * at half the soft descriptor limit when that is known.
 */
struct ConcurrencySettings {
  size_t ping{96};
  size_t port_probe{64};
  size_t port_conn{128};
  size_t enrich{96};
  size_t dns{16};
  size_t seed_ping{16};
  size_t neighbor_validation{8};

  static ConcurrencySettings FromEnvironment(OsFamily os, std::optional<uint64_t> fd_limit);
  static ConcurrencySettings FromEnvironment() { return FromEnvironment(HostOsFamily(), SoftFileLimit()); }
};

}  // namespace discovery
}  // namespace netdash
