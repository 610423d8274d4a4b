// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/platform.hpp"

#include "discovery/neighbor_parser.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <regex>
#include <string_view>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#if defined(__linux__)
#include <linux/if_packet.h>
#elif defined(__APPLE__)
#include <net/if_dl.h>
#endif

namespace netdash {
namespace discovery {

OsFamily HostOsFamily() {
#if defined(__linux__)
  return OsFamily::Linux;
#elif defined(__APPLE__)
  return OsFamily::MacOS;
#elif defined(_WIN32)
  return OsFamily::Windows;
#else
  return OsFamily::Other;
#endif
}

std::string OsFamilyName(OsFamily os) {
  switch (os) {
  case OsFamily::Linux:
    return "linux";
  case OsFamily::MacOS:
    return "darwin";
  case OsFamily::Windows:
    return "windows";
  case OsFamily::Other:
    break;
  }
  return "other";
}

bool IsTunnelInterface(const std::string& name) {
  static const std::vector<std::string_view> kPrefixes = {"utun", "tun", "tap",  "wg",  "tailscale", "ts",
                                                          "vpn",  "ppp", "awdl", "llw", "p2p",       "bridge"};
  if (name.empty()) {
    return false;
  }
  return util::StartsWithAny(util::ToLower(name), kPrefixes);
}

// ============================================================================
// Tool output parsers
// ============================================================================

std::optional<std::string> ParseLinuxDefaultRoute(const std::string& output) {
  static const std::regex re(R"(\bdefault via (\S+))");
  for (const auto& line : util::SplitLines(output)) {
    std::smatch m;
    if (std::regex_search(line, m, re)) {
      return m[1].str();
    }
  }
  return std::nullopt;
}

std::optional<std::string> ParseNetstatDefaultGateway(const std::string& output) {
  for (const auto& line : util::SplitLines(output)) {
    const auto parts = util::SplitWhitespace(line);
    if (parts.size() < 4 || parts[0] != "default") {
      continue;
    }
    const std::string& gateway = parts[1];
    const std::string& iface = parts[3];
    if (!IsTunnelInterface(iface) && gateway.find('.') != std::string::npos) {
      return gateway;
    }
  }
  return std::nullopt;
}

std::optional<std::string> ParseRouteGetGateway(const std::string& output) {
  for (const auto& raw : util::SplitLines(output)) {
    const std::string line = util::Trim(raw);
    if (!line.starts_with("gateway:")) {
      continue;
    }
    const auto parts = util::SplitWhitespace(line);
    if (parts.size() >= 2) {
      return parts[1];
    }
  }
  return std::nullopt;
}

std::optional<std::string> ParseGatewayMac(const std::string& output, const std::string& gateway_ip, bool windows) {
  std::smatch m;
  if (windows) {
    // Escape the dots of the IP for use inside the pattern
    std::string escaped;
    for (char c : gateway_ip) {
      if (c == '.')
        escaped += "\\.";
      else
        escaped.push_back(c);
    }
    const std::regex re(escaped + R"(\s+([0-9a-fA-F\-]{17}))");
    if (std::regex_search(output, m, re)) {
      return util::NormalizeMac(m[1].str());
    }
    return std::nullopt;
  }

  static const std::regex re(R"(([0-9a-fA-F]{2}(:[0-9a-fA-F]{2}){5}))");
  if (std::regex_search(output, m, re)) {
    return util::NormalizeMac(m[1].str());
  }
  return std::nullopt;
}

namespace {

// Shared by the airport and netsh parsers: "SSID : x" / "BSSID : y" lines.
std::string ComposeIdentity(const std::string& ssid, const std::string& bssid) {
  if (!ssid.empty() && !bssid.empty()) {
    return ssid + "|" + bssid;
  }
  return ssid;
}

std::string ValueAfterColon(const std::string& line) {
  const size_t colon = line.find(':');
  if (colon == std::string::npos) {
    return "";
  }
  return util::Trim(std::string_view(line).substr(colon + 1));
}

}  // namespace

std::string ParseAirportIdentity(const std::string& output) {
  std::string ssid, bssid;
  for (const auto& raw : util::SplitLines(output)) {
    const std::string line = util::Trim(raw);
    if (line.starts_with("SSID:")) {
      ssid = ValueAfterColon(line);
    } else if (line.starts_with("BSSID:")) {
      bssid = ValueAfterColon(line);
    }
  }
  return ComposeIdentity(ssid, bssid);
}

std::string ParseNetshWlanIdentity(const std::string& output) {
  std::string ssid, bssid;
  for (const auto& raw : util::SplitLines(output)) {
    const std::string line = util::Trim(raw);
    if (line.starts_with("SSID") && line.find("BSSID") == std::string::npos) {
      ssid = ValueAfterColon(line);
    } else if (line.starts_with("BSSID")) {
      bssid = ValueAfterColon(line);
    }
  }
  return ComposeIdentity(ssid, bssid);
}

std::string ParseNmcliActiveSsid(const std::string& output) {
  for (const auto& line : util::SplitLines(output)) {
    if (line.starts_with("yes:")) {
      return util::Trim(std::string_view(line).substr(4));
    }
  }
  return "";
}

// ============================================================================
// SystemPlatform
// ============================================================================

SystemPlatform::SystemPlatform(OsFamily os) : os_(os) {}

std::vector<InterfaceAddress> SystemPlatform::ListInterfaceAddresses() {
  std::vector<InterfaceAddress> out;
  struct ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    LOG_DISC_WARN_RL("getifaddrs failed: {}", std::strerror(errno));
    return out;
  }

  for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
      continue;
    }
    InterfaceAddress entry;
    entry.name = ifa->ifa_name ? ifa->ifa_name : "";
    entry.is_up = (ifa->ifa_flags & IFF_UP) && (ifa->ifa_flags & IFF_RUNNING);
    entry.is_loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;

    char buf[INET_ADDRSTRLEN] = {};
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_addr);
    if (!inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
      continue;
    }
    entry.address = buf;

    if (ifa->ifa_netmask && ifa->ifa_netmask->sa_family == AF_INET) {
      const auto* mask = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_netmask);
      char mbuf[INET_ADDRSTRLEN] = {};
      if (inet_ntop(AF_INET, &mask->sin_addr, mbuf, sizeof(mbuf))) {
        entry.netmask = mbuf;
      }
    }
    out.push_back(std::move(entry));
  }
  freeifaddrs(ifaddr);
  return out;
}

std::vector<InterfaceLink> SystemPlatform::ListInterfaceLinks() {
  std::vector<InterfaceLink> out;
  struct ifaddrs* ifaddr = nullptr;
  if (getifaddrs(&ifaddr) != 0) {
    return out;
  }

  for (struct ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr) {
      continue;
    }
    const unsigned char* bytes = nullptr;
#if defined(__linux__)
    if (ifa->ifa_addr->sa_family == AF_PACKET) {
      const auto* sll = reinterpret_cast<const struct sockaddr_ll*>(ifa->ifa_addr);
      if (sll->sll_halen == 6) {
        bytes = sll->sll_addr;
      }
    }
#elif defined(__APPLE__)
    if (ifa->ifa_addr->sa_family == AF_LINK) {
      const auto* sdl = reinterpret_cast<const struct sockaddr_dl*>(ifa->ifa_addr);
      if (sdl->sdl_alen == 6) {
        bytes = reinterpret_cast<const unsigned char*>(LLADDR(sdl));
      }
    }
#endif
    if (!bytes) {
      continue;
    }
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1], bytes[2], bytes[3],
                  bytes[4], bytes[5]);
    if (std::string_view(buf) == "00:00:00:00:00:00") {
      continue;
    }
    out.push_back(InterfaceLink{ifa->ifa_name ? ifa->ifa_name : "", buf});
  }
  freeifaddrs(ifaddr);
  return out;
}

std::string SystemPlatform::Hostname() {
  char buf[256] = {};
  if (gethostname(buf, sizeof(buf) - 1) != 0) {
    return "localhost";
  }
  return buf;
}

std::optional<std::string> SystemPlatform::HostnameAddress() {
  struct addrinfo hints {};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  const std::string host = Hostname();
  if (getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || !res) {
    LOG_DISC_DEBUG("hostname '{}' does not resolve to IPv4", host);
    return std::nullopt;
  }
  std::optional<std::string> out;
  char buf[INET_ADDRSTRLEN] = {};
  const auto* sin = reinterpret_cast<const struct sockaddr_in*>(res->ai_addr);
  if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
    out = std::string(buf);
  }
  freeaddrinfo(res);
  return out;
}

std::vector<NeighborEntry> SystemPlatform::EnumerateNeighbors() {
  if (Os() == OsFamily::Windows) {
    auto ps = RunProcess({"powershell", "-NoProfile", "-Command",
                          "Get-NetNeighbor -AddressFamily IPv4 | Select-Object IPAddress,LinkLayerAddress,State | "
                          "ConvertTo-Json"},
                         POWERSHELL_TIMEOUT_SEC);
    if (ps.ok()) {
      auto entries = ParseWindowsGetNetNeighbor(ps.out);
      if (!entries.empty()) {
        return entries;
      }
    }
    auto arp = RunProcess({"arp", "-an"}, NEIGHBOR_TIMEOUT_SEC);
    if (!arp.ok()) {
      return {};
    }
    return ParseWindowsArp(arp.out);
  }

  if (Os() == OsFamily::Linux) {
    auto ip = RunProcess({"ip", "neigh"}, NEIGHBOR_TIMEOUT_SEC);
    if (ip.ok()) {
      auto entries = ParseIpNeigh(ip.out);
      if (!entries.empty()) {
        return entries;
      }
    } else {
      LOG_DISC_DEBUG("ip neigh failed (rc={}): {}", ip.exit_code, util::Trim(ip.err));
    }
  }

  auto arp = RunProcess({"arp", "-an"}, NEIGHBOR_TIMEOUT_SEC);
  if (!arp.ok()) {
    LOG_DISC_DEBUG("arp -an failed (rc={}): {}", arp.exit_code, util::Trim(arp.err));
    return {};
  }
  return ParseArpAn(arp.out);
}

std::optional<std::string> SystemPlatform::DefaultGateway() {
  if (Os() == OsFamily::MacOS) {
    auto netstat = RunProcess({"netstat", "-rn"}, QUERY_TIMEOUT_SEC);
    if (netstat.ok()) {
      if (auto gw = ParseNetstatDefaultGateway(netstat.out)) {
        return gw;
      }
    }
    auto route = RunProcess({"route", "-n", "get", "default"}, QUERY_TIMEOUT_SEC);
    if (route.ok()) {
      return ParseRouteGetGateway(route.out);
    }
    if (!route.err.empty()) {
      LOG_DISC_DEBUG("route get default failed (rc={}): {}", route.exit_code, util::Trim(route.err));
    }
    return std::nullopt;
  }

  if (Os() == OsFamily::Linux) {
    auto route = RunProcess({"ip", "route", "show", "default"}, QUERY_TIMEOUT_SEC);
    if (route.ok()) {
      return ParseLinuxDefaultRoute(route.out);
    }
    if (!route.err.empty()) {
      LOG_DISC_DEBUG("ip route default failed (rc={}): {}", route.exit_code, util::Trim(route.err));
    }
  }
  return std::nullopt;
}

std::optional<std::string> SystemPlatform::GatewayMac(const std::string& gateway_ip) {
  if (gateway_ip.empty()) {
    return std::nullopt;
  }
  const bool windows = Os() == OsFamily::Windows;
  auto arp = RunProcess({"arp", windows ? "-a" : "-n", gateway_ip}, QUERY_TIMEOUT_SEC);
  if (!arp.ok()) {
    return std::nullopt;
  }
  return ParseGatewayMac(arp.out, gateway_ip, windows);
}

std::string SystemPlatform::WifiIdentity() {
  switch (Os()) {
  case OsFamily::MacOS: {
    auto airport = RunProcess(
        {"/System/Library/PrivateFrameworks/Apple80211.framework/Resources/airport", "-I"}, QUERY_TIMEOUT_SEC);
    return airport.ok() ? ParseAirportIdentity(airport.out) : "";
  }
  case OsFamily::Linux: {
    auto iwgetid = RunProcess({"iwgetid", "-r"}, QUERY_TIMEOUT_SEC);
    if (iwgetid.ok() && !util::Trim(iwgetid.out).empty()) {
      return util::Trim(iwgetid.out);
    }
    auto nmcli = RunProcess({"nmcli", "-t", "-f", "active,ssid", "dev", "wifi"}, QUERY_TIMEOUT_SEC);
    return nmcli.ok() ? ParseNmcliActiveSsid(nmcli.out) : "";
  }
  case OsFamily::Windows: {
    auto netsh = RunProcess({"netsh", "wlan", "show", "interfaces"}, QUERY_TIMEOUT_SEC);
    return netsh.ok() ? ParseNetshWlanIdentity(netsh.out) : "";
  }
  case OsFamily::Other:
    break;
  }
  return "";
}

util::ProcessResult SystemPlatform::RunProcess(const std::vector<std::string>& argv, int timeout_seconds) {
  return util::RunProcess(argv, timeout_seconds);
}

}  // namespace discovery
}  // namespace netdash
