// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Platform - capability interface over the operating system

 Everything the discovery core needs from the OS goes through this interface:
 interface enumeration, the neighbor table, the default route, Wi-Fi identity
 and raw process execution. SystemPlatform is the real implementation; tests
 substitute scripted platforms.

 All methods fail soft: an unavailable tool, a non-zero exit code or
 unparsable output yields an empty collection, std::nullopt or "".
*/

#include "discovery/types.hpp"
#include "util/process.hpp"

#include <optional>
#include <string>
#include <vector>

namespace netdash {
namespace discovery {

enum class OsFamily { Linux, MacOS, Windows, Other };

// Family this binary was compiled for.
OsFamily HostOsFamily();
std::string OsFamilyName(OsFamily os);

// VPN, mesh, tunnel and peer-to-peer link interfaces (utun0, wg0, tailscale0,
// awdl0, bridge100, ...). Case-insensitive prefix match.
bool IsTunnelInterface(const std::string& name);

class Platform {
public:
  virtual ~Platform() = default;

  virtual OsFamily Os() const = 0;

  // IPv4 addresses of every interface, loopback included.
  virtual std::vector<InterfaceAddress> ListInterfaceAddresses() = 0;

  // Link-layer (MAC) addresses of every interface that has one.
  virtual std::vector<InterfaceLink> ListInterfaceLinks() = 0;

  virtual std::string Hostname() = 0;

  // IPv4 address the local hostname resolves to, if any.
  virtual std::optional<std::string> HostnameAddress() = 0;

  // Parsed OS neighbor/ARP table.
  virtual std::vector<NeighborEntry> EnumerateNeighbors() = 0;

  virtual std::optional<std::string> DefaultGateway() = 0;
  virtual std::optional<std::string> GatewayMac(const std::string& gateway_ip) = 0;

  // "SSID|BSSID", "SSID", or "" when unknown.
  virtual std::string WifiIdentity() = 0;

  virtual util::ProcessResult RunProcess(const std::vector<std::string>& argv, int timeout_seconds) = 0;
};

/**
 * SystemPlatform - getifaddrs plus the platform's command line tools
 *
 * Command selection:
 *   neighbors  Linux: ip neigh, then arp -an | macOS: arp -an |
 *              Windows: Get-NetNeighbor, then arp -an
 *   gateway    Linux: ip route show default | macOS: netstat -rn, then
 *              route -n get default
 *   gw mac     arp -n <ip> (Windows: arp -a <ip>)
 *   wifi       macOS: airport -I | Linux: iwgetid -r, then nmcli |
 *              Windows: netsh wlan show interfaces
 *
 * The command based methods only depend on Os() and RunProcess(), so a
 * subclass can replay recorded tool output for any OS family.
 */
class SystemPlatform : public Platform {
public:
  explicit SystemPlatform(OsFamily os = HostOsFamily());

  OsFamily Os() const override { return os_; }
  std::vector<InterfaceAddress> ListInterfaceAddresses() override;
  std::vector<InterfaceLink> ListInterfaceLinks() override;
  std::string Hostname() override;
  std::optional<std::string> HostnameAddress() override;
  std::vector<NeighborEntry> EnumerateNeighbors() override;
  std::optional<std::string> DefaultGateway() override;
  std::optional<std::string> GatewayMac(const std::string& gateway_ip) override;
  std::string WifiIdentity() override;
  util::ProcessResult RunProcess(const std::vector<std::string>& argv, int timeout_seconds) override;

  // Subprocess timeouts (seconds)
  static constexpr int NEIGHBOR_TIMEOUT_SEC = 5;
  static constexpr int POWERSHELL_TIMEOUT_SEC = 7;
  static constexpr int QUERY_TIMEOUT_SEC = 2;

private:
  OsFamily os_;
};

// === Tool output parsers ===

// `ip route show default`: "default via 192.168.1.1 dev eth0 ..."
std::optional<std::string> ParseLinuxDefaultRoute(const std::string& output);

// `netstat -rn`: first "default" row whose interface is not a tunnel and
// whose gateway is a dotted address.
std::optional<std::string> ParseNetstatDefaultGateway(const std::string& output);

// `route -n get default`: the "gateway:" line.
std::optional<std::string> ParseRouteGetGateway(const std::string& output);

// `arp -n <ip>` (first colon MAC) or, for Windows, `arp -a <ip>` (dash MAC
// following the IP). Normalized.
std::optional<std::string> ParseGatewayMac(const std::string& output, const std::string& gateway_ip, bool windows);

// `airport -I` and `netsh wlan show interfaces`: "SSID|BSSID" or "SSID".
std::string ParseAirportIdentity(const std::string& output);
std::string ParseNetshWlanIdentity(const std::string& output);

// `nmcli -t -f active,ssid dev wifi`: SSID of the "yes:" row.
std::string ParseNmcliActiveSsid(const std::string& output);

}  // namespace discovery
}  // namespace netdash
