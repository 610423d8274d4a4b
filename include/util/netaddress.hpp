#pragma once

/*
 Network Address Utilities (IPv4 + link-layer)

 Purpose:
 - Parse and classify IPv4 addresses gathered from neighbor tables and
   interface enumeration
 - Normalize MAC addresses so every comparison happens in one canonical form
 - Represent IPv4 networks for sweep planning and membership checks

 Key functions:
 - IsValidHostIP: filter applied to every neighbor/sweep address before it can
   become a discovery candidate
 - NormalizeMac / NormalizeMacOctets: canonical lowercase colon-hex
 - Ipv4Network: non-strict CIDR parsing, host enumeration, /24 tightening
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace netdash {
namespace util {

// Parse dotted-quad IPv4. Returns host-order value, or nullopt.
std::optional<uint32_t> ParseIPv4(const std::string& address);

std::string FormatIPv4(uint32_t address);

bool IsValidIPv4(const std::string& address);

// 127.0.0.0/8
bool IsIPv4Loopback(uint32_t address) noexcept;

// RFC 3927 link-local (169.254.0.0/16)
bool IsRFC3927(const std::string& address);

// RFC 6598 shared address space (100.64.0.0/10). Mesh VPN overlays
// allocate their node addresses from this range.
bool IsRFC6598(const std::string& address);

/**
 * Check if an address may be treated as a LAN host
 *
 * Rejects: non-IPv4, unspecified/"this network" (0.0.0.0/8), loopback,
 * link-local, multicast (224.0.0.0/4), reserved (240.0.0.0/4) including the
 * limited broadcast address, IETF protocol assignments (192.0.0.0/24) and
 * shared CGNAT space (neither private nor global).
 *
 * Everything else is either private or globally routable and is accepted.
 */
bool IsValidHostIP(const std::string& address);

// Trim, lowercase, '-' -> ':'. Input that is empty after trimming stays empty.
std::string NormalizeMac(const std::string& mac);

// NormalizeMac plus: Cisco dotted form (aabb.ccdd.eeff) expanded to octets and
// single-digit octets zero-padded ("0:1b:2:..." -> "00:1b:02:...").
std::string NormalizeMacOctets(const std::string& mac);

// Exactly six colon-separated two-digit hex octets (after NormalizeMac).
bool IsValidMac(const std::string& mac);

/**
 * IPv4 network (address + prefix length)
 *
 * Parsing is non-strict: host bits are masked off, so "192.168.1.37/24"
 * yields 192.168.1.0/24. Both prefix lengths and dotted netmasks are accepted.
 */
class Ipv4Network {
public:
  Ipv4Network() = default;
  Ipv4Network(uint32_t address, int prefix);

  // "a.b.c.d/len" or "a.b.c.d/m.m.m.m"
  static std::optional<Ipv4Network> Parse(const std::string& cidr);
  // Address plus dotted netmask; an empty netmask means /24.
  static std::optional<Ipv4Network> FromAddressAndMask(const std::string& address, const std::string& netmask);

  uint32_t network() const { return network_; }
  int prefix() const { return prefix_; }
  uint32_t netmask() const;
  uint32_t broadcast() const;
  uint64_t NumAddresses() const;

  bool Contains(uint32_t address) const;
  bool Contains(const std::string& address) const;

  // Usable hosts in address order. Network and broadcast addresses are
  // excluded except for /31 and /32 where every address is a host.
  // limit == 0 means no limit.
  std::vector<uint32_t> Hosts(size_t limit = 0) const;
  // First and last usable host (inclusive), same rules as Hosts().
  std::pair<uint32_t, uint32_t> HostRange() const;
  std::optional<uint32_t> FirstHost() const;

  // The /24 around anchor when this network is wider than /24, else *this.
  Ipv4Network Tighten24(uint32_t anchor) const;

  std::string ToString() const;

  bool operator==(const Ipv4Network& other) const = default;

private:
  uint32_t network_{0};
  int prefix_{32};
};

}  // namespace util
}  // namespace netdash
