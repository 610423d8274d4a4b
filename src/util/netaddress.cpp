#include "util/netaddress.hpp"

#include "util/logging.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

#include <asio/ip/address.hpp>
#include <asio/ip/address_v4.hpp>

namespace netdash {
namespace util {

// ============================================================================
// IPv4 parsing
// ============================================================================

std::optional<uint32_t> ParseIPv4(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    asio::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if (ec) {
      return std::nullopt;
    }
    return ip.to_uint();
  } catch (const std::exception& e) {
    LOG_TRACE("ParseIPv4: exception parsing address '{}': {}", address, e.what());
    return std::nullopt;
  }
}

std::string FormatIPv4(uint32_t address) {
  return asio::ip::address_v4(address).to_string();
}

bool IsValidIPv4(const std::string& address) {
  return ParseIPv4(address).has_value();
}

bool IsIPv4Loopback(uint32_t address) noexcept {
  return (address >> 24) == 127;
}

bool IsRFC3927(const std::string& address) {
  auto ip = ParseIPv4(address);
  if (!ip)
    return false;
  // 169.254.0.0/16
  return (*ip & 0xFFFF0000u) == 0xA9FE0000u;
}

bool IsRFC6598(const std::string& address) {
  auto ip = ParseIPv4(address);
  if (!ip)
    return false;
  // 100.64.0.0/10
  return (*ip & 0xFFC00000u) == 0x64400000u;
}

bool IsValidHostIP(const std::string& address) {
  auto ip_opt = ParseIPv4(address);
  if (!ip_opt) {
    return false;
  }
  const uint32_t ip = *ip_opt;
  const uint8_t b0 = static_cast<uint8_t>(ip >> 24);
  const uint8_t b1 = static_cast<uint8_t>(ip >> 16);
  const uint8_t b2 = static_cast<uint8_t>(ip >> 8);

  // 0.0.0.0/8 - unspecified / "this network"
  if (b0 == 0)
    return false;

  // 127.0.0.0/8 - loopback
  if (b0 == 127)
    return false;

  // 169.254.0.0/16 - link-local
  if (b0 == 169 && b1 == 254)
    return false;

  // 224.0.0.0/4 - multicast
  if ((b0 & 0xF0) == 224)
    return false;

  // 240.0.0.0/4 - reserved, includes 255.255.255.255
  if ((b0 & 0xF0) == 240)
    return false;

  // 100.64.0.0/10 - shared CGNAT, neither private nor global
  if (b0 == 100 && (b1 & 0xC0) == 64)
    return false;

  // 192.0.0.0/24 - IETF protocol assignments
  if (b0 == 192 && b1 == 0 && b2 == 0)
    return false;

  return true;
}

// ============================================================================
// MAC addresses
// ============================================================================

std::string NormalizeMac(const std::string& mac) {
  std::string out = ToLower(Trim(mac));
  std::replace(out.begin(), out.end(), '-', ':');
  return out;
}

std::string NormalizeMacOctets(const std::string& mac) {
  std::string norm = NormalizeMac(mac);
  if (norm.empty()) {
    return norm;
  }

  // Cisco style "aabb.ccdd.eeff"
  if (norm.size() == 14 && norm[4] == '.' && norm[9] == '.') {
    std::string hex;
    for (char c : norm) {
      if (c != '.')
        hex.push_back(c);
    }
    std::string out;
    for (size_t i = 0; i < hex.size(); i += 2) {
      if (!out.empty())
        out.push_back(':');
      out.append(hex, i, 2);
    }
    return out;
  }

  std::replace(norm.begin(), norm.end(), '.', ':');

  std::string out;
  size_t start = 0;
  while (start <= norm.size()) {
    size_t colon = norm.find(':', start);
    std::string part = norm.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
    if (part.size() < 2) {
      part.insert(0, 2 - part.size(), '0');
    }
    if (!out.empty())
      out.push_back(':');
    out += part;
    if (colon == std::string::npos)
      break;
    start = colon + 1;
  }
  return out;
}

bool IsValidMac(const std::string& mac) {
  const std::string norm = NormalizeMac(mac);
  if (norm.size() != 17) {
    return false;
  }
  for (size_t i = 0; i < norm.size(); ++i) {
    if (i % 3 == 2) {
      if (norm[i] != ':')
        return false;
    } else if (!std::isxdigit(static_cast<unsigned char>(norm[i]))) {
      return false;
    }
  }
  return true;
}

// ============================================================================
// Ipv4Network
// ============================================================================

namespace {

uint32_t PrefixToMask(int prefix) {
  if (prefix <= 0)
    return 0;
  if (prefix >= 32)
    return 0xFFFFFFFFu;
  return 0xFFFFFFFFu << (32 - prefix);
}

// Contiguous netmask -> prefix length, nullopt for masks like 255.0.255.0
std::optional<int> MaskToPrefix(uint32_t mask) {
  int prefix = 0;
  while (prefix < 32 && (mask & (0x80000000u >> prefix))) {
    ++prefix;
  }
  if (PrefixToMask(prefix) != mask) {
    return std::nullopt;
  }
  return prefix;
}

}  // namespace

Ipv4Network::Ipv4Network(uint32_t address, int prefix)
    : network_(address & PrefixToMask(prefix)), prefix_(std::clamp(prefix, 0, 32)) {}

std::optional<Ipv4Network> Ipv4Network::Parse(const std::string& cidr) {
  const size_t slash = cidr.find('/');
  if (slash == std::string::npos) {
    auto ip = ParseIPv4(cidr);
    if (!ip)
      return std::nullopt;
    return Ipv4Network(*ip, 32);
  }

  auto ip = ParseIPv4(cidr.substr(0, slash));
  if (!ip) {
    return std::nullopt;
  }

  const std::string suffix = cidr.substr(slash + 1);
  if (auto prefix = SafeParseInt(suffix, 0, 32)) {
    return Ipv4Network(*ip, *prefix);
  }
  auto mask = ParseIPv4(suffix);
  if (!mask) {
    return std::nullopt;
  }
  auto prefix = MaskToPrefix(*mask);
  if (!prefix) {
    return std::nullopt;
  }
  return Ipv4Network(*ip, *prefix);
}

std::optional<Ipv4Network> Ipv4Network::FromAddressAndMask(const std::string& address, const std::string& netmask) {
  return Parse(address + "/" + (netmask.empty() ? std::string("255.255.255.0") : netmask));
}

uint32_t Ipv4Network::netmask() const {
  return PrefixToMask(prefix_);
}

uint32_t Ipv4Network::broadcast() const {
  return network_ | ~netmask();
}

uint64_t Ipv4Network::NumAddresses() const {
  return uint64_t{1} << (32 - prefix_);
}

bool Ipv4Network::Contains(uint32_t address) const {
  return (address & netmask()) == network_;
}

bool Ipv4Network::Contains(const std::string& address) const {
  auto ip = ParseIPv4(address);
  return ip && Contains(*ip);
}

std::pair<uint32_t, uint32_t> Ipv4Network::HostRange() const {
  if (prefix_ < 31) {
    return {network_ + 1, broadcast() - 1};
  }
  return {network_, broadcast()};
}

std::vector<uint32_t> Ipv4Network::Hosts(size_t limit) const {
  std::vector<uint32_t> out;
  const auto [first, last] = HostRange();
  for (uint64_t a = first; a <= last; ++a) {
    if (limit != 0 && out.size() >= limit)
      break;
    out.push_back(static_cast<uint32_t>(a));
  }
  return out;
}

std::optional<uint32_t> Ipv4Network::FirstHost() const {
  auto hosts = Hosts(1);
  if (hosts.empty())
    return std::nullopt;
  return hosts.front();
}

Ipv4Network Ipv4Network::Tighten24(uint32_t anchor) const {
  if (prefix_ >= 24) {
    return *this;
  }
  return Ipv4Network(anchor, 24);
}

std::string Ipv4Network::ToString() const {
  return FormatIPv4(network_) + "/" + std::to_string(prefix_);
}

}  // namespace util
}  // namespace netdash
