// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/types.hpp"

#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <algorithm>

namespace netdash {
namespace discovery {

NeighborState ParseNeighborState(const std::string& token) {
  const std::string t = util::ToLower(token);
  if (t == "reachable")
    return NeighborState::REACHABLE;
  if (t == "stale")
    return NeighborState::STALE;
  if (t == "delay")
    return NeighborState::DELAY;
  if (t == "probe")
    return NeighborState::PROBE;
  if (t == "failed")
    return NeighborState::FAILED;
  if (t == "incomplete")
    return NeighborState::INCOMPLETE;
  return NeighborState::UNKNOWN;
}

std::string NeighborStateName(NeighborState state) {
  switch (state) {
  case NeighborState::REACHABLE:
    return "REACHABLE";
  case NeighborState::STALE:
    return "STALE";
  case NeighborState::DELAY:
    return "DELAY";
  case NeighborState::PROBE:
    return "PROBE";
  case NeighborState::FAILED:
    return "FAILED";
  case NeighborState::INCOMPLETE:
    return "INCOMPLETE";
  case NeighborState::UNKNOWN:
    break;
  }
  return "";
}

std::optional<std::string> CandidateSet::MacFor(const std::string& ip) const {
  auto it = mac_by_ip.find(ip);
  if (it == mac_by_ip.end())
    return std::nullopt;
  return it->second;
}

std::optional<std::string> CandidateSet::IfaceFor(const std::string& ip) const {
  auto it = iface_by_ip.find(ip);
  if (it == iface_by_ip.end())
    return std::nullopt;
  return it->second;
}

std::string ConnectionTypeName(ConnectionType type) {
  return type == ConnectionType::Wireless ? "Wireless" : "Wired";
}

std::string InterfaceKindName(InterfaceKind kind) {
  return kind == InterfaceKind::Overlay ? "Overlay" : "Local";
}

InterfaceKind InterfaceKindForIp(const std::string& ip) {
  return util::IsRFC6598(ip) ? InterfaceKind::Overlay : InterfaceKind::Local;
}

namespace {

template <typename T>
void KeepFirst(std::optional<T>& mine, const std::optional<T>& theirs) {
  if (!mine && theirs)
    mine = theirs;
}

void KeepFirst(std::string& mine, const std::string& theirs) {
  if (mine.empty())
    mine = theirs;
}

}  // namespace

void DeviceInterface::MergeFrom(const DeviceInterface& other) {
  ping = ping || other.ping;
  up = up || other.up;
  missing = missing && other.missing;
  for (const auto& [port, open] : other.ports) {
    ports[port] = ports[port] || open;
  }
  KeepFirst(mac, other.mac);
  KeepFirst(original_name, other.original_name);
  KeepFirst(iface, other.iface);
  if (other.conn_type == ConnectionType::Wireless) {
    conn_type = ConnectionType::Wireless;
  }
  if (other.kind == InterfaceKind::Overlay) {
    kind = InterfaceKind::Overlay;
  }
}

void DeviceGroup::UpsertInterface(const DeviceInterface& iface) {
  auto it = std::find_if(interfaces.begin(), interfaces.end(),
                         [&](const DeviceInterface& existing) { return existing.ip == iface.ip; });
  if (it == interfaces.end()) {
    interfaces.push_back(iface);
  } else {
    it->MergeFrom(iface);
  }
  Recompute();
}

void DeviceGroup::MergeFrom(const DeviceGroup& other) {
  known = known || other.known;
  is_host = is_host || other.is_host;
  has_overlay = has_overlay || other.has_overlay;
  KeepFirst(mac, other.mac);
  KeepFirst(notes, other.notes);
  for (const auto& iface : other.interfaces) {
    UpsertInterface(iface);
  }
  Recompute();
}

void DeviceGroup::Recompute() {
  up = std::any_of(interfaces.begin(), interfaces.end(), [](const DeviceInterface& i) { return i.up; });
  missing = std::all_of(interfaces.begin(), interfaces.end(), [](const DeviceInterface& i) { return i.missing; });
  if (std::any_of(interfaces.begin(), interfaces.end(),
                  [](const DeviceInterface& i) { return i.kind == InterfaceKind::Overlay; })) {
    has_overlay = true;
  }
}

}  // namespace discovery
}  // namespace netdash
