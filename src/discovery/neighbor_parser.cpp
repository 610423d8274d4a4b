// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/neighbor_parser.hpp"

#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_parsing.hpp"

#include <map>
#include <regex>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace netdash {
namespace discovery {

namespace {

const std::regex& IpNeighPattern() {
  static const std::regex re(
      R"((\d+\.\d+\.\d+\.\d+).*dev\s+(\w+).*lladdr\s+([0-9a-f:]{17})(?:.*\b(REACHABLE|STALE|DELAY|PROBE|FAILED|INCOMPLETE|PERMANENT|NOARP)\b)?)",
      std::regex::icase);
  return re;
}

const std::regex& ArpAnPattern() {
  static const std::regex re(
      R"(\((\d+\.\d+\.\d+\.\d+)\)\s+at\s+([0-9a-f:]{1,17}|[0-9a-f\.]{1,17})(?:\s+on\s+(\w+))?)", std::regex::icase);
  return re;
}

const std::regex& WindowsArpPattern() {
  static const std::regex re(R"((\d+\.\d+\.\d+\.\d+)\s+([0-9a-fA-F\-]{17})\s+(\w+))");
  return re;
}

}  // namespace

std::vector<NeighborEntry> DedupeByIp(const std::vector<NeighborEntry>& entries) {
  std::vector<NeighborEntry> out;
  std::map<std::string, size_t> index_by_ip;
  for (const auto& e : entries) {
    auto it = index_by_ip.find(e.ip);
    if (it == index_by_ip.end()) {
      index_by_ip.emplace(e.ip, out.size());
      out.push_back(e);
    } else {
      out[it->second] = e;
    }
  }
  return out;
}

std::vector<NeighborEntry> ParseIpNeigh(const std::string& output) {
  std::vector<NeighborEntry> entries;
  for (const auto& line : util::SplitLines(output)) {
    std::smatch m;
    if (!std::regex_search(line, m, IpNeighPattern())) {
      continue;
    }
    NeighborEntry entry;
    entry.ip = m[1].str();
    entry.iface = m[2].str();
    entry.mac = util::NormalizeMac(m[3].str());
    entry.state = m[4].matched ? ParseNeighborState(m[4].str()) : NeighborState::UNKNOWN;
    if (!util::IsValidIPv4(entry.ip) || !util::IsValidMac(entry.mac)) {
      LOG_DISC_WARN_RL("ip neigh: dropping malformed row '{}'", line);
      continue;
    }
    if (!entry.IsPresent()) {
      continue;
    }
    entries.push_back(std::move(entry));
  }
  return DedupeByIp(entries);
}

std::vector<NeighborEntry> ParseArpAn(const std::string& output) {
  std::vector<NeighborEntry> entries;
  for (const auto& line : util::SplitLines(output)) {
    std::smatch m;
    if (!std::regex_search(line, m, ArpAnPattern())) {
      continue;
    }
    const std::string raw_mac = m[2].str();
    if (raw_mac.find(':') == std::string::npos && raw_mac.find('.') == std::string::npos) {
      continue;
    }
    NeighborEntry entry;
    entry.ip = m[1].str();
    entry.mac = util::NormalizeMacOctets(raw_mac);
    if (m[3].matched) {
      entry.iface = m[3].str();
    }
    if (!util::IsValidIPv4(entry.ip) || !util::IsValidMac(entry.mac)) {
      LOG_DISC_WARN_RL("arp -an: dropping malformed row '{}'", line);
      continue;
    }
    entries.push_back(std::move(entry));
  }
  return DedupeByIp(entries);
}

std::vector<NeighborEntry> ParseWindowsArp(const std::string& output) {
  std::vector<NeighborEntry> entries;
  for (const auto& line : util::SplitLines(output)) {
    std::smatch m;
    if (!std::regex_search(line, m, WindowsArpPattern())) {
      continue;
    }
    NeighborEntry entry;
    entry.ip = m[1].str();
    entry.mac = util::NormalizeMac(m[2].str());
    entry.state = ParseNeighborState(m[3].str());
    if (!util::IsValidIPv4(entry.ip) || !util::IsValidMac(entry.mac)) {
      continue;
    }
    entries.push_back(std::move(entry));
  }
  return DedupeByIp(entries);
}

std::vector<NeighborEntry> ParseWindowsGetNetNeighbor(const std::string& json_output) {
  std::vector<NeighborEntry> entries;
  if (util::Trim(json_output).empty()) {
    return entries;
  }

  json doc = json::parse(json_output, nullptr, false);
  if (doc.is_discarded()) {
    LOG_DISC_WARN_RL("Get-NetNeighbor: output is not valid JSON");
    return entries;
  }
  if (doc.is_object()) {
    doc = json::array({doc});
  }
  if (!doc.is_array()) {
    return entries;
  }

  auto field = [](const json& row, const char* key) -> std::string {
    auto it = row.find(key);
    if (it == row.end() || !it->is_string()) {
      return "";
    }
    return util::Trim(it->get<std::string>());
  };

  for (const auto& row : doc) {
    if (!row.is_object()) {
      continue;
    }
    NeighborEntry entry;
    entry.ip = field(row, "IPAddress");
    const std::string raw_mac = field(row, "LinkLayerAddress");
    if (entry.ip.empty() || raw_mac.empty() || raw_mac == "00-00-00-00-00-00") {
      continue;
    }
    entry.mac = util::NormalizeMac(raw_mac);
    entry.state = ParseNeighborState(field(row, "State"));
    if (!util::IsValidIPv4(entry.ip)) {
      continue;
    }
    entries.push_back(std::move(entry));
  }
  return DedupeByIp(entries);
}

}  // namespace discovery
}  // namespace netdash
