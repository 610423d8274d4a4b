// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Neighbor table output parsers

 One parser per tool output format. All of them:
 - drop rows that do not match the expected shape (no exceptions)
 - normalize MACs to lowercase colon-hex
 - de-duplicate by IP; the last row for an IP wins, but the IP keeps the
   position where it was first seen
*/

#include "discovery/types.hpp"

#include <string>
#include <vector>

namespace netdash {
namespace discovery {

// Linux `ip neigh`:
//   192.168.1.1 dev eth0 lladdr aa:bb:cc:dd:ee:ff REACHABLE
// Rows without lladdr, and FAILED/INCOMPLETE rows, are dropped.
std::vector<NeighborEntry> ParseIpNeigh(const std::string& output);

// BSD/macOS/Linux `arp -an`:
//   ? (192.168.1.1) at 0:1b:2:aa:bb:cc on en0 ifscope [ethernet]
// "(incomplete)" rows are skipped. Octets are zero-padded and Cisco dotted
// MACs are expanded. State is UNKNOWN.
std::vector<NeighborEntry> ParseArpAn(const std::string& output);

// Windows `arp -a`:
//   192.168.1.1           aa-bb-cc-dd-ee-ff     dynamic
std::vector<NeighborEntry> ParseWindowsArp(const std::string& output);

// PowerShell `Get-NetNeighbor | Select-Object IPAddress,LinkLayerAddress,State
// | ConvertTo-Json`. Accepts a single object or an array. The all-zero MAC
// (unresolved placeholder) is skipped.
std::vector<NeighborEntry> ParseWindowsGetNetNeighbor(const std::string& json_output);

// Keep the last entry per IP, ordered by first appearance.
std::vector<NeighborEntry> DedupeByIp(const std::vector<NeighborEntry>& entries);

}  // namespace discovery
}  // namespace netdash
