// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/types.hpp"

#include <nlohmann/json.hpp>

namespace netdash {
namespace discovery {

// Dashboard payload rendering. Absent optionals become null; port maps are
// keyed by the decimal port number.
nlohmann::json ToJson(const DeviceInterface& iface);
nlohmann::json ToJson(const DeviceGroup& group);
nlohmann::json ToJson(const DiscoveryMeta& meta);
nlohmann::json ToJson(const DiscoveryResult& result);

}  // namespace discovery
}  // namespace netdash
