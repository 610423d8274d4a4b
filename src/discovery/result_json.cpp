// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/result_json.hpp"

#include <string>

namespace netdash {
namespace discovery {

using json = nlohmann::json;

namespace {

json OptionalString(const std::optional<std::string>& value) {
  return value ? json(*value) : json(nullptr);
}

json GroupList(const std::vector<DeviceGroup>& groups) {
  json list = json::array();
  for (const auto& group : groups) {
    list.push_back(ToJson(group));
  }
  return list;
}

}  // namespace

json ToJson(const DeviceInterface& iface) {
  json ports = json::object();
  for (const auto& [port, open] : iface.ports) {
    ports[std::to_string(port)] = open;
  }
  return json{{"ip", iface.ip},
              {"mac", OptionalString(iface.mac)},
              {"ping", iface.ping},
              {"ports", std::move(ports)},
              {"up", iface.up},
              {"missing", iface.missing},
              {"type", InterfaceKindName(iface.kind)},
              {"original_name", iface.original_name},
              {"conn_type", ConnectionTypeName(iface.conn_type)},
              {"iface", OptionalString(iface.iface)}};
}

json ToJson(const DeviceGroup& group) {
  json interfaces = json::array();
  for (const auto& iface : group.interfaces) {
    interfaces.push_back(ToJson(iface));
  }
  return json{{"name", group.name},
              {"mac", OptionalString(group.mac)},
              {"known", group.known},
              {"notes", group.notes},
              {"interfaces", std::move(interfaces)},
              {"up", group.up},
              {"missing", group.missing},
              {"is_host", group.is_host},
              {"has_overlay", group.has_overlay}};
}

json ToJson(const DiscoveryMeta& meta) {
  json out{{"neighbor_source", meta.neighbor_source},
           {"sweep_size", meta.sweep_size},
           {"ping_hits", meta.ping_hits},
           {"port_only_hits", meta.port_only_hits},
           {"transparent_proxy_detected", meta.transparent_proxy_detected},
           {"duration_ms", meta.duration_ms},
           {"completed_at", meta.completed_at},
           {"gateway_ip", OptionalString(meta.gateway_ip)},
           {"gateway_mac", OptionalString(meta.gateway_mac)},
           {"gateway_outside_sweep", meta.gateway_outside_sweep},
           {"sweep_network", OptionalString(meta.sweep_network)},
           {"host_ips", meta.host_ips}};
  if (meta.subnet_mismatches.empty()) {
    out["subnet_mismatches"] = nullptr;
  } else {
    out["subnet_mismatches"] = meta.subnet_mismatches;
  }
  return out;
}

json ToJson(const DiscoveryResult& result) {
  return json{{"networks", result.networks},
              {"neighbors_count", result.neighbors_count},
              {"mode", result.mode},
              {"known_devices", GroupList(result.known_devices)},
              {"discovered_devices", GroupList(result.discovered_devices)},
              {"meta", ToJson(result.meta)}};
}

}  // namespace discovery
}  // namespace netdash
