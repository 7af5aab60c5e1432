// Typed envelopes mirroring the Junos XML replies, one per domain.
// Decoding only; turning envelopes into records is RpcClient's job.
#pragma once

#include "Schema.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace junoskit::rpc {

// show system alarms / show chassis alarms
struct AlarmDetailEntry {
  std::string alarm_class;
  std::string description;
  std::string type;
};
struct AlarmReply {
  std::vector<AlarmDetailEntry> details;
};

// show interfaces statistics detail
struct LogicalInterfaceEntry {
  std::string name;
  std::string description;
  std::int64_t input_bytes = 0;
  std::int64_t output_bytes = 0;
};
struct PhysicalInterfaceEntry {
  std::string name;
  std::string admin_status;
  std::string oper_status;
  std::string description;
  std::string mac;
  std::int64_t input_bytes = 0;
  std::int64_t output_bytes = 0;
  std::int64_t input_errors = 0;
  std::int64_t input_drops = 0;
  std::int64_t output_errors = 0;
  std::int64_t output_drops = 0;
  std::vector<LogicalInterfaceEntry> logical;
};
struct InterfaceReply {
  std::vector<PhysicalInterfaceEntry> interfaces;
};

// show bgp summary
struct BgpPeerEntry {
  std::string ip;
  std::string state;
  std::string asn;
  std::int64_t flaps = 0;
  std::int64_t input_messages = 0;
  std::int64_t output_messages = 0;
  // last <bgp-rib> of the peer wins, leaf by leaf
  std::int64_t accepted_prefixes = 0;
  std::int64_t active_prefixes = 0;
  std::int64_t received_prefixes = 0;
  std::int64_t suppressed_prefixes = 0;
};
struct BgpReply {
  std::vector<BgpPeerEntry> peers;
};

// show ospf3 overview
struct OspfAreaEntry {
  std::string name;
  std::int64_t neighbors_up = 0;
};
struct Ospf3Reply {
  std::vector<OspfAreaEntry> areas;
};

// show isis adjacency
struct IsisAdjacencyEntry {
  std::string interface_name;
  std::string system_name;
  std::string state;
};
struct IsisReply {
  std::vector<IsisAdjacencyEntry> adjacencies;
};

// show route summary
struct RouteProtocolEntry {
  std::string name;
  std::int64_t routes = 0;
  std::int64_t active_routes = 0;
};
struct RouteTableEntry {
  std::string name;
  std::int64_t destinations = 0;
  std::int64_t active_routes = 0;
  std::int64_t total_routes = 0;
  std::vector<RouteProtocolEntry> protocols;
};
struct RouteReply {
  std::vector<RouteTableEntry> tables;
};

// show chassis routing-engine (later engines overwrite earlier ones)
struct RoutingEngineReply {
  std::int64_t temperature = 0;
  std::int64_t cpu_temperature = 0;
  std::int64_t memory_utilization = 0;
  std::int64_t cpu_user = 0;
  std::int64_t cpu_background = 0;
  std::int64_t cpu_system = 0;
  std::int64_t cpu_interrupt = 0;
  std::int64_t cpu_idle = 0;
  double load_average_one = 0;
  double load_average_five = 0;
  double load_average_fifteen = 0;
};

// show chassis environment
struct EnvironmentItemEntry {
  std::string name;
  std::optional<double> temperature; // absent for non-thermal items
};
struct EnvironmentReply {
  std::vector<EnvironmentItemEntry> items;
};

// show interfaces diagnostics optics
struct OpticsDiagnosticsEntry {
  std::string name;
  std::string not_available; // "N/A" when no optics are present
  double laser_bias_current = 0;
  double laser_output_power = 0;
  std::string laser_output_power_dbm;
  double module_temperature = 0;
  double module_voltage = 0;
  double rx_signal_avg_optical_power = 0;
  std::string rx_signal_avg_optical_power_dbm;
  double laser_rx_optical_power = 0;
  std::string laser_rx_optical_power_dbm;
};
struct OpticsReply {
  std::vector<OpticsDiagnosticsEntry> interfaces;
};

const Schema<AlarmReply>& AlarmSchema();
const Schema<InterfaceReply>& InterfaceSchema();
const Schema<BgpReply>& BgpSchema();
const Schema<Ospf3Reply>& Ospf3Schema();
const Schema<IsisReply>& IsisSchema();
const Schema<RouteReply>& RouteSchema();
const Schema<RoutingEngineReply>& RoutingEngineSchema();
const Schema<EnvironmentReply>& EnvironmentSchema();
const Schema<OpticsReply>& OpticsSchema();

} // namespace junoskit::rpc
