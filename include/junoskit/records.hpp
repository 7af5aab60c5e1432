// Normalized domain records produced by the rpc client on every scrape.
#pragma once

#include <string>
#include <vector>

namespace junoskit {

struct InterfaceStats {
  std::string name;
  std::string description;
  std::string mac;
  bool is_physical = false;
  // status and error counters are only meaningful when is_physical
  bool admin_status = false;
  bool oper_status = false;
  bool error_status = false;
  double receive_bytes = 0;
  double receive_errors = 0;
  double receive_drops = 0;
  double transmit_bytes = 0;
  double transmit_errors = 0;
  double transmit_drops = 0;
};

struct AlarmCounter {
  double red_count = 0;    // class Major
  double yellow_count = 0; // class Minor
};

struct BgpSession {
  std::string ip;
  bool up = false;
  std::string asn;
  double flaps = 0;
  double input_messages = 0;
  double output_messages = 0;
  double accepted_prefixes = 0;
  double active_prefixes = 0;
  double received_prefixes = 0;
  double rejected_prefixes = 0;
};

struct OspfArea {
  std::string name;
  double neighbors = 0;
};

struct IsisAdjacencies {
  double up = 0;
  double total = 0;
};

struct ProtocolRouteCount {
  std::string name;
  double routes = 0;
  double active_routes = 0;
};

struct RoutingTable {
  std::string name;
  double max_routes = 0;
  double active_routes = 0;
  double total_routes = 0;
  std::vector<ProtocolRouteCount> protocols; // reply order
};

struct RouteEngineStats {
  double temperature = 0;
  double cpu_temperature = 0;
  double memory_utilization = 0;
  double cpu_user = 0;
  double cpu_background = 0;
  double cpu_system = 0;
  double cpu_interrupt = 0;
  double cpu_idle = 0;
  double load_average_one = 0;
  double load_average_five = 0;
  double load_average_fifteen = 0;
};

struct EnvironmentItem {
  std::string name;
  double temperature = 0;
};

// Exactly one of the rx branches is populated, chosen by module_voltage > 0:
// module_voltage + rx_signal_avg_optical_power(_dbm), or laser_rx_optical_power(_dbm).
struct InterfaceDiagnostics {
  std::string name;
  double laser_bias_current = 0;
  double laser_output_power = 0;
  double laser_output_power_dbm = 0;
  double module_temperature = 0;
  double module_voltage = 0;
  double rx_signal_avg_optical_power = 0;
  double rx_signal_avg_optical_power_dbm = 0;
  double laser_rx_optical_power = 0;
  double laser_rx_optical_power_dbm = 0;
};

} // namespace junoskit
