#include "RpcClient.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

namespace junoskit::rpc {

RpcClient::RpcClient(RemoteCommandChannel& channel, std::string target,
                     std::shared_ptr<const AlarmFilter> alarm_filter)
    : channel_(channel), target_(std::move(target)), alarm_filter_(std::move(alarm_filter)) {}

RpcClient::RpcClient(RemoteCommandChannel& channel, std::string target, const std::string& alarm_filter)
    : RpcClient(channel, std::move(target), AlarmFilter::Compile(alarm_filter)) {}

template <typename T>
T RpcClient::RunCommandAndParse(const std::string& cmd, const Schema<T>& schema) {
  spdlog::debug("Running command on {}: {}", target_, cmd);
  auto reply = channel_.RunCommand(target_, cmd + " | display xml");
  spdlog::debug("Output for {}: {}", target_, reply);
  try {
    return DecodeReply(reply, schema);
  } catch (const DecodeError& e) {
    throw DecodeError("'" + cmd + "' on " + target_ + ": " + e.what());
  }
}

AlarmCounter RpcClient::FetchAlarmCounter() {
  AlarmCounter counter;
  for (const char* cmd : {"show system alarms", "show chassis alarms"}) {
    auto a = RunCommandAndParse(cmd, AlarmSchema());
    for (const auto& d : a.details) {
      if (ShouldFilterAlarm(d)) continue;

      if (d.alarm_class == "Major") {
        counter.red_count++;
      } else if (d.alarm_class == "Minor") {
        counter.yellow_count++;
      }
    }
  }
  return counter;
}

bool RpcClient::ShouldFilterAlarm(const AlarmDetailEntry& alarm) const {
  if (!alarm_filter_) return false;
  return alarm_filter_->Matches(alarm.description) || alarm_filter_->Matches(alarm.type);
}

std::vector<InterfaceStats> RpcClient::FetchInterfaceStats() {
  auto x = RunCommandAndParse("show interfaces statistics detail", InterfaceSchema());

  std::vector<InterfaceStats> stats;
  for (const auto& phy : x.interfaces) {
    InterfaceStats s;
    s.is_physical = true;
    s.name = phy.name;
    s.description = phy.description;
    s.mac = phy.mac;
    s.admin_status = phy.admin_status == "up";
    s.oper_status = phy.oper_status == "up";
    s.error_status = phy.admin_status != phy.oper_status;
    s.receive_bytes = static_cast<double>(phy.input_bytes);
    s.receive_errors = static_cast<double>(phy.input_errors);
    s.receive_drops = static_cast<double>(phy.input_drops);
    s.transmit_bytes = static_cast<double>(phy.output_bytes);
    s.transmit_errors = static_cast<double>(phy.output_errors);
    s.transmit_drops = static_cast<double>(phy.output_drops);
    stats.push_back(std::move(s));

    for (const auto& log : phy.logical) {
      InterfaceStats sl;
      sl.is_physical = false;
      sl.name = log.name;
      sl.description = log.description;
      sl.mac = phy.mac;
      sl.receive_bytes = static_cast<double>(log.input_bytes);
      sl.transmit_bytes = static_cast<double>(log.output_bytes);
      stats.push_back(std::move(sl));
    }
  }
  return stats;
}

std::vector<BgpSession> RpcClient::FetchBgpSessions() {
  auto x = RunCommandAndParse("show bgp summary", BgpSchema());

  std::vector<BgpSession> sessions;
  sessions.reserve(x.peers.size());
  for (const auto& peer : x.peers) {
    BgpSession s;
    s.ip = peer.ip;
    s.up = peer.state == "Established";
    s.asn = peer.asn;
    s.flaps = static_cast<double>(peer.flaps);
    s.input_messages = static_cast<double>(peer.input_messages);
    s.output_messages = static_cast<double>(peer.output_messages);
    s.accepted_prefixes = static_cast<double>(peer.accepted_prefixes);
    s.active_prefixes = static_cast<double>(peer.active_prefixes);
    s.received_prefixes = static_cast<double>(peer.received_prefixes);
    s.rejected_prefixes = static_cast<double>(peer.suppressed_prefixes);
    sessions.push_back(std::move(s));
  }
  return sessions;
}

std::vector<OspfArea> RpcClient::FetchOspfAreas() {
  auto x = RunCommandAndParse("show ospf3 overview", Ospf3Schema());

  std::vector<OspfArea> areas;
  areas.reserve(x.areas.size());
  for (const auto& area : x.areas) {
    areas.push_back(OspfArea{area.name, static_cast<double>(area.neighbors_up)});
  }
  return areas;
}

IsisAdjacencies RpcClient::FetchIsisAdjacencies() {
  auto x = RunCommandAndParse("show isis adjacency", IsisSchema());

  IsisAdjacencies adj;
  for (const auto& a : x.adjacencies) {
    if (a.state == "Up") adj.up++;
    adj.total++;
  }
  return adj;
}

std::vector<RoutingTable> RpcClient::FetchRoutingTables() {
  auto x = RunCommandAndParse("show route summary", RouteSchema());

  std::vector<RoutingTable> tables;
  tables.reserve(x.tables.size());
  for (const auto& table : x.tables) {
    RoutingTable t;
    t.name = table.name;
    t.max_routes = static_cast<double>(table.destinations);
    t.active_routes = static_cast<double>(table.active_routes);
    t.total_routes = static_cast<double>(table.total_routes);
    t.protocols.reserve(table.protocols.size());
    for (const auto& proto : table.protocols) {
      t.protocols.push_back(ProtocolRouteCount{proto.name, static_cast<double>(proto.routes),
                                               static_cast<double>(proto.active_routes)});
    }
    tables.push_back(std::move(t));
  }
  return tables;
}

RouteEngineStats RpcClient::FetchRouteEngineStats() {
  auto x = RunCommandAndParse("show chassis routing-engine", RoutingEngineSchema());

  RouteEngineStats r;
  r.temperature = static_cast<double>(x.temperature);
  r.cpu_temperature = static_cast<double>(x.cpu_temperature);
  r.memory_utilization = static_cast<double>(x.memory_utilization);
  r.cpu_user = static_cast<double>(x.cpu_user);
  r.cpu_background = static_cast<double>(x.cpu_background);
  r.cpu_system = static_cast<double>(x.cpu_system);
  r.cpu_interrupt = static_cast<double>(x.cpu_interrupt);
  r.cpu_idle = static_cast<double>(x.cpu_idle);
  r.load_average_one = x.load_average_one;
  r.load_average_five = x.load_average_five;
  r.load_average_fifteen = x.load_average_fifteen;
  return r;
}

std::vector<EnvironmentItem> RpcClient::FetchEnvironmentItems() {
  auto x = RunCommandAndParse("show chassis environment", EnvironmentSchema());

  // the chassis reports some sensors more than once; keep the last reading per name
  std::map<std::string, double> temps;
  for (const auto& item : x.items) {
    if (item.temperature) temps[item.name] = *item.temperature;
  }

  std::vector<EnvironmentItem> items;
  items.reserve(temps.size());
  for (const auto& [name, value] : temps) items.push_back(EnvironmentItem{name, value});
  return items;
}

std::vector<InterfaceDiagnostics> RpcClient::FetchInterfaceDiagnostics() {
  auto x = RunCommandAndParse("show interfaces diagnostics optics", OpticsSchema());

  std::vector<InterfaceDiagnostics> diagnostics;
  for (const auto& diag : x.interfaces) {
    if (diag.not_available == "N/A") continue;

    InterfaceDiagnostics d;
    d.name = diag.name;
    d.laser_bias_current = diag.laser_bias_current;
    d.laser_output_power = diag.laser_output_power;
    d.module_temperature = diag.module_temperature;
    // dBm readings such as "- Inf" are not numbers; they stay 0
    d.laser_output_power_dbm = ParseDecimal(diag.laser_output_power_dbm).value_or(0.0);

    if (diag.module_voltage > 0) {
      d.module_voltage = diag.module_voltage;
      d.rx_signal_avg_optical_power = diag.rx_signal_avg_optical_power;
      d.rx_signal_avg_optical_power_dbm = ParseDecimal(diag.rx_signal_avg_optical_power_dbm).value_or(0.0);
    } else {
      d.laser_rx_optical_power = diag.laser_rx_optical_power;
      d.laser_rx_optical_power_dbm = ParseDecimal(diag.laser_rx_optical_power_dbm).value_or(0.0);
    }

    diagnostics.push_back(std::move(d));
  }
  return diagnostics;
}

} // namespace junoskit::rpc
