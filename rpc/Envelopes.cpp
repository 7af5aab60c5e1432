#include "Envelopes.hpp"

namespace junoskit::rpc {

const Schema<AlarmReply>& AlarmSchema() {
  static const Schema<AlarmReply> s = [] {
    Schema<AlarmDetailEntry> detail;
    detail.Text("alarm-class", &AlarmDetailEntry::alarm_class)
          .Text("alarm-description", &AlarmDetailEntry::description)
          .Text("alarm-type", &AlarmDetailEntry::type);
    Schema<AlarmReply> reply;
    reply.List("alarm-information/alarm-detail", &AlarmReply::details, detail);
    return reply;
  }();
  return s;
}

const Schema<InterfaceReply>& InterfaceSchema() {
  static const Schema<InterfaceReply> s = [] {
    Schema<LogicalInterfaceEntry> logical;
    logical.Text("name", &LogicalInterfaceEntry::name)
           .Text("description", &LogicalInterfaceEntry::description)
           .Int("traffic-statistics/input-bytes", &LogicalInterfaceEntry::input_bytes)
           .Int("traffic-statistics/output-bytes", &LogicalInterfaceEntry::output_bytes);
    Schema<PhysicalInterfaceEntry> phy;
    phy.Text("name", &PhysicalInterfaceEntry::name)
       .Text("admin-status", &PhysicalInterfaceEntry::admin_status)
       .Text("oper-status", &PhysicalInterfaceEntry::oper_status)
       .Text("description", &PhysicalInterfaceEntry::description)
       .Text("current-physical-address", &PhysicalInterfaceEntry::mac)
       .Int("traffic-statistics/input-bytes", &PhysicalInterfaceEntry::input_bytes)
       .Int("traffic-statistics/output-bytes", &PhysicalInterfaceEntry::output_bytes)
       .Int("input-error-list/input-errors", &PhysicalInterfaceEntry::input_errors)
       .Int("input-error-list/input-drops", &PhysicalInterfaceEntry::input_drops)
       .Int("output-error-list/output-errors", &PhysicalInterfaceEntry::output_errors)
       .Int("output-error-list/output-drops", &PhysicalInterfaceEntry::output_drops)
       .List("logical-interface", &PhysicalInterfaceEntry::logical, logical);
    Schema<InterfaceReply> reply;
    reply.List("interface-information/physical-interface", &InterfaceReply::interfaces, phy);
    return reply;
  }();
  return s;
}

const Schema<BgpReply>& BgpSchema() {
  static const Schema<BgpReply> s = [] {
    Schema<BgpPeerEntry> peer;
    peer.Text("peer-address", &BgpPeerEntry::ip)
        .Text("peer-state", &BgpPeerEntry::state)
        .Text("peer-as", &BgpPeerEntry::asn)
        .Int("flap-count", &BgpPeerEntry::flaps)
        .Int("input-messages", &BgpPeerEntry::input_messages)
        .Int("output-messages", &BgpPeerEntry::output_messages)
        .Int("bgp-rib/accepted-prefix-count", &BgpPeerEntry::accepted_prefixes)
        .Int("bgp-rib/active-prefix-count", &BgpPeerEntry::active_prefixes)
        .Int("bgp-rib/received-prefix-count", &BgpPeerEntry::received_prefixes)
        .Int("bgp-rib/suppressed-prefix-count", &BgpPeerEntry::suppressed_prefixes);
    Schema<BgpReply> reply;
    reply.List("bgp-information/bgp-peer", &BgpReply::peers, peer);
    return reply;
  }();
  return s;
}

const Schema<Ospf3Reply>& Ospf3Schema() {
  static const Schema<Ospf3Reply> s = [] {
    Schema<OspfAreaEntry> area;
    area.Text("ospf-area", &OspfAreaEntry::name)
        .Int("ospf-nbr-overview/ospf-nbr-up-count", &OspfAreaEntry::neighbors_up);
    Schema<Ospf3Reply> reply;
    reply.List("ospf3-overview-information/ospf-overview/ospf-area-overview", &Ospf3Reply::areas, area);
    return reply;
  }();
  return s;
}

const Schema<IsisReply>& IsisSchema() {
  static const Schema<IsisReply> s = [] {
    Schema<IsisAdjacencyEntry> adj;
    adj.Text("interface-name", &IsisAdjacencyEntry::interface_name)
       .Text("system-name", &IsisAdjacencyEntry::system_name)
       .Text("adjacency-state", &IsisAdjacencyEntry::state);
    Schema<IsisReply> reply;
    reply.List("isis-adjacency-information/isis-adjacency", &IsisReply::adjacencies, adj);
    return reply;
  }();
  return s;
}

const Schema<RouteReply>& RouteSchema() {
  static const Schema<RouteReply> s = [] {
    Schema<RouteProtocolEntry> proto;
    proto.Text("protocol-name", &RouteProtocolEntry::name)
         .Int("protocol-route-count", &RouteProtocolEntry::routes)
         .Int("active-route-count", &RouteProtocolEntry::active_routes);
    Schema<RouteTableEntry> table;
    table.Text("table-name", &RouteTableEntry::name)
         .Int("destination-count", &RouteTableEntry::destinations)
         .Int("active-route-count", &RouteTableEntry::active_routes)
         .Int("total-route-count", &RouteTableEntry::total_routes)
         .List("protocols", &RouteTableEntry::protocols, proto);
    Schema<RouteReply> reply;
    reply.List("route-summary-information/route-table", &RouteReply::tables, table);
    return reply;
  }();
  return s;
}

const Schema<RoutingEngineReply>& RoutingEngineSchema() {
  static const Schema<RoutingEngineReply> s = [] {
    const std::string re = "route-engine-information/route-engine/";
    Schema<RoutingEngineReply> reply;
    reply.Int(re + "temperature/@celsius", &RoutingEngineReply::temperature)
         .Int(re + "cpu-temperature/@celsius", &RoutingEngineReply::cpu_temperature)
         .Int(re + "memory-buffer-utilization", &RoutingEngineReply::memory_utilization)
         .Int(re + "cpu-user", &RoutingEngineReply::cpu_user)
         .Int(re + "cpu-background", &RoutingEngineReply::cpu_background)
         .Int(re + "cpu-system", &RoutingEngineReply::cpu_system)
         .Int(re + "cpu-interrupt", &RoutingEngineReply::cpu_interrupt)
         .Int(re + "cpu-idle", &RoutingEngineReply::cpu_idle)
         .Real(re + "load-average-one", &RoutingEngineReply::load_average_one)
         .Real(re + "load-average-five", &RoutingEngineReply::load_average_five)
         .Real(re + "load-average-fifteen", &RoutingEngineReply::load_average_fifteen);
    return reply;
  }();
  return s;
}

const Schema<EnvironmentReply>& EnvironmentSchema() {
  static const Schema<EnvironmentReply> s = [] {
    Schema<EnvironmentItemEntry> item;
    item.Text("name", &EnvironmentItemEntry::name)
        .OptionalReal("temperature/@celsius", &EnvironmentItemEntry::temperature);
    Schema<EnvironmentReply> reply;
    reply.List("environment-information/environment-item", &EnvironmentReply::items, item);
    return reply;
  }();
  return s;
}

const Schema<OpticsReply>& OpticsSchema() {
  static const Schema<OpticsReply> s = [] {
    const std::string d = "optics-diagnostics/";
    Schema<OpticsDiagnosticsEntry> phy;
    phy.Text("name", &OpticsDiagnosticsEntry::name)
       .Text(d + "optic-diagnostics-not-available", &OpticsDiagnosticsEntry::not_available)
       .Real(d + "laser-bias-current", &OpticsDiagnosticsEntry::laser_bias_current)
       .Real(d + "laser-output-power", &OpticsDiagnosticsEntry::laser_output_power)
       .Text(d + "laser-output-power-dbm", &OpticsDiagnosticsEntry::laser_output_power_dbm)
       .Real(d + "module-temperature/@celsius", &OpticsDiagnosticsEntry::module_temperature)
       .Real(d + "module-voltage", &OpticsDiagnosticsEntry::module_voltage)
       .Real(d + "rx-signal-avg-optical-power", &OpticsDiagnosticsEntry::rx_signal_avg_optical_power)
       .Text(d + "rx-signal-avg-optical-power-dbm", &OpticsDiagnosticsEntry::rx_signal_avg_optical_power_dbm)
       .Real(d + "laser-rx-optical-power", &OpticsDiagnosticsEntry::laser_rx_optical_power)
       .Text(d + "laser-rx-optical-power-dbm", &OpticsDiagnosticsEntry::laser_rx_optical_power_dbm);
    Schema<OpticsReply> reply;
    reply.List("interface-information/physical-interface", &OpticsReply::interfaces, phy);
    return reply;
  }();
  return s;
}

} // namespace junoskit::rpc
