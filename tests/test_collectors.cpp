#include <gtest/gtest.h>

#include "collectors/AlarmCollector.hpp"
#include "collectors/BgpCollector.hpp"
#include "collectors/EnvironmentCollector.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "collectors/InterfaceDiagnosticsCollector.hpp"
#include "collectors/IsisCollector.hpp"
#include "collectors/MetricSink.hpp"
#include "collectors/OspfCollector.hpp"
#include "collectors/RouteCollector.hpp"
#include "collectors/RoutingEngineCollector.hpp"
#include "core/Errors.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace junoskit::collectors {
namespace {

// Serves fixed records for every domain.
class FixtureDatasource : public InterfaceStatsDatasource,
                          public AlarmCounterDatasource,
                          public BgpSessionsDatasource,
                          public OspfAreasDatasource,
                          public IsisAdjacenciesDatasource,
                          public RoutingTablesDatasource,
                          public RouteEngineStatsDatasource,
                          public EnvironmentItemsDatasource,
                          public InterfaceDiagnosticsDatasource {
 public:
  std::vector<InterfaceStats> interfaces;
  AlarmCounter alarms;
  std::vector<BgpSession> sessions;
  std::vector<OspfArea> areas;
  IsisAdjacencies isis;
  std::vector<RoutingTable> tables;
  RouteEngineStats engine;
  std::vector<EnvironmentItem> environment;
  std::vector<InterfaceDiagnostics> optics;
  bool fail = false;

  std::vector<InterfaceStats> FetchInterfaceStats() override { return Get(interfaces); }
  AlarmCounter FetchAlarmCounter() override { return Get(alarms); }
  std::vector<BgpSession> FetchBgpSessions() override { return Get(sessions); }
  std::vector<OspfArea> FetchOspfAreas() override { return Get(areas); }
  IsisAdjacencies FetchIsisAdjacencies() override { return Get(isis); }
  std::vector<RoutingTable> FetchRoutingTables() override { return Get(tables); }
  RouteEngineStats FetchRouteEngineStats() override { return Get(engine); }
  std::vector<EnvironmentItem> FetchEnvironmentItems() override { return Get(environment); }
  std::vector<InterfaceDiagnostics> FetchInterfaceDiagnostics() override { return Get(optics); }

 private:
  template <typename T>
  T Get(const T& v) const {
    if (fail) throw TransportError("session closed");
    return v;
  }
};

const prometheus::MetricFamily* Family(const MetricSink& sink, const std::string& name) {
  for (const auto& f : sink.families()) {
    if (f.name == name) return &f;
  }
  return nullptr;
}

std::vector<std::string> LabelNames(const prometheus::ClientMetric& m) {
  std::vector<std::string> out;
  for (const auto& l : m.label) out.push_back(l.name);
  return out;
}

std::vector<std::string> LabelValues(const prometheus::ClientMetric& m) {
  std::vector<std::string> out;
  for (const auto& l : m.label) out.push_back(l.value);
  return out;
}

const std::vector<std::string> kTarget{"router1"};

InterfaceStats Physical(const std::string& name, bool admin, bool oper) {
  InterfaceStats s;
  s.is_physical = true;
  s.name = name;
  s.description = "core link";
  s.mac = "00:11:22:33:44:55";
  s.admin_status = admin;
  s.oper_status = oper;
  s.error_status = admin != oper;
  s.receive_bytes = 100;
  s.transmit_bytes = 200;
  s.receive_errors = 1;
  s.receive_drops = 2;
  s.transmit_errors = 3;
  s.transmit_drops = 4;
  return s;
}

TEST(MetricSinkTest, GroupsSamplesByDescriptor) {
  const Desc d{"junos_test", "help", {"target", "x"}};
  MetricSink sink;
  sink.Gauge(d, 1, {"r1", "a"});
  sink.Gauge(d, 2, {"r1", "b"});
  ASSERT_EQ(sink.families().size(), 1u);
  EXPECT_EQ(sink.families()[0].type, prometheus::MetricType::Gauge);
  EXPECT_EQ(sink.families()[0].help, "help");
  EXPECT_EQ(sink.size(), 2u);
  EXPECT_DOUBLE_EQ(sink.families()[0].metric[1].gauge.value, 2);
}

TEST(MetricSinkTest, RejectsLabelCountMismatch) {
  const Desc d{"junos_test", "help", {"target", "x"}};
  MetricSink sink;
  EXPECT_THROW(sink.Gauge(d, 1, {"r1"}), std::invalid_argument);
  EXPECT_EQ(sink.size(), 0u);
}

TEST(MetricSinkTest, MergeAppendsSeriesOfSameFamily) {
  const Desc d{"junos_test", "help", {"target"}};
  MetricSink a, b;
  a.Gauge(d, 1, {"r1"});
  b.Gauge(d, 2, {"r2"});
  b.Gauge(Desc{"junos_other", "", {"target"}}, 3, {"r2"});
  auto merged = a.Take();
  MergeFamilies(merged, b.Take());
  ASSERT_EQ(merged.size(), 2u);
  EXPECT_EQ(merged[0].metric.size(), 2u);
  EXPECT_EQ(merged[1].name, "junos_other");
  EXPECT_EQ(a.size(), 0u);
}

TEST(InterfaceCollectorTest, PhysicalEmitsAllSeriesLogicalOnlyBytes) {
  FixtureDatasource ds;
  ds.interfaces.push_back(Physical("ge-0/0/0", true, false));
  InterfaceStats logical;
  logical.name = "ge-0/0/0.0";
  logical.mac = "00:11:22:33:44:55";
  logical.receive_bytes = 10;
  logical.transmit_bytes = 20;
  ds.interfaces.push_back(logical);

  MetricSink sink;
  InterfaceCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 9u + 2u);

  const auto* rx = Family(sink, "junos_interface_receive_bytes");
  ASSERT_NE(rx, nullptr);
  ASSERT_EQ(rx->metric.size(), 2u);
  EXPECT_EQ(LabelNames(rx->metric[0]), (std::vector<std::string>{"target", "name", "description", "mac"}));
  EXPECT_EQ(LabelValues(rx->metric[0]),
            (std::vector<std::string>{"router1", "ge-0/0/0", "core link", "00:11:22:33:44:55"}));
  EXPECT_DOUBLE_EQ(rx->metric[1].gauge.value, 10);

  const auto* err = Family(sink, "junos_interface_error_status");
  ASSERT_NE(err, nullptr);
  ASSERT_EQ(err->metric.size(), 1u);
  EXPECT_DOUBLE_EQ(err->metric[0].gauge.value, 1);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_interface_admin_up")->metric[0].gauge.value, 1);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_interface_up")->metric[0].gauge.value, 0);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_interface_transmit_drops")->metric[0].gauge.value, 4);
}

TEST(InterfaceCollectorTest, DescribeListsNineDescriptors) {
  EXPECT_EQ(InterfaceCollector{}.Describe().size(), 9u);
}

TEST(AlarmCollectorTest, EmitsRedAndYellow) {
  FixtureDatasource ds;
  ds.alarms.red_count = 2;
  ds.alarms.yellow_count = 1;
  MetricSink sink;
  AlarmCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 2u);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_alarms_red_count")->metric[0].gauge.value, 2);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_alarms_yellow_count")->metric[0].gauge.value, 1);
  EXPECT_EQ(AlarmCollector{}.Describe().size(), 2u);
}

TEST(BgpCollectorTest, LabelsByAsnAndIp) {
  FixtureDatasource ds;
  BgpSession s;
  s.ip = "192.0.2.1";
  s.asn = "65001";
  s.up = true;
  s.accepted_prefixes = 100;
  s.active_prefixes = 98;
  ds.sessions.push_back(s);
  MetricSink sink;
  BgpCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 8u);
  const auto* up = Family(sink, "junos_bgp_session_up");
  ASSERT_NE(up, nullptr);
  EXPECT_EQ(LabelNames(up->metric[0]), (std::vector<std::string>{"target", "asn", "ip"}));
  EXPECT_EQ(LabelValues(up->metric[0]), (std::vector<std::string>{"router1", "65001", "192.0.2.1"}));
  EXPECT_DOUBLE_EQ(up->metric[0].gauge.value, 1);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_bgp_session_accepted_prefixes_count")->metric[0].gauge.value, 100);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_bgp_session_active_prefixes_count")->metric[0].gauge.value, 98);
}

TEST(OspfCollectorTest, OneSamplePerArea) {
  FixtureDatasource ds;
  ds.areas = {{"0.0.0.0", 3}, {"0.0.0.1", 0}};
  MetricSink sink;
  OspfCollector{}.Collect(ds, sink, kTarget);
  const auto* f = Family(sink, "junos_ospf3_neighbors_up");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->metric.size(), 2u);
  EXPECT_EQ(LabelValues(f->metric[1]), (std::vector<std::string>{"router1", "0.0.0.1"}));
  EXPECT_DOUBLE_EQ(f->metric[0].gauge.value, 3);
}

TEST(IsisCollectorTest, UpAndTotal) {
  FixtureDatasource ds;
  ds.isis = {2, 3};
  MetricSink sink;
  IsisCollector{}.Collect(ds, sink, kTarget);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_isis_up_count")->metric[0].gauge.value, 2);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_isis_total_count")->metric[0].gauge.value, 3);
}

TEST(RouteCollectorTest, TableAndProtocolSeries) {
  FixtureDatasource ds;
  RoutingTable t;
  t.name = "inet.0";
  t.max_routes = 210;
  t.total_routes = 205;
  t.active_routes = 155;
  t.protocols = {{"direct", 5, 5}, {"bgp", 200, 150}};
  ds.tables.push_back(t);
  MetricSink sink;
  RouteCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 3u + 4u);

  EXPECT_DOUBLE_EQ(Family(sink, "junos_route_max_count")->metric[0].gauge.value, 210);
  const auto* proto = Family(sink, "junos_route_protocol_routes_count");
  ASSERT_NE(proto, nullptr);
  ASSERT_EQ(proto->metric.size(), 2u);
  EXPECT_EQ(LabelNames(proto->metric[0]), (std::vector<std::string>{"target", "table", "protocol"}));
  EXPECT_EQ(LabelValues(proto->metric[0]), (std::vector<std::string>{"router1", "inet.0", "direct"}));
  EXPECT_EQ(LabelValues(proto->metric[1]), (std::vector<std::string>{"router1", "inet.0", "bgp"}));
  EXPECT_DOUBLE_EQ(Family(sink, "junos_route_protocol_active_routes_count")->metric[1].gauge.value, 150);
}

TEST(RoutingEngineCollectorTest, ElevenTargetOnlySeries) {
  FixtureDatasource ds;
  ds.engine.temperature = 37;
  ds.engine.load_average_fifteen = 0.25;
  MetricSink sink;
  RoutingEngineCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 11u);
  EXPECT_DOUBLE_EQ(Family(sink, "junos_route_engine_temp")->metric[0].gauge.value, 37);
  const auto* load = Family(sink, "junos_route_engine_load_average_fifteen");
  ASSERT_NE(load, nullptr);
  EXPECT_EQ(LabelNames(load->metric[0]), (std::vector<std::string>{"target"}));
  EXPECT_DOUBLE_EQ(load->metric[0].gauge.value, 0.25);
}

TEST(EnvironmentCollectorTest, OneSamplePerItem) {
  FixtureDatasource ds;
  ds.environment = {{"FPC 0 Intake", 33}, {"Routing Engine", 41}};
  MetricSink sink;
  EnvironmentCollector{}.Collect(ds, sink, kTarget);
  const auto* f = Family(sink, "junos_environment_item_temp");
  ASSERT_NE(f, nullptr);
  ASSERT_EQ(f->metric.size(), 2u);
  EXPECT_EQ(LabelValues(f->metric[0]), (std::vector<std::string>{"router1", "FPC 0 Intake"}));
  EXPECT_DOUBLE_EQ(f->metric[1].gauge.value, 41);
}

TEST(InterfaceDiagnosticsCollectorTest, EmitsOnlyPopulatedRxBranch) {
  FixtureDatasource ds;
  InterfaceDiagnostics sfp;
  sfp.name = "xe-0/0/0";
  sfp.module_voltage = 3.3;
  sfp.rx_signal_avg_optical_power = 0.41;
  sfp.rx_signal_avg_optical_power_dbm = -3.86;
  InterfaceDiagnostics qsfp;
  qsfp.name = "et-0/0/2";
  qsfp.laser_rx_optical_power = 0.8;
  qsfp.laser_rx_optical_power_dbm = -0.97;
  ds.optics = {sfp, qsfp};

  MetricSink sink;
  InterfaceDiagnosticsCollector{}.Collect(ds, sink, kTarget);
  EXPECT_EQ(sink.size(), 7u + 6u);
  const auto* voltage = Family(sink, "junos_interface_diagnostics_module_voltage");
  ASSERT_NE(voltage, nullptr);
  ASSERT_EQ(voltage->metric.size(), 1u);
  EXPECT_EQ(LabelValues(voltage->metric[0]), (std::vector<std::string>{"router1", "xe-0/0/0"}));
  const auto* rx = Family(sink, "junos_interface_diagnostics_laser_rx_optical_power_dbm");
  ASSERT_NE(rx, nullptr);
  ASSERT_EQ(rx->metric.size(), 1u);
  EXPECT_EQ(LabelValues(rx->metric[0]), (std::vector<std::string>{"router1", "et-0/0/2"}));
  EXPECT_DOUBLE_EQ(rx->metric[0].gauge.value, -0.97);
}

TEST(CollectorTest, DatasourceErrorPropagatesWithoutSamples) {
  FixtureDatasource ds;
  ds.fail = true;
  ds.interfaces.push_back(Physical("ge-0/0/0", true, true));
  MetricSink sink;
  EXPECT_THROW(InterfaceCollector{}.Collect(ds, sink, kTarget), TransportError);
  EXPECT_THROW(RoutingEngineCollector{}.Collect(ds, sink, kTarget), TransportError);
  EXPECT_EQ(sink.size(), 0u);
}

TEST(CollectorTest, RepeatedCollectYieldsSameSamples) {
  FixtureDatasource ds;
  ds.areas = {{"0.0.0.0", 3}};
  MetricSink first, second;
  OspfCollector c;
  c.Collect(ds, first, kTarget);
  c.Collect(ds, second, kTarget);
  ASSERT_EQ(first.size(), second.size());
  EXPECT_DOUBLE_EQ(first.families()[0].metric[0].gauge.value, second.families()[0].metric[0].gauge.value);
}

} // namespace
} // namespace junoskit::collectors
