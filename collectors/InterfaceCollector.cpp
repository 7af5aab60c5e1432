#include "InterfaceCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::string kPrefix = "junos_interface_";

Desc MakeDesc(const std::string& name, const std::string& help) {
  return Desc{kPrefix + name, help, {"target", "name", "description", "mac"}};
}

const Desc receiveBytesDesc   = MakeDesc("receive_bytes", "Received data in bytes");
const Desc receiveErrorsDesc  = MakeDesc("receive_errors", "Number of errors caused by incoming packets");
const Desc receiveDropsDesc   = MakeDesc("receive_drops", "Number of dropped incoming packets");
const Desc transmitBytesDesc  = MakeDesc("transmit_bytes", "Transmitted data in bytes");
const Desc transmitErrorsDesc = MakeDesc("transmit_errors", "Number of errors caused by outgoing packets");
const Desc transmitDropsDesc  = MakeDesc("transmit_drops", "Number of dropped outgoing packets");
const Desc adminStatusDesc    = MakeDesc("admin_up", "Admin operational status");
const Desc operStatusDesc     = MakeDesc("up", "Interface operational status");
const Desc errorStatusDesc    = MakeDesc("error_status", "Admin and operational status differ");

} // namespace

std::vector<Desc> InterfaceCollector::Describe() const {
  return {receiveBytesDesc, receiveErrorsDesc, receiveDropsDesc,
          transmitBytesDesc, transmitDropsDesc, transmitErrorsDesc,
          adminStatusDesc, operStatusDesc, errorStatusDesc};
}

void InterfaceCollector::Collect(InterfaceStatsDatasource& datasource, MetricSink& sink,
                                 const std::vector<std::string>& label_values) const {
  auto stats = datasource.FetchInterfaceStats();
  for (const auto& s : stats) CollectForInterface(s, sink, label_values);
}

void InterfaceCollector::CollectForInterface(const InterfaceStats& s, MetricSink& sink,
                                             const std::vector<std::string>& label_values) const {
  const auto l = WithLabels(label_values, {s.name, s.description, s.mac});
  sink.Gauge(receiveBytesDesc, s.receive_bytes, l);
  sink.Gauge(transmitBytesDesc, s.transmit_bytes, l);

  if (!s.is_physical) return;

  sink.Gauge(adminStatusDesc, s.admin_status ? 1 : 0, l);
  sink.Gauge(operStatusDesc, s.oper_status ? 1 : 0, l);
  sink.Gauge(errorStatusDesc, s.error_status ? 1 : 0, l);
  sink.Gauge(transmitErrorsDesc, s.transmit_errors, l);
  sink.Gauge(transmitDropsDesc, s.transmit_drops, l);
  sink.Gauge(receiveErrorsDesc, s.receive_errors, l);
  sink.Gauge(receiveDropsDesc, s.receive_drops, l);
}

} // namespace junoskit::collectors
