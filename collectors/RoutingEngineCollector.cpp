#include "RoutingEngineCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::string kPrefix = "junos_route_engine_";

Desc MakeDesc(const std::string& name, const std::string& help) {
  return Desc{kPrefix + name, help, {"target"}};
}

const Desc temperature       = MakeDesc("temp", "Temperature of the air flowing past the Routing Engine");
const Desc memoryUtilization = MakeDesc("memory_utilization", "Percentage of Routing Engine memory being used");
const Desc cpuTemperature    = MakeDesc("cpu_temp", "Temperature of the CPU");
const Desc cpuUser           = MakeDesc("cpu_user_percent", "Percentage of CPU time being used by user processes");
const Desc cpuBackground     = MakeDesc("cpu_background_percent", "Percentage of CPU time being used by background processes");
const Desc cpuSystem         = MakeDesc("cpu_system_percent", "Percentage of CPU time being used by kernel processes");
const Desc cpuInterrupt      = MakeDesc("cpu_interrupt_percent", "Percentage of CPU time being used by interrupts");
const Desc cpuIdle           = MakeDesc("cpu_idle_percent", "Percentage of CPU time that is idle");
const Desc loadAverageOne     = MakeDesc("load_average_one", "Routing Engine load average over the last 1 minute");
const Desc loadAverageFive    = MakeDesc("load_average_five", "Routing Engine load average over the last 5 minutes");
const Desc loadAverageFifteen = MakeDesc("load_average_fifteen", "Routing Engine load average over the last 15 minutes");

} // namespace

std::vector<Desc> RoutingEngineCollector::Describe() const {
  return {temperature, memoryUtilization, cpuTemperature, cpuUser, cpuBackground, cpuSystem,
          cpuInterrupt, cpuIdle, loadAverageOne, loadAverageFive, loadAverageFifteen};
}

void RoutingEngineCollector::Collect(RouteEngineStatsDatasource& datasource, MetricSink& sink,
                                     const std::vector<std::string>& label_values) const {
  auto r = datasource.FetchRouteEngineStats();
  sink.Gauge(temperature, r.temperature, label_values);
  sink.Gauge(memoryUtilization, r.memory_utilization, label_values);
  sink.Gauge(cpuTemperature, r.cpu_temperature, label_values);
  sink.Gauge(cpuUser, r.cpu_user, label_values);
  sink.Gauge(cpuBackground, r.cpu_background, label_values);
  sink.Gauge(cpuSystem, r.cpu_system, label_values);
  sink.Gauge(cpuInterrupt, r.cpu_interrupt, label_values);
  sink.Gauge(cpuIdle, r.cpu_idle, label_values);
  sink.Gauge(loadAverageOne, r.load_average_one, label_values);
  sink.Gauge(loadAverageFive, r.load_average_five, label_values);
  sink.Gauge(loadAverageFifteen, r.load_average_fifteen, label_values);
}

} // namespace junoskit::collectors
