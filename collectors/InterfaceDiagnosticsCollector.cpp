#include "InterfaceDiagnosticsCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::string kPrefix = "junos_interface_diagnostics_";

Desc MakeDesc(const std::string& name, const std::string& help) {
  return Desc{kPrefix + name, help, {"target", "name"}};
}

const Desc laserBiasCurrentDesc           = MakeDesc("laser_bias_current", "Laser bias current");
const Desc laserOutputPowerDesc           = MakeDesc("laser_output_power", "Laser output power");
const Desc laserOutputPowerDbmDesc        = MakeDesc("laser_output_power_dbm", "Laser output power in dBm");
const Desc moduleTemperatureDesc          = MakeDesc("module_temperature", "Module temperature");
const Desc moduleVoltageDesc              = MakeDesc("module_voltage", "Module voltage");
const Desc rxSignalAvgOpticalPowerDesc    = MakeDesc("rx_signal_avg_optical_power", "Receiver signal average optical power");
const Desc rxSignalAvgOpticalPowerDbmDesc = MakeDesc("rx_signal_avg_optical_power_dbm", "Receiver signal average optical power in dBm");
const Desc laserRxOpticalPowerDesc        = MakeDesc("laser_rx_optical_power", "Laser rx power");
const Desc laserRxOpticalPowerDbmDesc     = MakeDesc("laser_rx_optical_power_dbm", "Laser rx power in dBm");

} // namespace

std::vector<Desc> InterfaceDiagnosticsCollector::Describe() const {
  return {laserBiasCurrentDesc, laserOutputPowerDesc, laserOutputPowerDbmDesc,
          moduleTemperatureDesc, moduleVoltageDesc,
          rxSignalAvgOpticalPowerDesc, rxSignalAvgOpticalPowerDbmDesc,
          laserRxOpticalPowerDesc, laserRxOpticalPowerDbmDesc};
}

void InterfaceDiagnosticsCollector::Collect(InterfaceDiagnosticsDatasource& datasource, MetricSink& sink,
                                            const std::vector<std::string>& label_values) const {
  auto diagnostics = datasource.FetchInterfaceDiagnostics();
  for (const auto& d : diagnostics) {
    const auto l = WithLabels(label_values, {d.name});
    sink.Gauge(laserBiasCurrentDesc, d.laser_bias_current, l);
    sink.Gauge(laserOutputPowerDesc, d.laser_output_power, l);
    sink.Gauge(laserOutputPowerDbmDesc, d.laser_output_power_dbm, l);
    sink.Gauge(moduleTemperatureDesc, d.module_temperature, l);

    // same branch the rpc client populated
    if (d.module_voltage > 0) {
      sink.Gauge(moduleVoltageDesc, d.module_voltage, l);
      sink.Gauge(rxSignalAvgOpticalPowerDesc, d.rx_signal_avg_optical_power, l);
      sink.Gauge(rxSignalAvgOpticalPowerDbmDesc, d.rx_signal_avg_optical_power_dbm, l);
    } else {
      sink.Gauge(laserRxOpticalPowerDesc, d.laser_rx_optical_power, l);
      sink.Gauge(laserRxOpticalPowerDbmDesc, d.laser_rx_optical_power_dbm, l);
    }
  }
}

} // namespace junoskit::collectors
