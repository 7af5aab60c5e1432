// Optical transceiver diagnostics (junos_interface_diagnostics_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class InterfaceDiagnosticsCollector {
 public:
  std::string Name() const { return "Interface Diagnostics"; }
  std::vector<Desc> Describe() const;
  void Collect(InterfaceDiagnosticsDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
