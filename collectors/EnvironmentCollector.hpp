// Chassis temperature sensors (junos_environment_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class EnvironmentCollector {
 public:
  std::string Name() const { return "Environment"; }
  std::vector<Desc> Describe() const;
  void Collect(EnvironmentItemsDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
