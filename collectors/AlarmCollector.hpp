// Chassis and system alarm counts (junos_alarms_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class AlarmCollector {
 public:
  std::string Name() const { return "Alarm"; }
  std::vector<Desc> Describe() const;
  void Collect(AlarmCounterDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
