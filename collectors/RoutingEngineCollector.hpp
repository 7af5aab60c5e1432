// Routing engine health (junos_route_engine_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class RoutingEngineCollector {
 public:
  std::string Name() const { return "Routing Engine"; }
  std::vector<Desc> Describe() const;
  void Collect(RouteEngineStatsDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
