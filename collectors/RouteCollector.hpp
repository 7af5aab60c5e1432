// Routing table sizes, per table and per protocol (junos_route_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class RouteCollector {
 public:
  std::string Name() const { return "Routes"; }
  std::vector<Desc> Describe() const;
  void Collect(RoutingTablesDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
