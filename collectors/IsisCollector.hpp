// ISIS adjacency counts (junos_isis_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class IsisCollector {
 public:
  std::string Name() const { return "ISIS"; }
  std::vector<Desc> Describe() const;
  void Collect(IsisAdjacenciesDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
