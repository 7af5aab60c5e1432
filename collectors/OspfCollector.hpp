// OSPFv3 neighbors per area (junos_ospf3_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class OspfCollector {
 public:
  std::string Name() const { return "OSPF"; }
  std::vector<Desc> Describe() const;
  void Collect(OspfAreasDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
