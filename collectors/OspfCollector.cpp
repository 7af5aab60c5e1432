#include "OspfCollector.hpp"

namespace junoskit::collectors {

namespace {

const Desc upCount{"junos_ospf3_neighbors_up", "Number of neighbors in state up", {"target", "area"}};

} // namespace

std::vector<Desc> OspfCollector::Describe() const {
  return {upCount};
}

void OspfCollector::Collect(OspfAreasDatasource& datasource, MetricSink& sink,
                            const std::vector<std::string>& label_values) const {
  auto areas = datasource.FetchOspfAreas();
  for (const auto& a : areas) {
    sink.Gauge(upCount, a.neighbors, WithLabels(label_values, {a.name}));
  }
}

} // namespace junoskit::collectors
