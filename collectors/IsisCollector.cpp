#include "IsisCollector.hpp"

namespace junoskit::collectors {

namespace {

const Desc upCount{"junos_isis_up_count", "Number of ISIS Adjacencies in state up", {"target"}};
const Desc totalCount{"junos_isis_total_count", "Number of ISIS Adjacencies", {"target"}};

} // namespace

std::vector<Desc> IsisCollector::Describe() const {
  return {upCount, totalCount};
}

void IsisCollector::Collect(IsisAdjacenciesDatasource& datasource, MetricSink& sink,
                            const std::vector<std::string>& label_values) const {
  auto adjacencies = datasource.FetchIsisAdjacencies();
  sink.Gauge(upCount, adjacencies.up, label_values);
  sink.Gauge(totalCount, adjacencies.total, label_values);
}

} // namespace junoskit::collectors
