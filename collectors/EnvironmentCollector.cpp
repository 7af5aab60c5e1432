#include "EnvironmentCollector.hpp"

namespace junoskit::collectors {

namespace {

const Desc temperaturesDesc{"junos_environment_item_temp", "Temperature of the air flowing past", {"target", "item"}};

} // namespace

std::vector<Desc> EnvironmentCollector::Describe() const {
  return {temperaturesDesc};
}

void EnvironmentCollector::Collect(EnvironmentItemsDatasource& datasource, MetricSink& sink,
                                   const std::vector<std::string>& label_values) const {
  auto items = datasource.FetchEnvironmentItems();
  for (const auto& item : items) {
    sink.Gauge(temperaturesDesc, item.temperature, WithLabels(label_values, {item.name}));
  }
}

} // namespace junoskit::collectors
