#include "AlarmCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::vector<std::string> kLabels{"target"};

const Desc alarmsYellowCount{"junos_alarms_yellow_count", "Number of yellow alarms (not silenced)", kLabels};
const Desc alarmsRedCount{"junos_alarms_red_count", "Number of red alarms (not silenced)", kLabels};

} // namespace

std::vector<Desc> AlarmCollector::Describe() const {
  return {alarmsYellowCount, alarmsRedCount};
}

void AlarmCollector::Collect(AlarmCounterDatasource& datasource, MetricSink& sink,
                             const std::vector<std::string>& label_values) const {
  auto counter = datasource.FetchAlarmCounter();
  sink.Gauge(alarmsYellowCount, counter.yellow_count, label_values);
  sink.Gauge(alarmsRedCount, counter.red_count, label_values);
}

} // namespace junoskit::collectors
