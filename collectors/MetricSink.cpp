#include "MetricSink.hpp"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace junoskit::collectors {

prometheus::MetricFamily& MetricSink::FamilyFor(const Desc& desc) {
  for (auto& f : families_) {
    if (f.name == desc.name) return f;
  }
  families_.push_back({});
  auto& f = families_.back();
  f.name = desc.name;
  f.help = desc.help;
  f.type = prometheus::MetricType::Gauge;
  return f;
}

void MetricSink::Gauge(const Desc& desc, double value, const std::vector<std::string>& label_values) {
  if (label_values.size() != desc.labels.size()) {
    throw std::invalid_argument(desc.name + ": expected " + std::to_string(desc.labels.size()) +
                                " label values, got " + std::to_string(label_values.size()));
  }
  prometheus::ClientMetric m;
  m.label.reserve(desc.labels.size());
  for (size_t i = 0; i < desc.labels.size(); ++i) {
    m.label.push_back({desc.labels[i], label_values[i]});
  }
  m.gauge.value = value;
  FamilyFor(desc).metric.push_back(std::move(m));
}

std::vector<prometheus::MetricFamily> MetricSink::Take() {
  return std::exchange(families_, {});
}

size_t MetricSink::size() const {
  size_t n = 0;
  for (const auto& f : families_) n += f.metric.size();
  return n;
}

void MergeFamilies(std::vector<prometheus::MetricFamily>& dst, std::vector<prometheus::MetricFamily> src) {
  for (auto& f : src) {
    prometheus::MetricFamily* target = nullptr;
    for (auto& d : dst) {
      if (d.name == f.name && d.type == f.type) { target = &d; break; }
    }
    if (!target) {
      dst.push_back(std::move(f));
      continue;
    }
    // Keep first non-empty help
    if (target->help.empty() && !f.help.empty()) target->help = f.help;
    target->metric.insert(target->metric.end(), std::make_move_iterator(f.metric.begin()),
                          std::make_move_iterator(f.metric.end()));
  }
}

std::vector<std::string> WithLabels(const std::vector<std::string>& label_values,
                                    std::initializer_list<std::string> extra) {
  std::vector<std::string> l = label_values;
  l.insert(l.end(), extra.begin(), extra.end());
  return l;
}

} // namespace junoskit::collectors
