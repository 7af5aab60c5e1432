// Metric descriptors and the sample sink collectors write into
#pragma once

#include <prometheus/metric_family.h>

#include <initializer_list>
#include <string>
#include <vector>

namespace junoskit::collectors {

struct Desc {
  std::string name;
  std::string help;
  std::vector<std::string> labels; // ordered label names, "target" first
};

// Accumulates gauge samples grouped into one family per descriptor.
class MetricSink {
 public:
  // Throws std::invalid_argument when label_values does not match desc.labels.
  void Gauge(const Desc& desc, double value, const std::vector<std::string>& label_values);

  // Families in first-emitted order.
  const std::vector<prometheus::MetricFamily>& families() const { return families_; }
  std::vector<prometheus::MetricFamily> Take();
  size_t size() const;

 private:
  prometheus::MetricFamily& FamilyFor(const Desc& desc);
  std::vector<prometheus::MetricFamily> families_;
};

// Appends families from src into dst, merging series of same-named families.
void MergeFamilies(std::vector<prometheus::MetricFamily>& dst, std::vector<prometheus::MetricFamily> src);

// label_values followed by extra, as handed to MetricSink::Gauge.
std::vector<std::string> WithLabels(const std::vector<std::string>& label_values,
                                    std::initializer_list<std::string> extra);

} // namespace junoskit::collectors
