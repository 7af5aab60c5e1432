// Interface traffic, error and status metrics (junos_interface_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class InterfaceCollector {
 public:
  std::string Name() const { return "Interfaces"; }
  std::vector<Desc> Describe() const;
  // Byte counters for every interface; status, errors and drops for physical ones only.
  void Collect(InterfaceStatsDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;

 private:
  void CollectForInterface(const InterfaceStats& s, MetricSink& sink,
                           const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
