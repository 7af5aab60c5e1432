// Per-peer BGP session metrics (junos_bgp_session_*)
#pragma once

#include "MetricSink.hpp"

#include <junoskit/datasource.hpp>

#include <string>
#include <vector>

namespace junoskit::collectors {

class BgpCollector {
 public:
  std::string Name() const { return "BGP"; }
  std::vector<Desc> Describe() const;
  void Collect(BgpSessionsDatasource& datasource, MetricSink& sink,
               const std::vector<std::string>& label_values) const;
};

} // namespace junoskit::collectors
