// JunosCollector: a Collectable that scrapes every configured target on each
// pull and merges the per-target samples into metric families.
#pragma once

#include "collectors/MetricSink.hpp"
#include "rpc/AlarmFilter.hpp"
#include "rpc/CommandChannel.hpp"
#include "rpc/RpcClient.hpp"

#include <junoskit/junoskit.hpp>

#include <prometheus/collectable.h>
#include <prometheus/metric_family.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace junoskit::exporter {

// One enabled domain: runs its collector against a client into a sink.
struct Feature {
  std::string name;
  std::function<void(rpc::RpcClient&, collectors::MetricSink&, const std::vector<std::string>&)> collect;
  std::vector<collectors::Desc> descs;
};

// Domains switched on in features, in a fixed order.
std::vector<Feature> EnabledFeatures(const Features& features);

class JunosCollector : public prometheus::Collectable {
 public:
  // Throws ConfigError when alarm_filter does not compile.
  JunosCollector(std::vector<std::string> targets, std::shared_ptr<rpc::ChannelFactory> channels,
                 const std::string& alarm_filter, const Features& features);

  std::vector<prometheus::MetricFamily> Collect() const override;

  // Every descriptor this collector can emit, including junos_up and the duration gauge.
  std::vector<collectors::Desc> Describe() const;

 private:
  std::vector<prometheus::MetricFamily> CollectForHost(const std::string& host) const;

  std::vector<std::string> targets_;
  std::shared_ptr<rpc::ChannelFactory> channels_;
  std::shared_ptr<const rpc::AlarmFilter> alarm_filter_;
  std::vector<Feature> features_;
};

} // namespace junoskit::exporter
