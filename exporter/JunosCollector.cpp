#include "JunosCollector.hpp"

#include "collectors/AlarmCollector.hpp"
#include "collectors/BgpCollector.hpp"
#include "collectors/EnvironmentCollector.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "collectors/InterfaceDiagnosticsCollector.hpp"
#include "collectors/IsisCollector.hpp"
#include "collectors/OspfCollector.hpp"
#include "collectors/RouteCollector.hpp"
#include "collectors/RoutingEngineCollector.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <future>
#include <utility>

namespace junoskit::exporter {

namespace {

const collectors::Desc upDesc{"junos_up", "Scrape of target was successful", {"target"}};
const collectors::Desc scrapeDurationDesc{"junos_collector_duration_seconds", "Duration of a scrape by target",
                                          {"target"}};

template <typename C>
Feature MakeFeature(C collector) {
  auto descs = collector.Describe();
  auto name = collector.Name();
  return Feature{std::move(name),
                 [collector](rpc::RpcClient& client, collectors::MetricSink& sink,
                             const std::vector<std::string>& label_values) {
                   collector.Collect(client, sink, label_values);
                 },
                 std::move(descs)};
}

} // namespace

std::vector<Feature> EnabledFeatures(const Features& features) {
  std::vector<Feature> out;
  if (features.interfaces) out.push_back(MakeFeature(collectors::InterfaceCollector{}));
  if (features.alarm) out.push_back(MakeFeature(collectors::AlarmCollector{}));
  if (features.bgp) out.push_back(MakeFeature(collectors::BgpCollector{}));
  if (features.ospf) out.push_back(MakeFeature(collectors::OspfCollector{}));
  if (features.isis) out.push_back(MakeFeature(collectors::IsisCollector{}));
  if (features.routes) out.push_back(MakeFeature(collectors::RouteCollector{}));
  if (features.routing_engine) out.push_back(MakeFeature(collectors::RoutingEngineCollector{}));
  if (features.environment) out.push_back(MakeFeature(collectors::EnvironmentCollector{}));
  if (features.interface_diagnostics) out.push_back(MakeFeature(collectors::InterfaceDiagnosticsCollector{}));
  return out;
}

JunosCollector::JunosCollector(std::vector<std::string> targets, std::shared_ptr<rpc::ChannelFactory> channels,
                               const std::string& alarm_filter, const Features& features)
    : targets_(std::move(targets)),
      channels_(std::move(channels)),
      alarm_filter_(rpc::AlarmFilter::Compile(alarm_filter)),
      features_(EnabledFeatures(features)) {}

std::vector<collectors::Desc> JunosCollector::Describe() const {
  std::vector<collectors::Desc> out{upDesc, scrapeDurationDesc};
  for (const auto& f : features_) out.insert(out.end(), f.descs.begin(), f.descs.end());
  return out;
}

std::vector<prometheus::MetricFamily> JunosCollector::Collect() const {
  // one channel per target, so targets can be scraped concurrently
  std::vector<std::future<std::vector<prometheus::MetricFamily>>> pending;
  pending.reserve(targets_.size());
  for (const auto& host : targets_) {
    pending.push_back(std::async(std::launch::async, [this, &host] { return CollectForHost(host); }));
  }

  std::vector<prometheus::MetricFamily> merged;
  for (auto& p : pending) collectors::MergeFamilies(merged, p.get());
  return merged;
}

std::vector<prometheus::MetricFamily> JunosCollector::CollectForHost(const std::string& host) const {
  const std::vector<std::string> l{host};
  const auto start = std::chrono::steady_clock::now();
  std::vector<prometheus::MetricFamily> fams;

  auto finish = [&](bool up) {
    collectors::MetricSink status;
    status.Gauge(upDesc, up ? 1 : 0, l);
    status.Gauge(scrapeDurationDesc, std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count(), l);
    auto out = status.Take();
    collectors::MergeFamilies(out, std::move(fams));
    return out;
  };

  std::unique_ptr<rpc::RemoteCommandChannel> channel;
  try {
    channel = channels_->Open(host);
  } catch (const std::exception& e) {
    spdlog::error("{}: {}", host, e.what());
    return finish(false);
  }

  rpc::RpcClient client(*channel, host, alarm_filter_);
  size_t transport_failures = 0;
  for (const auto& f : features_) {
    // scratch sink so a failing domain contributes nothing
    collectors::MetricSink sink;
    try {
      f.collect(client, sink, l);
    } catch (const TransportError& e) {
      ++transport_failures;
      spdlog::error("{} ({}): {}", f.name, host, e.what());
      continue;
    } catch (const std::exception& e) {
      spdlog::error("{} ({}): {}", f.name, host, e.what());
      continue;
    }
    collectors::MergeFamilies(fams, sink.Take());
  }

  // down only when the device could not be reached for any domain
  const bool up = features_.empty() || transport_failures < features_.size();
  return finish(up);
}

} // namespace junoskit::exporter
