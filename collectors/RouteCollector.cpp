#include "RouteCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::string kPrefix = "junos_route_";

const std::vector<std::string> kTableLabels{"target", "table"};
const std::vector<std::string> kProtocolLabels{"target", "table", "protocol"};

const Desc totalRoutesDesc{kPrefix + "total_count", "Number of routes in table", kTableLabels};
const Desc maxRoutesDesc{kPrefix + "max_count", "Max routes in table (destinations)", kTableLabels};
const Desc activeRoutesDesc{kPrefix + "active_count", "Number of active routes in table", kTableLabels};
const Desc protocolRoutesDesc{kPrefix + "protocol_routes_count", "Number of routes by protocol in table", kProtocolLabels};
const Desc protocolActiveRoutesDesc{kPrefix + "protocol_active_routes_count",
                                    "Number of active routes by protocol in table", kProtocolLabels};

} // namespace

std::vector<Desc> RouteCollector::Describe() const {
  return {totalRoutesDesc, maxRoutesDesc, activeRoutesDesc, protocolRoutesDesc, protocolActiveRoutesDesc};
}

void RouteCollector::Collect(RoutingTablesDatasource& datasource, MetricSink& sink,
                             const std::vector<std::string>& label_values) const {
  auto tables = datasource.FetchRoutingTables();
  for (const auto& t : tables) {
    const auto l = WithLabels(label_values, {t.name});
    sink.Gauge(totalRoutesDesc, t.total_routes, l);
    sink.Gauge(maxRoutesDesc, t.max_routes, l);
    sink.Gauge(activeRoutesDesc, t.active_routes, l);

    for (const auto& p : t.protocols) {
      const auto lp = WithLabels(l, {p.name});
      sink.Gauge(protocolRoutesDesc, p.routes, lp);
      sink.Gauge(protocolActiveRoutesDesc, p.active_routes, lp);
    }
  }
}

} // namespace junoskit::collectors
