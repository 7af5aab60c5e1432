// Datasource capabilities consumed by the domain collectors.
// rpc::RpcClient implements all of them; tests substitute fixtures.
// Every Fetch* throws TransportError or DecodeError (core/Errors.hpp) on failure.
#pragma once

#include <junoskit/records.hpp>

#include <vector>

namespace junoskit {

class InterfaceStatsDatasource {
 public:
  virtual ~InterfaceStatsDatasource() = default;
  virtual std::vector<InterfaceStats> FetchInterfaceStats() = 0;
};

class AlarmCounterDatasource {
 public:
  virtual ~AlarmCounterDatasource() = default;
  virtual AlarmCounter FetchAlarmCounter() = 0;
};

class BgpSessionsDatasource {
 public:
  virtual ~BgpSessionsDatasource() = default;
  virtual std::vector<BgpSession> FetchBgpSessions() = 0;
};

class OspfAreasDatasource {
 public:
  virtual ~OspfAreasDatasource() = default;
  virtual std::vector<OspfArea> FetchOspfAreas() = 0;
};

class IsisAdjacenciesDatasource {
 public:
  virtual ~IsisAdjacenciesDatasource() = default;
  virtual IsisAdjacencies FetchIsisAdjacencies() = 0;
};

class RoutingTablesDatasource {
 public:
  virtual ~RoutingTablesDatasource() = default;
  virtual std::vector<RoutingTable> FetchRoutingTables() = 0;
};

class RouteEngineStatsDatasource {
 public:
  virtual ~RouteEngineStatsDatasource() = default;
  virtual RouteEngineStats FetchRouteEngineStats() = 0;
};

class EnvironmentItemsDatasource {
 public:
  virtual ~EnvironmentItemsDatasource() = default;
  virtual std::vector<EnvironmentItem> FetchEnvironmentItems() = 0;
};

class InterfaceDiagnosticsDatasource {
 public:
  virtual ~InterfaceDiagnosticsDatasource() = default;
  virtual std::vector<InterfaceDiagnostics> FetchInterfaceDiagnostics() = 0;
};

} // namespace junoskit
