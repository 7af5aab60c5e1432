// RpcClient: sends the per-domain CLI commands to one target and maps the
// decoded replies into normalized records.
#pragma once

#include "AlarmFilter.hpp"
#include "CommandChannel.hpp"
#include "Envelopes.hpp"

#include <junoskit/datasource.hpp>

#include <memory>
#include <string>
#include <vector>

namespace junoskit::rpc {

class RpcClient : public InterfaceStatsDatasource,
                  public AlarmCounterDatasource,
                  public BgpSessionsDatasource,
                  public OspfAreasDatasource,
                  public IsisAdjacenciesDatasource,
                  public RoutingTablesDatasource,
                  public RouteEngineStatsDatasource,
                  public EnvironmentItemsDatasource,
                  public InterfaceDiagnosticsDatasource {
 public:
  // channel must outlive the client; alarm_filter may be null.
  RpcClient(RemoteCommandChannel& channel, std::string target,
            std::shared_ptr<const AlarmFilter> alarm_filter = nullptr);
  // Compiles alarm_filter; throws ConfigError when it is invalid.
  RpcClient(RemoteCommandChannel& channel, std::string target, const std::string& alarm_filter);

  const std::string& target() const { return target_; }

  AlarmCounter FetchAlarmCounter() override;
  std::vector<InterfaceStats> FetchInterfaceStats() override;
  std::vector<BgpSession> FetchBgpSessions() override;
  std::vector<OspfArea> FetchOspfAreas() override;
  IsisAdjacencies FetchIsisAdjacencies() override;
  std::vector<RoutingTable> FetchRoutingTables() override;
  RouteEngineStats FetchRouteEngineStats() override;
  std::vector<EnvironmentItem> FetchEnvironmentItems() override;
  std::vector<InterfaceDiagnostics> FetchInterfaceDiagnostics() override;

 private:
  bool ShouldFilterAlarm(const AlarmDetailEntry& alarm) const;

  template <typename T>
  T RunCommandAndParse(const std::string& cmd, const Schema<T>& schema);

  RemoteCommandChannel& channel_;
  std::string target_;
  std::shared_ptr<const AlarmFilter> alarm_filter_;
};

} // namespace junoskit::rpc
