#include "BgpCollector.hpp"

namespace junoskit::collectors {

namespace {

const std::string kPrefix = "junos_bgp_session_";

Desc MakeDesc(const std::string& name, const std::string& help) {
  return Desc{kPrefix + name, help, {"target", "asn", "ip"}};
}

const Desc upDesc               = MakeDesc("up", "Session is up (1 = Established)");
const Desc receivedPrefixesDesc = MakeDesc("received_prefixes_count", "Number of received prefixes");
const Desc acceptedPrefixesDesc = MakeDesc("accepted_prefixes_count", "Number of accepted prefixes");
const Desc rejectedPrefixesDesc = MakeDesc("rejected_prefixes_count", "Number of rejected prefixes");
const Desc activePrefixesDesc   = MakeDesc("active_prefixes_count", "Number of active prefixes (best route in RIB)");
const Desc inputMessagesDesc    = MakeDesc("messages_input_count", "Number of received messages");
const Desc outputMessagesDesc   = MakeDesc("messages_output_count", "Number of transmitted messages");
const Desc flapsDesc            = MakeDesc("flap_count", "Number of session flaps");

} // namespace

std::vector<Desc> BgpCollector::Describe() const {
  return {upDesc, receivedPrefixesDesc, acceptedPrefixesDesc, rejectedPrefixesDesc,
          activePrefixesDesc, inputMessagesDesc, outputMessagesDesc, flapsDesc};
}

void BgpCollector::Collect(BgpSessionsDatasource& datasource, MetricSink& sink,
                           const std::vector<std::string>& label_values) const {
  auto sessions = datasource.FetchBgpSessions();
  for (const auto& s : sessions) {
    const auto l = WithLabels(label_values, {s.asn, s.ip});
    sink.Gauge(upDesc, s.up ? 1 : 0, l);
    sink.Gauge(receivedPrefixesDesc, s.received_prefixes, l);
    sink.Gauge(acceptedPrefixesDesc, s.accepted_prefixes, l);
    sink.Gauge(rejectedPrefixesDesc, s.rejected_prefixes, l);
    sink.Gauge(activePrefixesDesc, s.active_prefixes, l);
    sink.Gauge(inputMessagesDesc, s.input_messages, l);
    sink.Gauge(outputMessagesDesc, s.output_messages, l);
    sink.Gauge(flapsDesc, s.flaps, l);
  }
}

} // namespace junoskit::collectors
