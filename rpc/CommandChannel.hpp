// Remote command channel: executes a CLI command on a target and returns the raw reply
#pragma once

#include <memory>
#include <string>

namespace junoskit::rpc {

// At most one command may be in flight per instance; callers wanting
// concurrency use one channel per target (see ChannelFactory).
class RemoteCommandChannel {
 public:
  virtual ~RemoteCommandChannel() = default;
  // Throws TransportError on any failure to obtain the reply.
  virtual std::string RunCommand(const std::string& target, const std::string& command) = 0;
};

class ChannelFactory {
 public:
  virtual ~ChannelFactory() = default;
  virtual std::unique_ptr<RemoteCommandChannel> Open(const std::string& target) = 0;
};

} // namespace junoskit::rpc
