// Command channel backed by the system ssh client (batch mode, key auth)
#pragma once

#include "CommandChannel.hpp"

#include <string>
#include <utility>
#include <vector>

namespace junoskit::rpc {

struct SshOptions {
  std::string binary = "ssh";
  std::string user;
  std::string keyfile;
  int         timeout_seconds = 10;
};

class SshCommandChannel : public RemoteCommandChannel {
 public:
  explicit SshCommandChannel(SshOptions opts);
  std::string RunCommand(const std::string& target, const std::string& command) override;

  // Argument vector handed to the shell; exposed for tests.
  std::vector<std::string> BuildArgv(const std::string& target, const std::string& command) const;

 private:
  SshOptions opts_;
};

class SshChannelFactory : public ChannelFactory {
 public:
  explicit SshChannelFactory(SshOptions opts) : opts_(std::move(opts)) {}
  std::unique_ptr<RemoteCommandChannel> Open(const std::string& target) override;

 private:
  SshOptions opts_;
};

// Single-quote s for /bin/sh.
std::string ShellQuote(const std::string& s);

} // namespace junoskit::rpc
