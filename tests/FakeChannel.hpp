// Test fixture: command channel answering from canned replies
#pragma once

#include "core/Errors.hpp"
#include "rpc/CommandChannel.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace junoskit::testing {

class FakeChannel : public rpc::RemoteCommandChannel {
 public:
  // reply for the command without the " | display xml" suffix
  void Reply(const std::string& command, std::string xml) { replies_[command + " | display xml"] = std::move(xml); }
  void Fail(const std::string& command) { failing_.insert(command + " | display xml"); }

  std::string RunCommand(const std::string& target, const std::string& command) override {
    calls.push_back({target, command});
    if (failing_.count(command)) throw TransportError("connection reset by " + target);
    auto it = replies_.find(command);
    if (it == replies_.end()) throw TransportError("no reply for " + command);
    return it->second;
  }

  struct Call {
    std::string target;
    std::string command;
  };
  std::vector<Call> calls;

 private:
  std::map<std::string, std::string> replies_;
  std::set<std::string> failing_;
};

// Hands out a fresh copy of the per-target channel on every Open.
class FakeChannelFactory : public rpc::ChannelFactory {
 public:
  FakeChannel& For(const std::string& target) { return channels_[target]; }
  void Unreachable(const std::string& target) { unreachable_.insert(target); }

  std::unique_ptr<rpc::RemoteCommandChannel> Open(const std::string& target) override {
    if (unreachable_.count(target)) throw TransportError("could not connect to " + target);
    // read-only lookup: Open runs concurrently for different targets
    auto it = channels_.find(target);
    if (it == channels_.end()) return std::make_unique<FakeChannel>();
    return std::make_unique<FakeChannel>(it->second);
  }

 private:
  std::map<std::string, FakeChannel> channels_;
  std::set<std::string> unreachable_;
};

inline std::string RpcReply(const std::string& body) {
  return "<rpc-reply xmlns:junos=\"http://xml.juniper.net/junos/15.1R7/junos\">\n" + body + "\n</rpc-reply>\n";
}

} // namespace junoskit::testing
