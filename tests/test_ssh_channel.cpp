#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "rpc/SshChannel.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace junoskit::rpc {
namespace {

TEST(SshChannelTest, ArgvForPlainHost) {
  SshCommandChannel ch(SshOptions{"ssh", "prom", "", 7});
  EXPECT_EQ(ch.BuildArgv("router1", "show isis adjacency | display xml"),
            (std::vector<std::string>{"ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=7", "-p", "22",
                                      "prom@router1", "show isis adjacency | display xml"}));
}

TEST(SshChannelTest, ArgvSplitsPortAndAddsKeyfile) {
  SshCommandChannel ch(SshOptions{"/usr/bin/ssh", "", "/keys/id_rsa", 10});
  EXPECT_EQ(ch.BuildArgv("192.0.2.1:2222", "show bgp summary"),
            (std::vector<std::string>{"/usr/bin/ssh", "-o", "BatchMode=yes", "-o", "ConnectTimeout=10", "-p",
                                      "2222", "-i", "/keys/id_rsa", "192.0.2.1", "show bgp summary"}));
}

TEST(SshChannelTest, BareIpv6KeepsDefaultPort) {
  SshCommandChannel ch(SshOptions{"ssh", "", "", 10});
  auto argv = ch.BuildArgv("2001:db8::1", "show route summary");
  ASSERT_EQ(argv.size(), 9u);
  EXPECT_EQ(argv[6], "22");
  EXPECT_EQ(argv[7], "2001:db8::1");
}

TEST(SshChannelTest, ShellQuoteEscapesSingleQuotes) {
  EXPECT_EQ(ShellQuote("show system alarms | display xml"), "'show system alarms | display xml'");
  EXPECT_EQ(ShellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(ShellQuote(""), "''");
}

TEST(SshChannelTest, NonZeroExitIsTransportError) {
  SshCommandChannel ch(SshOptions{"false", "", "", 1});
  EXPECT_THROW(ch.RunCommand("router1", "show chassis environment | display xml"), TransportError);
}

TEST(SshChannelTest, FailureCarriesClientStderr) {
  const auto script = std::filesystem::temp_directory_path() / "junoskit_fake_ssh.sh";
  std::ofstream(script) << "#!/bin/sh\necho 'reply on stdout'\necho 'prom@router1: Permission denied (publickey).' >&2\nexit 255\n";
  std::filesystem::permissions(script, std::filesystem::perms::owner_all);

  SshCommandChannel ch(SshOptions{script.string(), "prom", "", 1});
  try {
    ch.RunCommand("router1", "show bgp summary | display xml");
    ADD_FAILURE() << "expected TransportError";
  } catch (const TransportError& e) {
    const std::string msg = e.what();
    EXPECT_NE(msg.find("status 255"), std::string::npos) << msg;
    EXPECT_NE(msg.find("Permission denied (publickey)."), std::string::npos) << msg;
    EXPECT_EQ(msg.find("reply on stdout"), std::string::npos) << msg;
  }
  std::filesystem::remove(script);
}

TEST(SshChannelTest, SuccessfulExitReturnsOutput) {
  SshCommandChannel ch(SshOptions{"true", "", "", 1});
  EXPECT_EQ(ch.RunCommand("router1", "show chassis environment | display xml"), "");
}

TEST(SshChannelTest, FactoryOpensIndependentChannels) {
  SshChannelFactory factory(SshOptions{"true", "", "", 1});
  auto a = factory.Open("r1");
  auto b = factory.Open("r2");
  ASSERT_NE(a, nullptr);
  ASSERT_NE(b, nullptr);
  EXPECT_NE(a.get(), b.get());
}

} // namespace
} // namespace junoskit::rpc
