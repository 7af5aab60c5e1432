#include "SshChannel.hpp"
#include "core/Errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace junoskit::rpc {

namespace {

// Temp file receiving the ssh client's stderr; removed on destruction.
class StderrCapture {
 public:
  StderrCapture() {
    std::string tmpl = (std::filesystem::temp_directory_path() / "junoskit-ssh-XXXXXX").string();
    int fd = ::mkstemp(tmpl.data());
    if (fd == -1) throw TransportError("failed to create stderr capture file");
    ::close(fd);
    path_ = std::move(tmpl);
  }
  ~StderrCapture() { ::unlink(path_.c_str()); }
  StderrCapture(const StderrCapture&) = delete;
  StderrCapture& operator=(const StderrCapture&) = delete;

  const std::string& path() const { return path_; }

  // Captured text, whitespace-trimmed and capped to a log-friendly length.
  std::string Read() const {
    std::ifstream in(path_);
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto l = s.find_first_not_of(" \t\r\n");
    if (l == std::string::npos) return {};
    s = s.substr(l, s.find_last_not_of(" \t\r\n") - l + 1);
    if (s.size() > kMaxStderr) s = s.substr(s.size() - kMaxStderr);
    return s;
  }

 private:
  static constexpr size_t kMaxStderr = 512;
  std::string path_;
};

} // namespace

std::string ShellQuote(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') out.append("'\\''");
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

SshCommandChannel::SshCommandChannel(SshOptions opts) : opts_(std::move(opts)) {}

std::vector<std::string> SshCommandChannel::BuildArgv(const std::string& target, const std::string& command) const {
  // target: host or host:port (a single colon only; bare IPv6 addresses keep port 22)
  std::string host = target;
  std::string port = "22";
  auto colon = target.find(':');
  if (colon != std::string::npos && target.find(':', colon + 1) == std::string::npos) {
    host = target.substr(0, colon);
    port = target.substr(colon + 1);
  }

  std::vector<std::string> argv{opts_.binary,
                                "-o", "BatchMode=yes",
                                "-o", "ConnectTimeout=" + std::to_string(opts_.timeout_seconds),
                                "-p", port};
  if (!opts_.keyfile.empty()) {
    argv.push_back("-i");
    argv.push_back(opts_.keyfile);
  }
  argv.push_back(opts_.user.empty() ? host : opts_.user + "@" + host);
  argv.push_back(command);
  return argv;
}

std::string SshCommandChannel::RunCommand(const std::string& target, const std::string& command) {
  std::string cmd;
  for (const auto& a : BuildArgv(target, command)) {
    if (!cmd.empty()) cmd.push_back(' ');
    cmd.append(ShellQuote(a));
  }
  StderrCapture err;
  cmd.append(" 2>").append(ShellQuote(err.path()));

  FILE* fp = ::popen(cmd.c_str(), "r");
  if (!fp) throw TransportError("failed to spawn ssh for " + target);

  std::string out;
  char buf[4096];
  size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), fp)) > 0) out.append(buf, n);
  const bool read_failed = std::ferror(fp) != 0;
  int status = ::pclose(fp);

  if (read_failed) throw TransportError("failed reading reply of '" + command + "' from " + target);
  if (status == -1) throw TransportError("failed waiting for ssh to " + target);

  std::string reason;
  if (!WIFEXITED(status)) {
    reason = "ssh to " + target + " terminated abnormally";
  } else if (WEXITSTATUS(status) != 0) {
    reason = "ssh to " + target + " exited with status " + std::to_string(WEXITSTATUS(status));
  } else {
    return out;
  }
  if (auto detail = err.Read(); !detail.empty()) reason += ": " + detail;
  throw TransportError(reason);
}

std::unique_ptr<RemoteCommandChannel> SshChannelFactory::Open(const std::string& target) {
  spdlog::debug("opening ssh channel to {}", target);
  return std::make_unique<SshCommandChannel>(opts_);
}

} // namespace junoskit::rpc
