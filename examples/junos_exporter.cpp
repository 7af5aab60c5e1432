#include <junoskit/junoskit.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {
std::atomic<bool> g_stop{false};
extern "C" void OnSignal(int) { g_stop.store(true); }
} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.toml>" << std::endl;
    return 2;
  }
  const std::string cfg_path = argv[1];

  if (!junoskit::InitFromToml(cfg_path)) {
    std::cerr << "InitFromToml failed: " << cfg_path << std::endl;
    return 1;
  }

  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);

  using namespace std::chrono_literals;
  while (!g_stop.load() && junoskit::IsRunning()) {
    std::this_thread::sleep_for(200ms);
  }

  spdlog::info("Shutting down");
  junoskit::Shutdown();
  return 0;
}
