// Prometheus backend: exposes the JunosCollector through a prometheus-cpp Exposer

#include <junoskit/junoskit.hpp>
#include "core/Config.hpp"
#include "exporter/JunosCollector.hpp"
#include "rpc/SshChannel.hpp"

#include <prometheus/exposer.h>

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace junoskit {

namespace {

struct Backend {
  std::unique_ptr<prometheus::Exposer> exposer;
  std::shared_ptr<exporter::JunosCollector> collector;

  // serializes Init/Shutdown
  std::mutex mu;

  Config cfg;
  // Lifecycle state for safety around Shutdown/Reinit
  enum class State { Uninitialized, Running, ShuttingDown, Stopped };
  std::atomic<State> state{State::Uninitialized};
};

Backend& G() {
  static Backend* inst = new Backend();
  return *inst;
}

static rpc::SshOptions SshOptionsFrom(const Config& cfg) {
  rpc::SshOptions o;
  o.binary = cfg.ssh_binary;
  o.user = cfg.ssh_user;
  o.keyfile = cfg.ssh_keyfile;
  o.timeout_seconds = cfg.ssh_timeout_seconds;
  return o;
}

// Tear down prometheus-cpp objects; caller holds mu.
static void ShutdownLocked() {
  G().state.store(Backend::State::ShuttingDown, std::memory_order_release);
  G().exposer.reset();
  G().collector.reset();
  G().state.store(Backend::State::Stopped, std::memory_order_release);
}

} // namespace

bool Init(const Config& cfg) noexcept {
  std::unique_lock<std::mutex> lk(G().mu, std::defer_lock);
  try {
    lk.lock();
    // If already running, perform a safe shutdown to allow re-init.
    if (G().state.load(std::memory_order_acquire) == Backend::State::Running) {
      ShutdownLocked();
    }

    spdlog::set_level(cfg.debug ? spdlog::level::debug : spdlog::level::info);
    ValidateConfig(cfg);
    G().cfg = cfg;

    G().collector = std::make_shared<exporter::JunosCollector>(
        cfg.targets, std::make_shared<rpc::SshChannelFactory>(SshOptionsFrom(cfg)), cfg.alarm_filter, cfg.features);

    std::string addr = cfg.host + ":" + std::to_string(cfg.port);
    G().exposer = std::make_unique<prometheus::Exposer>(addr);
    G().exposer->RegisterCollectable(G().collector, cfg.path.empty() ? std::string{"/metrics"} : cfg.path);

    spdlog::info("Listening on {} ({} targets)", addr, cfg.targets.size());
    G().state.store(Backend::State::Running, std::memory_order_release);
    return true;
  } catch (const std::exception& e) {
    spdlog::error("init failed: {}", e.what());
    G().exposer.reset();
    G().collector.reset();
    G().state.store(Backend::State::Stopped, std::memory_order_release);
    return false;
  }
}

bool InitFromToml(const std::string& toml_path) noexcept {
  Config cfg;
  std::string err;
  try {
    if (!ParseConfigToml(toml_path, cfg, err)) {
      spdlog::error("failed to parse {}: {}", toml_path, err);
      return false;
    }
  } catch (const std::exception& e) {
    spdlog::error("failed to load {}: {}", toml_path, e.what());
    return false;
  }
  return Init(cfg);
}

void Shutdown() noexcept {
  try {
    std::lock_guard<std::mutex> lk(G().mu);
    ShutdownLocked();
  } catch (const std::exception& e) {
    spdlog::error("shutdown failed: {}", e.what());
    G().state.store(Backend::State::Stopped, std::memory_order_release);
  }
}

bool IsRunning() noexcept {
  return G().state.load(std::memory_order_acquire) == Backend::State::Running;
}

} // namespace junoskit
