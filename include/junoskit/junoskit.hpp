#pragma once
// junoskit public API
// - Scrapes Junos devices over ssh on every pull of the metrics path
// - Programmatic config or TOML file (see core/Config.hpp)
// - prometheus-cpp types stay out of public headers

#include <cstdint>
#include <string>
#include <vector>

namespace junoskit {

// Per-domain switches; every domain is scraped unless turned off.
struct Features {
  bool interfaces = true;
  bool alarm = true;
  bool bgp = true;
  bool ospf = true;
  bool isis = true;
  bool routes = true;
  bool routing_engine = true;
  bool environment = true;
  bool interface_diagnostics = true;
};

struct Config {
  std::string host = "0.0.0.0";     // bind host for HTTP exposer
  int         port = 9326;          // bind port for HTTP exposer
  std::string path = "/metrics";    // metrics path
  bool        debug = false;        // log commands and raw replies

  std::vector<std::string> targets; // host or host:port
  std::string ssh_user;
  std::string ssh_keyfile;
  std::string ssh_binary = "ssh";
  int         ssh_timeout_seconds = 10;

  std::string alarm_filter;         // ECMAScript regex; empty disables
  Features    features;
};

// Lifecycle
// Validates cfg (targets, port, alarm filter), starts the exposer; returns false on failure.
bool Init(const Config& cfg) noexcept;
// Init from TOML path (uses ParseConfigToml internally); returns false on parse or init failure.
bool InitFromToml(const std::string& toml_path) noexcept;
void Shutdown() noexcept;

// Returns whether the exposer is currently serving (thread-safe).
bool IsRunning() noexcept;

} // namespace junoskit
