// TOML config loader using toml++ (header-only)
#include "Config.hpp"
#include "Errors.hpp"
#include "rpc/AlarmFilter.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace junoskit {

static inline std::string as_string_or(const toml::node_view<toml::node>& nv, const std::string& def) {
  if (!nv) return def;
  if (auto v = nv.value<std::string>()) return *v;
  return def;
}

// Throws ConfigError for values that do not fit an int.
static inline int as_int_or(const toml::node_view<toml::node>& nv, const char* key, int def) {
  if (!nv) return def;
  if (auto v = nv.value_exact<int64_t>()) {
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
      throw ConfigError(std::string(key) + " out of range: " + std::to_string(*v));
    }
    return static_cast<int>(*v);
  }
  return def;
}

static inline bool as_bool_or(const toml::node_view<toml::node>& nv, bool def) {
  if (!nv) return def;
  if (auto v = nv.value<bool>()) return *v;
  return def;
}

bool ParseConfigToml(const std::string& path, Config& out, std::string& err) {
  try {
    auto tbl = toml::parse_file(path);

    // exporter
    if (auto exporter = tbl["exporter"]; exporter.is_table()) {
      out.host  = as_string_or(exporter["host"], out.host);
      out.port  = as_int_or(exporter["port"], "exporter.port", out.port);
      out.path  = as_string_or(exporter["path"], out.path);
      out.debug = as_bool_or(exporter["debug"], out.debug);
    }

    // ssh
    if (auto ssh = tbl["ssh"]; ssh.is_table()) {
      if (auto arr = ssh["targets"].as_array()) {
        std::vector<std::string> targets;
        targets.reserve(arr->size());
        for (auto&& el : *arr) {
          if (auto s = el.value<std::string>()) targets.push_back(*s);
        }
        out.targets = std::move(targets);
      }
      out.ssh_user            = as_string_or(ssh["user"], out.ssh_user);
      out.ssh_keyfile         = as_string_or(ssh["keyfile"], out.ssh_keyfile);
      out.ssh_binary          = as_string_or(ssh["binary"], out.ssh_binary);
      out.ssh_timeout_seconds = as_int_or(ssh["timeout_seconds"], "ssh.timeout_seconds", out.ssh_timeout_seconds);
    }

    // alarms
    if (auto alarms = tbl["alarms"]; alarms.is_table()) {
      out.alarm_filter = as_string_or(alarms["filter"], out.alarm_filter);
    }

    // features
    if (auto f = tbl["features"]; f.is_table()) {
      auto& ft = out.features;
      ft.interfaces            = as_bool_or(f["interfaces"], ft.interfaces);
      ft.alarm                 = as_bool_or(f["alarm"], ft.alarm);
      ft.bgp                   = as_bool_or(f["bgp"], ft.bgp);
      ft.ospf                  = as_bool_or(f["ospf"], ft.ospf);
      ft.isis                  = as_bool_or(f["isis"], ft.isis);
      ft.routes                = as_bool_or(f["routes"], ft.routes);
      ft.routing_engine        = as_bool_or(f["routing_engine"], ft.routing_engine);
      ft.environment           = as_bool_or(f["environment"], ft.environment);
      ft.interface_diagnostics = as_bool_or(f["interface_diagnostics"], ft.interface_diagnostics);
    }

    return true;
  } catch (const std::exception& e) {
    err = e.what();
  }
  return false;
}

void ValidateConfig(const Config& cfg) {
  if (cfg.targets.empty()) throw ConfigError("no ssh targets configured");
  for (const auto& t : cfg.targets) {
    if (t.empty()) throw ConfigError("empty ssh target");
  }
  if (cfg.port <= 0 || cfg.port > 65535) throw ConfigError("exporter port out of range: " + std::to_string(cfg.port));
  if (cfg.ssh_timeout_seconds <= 0) throw ConfigError("ssh timeout must be positive");
  // the exporter compiles its own shared copy
  rpc::AlarmFilter::Compile(cfg.alarm_filter);
}

} // namespace junoskit
