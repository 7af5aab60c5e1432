// Config parsing and validation
#pragma once
#include <junoskit/junoskit.hpp>

#include <string>

namespace junoskit {

// Try to parse TOML file into Config. Returns true on success, false on failure.
// Keys missing from the file keep the defaults of Config.
bool ParseConfigToml(const std::string& path, Config& out, std::string& err);

// Throws ConfigError when cfg cannot be used to start the exporter.
void ValidateConfig(const Config& cfg);

} // namespace junoskit
