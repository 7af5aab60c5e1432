// Error kinds raised by the scrape pipeline
#pragma once

#include <stdexcept>
#include <string>

namespace junoskit {

// Command channel failed: spawn, connectivity, auth, timeout, non-zero exit.
class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Reply bytes do not match the domain's XML schema.
class DecodeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Invalid configuration (bad alarm filter, no targets, ...). Raised before any scrape.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

} // namespace junoskit
