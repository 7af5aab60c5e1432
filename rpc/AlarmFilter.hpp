// Compiled alarm exclusion pattern, shared read-only across scrapes
#pragma once

#include <memory>
#include <regex>
#include <string>

namespace junoskit::rpc {

class AlarmFilter {
 public:
  // Throws ConfigError when pattern is not a valid ECMAScript regex.
  explicit AlarmFilter(const std::string& pattern);

  // Unanchored search, so "fan" matches "fan failure".
  bool Matches(const std::string& text) const;

  const std::string& pattern() const { return pattern_; }

  // nullptr for an empty pattern (filtering disabled).
  static std::shared_ptr<const AlarmFilter> Compile(const std::string& pattern);

 private:
  std::string pattern_;
  std::regex re_;
};

} // namespace junoskit::rpc
