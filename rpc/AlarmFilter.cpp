#include "AlarmFilter.hpp"
#include "core/Errors.hpp"

namespace junoskit::rpc {

AlarmFilter::AlarmFilter(const std::string& pattern) : pattern_(pattern) {
  try {
    re_ = std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw ConfigError("invalid alarm filter '" + pattern + "': " + e.what());
  }
}

bool AlarmFilter::Matches(const std::string& text) const {
  return std::regex_search(text, re_);
}

std::shared_ptr<const AlarmFilter> AlarmFilter::Compile(const std::string& pattern) {
  if (pattern.empty()) return nullptr;
  return std::make_shared<const AlarmFilter>(pattern);
}

} // namespace junoskit::rpc
