// Declarative binding of XML element paths to envelope struct fields.
//
// A Schema<T> is an ordered table of (path -> member, type) entries built once
// per domain and applied to a decoded document. Missing elements leave the
// member at its default; a scalar bound to a repeated element takes the last
// one. Present numeric leaves must parse completely, otherwise decoding fails
// with DecodeError; there is no per-entry recovery.
#pragma once

#include "Xml.hpp"
#include "core/Errors.hpp"

#include <charconv>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace junoskit::rpc {

// Strict decimal parse: the whole string must be consumed.
inline std::optional<double> ParseDecimal(std::string_view sv) {
  if (sv.empty()) return std::nullopt;
  try {
    std::string s(sv);
    size_t idx = 0;
    double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

inline std::optional<std::int64_t> ParseInteger(std::string_view sv) {
  if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
  std::int64_t v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
  return v;
}

template <typename T>
class Schema {
 public:
  Schema& Text(std::string path, std::string T::*field) {
    return Bind(std::move(path), [field](const std::string& p, const xml::Node& n, T& out) {
      if (auto v = n.Lookup(p)) out.*field = *v;
    });
  }

  // Empty text decodes as 0.
  Schema& Int(std::string path, std::int64_t T::*field) {
    return Bind(std::move(path), [field](const std::string& p, const xml::Node& n, T& out) {
      auto v = n.Lookup(p);
      if (!v || v->empty()) return;
      auto parsed = ParseInteger(*v);
      if (!parsed) throw DecodeError(p + ": invalid integer '" + *v + "'");
      out.*field = *parsed;
    });
  }

  // Empty text decodes as 0.
  Schema& Real(std::string path, double T::*field) {
    return Bind(std::move(path), [field](const std::string& p, const xml::Node& n, T& out) {
      auto v = n.Lookup(p);
      if (!v || v->empty()) return;
      auto parsed = ParseDecimal(*v);
      if (!parsed) throw DecodeError(p + ": invalid number '" + *v + "'");
      out.*field = *parsed;
    });
  }

  // Engaged iff the element on path is present (an empty value reads as 0).
  Schema& OptionalReal(std::string path, std::optional<double> T::*field) {
    return Bind(std::move(path), [field](const std::string& p, const xml::Node& n, T& out) {
      auto v = n.Lookup(p);
      if (!v) return;
      if (v->empty()) { out.*field = 0.0; return; }
      auto parsed = ParseDecimal(*v);
      if (!parsed) throw DecodeError(p + ": invalid number '" + *v + "'");
      out.*field = *parsed;
    });
  }

  // Every element matching path, decoded with item, appended in document order.
  template <typename U>
  Schema& List(std::string path, std::vector<U> T::*field, Schema<U> item) {
    return Bind(std::move(path), [field, item = std::move(item)](const std::string& p, const xml::Node& n, T& out) {
      for (const auto& child : n.Select(p)) (out.*field).push_back(item.Decode(child));
    });
  }

  T Decode(const xml::Node& node) const {
    T out{};
    for (const auto& b : bindings_) b.apply(b.path, node, out);
    return out;
  }

 private:
  struct Binding {
    std::string path;
    std::function<void(const std::string&, const xml::Node&, T&)> apply;
  };

  template <typename F>
  Schema& Bind(std::string path, F&& fn) {
    bindings_.push_back(Binding{std::move(path), std::forward<F>(fn)});
    return *this;
  }

  std::vector<Binding> bindings_;
};

// Parses a full reply and decodes it from the root element with schema.
// A well-formed reply without the domain's elements decodes as an empty envelope.
template <typename T>
T DecodeReply(const std::string& bytes, const Schema<T>& schema) {
  auto doc = xml::Document::Parse(bytes);
  return schema.Decode(doc.Root());
}

} // namespace junoskit::rpc
