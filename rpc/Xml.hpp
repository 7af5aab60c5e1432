// Thin RAII layer over libxml2 trees used by the envelope schemas
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct _xmlDoc;
struct _xmlNode;

namespace junoskit::rpc::xml {

// Non-owning view of an element; valid while its Document lives.
class Node {
 public:
  explicit Node(_xmlNode* n) : node_(n) {}

  // Local name, namespace prefix stripped.
  std::string Name() const;
  // Concatenated text content with surrounding whitespace trimmed.
  std::string Text() const;
  std::optional<std::string> Attr(std::string_view name) const;

  // All child elements with the given local name, document order.
  std::vector<Node> Children(std::string_view name) const;

  // Paths are '/'-separated element names, optionally ending in "@attr".
  // Every matching child is followed at each step.
  //
  // Text of the last element (or last present attribute) at path; nullopt
  // when no element matches. A missing attribute on a present element yields "".
  std::optional<std::string> Lookup(std::string_view path) const;
  // All elements at path, document order.
  std::vector<Node> Select(std::string_view path) const;

 private:
  _xmlNode* node_;
};

class Document {
 public:
  // Throws DecodeError when bytes are not well-formed XML.
  static Document Parse(const std::string& bytes);

  Node Root() const;

 private:
  struct Free { void operator()(_xmlDoc* d) const noexcept; };
  explicit Document(_xmlDoc* d) : doc_(d) {}
  std::unique_ptr<_xmlDoc, Free> doc_;
};

} // namespace junoskit::rpc::xml
