#include "Xml.hpp"
#include "core/Errors.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <climits>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace junoskit::rpc::xml {

namespace {

std::string trim(std::string_view sv) {
  auto l = sv.find_first_not_of(" \t\r\n");
  if (l == std::string_view::npos) return {};
  auto r = sv.find_last_not_of(" \t\r\n");
  return std::string(sv.substr(l, r - l + 1));
}

// xmlChar* owned by libxml2's allocator
struct XmlString {
  explicit XmlString(xmlChar* p) : p_(p) {}
  ~XmlString() { if (p_) xmlFree(p_); }
  XmlString(const XmlString&) = delete;
  XmlString& operator=(const XmlString&) = delete;
  const char* c_str() const { return reinterpret_cast<const char*>(p_); }
  explicit operator bool() const { return p_ != nullptr; }
  xmlChar* p_;
};

// Local part of a possibly prefixed name; undeclared prefixes stay in the name.
std::string_view LocalName(const xmlChar* raw) {
  std::string_view n(reinterpret_cast<const char*>(raw));
  auto colon = n.rfind(':');
  return colon == std::string_view::npos ? n : n.substr(colon + 1);
}

bool NameIs(const xmlNode* n, std::string_view name) {
  return n->type == XML_ELEMENT_NODE && n->name && LocalName(n->name) == name;
}

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> out;
  while (!path.empty()) {
    auto slash = path.find('/');
    out.push_back(path.substr(0, slash));
    if (slash == std::string_view::npos) break;
    path.remove_prefix(slash + 1);
  }
  return out;
}

} // namespace

std::string Node::Name() const {
  return node_->name ? std::string(LocalName(node_->name)) : std::string{};
}

std::string Node::Text() const {
  XmlString s(xmlNodeGetContent(node_));
  if (!s) return {};
  return trim(s.c_str());
}

std::optional<std::string> Node::Attr(std::string_view name) const {
  // vendor attributes are often prefixed (junos:celsius); match on the local name
  for (xmlAttr* a = node_->properties; a; a = a->next) {
    if (!a->name || LocalName(a->name) != name) continue;
    XmlString s(xmlNodeListGetString(node_->doc, a->children, 1));
    if (!s) return std::string{};
    return trim(s.c_str());
  }
  return std::nullopt;
}

std::vector<Node> Node::Children(std::string_view name) const {
  std::vector<Node> out;
  for (xmlNode* c = node_->children; c; c = c->next) {
    if (NameIs(c, name)) out.emplace_back(c);
  }
  return out;
}

std::vector<Node> Node::Select(std::string_view path) const {
  auto steps = SplitPath(path);
  if (steps.empty()) return {};
  // every branch is followed, so repeated parents contribute their children too
  std::vector<Node> cur{*this};
  for (const auto& step : steps) {
    std::vector<Node> next;
    for (const auto& n : cur) {
      auto c = n.Children(step);
      next.insert(next.end(), c.begin(), c.end());
    }
    if (next.empty()) return {};
    cur = std::move(next);
  }
  return cur;
}

std::optional<std::string> Node::Lookup(std::string_view path) const {
  std::string_view attr;
  if (auto at = path.rfind('@'); at != std::string_view::npos && (at == 0 || path[at - 1] == '/')) {
    attr = path.substr(at + 1);
    path = path.substr(0, at == 0 ? 0 : at - 1);
  }

  std::vector<Node> matches = path.empty() ? std::vector<Node>{*this} : Select(path);
  if (matches.empty()) return std::nullopt;

  // repeated elements overwrite each other; the last occurrence wins
  if (attr.empty()) return matches.back().Text();
  for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
    if (auto v = it->Attr(attr)) return v;
  }
  return std::string{};
}

void Document::Free::operator()(xmlDoc* d) const noexcept {
  if (d) xmlFreeDoc(d);
}

Document Document::Parse(const std::string& bytes) {
  static std::once_flag init;
  std::call_once(init, [] { xmlInitParser(); });

  if (bytes.size() > static_cast<size_t>(INT_MAX)) throw DecodeError("reply too large");

  std::unique_ptr<xmlParserCtxt, void (*)(xmlParserCtxtPtr)> ctxt(xmlNewParserCtxt(), xmlFreeParserCtxt);
  if (!ctxt) throw DecodeError("failed to allocate xml parser");

  const int opts = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_NOBLANKS;
  xmlDoc* doc = xmlCtxtReadMemory(ctxt.get(), bytes.data(), static_cast<int>(bytes.size()),
                                  "reply.xml", nullptr, opts);
  if (!doc) {
    std::string msg = "malformed xml";
    if (auto err = xmlCtxtGetLastError(ctxt.get()); err && err->message) {
      msg += ": " + trim(err->message) + " (line " + std::to_string(err->line) + ")";
    }
    throw DecodeError(msg);
  }
  Document out(doc);
  if (!xmlDocGetRootElement(doc)) throw DecodeError("xml reply has no root element");
  return out;
}

Node Document::Root() const {
  return Node(xmlDocGetRootElement(doc_.get()));
}

} // namespace junoskit::rpc::xml
