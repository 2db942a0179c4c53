#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::ui {

struct ComponentDef;

using PropValue = std::variant<std::string, std::int64_t, double, bool>;

using Props = std::unordered_map<std::string, PropValue>;

using Attributes = std::map<std::string, std::string>;

// Opaque reference to an event handler owned by the component runtime.
// id 0 means "no handler".
struct HandlerRef {
  std::uint64_t id{};

  explicit operator bool() const noexcept { return id != 0; }

  friend bool operator==(const HandlerRef &, const HandlerRef &) = default;
};

using EventBindings = std::map<std::string, HandlerRef>;

class Node;

struct Element {
  std::string tag;
  Attributes attributes;
  std::vector<Node> children;
  std::optional<std::string> key;
  EventBindings events;
};

struct Text {
  std::string value;
};

struct Fragment {
  std::vector<Node> children;
};

struct ComponentSlot {
  std::shared_ptr<const ComponentDef> def;
  Props props;
  std::optional<std::string> key;
};

enum class NodeKind { Element, Text, Fragment, Component };

// Immutable once built. A render pass always produces a fresh tree.
class Node {
public:
  using Variant = std::variant<Element, Text, Fragment, ComponentSlot>;

  Node() : value_{Fragment{}} {}
  Node(Element e) : value_{std::move(e)} {}
  Node(Text t) : value_{std::move(t)} {}
  Node(Fragment f) : value_{std::move(f)} {}
  Node(ComponentSlot c) : value_{std::move(c)} {}

  NodeKind kind() const noexcept {
    return static_cast<NodeKind>(value_.index());
  }

  bool is_element() const noexcept {
    return std::holds_alternative<Element>(value_);
  }
  bool is_text() const noexcept { return std::holds_alternative<Text>(value_); }
  bool is_fragment() const noexcept {
    return std::holds_alternative<Fragment>(value_);
  }
  bool is_component() const noexcept {
    return std::holds_alternative<ComponentSlot>(value_);
  }

  const Element &as_element() const { return std::get<Element>(value_); }
  const Text &as_text() const { return std::get<Text>(value_); }
  const Fragment &as_fragment() const { return std::get<Fragment>(value_); }
  const ComponentSlot &as_component() const {
    return std::get<ComponentSlot>(value_);
  }

  const Variant &variant() const noexcept { return value_; }

  // Children of an element or fragment; empty for text and slots.
  const std::vector<Node> &children() const {
    static const std::vector<Node> none;
    if (const auto *e = std::get_if<Element>(&value_)) {
      return e->children;
    }
    if (const auto *f = std::get_if<Fragment>(&value_)) {
      return f->children;
    }
    return none;
  }

  const std::optional<std::string> &key() const {
    static const std::optional<std::string> none;
    if (const auto *e = std::get_if<Element>(&value_)) {
      return e->key;
    }
    if (const auto *c = std::get_if<ComponentSlot>(&value_)) {
      return c->key;
    }
    return none;
  }

private:
  Variant value_;
};

inline const char *to_string(NodeKind kind) {
  switch (kind) {
  case NodeKind::Element:
    return "Element";
  case NodeKind::Text:
    return "Text";
  case NodeKind::Fragment:
    return "Fragment";
  case NodeKind::Component:
    return "Component";
  }
  return "?";
}

namespace detail {

inline bool nodes_equal(const Node &a, const Node &b, bool compare_keys);

inline bool children_equal(const std::vector<Node> &a,
                           const std::vector<Node> &b, bool compare_keys) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!nodes_equal(a[i], b[i], compare_keys)) {
      return false;
    }
  }
  return true;
}

inline bool nodes_equal(const Node &a, const Node &b, bool compare_keys) {
  if (a.kind() != b.kind()) {
    return false;
  }
  switch (a.kind()) {
  case NodeKind::Text:
    return a.as_text().value == b.as_text().value;
  case NodeKind::Fragment:
    return children_equal(a.children(), b.children(), compare_keys);
  case NodeKind::Element: {
    const auto &x = a.as_element();
    const auto &y = b.as_element();
    if (x.tag != y.tag || x.attributes != y.attributes ||
        x.events != y.events) {
      return false;
    }
    if (compare_keys && x.key != y.key) {
      return false;
    }
    return children_equal(x.children, y.children, compare_keys);
  }
  case NodeKind::Component: {
    const auto &x = a.as_component();
    const auto &y = b.as_component();
    if (compare_keys && x.key != y.key) {
      return false;
    }
    return x.def == y.def && x.props == y.props;
  }
  }
  return false;
}

} // namespace detail

inline bool operator==(const Node &a, const Node &b) {
  return detail::nodes_equal(a, b, true);
}

// Rendered-structure equality. Sibling keys are identity, not output, so
// they are ignored here.
inline bool structurally_equal(const Node &a, const Node &b) {
  return detail::nodes_equal(a, b, false);
}

class ElementBuilder {
public:
  explicit ElementBuilder(std::string tag) { node_.tag = std::move(tag); }

  ElementBuilder &key(std::string k) {
    node_.key = std::move(k);
    return *this;
  }

  ElementBuilder &attr(std::string name, std::string value) {
    node_.attributes.insert_or_assign(std::move(name), std::move(value));
    return *this;
  }

  ElementBuilder &attr(std::string name, const char *value) {
    return attr(std::move(name), std::string{value});
  }

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool>>>
  ElementBuilder &attr(std::string name, Int value) {
    return attr(std::move(name), std::to_string(value));
  }

  ElementBuilder &on(std::string event, HandlerRef handler) {
    node_.events.insert_or_assign(std::move(event), handler);
    return *this;
  }

  template <typename F> ElementBuilder &children(F &&fn) {
    ChildCollector collector;
    fn(collector);
    node_.children = std::move(collector.children);
    return *this;
  }

  ElementBuilder &children(std::initializer_list<Node> nodes) {
    node_.children.assign(nodes.begin(), nodes.end());
    return *this;
  }

  ElementBuilder &children(std::vector<Node> nodes) {
    node_.children = std::move(nodes);
    return *this;
  }

  ElementBuilder &child(Node node) {
    node_.children.push_back(std::move(node));
    return *this;
  }

  Node build() const & { return Node{node_}; }

  Node build() && { return Node{std::move(node_)}; }

private:
  struct ChildCollector {
    std::vector<Node> children;

    void add(Node node) { children.push_back(std::move(node)); }
  };

  Element node_;
};

class ComponentBuilder {
public:
  explicit ComponentBuilder(std::shared_ptr<const ComponentDef> def) {
    slot_.def = std::move(def);
  }

  ComponentBuilder &key(std::string k) {
    slot_.key = std::move(k);
    return *this;
  }

  ComponentBuilder &prop(std::string name, std::string value) {
    slot_.props.insert_or_assign(std::move(name), PropValue{std::move(value)});
    return *this;
  }

  ComponentBuilder &prop(std::string name, const char *value) {
    return prop(std::move(name), std::string{value});
  }

  ComponentBuilder &prop(std::string name, std::int64_t value) {
    slot_.props.insert_or_assign(std::move(name), PropValue{value});
    return *this;
  }

  ComponentBuilder &prop(std::string name, double value) {
    slot_.props.insert_or_assign(std::move(name), PropValue{value});
    return *this;
  }

  ComponentBuilder &prop(std::string name, bool value) {
    slot_.props.insert_or_assign(std::move(name), PropValue{value});
    return *this;
  }

  template <typename Int,
            typename = std::enable_if_t<
                std::is_integral_v<std::remove_reference_t<Int>> &&
                !std::is_same_v<std::remove_reference_t<Int>, bool> &&
                !std::is_same_v<std::remove_reference_t<Int>, std::int64_t>>>
  ComponentBuilder &prop(std::string name, Int value) {
    return prop(std::move(name), static_cast<std::int64_t>(value));
  }

  Node build() const & { return Node{slot_}; }

  Node build() && { return Node{std::move(slot_)}; }

private:
  ComponentSlot slot_;
};

inline ElementBuilder element(std::string tag) {
  return ElementBuilder{std::move(tag)};
}

inline Node text(std::string value) { return Node{Text{std::move(value)}}; }

inline Node fragment(std::initializer_list<Node> children) {
  return Node{Fragment{std::vector<Node>(children.begin(), children.end())}};
}

inline Node fragment(std::vector<Node> children) {
  return Node{Fragment{std::move(children)}};
}

inline ComponentBuilder component(std::shared_ptr<const ComponentDef> def) {
  return ComponentBuilder{std::move(def)};
}

inline std::size_t count_nodes(const Node &node) {
  std::size_t n = 1;
  for (const auto &ch : node.children()) {
    n += count_nodes(ch);
  }
  return n;
}

inline void dump_tree(std::ostream &os, const Node &node,
                      int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  switch (node.kind()) {
  case NodeKind::Text:
    os << '"' << node.as_text().value << "\"\n";
    return;
  case NodeKind::Component: {
    const auto &c = node.as_component();
    os << "<component>";
    if (c.key) {
      os << " key=" << *c.key;
    }
    os << "\n";
    return;
  }
  case NodeKind::Fragment:
    os << "Fragment\n";
    break;
  case NodeKind::Element: {
    const auto &e = node.as_element();
    os << e.tag;
    if (e.key) {
      os << "#" << *e.key;
    }
    if (!e.attributes.empty()) {
      os << " {";
      bool first = true;
      for (const auto &kv : e.attributes) {
        if (!std::exchange(first, false)) {
          os << ", ";
        }
        os << kv.first << ": " << kv.second;
      }
      os << "}";
    }
    for (const auto &kv : e.events) {
      os << " @" << kv.first << "=" << kv.second.id;
    }
    os << "\n";
    break;
  }
  }

  for (const auto &child : node.children()) {
    dump_tree(os, child, indent_spaces + 2);
  }
}

} // namespace arbor::ui
