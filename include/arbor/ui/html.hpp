#pragma once

#include <arbor/ui/node.hpp>

#include <string>
#include <string_view>

namespace arbor::ui {

inline void append_escaped(std::string &out, std::string_view s,
                           bool in_attribute) {
  for (const char c : s) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      if (in_attribute) {
        out += "&quot;";
      } else {
        out += c;
      }
      break;
    default:
      out += c;
      break;
    }
  }
}

inline void render_html(std::string &out, const Node &node) {
  switch (node.kind()) {
  case NodeKind::Text:
    append_escaped(out, node.as_text().value, false);
    return;
  case NodeKind::Fragment:
    for (const auto &ch : node.children()) {
      render_html(out, ch);
    }
    return;
  case NodeKind::Component:
    out += "<!--component-->";
    return;
  case NodeKind::Element: {
    const auto &e = node.as_element();
    out += '<';
    out += e.tag;
    for (const auto &kv : e.attributes) {
      out += ' ';
      out += kv.first;
      out += "=\"";
      append_escaped(out, kv.second, true);
      out += '"';
    }
    out += '>';
    for (const auto &ch : e.children) {
      render_html(out, ch);
    }
    out += "</";
    out += e.tag;
    out += '>';
    return;
  }
  }
}

// Headless string rendering. Event bindings have no markup form.
inline std::string render_html(const Node &node) {
  std::string out;
  render_html(out, node);
  return out;
}

} // namespace arbor::ui
