#pragma once

#include <arbor/ui/node.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::ui {

// Child-index path from the root of the diffed tree.
using Path = std::vector<std::size_t>;

struct PatchReplaceNode {
  Path path;
  Node node;

  friend bool operator==(const PatchReplaceNode &,
                         const PatchReplaceNode &) = default;
};

struct PatchUpdateText {
  Path path;
  std::string value;

  friend bool operator==(const PatchUpdateText &,
                         const PatchUpdateText &) = default;
};

struct PatchSetAttribute {
  Path path;
  std::string name;
  std::string value;

  friend bool operator==(const PatchSetAttribute &,
                         const PatchSetAttribute &) = default;
};

struct PatchRemoveAttribute {
  Path path;
  std::string name;

  friend bool operator==(const PatchRemoveAttribute &,
                         const PatchRemoveAttribute &) = default;
};

struct PatchInsertChild {
  Path parent_path;
  std::size_t index{};
  Node node;

  friend bool operator==(const PatchInsertChild &,
                         const PatchInsertChild &) = default;
};

struct PatchRemoveChild {
  Path parent_path;
  std::size_t index{};

  friend bool operator==(const PatchRemoveChild &,
                         const PatchRemoveChild &) = default;
};

// Detach the child at `from`, then insert it at `to` (an index into the
// list with the child already removed).
struct PatchMoveChild {
  Path parent_path;
  std::size_t from{};
  std::size_t to{};

  friend bool operator==(const PatchMoveChild &,
                         const PatchMoveChild &) = default;
};

// A null handler unbinds the event.
struct PatchUpdateEvent {
  Path path;
  std::string name;
  HandlerRef handler;

  friend bool operator==(const PatchUpdateEvent &,
                         const PatchUpdateEvent &) = default;
};

using Patch =
    std::variant<PatchReplaceNode, PatchUpdateText, PatchSetAttribute,
                 PatchRemoveAttribute, PatchInsertChild, PatchRemoveChild,
                 PatchMoveChild, PatchUpdateEvent>;

using PatchList = std::vector<Patch>;

inline const char *patch_name(const Patch &p) {
  return std::visit(
      [](const auto &op) -> const char * {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchReplaceNode>) {
          return "ReplaceNode";
        } else if constexpr (std::is_same_v<T, PatchUpdateText>) {
          return "UpdateText";
        } else if constexpr (std::is_same_v<T, PatchSetAttribute>) {
          return "SetAttribute";
        } else if constexpr (std::is_same_v<T, PatchRemoveAttribute>) {
          return "RemoveAttribute";
        } else if constexpr (std::is_same_v<T, PatchInsertChild>) {
          return "InsertChildAt";
        } else if constexpr (std::is_same_v<T, PatchRemoveChild>) {
          return "RemoveChildAt";
        } else if constexpr (std::is_same_v<T, PatchMoveChild>) {
          return "MoveChild";
        } else {
          return "UpdateEventBinding";
        }
      },
      p);
}

inline std::string format_path(const Path &path) {
  return fmt::format("[{}]", fmt::join(path, ","));
}

inline void dump_path(std::ostream &os, const Path &path) {
  os << format_path(path);
}

inline void dump_node_head(std::ostream &os, const Node &node) {
  switch (node.kind()) {
  case NodeKind::Element:
    os << "<" << node.as_element().tag;
    if (node.key()) {
      os << " key=" << *node.key();
    }
    os << ">";
    break;
  case NodeKind::Text:
    os << '"' << node.as_text().value << '"';
    break;
  case NodeKind::Fragment:
    os << "<>";
    break;
  case NodeKind::Component:
    os << "<component>";
    break;
  }
}

inline void dump_patches(std::ostream &os, const PatchList &patches) {
  for (const auto &p : patches) {
    os << patch_name(p) << " ";
    std::visit(
        [&](const auto &op) {
          using T = std::decay_t<decltype(op)>;
          if constexpr (std::is_same_v<T, PatchReplaceNode>) {
            dump_path(os, op.path);
            os << " -> ";
            dump_node_head(os, op.node);
          } else if constexpr (std::is_same_v<T, PatchUpdateText>) {
            dump_path(os, op.path);
            os << " \"" << op.value << "\"";
          } else if constexpr (std::is_same_v<T, PatchSetAttribute>) {
            dump_path(os, op.path);
            os << " " << op.name << "=" << op.value;
          } else if constexpr (std::is_same_v<T, PatchRemoveAttribute>) {
            dump_path(os, op.path);
            os << " " << op.name;
          } else if constexpr (std::is_same_v<T, PatchInsertChild>) {
            dump_path(os, op.parent_path);
            os << " @" << op.index << " -> ";
            dump_node_head(os, op.node);
          } else if constexpr (std::is_same_v<T, PatchRemoveChild>) {
            dump_path(os, op.parent_path);
            os << " @" << op.index;
          } else if constexpr (std::is_same_v<T, PatchMoveChild>) {
            dump_path(os, op.parent_path);
            os << " " << op.from << " -> " << op.to;
          } else if constexpr (std::is_same_v<T, PatchUpdateEvent>) {
            dump_path(os, op.path);
            os << " " << op.name << "=" << op.handler.id;
          }
        },
        p);
    os << "\n";
  }
}

} // namespace arbor::ui
