#pragma once

#include <arbor/ui/error.hpp>
#include <arbor/ui/log.hpp>
#include <arbor/ui/node.hpp>
#include <arbor/ui/patch.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace arbor::ui {

// Detached subtree produced by create_element and consumed by insert_child.
struct SurfaceHandle {
  std::uint64_t id{};

  explicit operator bool() const noexcept { return id != 0; }

  friend bool operator==(const SurfaceHandle &, const SurfaceHandle &) = default;
};

// Capability the host provides: a live UI tree, a string builder, a test
// double. Paths are child-index paths from the surface container. Every
// primitive reports failure instead of partially mutating.
class TargetSurface {
public:
  virtual ~TargetSurface() = default;

  virtual Status create_element(const Node &node, SurfaceHandle &out) = 0;
  virtual Status set_text(const Path &path, std::string_view value) = 0;
  virtual Status set_attribute(const Path &path, std::string_view name,
                               std::string_view value) = 0;
  virtual Status remove_attribute(const Path &path, std::string_view name) = 0;
  virtual Status insert_child(const Path &parent, std::size_t index,
                              SurfaceHandle child) = 0;
  virtual Status remove_child(const Path &parent, std::size_t index) = 0;
  virtual Status move_child(const Path &parent, std::size_t from,
                            std::size_t to) = 0;
  virtual Status bind_event(const Path &path, std::string_view name,
                            HandlerRef handler) = 0;

  // Drops a created subtree that was never inserted.
  virtual void discard(SurfaceHandle) {}
};

struct ApplyResult {
  std::size_t applied{};
  std::optional<Error> error;

  bool ok() const noexcept { return !error.has_value(); }
};

namespace detail {

inline Path join_path(const Path &base, const Path &rel) {
  Path out;
  out.reserve(base.size() + rel.size());
  out.insert(out.end(), base.begin(), base.end());
  out.insert(out.end(), rel.begin(), rel.end());
  return out;
}

inline Status insert_subtree(TargetSurface &surface, const Path &parent,
                             std::size_t index, const Node &node) {
  SurfaceHandle handle;
  if (auto st = surface.create_element(node, handle); !st.ok()) {
    return st;
  }
  auto st = surface.insert_child(parent, index, handle);
  if (!st.ok()) {
    surface.discard(handle);
  }
  return st;
}

inline Status apply_one(TargetSurface &surface, const Patch &patch,
                        const Path &at) {
  return std::visit(
      [&](const auto &op) -> Status {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, PatchReplaceNode>) {
          const auto abs = join_path(at, op.path);
          if (abs.empty()) {
            return Status::failure(ErrorKind::SurfaceApplicationFailure,
                                   "the surface container cannot be replaced");
          }
          Path parent{abs.begin(), abs.end() - 1};
          const auto index = abs.back();
          // Insert before removing: a failed insert leaves the old node in
          // place.
          if (auto st = insert_subtree(surface, parent, index, op.node);
              !st.ok()) {
            return st;
          }
          return surface.remove_child(parent, index + 1);
        } else if constexpr (std::is_same_v<T, PatchUpdateText>) {
          return surface.set_text(join_path(at, op.path), op.value);
        } else if constexpr (std::is_same_v<T, PatchSetAttribute>) {
          return surface.set_attribute(join_path(at, op.path), op.name,
                                       op.value);
        } else if constexpr (std::is_same_v<T, PatchRemoveAttribute>) {
          return surface.remove_attribute(join_path(at, op.path), op.name);
        } else if constexpr (std::is_same_v<T, PatchInsertChild>) {
          return insert_subtree(surface, join_path(at, op.parent_path),
                                op.index, op.node);
        } else if constexpr (std::is_same_v<T, PatchRemoveChild>) {
          return surface.remove_child(join_path(at, op.parent_path), op.index);
        } else if constexpr (std::is_same_v<T, PatchMoveChild>) {
          return surface.move_child(join_path(at, op.parent_path), op.from,
                                    op.to);
        } else {
          return surface.bind_event(join_path(at, op.path), op.name,
                                    op.handler);
        }
      },
      patch);
}

} // namespace detail

// Applies patches strictly in order and stops at the first failing
// primitive. `at` is the surface path of the diffed tree's root.
inline ApplyResult apply(TargetSurface &surface, const PatchList &patches,
                         const Path &at = {}) {
  ApplyResult result;
  for (const auto &p : patches) {
    auto st = detail::apply_one(surface, p, at);
    if (!st.ok()) {
      auto err = *st.error();
      err.kind = ErrorKind::SurfaceApplicationFailure;
      err.message = fmt::format("{} failed after {} of {} patches: {}",
                                patch_name(p), result.applied, patches.size(),
                                err.message);
      result.error = std::move(err);
      return result;
    }
    logger()->trace("applied {} at {}", patch_name(p), format_path(at));
    ++result.applied;
  }
  return result;
}

} // namespace arbor::ui
