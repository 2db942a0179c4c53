#pragma once

#include <arbor/ui/error.hpp>
#include <arbor/ui/html.hpp>
#include <arbor/ui/log.hpp>
#include <arbor/ui/node.hpp>
#include <arbor/ui/patch.hpp>
#include <arbor/ui/surface.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace arbor::ui {

// Headless surface holding a plain tree in memory. The container at path
// {} has no output of its own; mounted trees are its children.
class MemorySurface final : public TargetSurface {
public:
  struct Stats {
    std::size_t create_element{};
    std::size_t set_text{};
    std::size_t set_attribute{};
    std::size_t remove_attribute{};
    std::size_t insert_child{};
    std::size_t remove_child{};
    std::size_t move_child{};
    std::size_t bind_event{};

    std::size_t mutations() const noexcept {
      return set_text + set_attribute + remove_attribute + insert_child +
             remove_child + move_child + bind_event;
    }
  };

  MemorySurface() : root_{std::make_unique<SurfaceNode>()} {
    root_->kind = NodeKind::Fragment;
  }

  // Appends a fresh copy of `node` to the container.
  Status mount(const Node &node) {
    SurfaceHandle h;
    if (auto st = create_element(node, h); !st.ok()) {
      return st;
    }
    return insert_child({}, root_->children.size(), h);
  }

  std::size_t root_count() const noexcept { return root_->children.size(); }

  // Rebuilds a Node from the live tree. Path {} yields a Fragment of the
  // container's children.
  std::optional<Node> snapshot(const Path &path = {0}) const {
    const auto *n = find(path);
    if (!n) {
      return std::nullopt;
    }
    return to_node(*n);
  }

  std::string to_html() const {
    std::string out;
    for (const auto &ch : root_->children) {
      render_html(out, to_node(*ch));
    }
    return out;
  }

  const Stats &stats() const noexcept { return stats_; }

  void reset_stats() {
    stats_ = Stats{};
    log_.clear();
  }

  const std::vector<std::string> &operations() const noexcept { return log_; }

  std::size_t detached_count() const noexcept { return detached_.size(); }

  Status create_element(const Node &node, SurfaceHandle &out) override {
    ++stats_.create_element;
    auto built = build(node);
    if (!built) {
      return Status::failure(ErrorKind::SurfaceApplicationFailure,
                             "component slots cannot be materialized");
    }
    out = SurfaceHandle{++next_handle_};
    detached_.emplace(out.id, std::move(built));
    log_.push_back(fmt::format("create {}", out.id));
    return Status::success();
  }

  Status set_text(const Path &path, std::string_view value) override {
    ++stats_.set_text;
    auto *n = find(path);
    if (!n || n->kind != NodeKind::Text) {
      return missing("set_text", path, "text node");
    }
    n->text.assign(value);
    log_.push_back(fmt::format("set_text {}", format_path(path)));
    return Status::success();
  }

  Status set_attribute(const Path &path, std::string_view name,
                       std::string_view value) override {
    ++stats_.set_attribute;
    auto *n = find(path);
    if (!n || n->kind != NodeKind::Element) {
      return missing("set_attribute", path, "element");
    }
    n->attributes.insert_or_assign(std::string{name}, std::string{value});
    log_.push_back(fmt::format("set_attribute {} {}", format_path(path), name));
    return Status::success();
  }

  Status remove_attribute(const Path &path, std::string_view name) override {
    ++stats_.remove_attribute;
    auto *n = find(path);
    if (!n || n->kind != NodeKind::Element) {
      return missing("remove_attribute", path, "element");
    }
    n->attributes.erase(std::string{name});
    log_.push_back(
        fmt::format("remove_attribute {} {}", format_path(path), name));
    return Status::success();
  }

  Status insert_child(const Path &parent, std::size_t index,
                      SurfaceHandle child) override {
    ++stats_.insert_child;
    auto *p = find(parent);
    if (!p || !has_children(*p)) {
      return missing("insert_child", parent, "parent");
    }
    if (index > p->children.size()) {
      return out_of_range("insert_child", parent, index, p->children.size());
    }
    const auto it = detached_.find(child.id);
    if (it == detached_.end()) {
      return Status::failure(
          ErrorKind::SurfaceApplicationFailure,
          fmt::format("insert_child: unknown handle {}", child.id));
    }
    p->children.insert(p->children.begin() +
                           static_cast<std::ptrdiff_t>(index),
                       std::move(it->second));
    detached_.erase(it);
    log_.push_back(
        fmt::format("insert_child {} @{}", format_path(parent), index));
    return Status::success();
  }

  Status remove_child(const Path &parent, std::size_t index) override {
    ++stats_.remove_child;
    auto *p = find(parent);
    if (!p || !has_children(*p)) {
      return missing("remove_child", parent, "parent");
    }
    if (index >= p->children.size()) {
      return out_of_range("remove_child", parent, index, p->children.size());
    }
    p->children.erase(p->children.begin() + static_cast<std::ptrdiff_t>(index));
    log_.push_back(
        fmt::format("remove_child {} @{}", format_path(parent), index));
    return Status::success();
  }

  Status move_child(const Path &parent, std::size_t from,
                    std::size_t to) override {
    ++stats_.move_child;
    auto *p = find(parent);
    if (!p || !has_children(*p)) {
      return missing("move_child", parent, "parent");
    }
    const auto n = p->children.size();
    if (from >= n) {
      return out_of_range("move_child", parent, from, n);
    }
    if (to >= n) {
      return out_of_range("move_child", parent, to, n);
    }
    auto moved = std::move(p->children[from]);
    p->children.erase(p->children.begin() + static_cast<std::ptrdiff_t>(from));
    p->children.insert(p->children.begin() + static_cast<std::ptrdiff_t>(to),
                       std::move(moved));
    log_.push_back(fmt::format("move_child {} {} -> {}", format_path(parent),
                               from, to));
    return Status::success();
  }

  Status bind_event(const Path &path, std::string_view name,
                    HandlerRef handler) override {
    ++stats_.bind_event;
    auto *n = find(path);
    if (!n || n->kind != NodeKind::Element) {
      return missing("bind_event", path, "element");
    }
    if (handler) {
      n->events.insert_or_assign(std::string{name}, handler);
    } else {
      n->events.erase(std::string{name});
    }
    log_.push_back(fmt::format("bind_event {} {}={}", format_path(path), name,
                               handler.id));
    return Status::success();
  }

  void discard(SurfaceHandle handle) override {
    if (detached_.erase(handle.id) != 0) {
      log_.push_back(fmt::format("discard {}", handle.id));
    }
  }

private:
  struct SurfaceNode {
    NodeKind kind{NodeKind::Element};
    std::string tag;
    std::string text;
    Attributes attributes;
    EventBindings events;
    std::vector<std::unique_ptr<SurfaceNode>> children;
  };

  static bool has_children(const SurfaceNode &n) {
    return n.kind == NodeKind::Element || n.kind == NodeKind::Fragment;
  }

  static std::unique_ptr<SurfaceNode> build(const Node &node) {
    auto out = std::make_unique<SurfaceNode>();
    out->kind = node.kind();
    switch (node.kind()) {
    case NodeKind::Component:
      return nullptr;
    case NodeKind::Text:
      out->text = node.as_text().value;
      return out;
    case NodeKind::Element: {
      const auto &e = node.as_element();
      out->tag = e.tag;
      out->attributes = e.attributes;
      out->events = e.events;
      break;
    }
    case NodeKind::Fragment:
      break;
    }
    for (const auto &ch : node.children()) {
      auto built = build(ch);
      if (!built) {
        return nullptr;
      }
      out->children.push_back(std::move(built));
    }
    return out;
  }

  static Node to_node(const SurfaceNode &n) {
    std::vector<Node> children;
    children.reserve(n.children.size());
    for (const auto &ch : n.children) {
      children.push_back(to_node(*ch));
    }
    switch (n.kind) {
    case NodeKind::Text:
      return text(n.text);
    case NodeKind::Element: {
      Element e;
      e.tag = n.tag;
      e.attributes = n.attributes;
      e.events = n.events;
      e.children = std::move(children);
      return Node{std::move(e)};
    }
    default:
      return fragment(std::move(children));
    }
  }

  SurfaceNode *find(const Path &path) const {
    SurfaceNode *cur = root_.get();
    for (const auto idx : path) {
      if (idx >= cur->children.size()) {
        return nullptr;
      }
      cur = cur->children[idx].get();
    }
    return cur;
  }

  static Status missing(std::string_view op, const Path &path,
                        std::string_view what) {
    return Status::failure(ErrorKind::SurfaceApplicationFailure,
                           fmt::format("{}: no {} at {}", op, what,
                                       format_path(path)));
  }

  static Status out_of_range(std::string_view op, const Path &path,
                             std::size_t index, std::size_t size) {
    return Status::failure(
        ErrorKind::SurfaceApplicationFailure,
        fmt::format("{}: index {} out of range at {} (size {})", op, index,
                    format_path(path), size));
  }

  std::unique_ptr<SurfaceNode> root_;
  std::unordered_map<std::uint64_t, std::unique_ptr<SurfaceNode>> detached_;
  std::uint64_t next_handle_{0};
  Stats stats_{};
  std::vector<std::string> log_;
};

} // namespace arbor::ui
