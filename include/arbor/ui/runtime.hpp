#pragma once

#include <arbor/ui/component.hpp>
#include <arbor/ui/config.hpp>
#include <arbor/ui/diff.hpp>
#include <arbor/ui/error.hpp>
#include <arbor/ui/html.hpp>
#include <arbor/ui/log.hpp>
#include <arbor/ui/node.hpp>
#include <arbor/ui/patch.hpp>
#include <arbor/ui/scheduler.hpp>
#include <arbor/ui/store.hpp>
#include <arbor/ui/surface.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arbor::ui {

namespace detail {

// what() of the exception being handled; a fixed text for anything not
// derived from std::exception.
inline std::string current_exception_message() {
  try {
    throw;
  } catch (const std::exception &e) {
    return e.what();
  } catch (...) {
    return "non-standard exception";
  }
}

} // namespace detail

struct AppliedPatches {
  ComponentId component{};
  std::string component_name;
  // Surface path the patch paths are relative to.
  Path at;
  PatchList patches;
};

struct FlushReport {
  std::size_t rendered{};
  std::size_t skipped{};
  std::vector<AppliedPatches> patches;
  // Failures no error boundary took.
  std::vector<Error> errors;
  // Failures delivered to an error boundary.
  std::vector<Error> handled;
  std::vector<Error> warnings;

  bool ok() const noexcept { return errors.empty(); }

  std::size_t patch_count() const noexcept {
    std::size_t n = 0;
    for (const auto &a : patches) {
      n += a.patches.size();
    }
    return n;
  }

  void merge(FlushReport other) {
    rendered += other.rendered;
    skipped += other.skipped;
    for (auto &p : other.patches) {
      patches.push_back(std::move(p));
    }
    for (auto &e : other.errors) {
      errors.push_back(std::move(e));
    }
    for (auto &e : other.handled) {
      handled.push_back(std::move(e));
    }
    for (auto &e : other.warnings) {
      warnings.push_back(std::move(e));
    }
  }
};

// One mounted component tree bound to a target surface. Owns the store,
// the scheduler and every component instance. The root component's
// subtree lives at index 0 of the surface container.
class Root {
public:
  explicit Root(TargetSurface &surface, RootOptions options = {})
      : surface_{surface}, options_{std::move(options)} {
    store_.set_dirty_sink([this](ComponentId id) { scheduler_.mark_dirty(id); });
    store_.set_error_sink(
        [this](const Error &e) { pending_errors_.push_back(e); });
  }

  Root(const Root &) = delete;
  Root &operator=(const Root &) = delete;

  ~Root() {
    if (alive(root_)) {
      Pass pass;
      PassScope scope{*this, pass};
      release_instance(root_);
    }
  }

  Store &store() noexcept { return store_; }

  const Scheduler &scheduler() const noexcept { return scheduler_; }

  SchedulerState state() const noexcept { return scheduler_.state(); }

  const RootOptions &options() const noexcept { return options_; }

  void set_flush_requested(Scheduler::FlushRequest fn) {
    scheduler_.set_flush_requested(std::move(fn));
  }

  ComponentId root_id() const noexcept { return root_; }

  bool alive(ComponentId id) const {
    if (!id.valid() || id.index >= instances_.size()) {
      return false;
    }
    const auto &inst = *instances_[id.index];
    return inst.generation == id.generation &&
           inst.state != Lifecycle::Unmounted;
  }

  Lifecycle lifecycle(ComponentId id) const {
    return alive(id) ? instances_[id.index]->state : Lifecycle::Unmounted;
  }

  std::size_t render_count(ComponentId id) const {
    return alive(id) ? instances_[id.index]->renders : 0;
  }

  std::size_t component_count() const noexcept { return live_instances_; }

  // First live instance of the named definition, in arena order.
  std::optional<ComponentId> find_component(const std::string &name) const {
    for (const auto &inst : instances_) {
      if (inst->state != Lifecycle::Unmounted && inst->def &&
          inst->def->name == name) {
        return ComponentId{inst->index, inst->generation};
      }
    }
    return std::nullopt;
  }

  // The composed tree currently on the surface.
  std::optional<Node> tree() const {
    if (!alive(root_)) {
      return std::nullopt;
    }
    return compose(root_);
  }

  // Initial render, applied synchronously as one InsertChildAt against the
  // surface container.
  FlushReport mount(std::shared_ptr<const ComponentDef> def, Props props = {}) {
    FlushReport report;
    if (alive(root_)) {
      report.merge(unmount());
    }

    Pass pass;
    pass.report = &report;
    PassScope scope{*this, pass};

    root_ = allocate(std::move(def), std::move(props), ComponentId{}, Path{0},
                     0);
    render(root_);
    const PatchList patches{PatchInsertChild{Path{}, 0, compose(root_)}};
    root_attached_ = commit(root_, Path{}, patches);

    run_effects();
    deliver_errors();
    logger()->debug("mounted '{}' ({} component(s))", name_of(root_),
                    live_instances_);
    return report;
  }

  FlushReport unmount() {
    FlushReport report;
    if (!alive(root_)) {
      return report;
    }
    Pass pass;
    pass.report = &report;
    PassScope scope{*this, pass};
    if (root_attached_) {
      commit(root_, Path{}, PatchList{PatchRemoveChild{Path{}, 0}});
    }
    release_instance(root_);
    root_ = ComponentId{};
    root_attached_ = false;
    deliver_errors();
    return report;
  }

  // Renders every component dirtied before the call, once each, parent
  // before child. Work queued during the pass waits for the next call.
  FlushReport flush() {
    FlushReport report;
    if (scheduler_.state() != SchedulerState::Pending &&
        pending_errors_.empty()) {
      return report;
    }

    Pass pass;
    pass.report = &report;
    PassScope scope{*this, pass};

    const auto batch = scheduler_.begin_flush([this](ComponentId id) {
      return alive(id) ? instances_[id.index]->depth
                       : std::numeric_limits<std::size_t>::max();
    });
    pass.batch.insert(batch.begin(), batch.end());
    if (!batch.empty()) {
      logger()->debug("flush: {} dirty component(s)", batch.size());
    }

    for (const auto id : batch) {
      if (!alive(id)) {
        ++report.skipped;
        logger()->debug("flush: skipping component {} (unmounted)", id.index);
        continue;
      }
      if (pass.done.contains(id) || pass.failed.contains(id)) {
        continue;
      }
      update(id);
    }

    run_effects();
    deliver_errors();

    logger()->debug("flush: rendered {}, {} patch(es), {} error(s)",
                    report.rendered, report.patch_count(),
                    report.errors.size());
    return report;
  }

  // Flushes until the scheduler is idle or the configured pass budget is
  // spent.
  FlushReport flush_until_idle() {
    FlushReport report;
    for (std::size_t i = 0; i < options_.max_flush_passes; ++i) {
      if (scheduler_.state() == SchedulerState::Idle &&
          pending_errors_.empty()) {
        break;
      }
      report.merge(flush());
    }
    if (scheduler_.state() != SchedulerState::Idle) {
      logger()->warn("still {} after {} flush passes",
                     to_string(scheduler_.state()), options_.max_flush_passes);
    }
    return report;
  }

  // Invokes the handler bound to `name` on the element at `path` (relative
  // to the root node), bubbling to ancestors. Returns whether a handler ran.
  bool dispatch_event(const Path &path, const std::string &name,
                      Event event = {}) {
    if (!alive(root_)) {
      return false;
    }
    const auto tree = compose(root_);
    auto cur = path;
    for (;;) {
      if (const auto *n = node_at(tree, cur); n && n->is_element()) {
        const auto &events = n->as_element().events;
        const auto it = events.find(name);
        if (it != events.end() && it->second) {
          if (const auto *fn = handlers_.find(it->second)) {
            auto handler = *fn;
            event.name = name;
            event.target = path;
            try {
              handler(event);
            } catch (...) {
              Error err{ErrorKind::RenderPanic, handlers_.owner(it->second),
                        fmt::format("handler for '{}' failed: {}", name,
                                    detail::current_exception_message())};
              logger()->error("{}", err.message);
              pending_errors_.push_back(std::move(err));
            }
            return true;
          }
        }
      }
      if (cur.empty()) {
        break;
      }
      cur.pop_back();
    }
    return false;
  }

private:
  struct Pass;

  // Binds a pass to the root for one entry point. Unbinding and closing
  // the scheduler's flush happen on every exit path.
  class PassScope {
  public:
    PassScope(Root &root, Pass &pass) : root_{root} { root_.pass_ = &pass; }

    PassScope(const PassScope &) = delete;
    PassScope &operator=(const PassScope &) = delete;

    ~PassScope() {
      root_.pass_ = nullptr;
      root_.scheduler_.end_flush();
    }

  private:
    Root &root_;
  };

  struct Instance {
    std::uint32_t index{};
    std::uint32_t generation{1};
    Lifecycle state{Lifecycle::Unmounted};
    std::shared_ptr<const ComponentDef> def;
    Props props;
    ComponentId parent{};
    // Position inside the parent's composed tree (the surface container
    // for the root).
    Path position;
    std::size_t depth{};
    Node raw;
    // Owned children, by position in `raw`.
    std::map<Path, ComponentId> children;
    std::unordered_map<std::string, ComponentId> by_slot;
    Hooks hooks;
    std::size_t renders{};
    bool needs_resync{};
  };

  struct Failure {
    Error error;
    std::shared_ptr<const ComponentDef> boundary;
  };

  struct Pass {
    FlushReport *report{};
    std::unordered_set<ComponentId> batch;
    std::unordered_set<ComponentId> done;
    std::unordered_set<ComponentId> failed;
    std::vector<ComponentId> effects_due;
    std::vector<Failure> failures;
  };

  struct SlotRef {
    std::string key;
    Path position;
    const ComponentSlot *slot{};
  };

  Instance &at(ComponentId id) { return *instances_[id.index]; }
  const Instance &at(ComponentId id) const { return *instances_[id.index]; }

  std::string name_of(ComponentId id) const {
    if (!id.valid() || id.index >= instances_.size()) {
      return "?";
    }
    const auto &inst = at(id);
    return inst.def ? inst.def->name : std::string{"?"};
  }

  ComponentId allocate(std::shared_ptr<const ComponentDef> def, Props props,
                       ComponentId parent, Path position, std::size_t depth) {
    Instance *inst = nullptr;
    if (!free_.empty()) {
      inst = instances_[free_.back()].get();
      free_.pop_back();
    } else {
      instances_.push_back(std::make_unique<Instance>());
      inst = instances_.back().get();
      inst->index = static_cast<std::uint32_t>(instances_.size() - 1);
    }
    inst->state = Lifecycle::Mounted;
    inst->def = std::move(def);
    inst->props = std::move(props);
    inst->parent = parent;
    inst->position = std::move(position);
    inst->depth = depth;
    inst->raw = Node{};
    inst->renders = 0;
    inst->needs_resync = false;
    ++live_instances_;
    return ComponentId{inst->index, inst->generation};
  }

  Path absolute_path(ComponentId id) const {
    std::vector<const Path *> chain;
    for (auto cur = id; cur.valid(); cur = at(cur).parent) {
      chain.push_back(&at(cur).position);
    }
    Path out;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
      out.insert(out.end(), (*it)->begin(), (*it)->end());
    }
    return out;
  }

  static const Node *node_at(const Node &root, const Path &path) {
    const Node *cur = &root;
    for (const auto idx : path) {
      const auto &ch = cur->children();
      if (idx >= ch.size()) {
        return nullptr;
      }
      cur = &ch[idx];
    }
    return cur;
  }

  // Expands component slots into the children's current output.
  Node compose(ComponentId id) const {
    Path path;
    return compose_node(at(id), at(id).raw, path);
  }

  Node compose_node(const Instance &inst, const Node &node, Path &path) const {
    switch (node.kind()) {
    case NodeKind::Text:
      return node;
    case NodeKind::Component: {
      const auto it = inst.children.find(path);
      if (it == inst.children.end() || !alive(it->second)) {
        return Node{};
      }
      return compose(it->second);
    }
    case NodeKind::Fragment:
    case NodeKind::Element:
      break;
    }

    std::vector<Node> children;
    children.reserve(node.children().size());
    for (std::size_t i = 0; i < node.children().size(); ++i) {
      path.push_back(i);
      children.push_back(compose_node(inst, node.children()[i], path));
      path.pop_back();
    }
    if (node.is_fragment()) {
      return fragment(std::move(children));
    }
    auto e = node.as_element();
    e.children = std::move(children);
    return Node{std::move(e)};
  }

  // Slot identity: one segment per level, the sibling key when present
  // and unique, otherwise the index.
  static void collect_slots(const Node &node, Path &path,
                            const std::string &prefix,
                            std::vector<SlotRef> &out) {
    if (node.is_component()) {
      out.push_back(SlotRef{prefix, path, &node.as_component()});
      return;
    }
    const auto &children = node.children();
    std::unordered_set<std::string> seen;
    for (std::size_t i = 0; i < children.size(); ++i) {
      const auto &k = children[i].key();
      std::string segment;
      if (k && seen.insert(*k).second) {
        segment = prefix + "/k:" + *k;
      } else {
        segment = prefix + "/i:" + std::to_string(i);
      }
      path.push_back(i);
      collect_slots(children[i], path, segment, out);
      path.pop_back();
    }
  }

  bool render(ComponentId id) {
    auto &inst = at(id);
    if (!inst.def || !inst.def->render) {
      fail(id, ErrorKind::RenderPanic, "component has no render function");
      return false;
    }
    inst.state = Lifecycle::Updating;
    store_.clear_subscriptions(id);
    inst.hooks.effects_due.clear();

    Node raw;
    try {
      Store::TrackingScope scope{store_, id};
      RenderContext ctx{store_, handlers_, id, inst.hooks,
                        [this, id](const std::string &slot) {
                          return find_context(id, slot);
                        }};
      raw = inst.def->render(inst.props, ctx);
    } catch (...) {
      inst.state = Lifecycle::Mounted;
      fail(id, ErrorKind::RenderPanic,
           fmt::format("render of '{}' failed: {}", name_of(id),
                       detail::current_exception_message()));
      return false;
    }

    ++inst.renders;
    pass_->done.insert(id);
    if (pass_->report) {
      ++pass_->report->rendered;
    }
    logger()->debug("rendered '{}' (component {})", name_of(id), id.index);

    reconcile_children(id, raw);
    inst.raw = std::move(raw);
    inst.state = Lifecycle::Mounted;
    if (!inst.hooks.effects_due.empty()) {
      pass_->effects_due.push_back(id);
    }
    return true;
  }

  // Nearest ancestor's provided cell for `slot`.
  std::optional<SignalId> find_context(ComponentId id,
                                       const std::string &slot) const {
    for (auto cur = at(id).parent; alive(cur); cur = at(cur).parent) {
      const auto &provided = at(cur).hooks.provided;
      const auto it = provided.find(slot);
      if (it != provided.end() && store_.alive(it->second)) {
        return it->second;
      }
    }
    return std::nullopt;
  }

  // Matches the slots of a fresh render against the existing children:
  // same slot and definition updates, anything else mounts or unmounts.
  void reconcile_children(ComponentId id, const Node &raw) {
    auto &inst = at(id);
    std::vector<SlotRef> slots;
    Path path;
    collect_slots(raw, path, std::string{}, slots);

    auto previous = std::move(inst.by_slot);
    inst.by_slot.clear();
    std::map<Path, ComponentId> children;

    for (const auto &s : slots) {
      ComponentId child{};
      const auto it = previous.find(s.key);
      if (it != previous.end() && alive(it->second) &&
          at(it->second).def == s.slot->def) {
        child = it->second;
        previous.erase(it);
        auto &c = at(child);
        c.position = s.position;
        c.depth = inst.depth + 1;
        const bool props_changed = c.props != s.slot->props;
        if (props_changed) {
          c.props = s.slot->props;
        }
        const bool dirty =
            pass_->batch.contains(child) && !pass_->done.contains(child);
        if (props_changed || dirty) {
          render(child);
        }
      } else {
        child = allocate(s.slot->def, s.slot->props, id, s.position,
                         inst.depth + 1);
        render(child);
      }
      inst.by_slot.insert_or_assign(s.key, child);
      children.insert_or_assign(s.position, child);
    }

    for (const auto &kv : previous) {
      if (alive(kv.second)) {
        release_instance(kv.second);
      }
    }
    inst.children = std::move(children);
  }

  bool subtree_needs_resync(ComponentId id) const {
    const auto &inst = at(id);
    if (inst.needs_resync) {
      return true;
    }
    for (const auto &kv : inst.children) {
      if (alive(kv.second) && subtree_needs_resync(kv.second)) {
        return true;
      }
    }
    return false;
  }

  void clear_resync(ComponentId id) {
    auto &inst = at(id);
    inst.needs_resync = false;
    for (const auto &kv : inst.children) {
      if (alive(kv.second)) {
        clear_resync(kv.second);
      }
    }
  }

  // One dirty component's turn: render, diff against what the surface
  // shows, apply at the component's position.
  void update(ComponentId id) {
    if (id != root_ && !root_attached_) {
      // Nothing is on the surface yet; the root's re-insert carries this
      // component's output.
      if (!pass_->done.contains(root_) && !pass_->failed.contains(root_)) {
        update(root_);
      }
      return;
    }
    const auto before = compose(id);
    const bool resync = subtree_needs_resync(id);
    if (!render(id)) {
      return;
    }
    const auto after = compose(id);

    PatchList patches;
    if (resync && id == root_ && !root_attached_) {
      logger()->warn("re-inserting '{}' after a failed mount", name_of(id));
      clear_resync(id);
      root_attached_ = commit(
          id, Path{}, PatchList{PatchInsertChild{Path{}, 0, after}});
      return;
    }
    if (resync) {
      logger()->warn("resyncing '{}' after an earlier surface failure",
                     name_of(id));
      clear_resync(id);
      patches.push_back(PatchReplaceNode{Path{}, after});
    } else {
      DiffReport dr;
      patches = diff(before, after, &dr);
      report_duplicate_keys(id, dr);
    }
    commit(id, absolute_path(id), patches);
  }

  void report_duplicate_keys(ComponentId id, const DiffReport &dr) {
    if (!options_.warn_on_duplicate_keys || !pass_->report) {
      return;
    }
    for (const auto &d : dr.duplicate_keys) {
      Error w{ErrorKind::DuplicateKey, id,
              fmt::format("duplicate key '{}' at {} index {} in '{}'", d.key,
                          format_path(d.parent_path), d.index, name_of(id))};
      logger()->warn("{}", w.message);
      pass_->report->warnings.push_back(std::move(w));
    }
  }

  // Returns false when the surface rejected a patch; the component is
  // then resynced on its next render.
  bool commit(ComponentId id, const Path &at_path, const PatchList &patches) {
    if (patches.empty()) {
      return true;
    }
    const auto result = apply(surface_, patches, at_path);
    if (options_.record_patches && pass_->report) {
      pass_->report->patches.push_back(
          AppliedPatches{id, name_of(id), at_path, patches});
    }
    if (!result.ok()) {
      at(id).needs_resync = true;
      fail(id, result.error->kind, result.error->message);
      return false;
    }
    return true;
  }

  std::shared_ptr<const ComponentDef> boundary_for(ComponentId id) const {
    for (auto cur = id; cur.valid() && cur.index < instances_.size();
         cur = at(cur).parent) {
      const auto &inst = at(cur);
      if (inst.generation != cur.generation) {
        break;
      }
      if (inst.def && inst.def->on_error) {
        return inst.def;
      }
    }
    return nullptr;
  }

  void fail(ComponentId id, ErrorKind kind, std::string message) {
    Error err{kind, id, std::move(message)};
    logger()->error("{}", err.message);
    pass_->failed.insert(id);
    pass_->failures.push_back(Failure{std::move(err), boundary_for(id)});
  }

  // Failures are routed once the pass is over, never in the middle of it.
  void deliver_errors() {
    auto failures = std::exchange(pass_->failures, {});
    auto loose = std::exchange(pending_errors_, {});
    for (auto &e : loose) {
      failures.push_back(Failure{std::move(e), nullptr});
    }
    for (auto &f : failures) {
      if (!f.boundary) {
        if (pass_->report) {
          pass_->report->errors.push_back(std::move(f.error));
        }
        continue;
      }
      try {
        f.boundary->on_error(f.error);
        if (pass_->report) {
          pass_->report->handled.push_back(std::move(f.error));
        }
      } catch (...) {
        logger()->error("error boundary '{}' failed: {}", f.boundary->name,
                        detail::current_exception_message());
        if (pass_->report) {
          pass_->report->errors.push_back(std::move(f.error));
        }
      }
    }
  }

  void run_effects() {
    auto due = std::exchange(pass_->effects_due, {});
    std::unordered_set<ComponentId> seen;
    for (const auto id : due) {
      if (!alive(id) || !seen.insert(id).second) {
        continue;
      }
      auto slots = std::exchange(at(id).hooks.effects_due, {});
      for (const auto &slot : slots) {
        if (!alive(id)) {
          break;
        }
        auto &effect = at(id).hooks.effects[slot];
        if (!effect.pending) {
          continue;
        }
        auto fn = std::exchange(effect.pending, {});
        auto cleanup = std::exchange(effect.cleanup, {});
        try {
          if (cleanup) {
            cleanup();
          }
          effect.cleanup = fn();
          effect.ran = true;
        } catch (...) {
          fail(id, ErrorKind::RenderPanic,
               fmt::format("effect '{}' of '{}' failed: {}", slot, name_of(id),
                           detail::current_exception_message()));
        }
      }
    }
  }

  // Unmounts a subtree: children first, then cleanups, subscriptions,
  // owned cells and handlers. The slot's generation moves on so stale ids
  // stop resolving.
  void release_instance(ComponentId id) {
    auto &inst = at(id);
    const auto children = inst.children;
    for (const auto &kv : children) {
      if (alive(kv.second)) {
        release_instance(kv.second);
      }
    }

    for (const auto &slot : inst.hooks.effect_order) {
      auto &effect = inst.hooks.effects[slot];
      if (!effect.cleanup) {
        continue;
      }
      auto cleanup = std::exchange(effect.cleanup, {});
      try {
        cleanup();
      } catch (...) {
        fail(id, ErrorKind::RenderPanic,
             fmt::format("cleanup '{}' of '{}' failed: {}", slot, name_of(id),
                         detail::current_exception_message()));
      }
    }

    store_.clear_subscriptions(id);
    for (const auto cell : inst.hooks.owned) {
      store_.release(cell);
    }
    for (const auto &kv : inst.hooks.handlers) {
      handlers_.release(kv.second);
    }

    logger()->debug("unmounted '{}' (component {})", name_of(id), id.index);
    inst.state = Lifecycle::Unmounted;
    ++inst.generation;
    inst.def.reset();
    inst.props.clear();
    inst.parent = ComponentId{};
    inst.position.clear();
    inst.raw = Node{};
    inst.children.clear();
    inst.by_slot.clear();
    inst.hooks = Hooks{};
    --live_instances_;
    free_.push_back(inst.index);
  }

  TargetSurface &surface_;
  RootOptions options_;
  Store store_;
  Scheduler scheduler_;
  HandlerRegistry handlers_;
  std::vector<std::unique_ptr<Instance>> instances_;
  std::vector<std::uint32_t> free_;
  std::size_t live_instances_{0};
  ComponentId root_{};
  // Whether the root's subtree made it onto the surface.
  bool root_attached_{};
  std::vector<Error> pending_errors_;
  Pass *pass_{};
};

} // namespace arbor::ui
