#pragma once

#include <arbor/ui/error.hpp>
#include <arbor/ui/node.hpp>
#include <arbor/ui/patch.hpp>
#include <arbor/ui/store.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace arbor::ui {

enum class Lifecycle { Unmounted, Mounted, Updating };

inline const char *to_string(Lifecycle s) {
  switch (s) {
  case Lifecycle::Unmounted:
    return "Unmounted";
  case Lifecycle::Mounted:
    return "Mounted";
  case Lifecycle::Updating:
    return "Updating";
  }
  return "?";
}

struct Event {
  std::string name;
  Path target;
  std::string value;
};

using EventHandler = std::function<void(const Event &)>;
using EffectCleanup = std::function<void()>;
using EffectFn = std::function<EffectCleanup()>;

class RenderContext;

using RenderFn = std::function<Node(const Props &, RenderContext &)>;
using ErrorBoundary = std::function<void(const Error &)>;

struct ComponentDef {
  std::string name;
  RenderFn render;
  // Receives render and patch failures from this component's subtree,
  // the component itself included.
  ErrorBoundary on_error;
};

inline std::shared_ptr<const ComponentDef>
define_component(std::string name, RenderFn render, ErrorBoundary on_error = {}) {
  return std::make_shared<const ComponentDef>(
      ComponentDef{std::move(name), std::move(render), std::move(on_error)});
}

inline const PropValue *find_prop(const Props &props, const std::string &key) {
  const auto it = props.find(key);
  if (it == props.end()) {
    return nullptr;
  }
  return &it->second;
}

inline std::string prop_as_string(const Props &props, const std::string &key,
                                  std::string fallback = {}) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    return *s;
  }
  return fallback;
}

inline std::int64_t prop_as_i64(const Props &props, const std::string &key,
                                std::int64_t fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(pv)) {
    return static_cast<std::int64_t>(*d);
  }
  if (const auto *b = std::get_if<bool>(pv)) {
    return *b ? 1 : 0;
  }
  return fallback;
}

inline bool prop_as_bool(const Props &props, const std::string &key,
                         bool fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *b = std::get_if<bool>(pv)) {
    return *b;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return *i != 0;
  }
  return fallback;
}

// Handler table for one root. A ref stays stable for a given component
// slot across renders; only the callable behind it is replaced.
class HandlerRegistry {
public:
  HandlerRef add(ComponentId owner, EventHandler fn) {
    const HandlerRef ref{++next_id_};
    entries_.emplace(ref.id, Entry{owner, std::move(fn)});
    return ref;
  }

  bool set(HandlerRef ref, EventHandler fn) {
    const auto it = entries_.find(ref.id);
    if (it == entries_.end()) {
      return false;
    }
    it->second.fn = std::move(fn);
    return true;
  }

  const EventHandler *find(HandlerRef ref) const {
    const auto it = entries_.find(ref.id);
    if (it == entries_.end() || !it->second.fn) {
      return nullptr;
    }
    return &it->second.fn;
  }

  ComponentId owner(HandlerRef ref) const {
    const auto it = entries_.find(ref.id);
    return it == entries_.end() ? ComponentId{} : it->second.owner;
  }

  void release(HandlerRef ref) { entries_.erase(ref.id); }

  std::size_t size() const noexcept { return entries_.size(); }

private:
  struct Entry {
    ComponentId owner;
    EventHandler fn;
  };

  std::uint64_t next_id_{0};
  std::unordered_map<std::uint64_t, Entry> entries_;
};

struct EffectSlot {
  std::vector<PropValue> deps;
  EffectFn pending;
  EffectCleanup cleanup;
  bool ran{};
};

// Per-instance state that persists across renders, keyed by slot name.
struct Hooks {
  std::unordered_map<std::string, SignalId> cells;
  // Cells this instance provides to its descendants, by slot.
  std::unordered_map<std::string, SignalId> provided;
  std::vector<SignalId> owned;
  std::unordered_map<std::string, HandlerRef> handlers;
  std::unordered_map<std::string, EffectSlot> effects;
  std::vector<std::string> effect_order;
  std::vector<std::string> effects_due;
};

// Resolves a provided slot against the rendering component's ancestors.
using ContextLookup =
    std::function<std::optional<SignalId>(const std::string &)>;

// The store handle a render function receives. Reads subscribe the
// rendering component; writes made here land in the next flush.
class RenderContext {
public:
  RenderContext(Store &store, HandlerRegistry &handlers, ComponentId id,
                Hooks &hooks, ContextLookup lookup = {})
      : store_{store}, handlers_{handlers}, id_{id}, hooks_{hooks},
        lookup_{std::move(lookup)} {}

  ComponentId id() const noexcept { return id_; }

  Store &store() noexcept { return store_; }

  template <typename T> T read(Signal<T> s) { return store_.read(s); }

  template <typename T> T read(Computed<T> c) { return store_.read(c); }

  template <typename T> Status write(Signal<T> s, T value) {
    return store_.write(s, std::move(value));
  }

  template <typename T> Signal<T> use_signal(const std::string &slot, T initial) {
    const auto it = hooks_.cells.find(slot);
    if (it != hooks_.cells.end() && store_.alive(it->second)) {
      return Signal<T>{it->second};
    }
    auto s = store_.create<T>(std::move(initial), id_);
    hooks_.cells.insert_or_assign(slot, s.id());
    hooks_.owned.push_back(s.id());
    return s;
  }

  template <typename T, typename F>
  Computed<T> use_computed(const std::string &slot, F fn) {
    const auto it = hooks_.cells.find(slot);
    if (it != hooks_.cells.end() && store_.alive(it->second)) {
      return Computed<T>{it->second};
    }
    auto c = store_.computed<T>(std::move(fn), id_);
    hooks_.cells.insert_or_assign(slot, c.id());
    hooks_.owned.push_back(c.id());
    return c;
  }

  // Makes `value` visible to descendants under `slot`. Descendants that
  // read it re-render on the next pass when it changes.
  template <typename T> void provide(const std::string &slot, T value) {
    const auto it = hooks_.provided.find(slot);
    if (it == hooks_.provided.end() || !store_.alive(it->second)) {
      auto s = store_.create<T>(std::move(value), id_);
      hooks_.provided.insert_or_assign(slot, s.id());
      hooks_.owned.push_back(s.id());
      return;
    }
    const Signal<T> s{it->second};
    if (store_.peek(s) == value) {
      return;
    }
    if (auto st = store_.write(s, std::move(value)); !st.ok()) {
      logger()->warn("provide '{}': {}", slot, st.error()->message);
    }
  }

  // The nearest ancestor's value for `slot`, or `fallback` when none
  // provides it.
  template <typename T> T use_context(const std::string &slot, T fallback) {
    std::optional<SignalId> found;
    if (lookup_) {
      found = lookup_(slot);
    }
    if (!found) {
      return fallback;
    }
    return store_.read(Signal<T>{*found});
  }

  HandlerRef on(const std::string &slot, EventHandler fn) {
    const auto it = hooks_.handlers.find(slot);
    if (it != hooks_.handlers.end() && handlers_.set(it->second, fn)) {
      return it->second;
    }
    const auto ref = handlers_.add(id_, std::move(fn));
    hooks_.handlers.insert_or_assign(slot, ref);
    return ref;
  }

  // Runs `fn` after the flush when `deps` differ from the previous render
  // (and on mount). The previous cleanup runs first.
  void use_effect(const std::string &slot, std::vector<PropValue> deps,
                  EffectFn fn) {
    auto [it, inserted] = hooks_.effects.try_emplace(slot);
    auto &effect = it->second;
    if (inserted) {
      hooks_.effect_order.push_back(slot);
    }
    if (effect.ran && effect.deps == deps) {
      return;
    }
    effect.deps = std::move(deps);
    effect.pending = std::move(fn);
    hooks_.effects_due.push_back(slot);
  }

private:
  Store &store_;
  HandlerRegistry &handlers_;
  ComponentId id_;
  Hooks &hooks_;
  ContextLookup lookup_;
};

} // namespace arbor::ui
