#pragma once

#include <arbor/ui/error.hpp>
#include <arbor/ui/log.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arbor::ui {

struct SignalId {
  std::uint32_t index{};
  std::uint32_t generation{};

  bool valid() const noexcept { return generation != 0; }

  friend bool operator==(const SignalId &, const SignalId &) = default;
};

template <typename T> class Signal {
public:
  Signal() = default;
  explicit Signal(SignalId id) : id_{id} {}

  SignalId id() const noexcept { return id_; }

  explicit operator bool() const noexcept { return id_.valid(); }

private:
  SignalId id_{};
};

template <typename T> class Computed {
public:
  Computed() = default;
  explicit Computed(SignalId id) : id_{id} {}

  SignalId id() const noexcept { return id_; }

  explicit operator bool() const noexcept { return id_.valid(); }

private:
  SignalId id_{};
};

// Who gets notified when a cell changes: a component or a derived cell.
struct Subscriber {
  enum class Kind : std::uint8_t { Component, Computed };

  Kind kind{Kind::Component};
  std::uint32_t index{};
  std::uint32_t generation{};

  static Subscriber of(ComponentId id) {
    return Subscriber{Kind::Component, id.index, id.generation};
  }

  static Subscriber of(SignalId id) {
    return Subscriber{Kind::Computed, id.index, id.generation};
  }

  friend bool operator==(const Subscriber &, const Subscriber &) = default;
};

struct SubscriberHash {
  std::size_t operator()(const Subscriber &s) const noexcept {
    return (static_cast<std::size_t>(s.generation) << 33) ^
           (static_cast<std::size_t>(s.index) << 1) ^
           static_cast<std::size_t>(s.kind);
  }
};

// Thrown by reads of released cells and by computed cycles. Render code
// lets it escape; the component runtime turns it into a RenderPanic.
class StoreError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class Store;

namespace detail {

struct CellBase {
  virtual ~CellBase() = default;
  virtual bool computed() const noexcept { return false; }
  virtual void recompute(Store &) {}
};

template <typename T> struct ValueCell final : CellBase {
  explicit ValueCell(T v) : value{std::move(v)} {}
  T value;
};

template <typename T> struct ComputedCell final : CellBase {
  explicit ComputedCell(std::function<T(Store &)> f) : fn{std::move(f)} {}

  bool computed() const noexcept override { return true; }
  void recompute(Store &store) override { value = fn(store); }

  std::function<T(Store &)> fn;
  std::optional<T> value;
};

} // namespace detail

// Arena of signal and computed cells for one root. Cells are addressed by
// index plus generation; releasing a cell bumps its generation.
class Store {
public:
  using DirtySink = std::function<void(ComponentId)>;
  using ErrorSink = std::function<void(const Error &)>;

  Store() = default;
  Store(const Store &) = delete;
  Store &operator=(const Store &) = delete;

  void set_dirty_sink(DirtySink sink) { on_dirty_ = std::move(sink); }
  void set_error_sink(ErrorSink sink) { on_error_ = std::move(sink); }

  template <typename T>
  Signal<T> create(T initial, ComponentId owner = {}) {
    auto &slot = allocate(owner);
    slot.cell = std::make_unique<detail::ValueCell<T>>(std::move(initial));
    return Signal<T>{id_of(slot)};
  }

  template <typename T, typename F>
  Computed<T> computed(F fn, ComponentId owner = {}) {
    auto &slot = allocate(owner);
    slot.cell =
        std::make_unique<detail::ComputedCell<T>>(std::function<T(Store &)>{
            std::move(fn)});
    slot.stale = true;
    return Computed<T>{id_of(slot)};
  }

  // Returns the value and, inside a render or computation, subscribes the
  // active reader.
  template <typename T> T read(Signal<T> s) {
    auto &slot = checked(s.id(), "read");
    track(s.id(), slot);
    return value_cell<T>(slot, s.id()).value;
  }

  template <typename T> T read(Computed<T> c) {
    auto &slot = checked(c.id(), "read");
    track(c.id(), slot);
    refresh(c.id());
    auto *cell = dynamic_cast<detail::ComputedCell<T> *>(slot.cell.get());
    if (!cell || !cell->value) {
      throw StoreError{
          fmt::format("computed cell {} holds no value", c.id().index)};
    }
    return *cell->value;
  }

  // Reads without subscribing anyone.
  template <typename T> T peek(Signal<T> s) {
    auto &slot = checked(s.id(), "peek");
    return value_cell<T>(slot, s.id()).value;
  }

  template <typename T> Status write(Signal<T> s, T value) {
    auto *slot = live(s.id());
    if (!slot) {
      return write_after_release(s.id());
    }
    auto *cell = dynamic_cast<detail::ValueCell<T> *>(slot->cell.get());
    if (!cell) {
      return write_after_release(s.id());
    }
    cell->value = std::move(value);
    changed(s.id());
    return Status::success();
  }

  template <typename T, typename F> Status update(Signal<T> s, F &&fn) {
    auto *slot = live(s.id());
    if (!slot) {
      return write_after_release(s.id());
    }
    auto *cell = dynamic_cast<detail::ValueCell<T> *>(slot->cell.get());
    if (!cell) {
      return write_after_release(s.id());
    }
    fn(cell->value);
    changed(s.id());
    return Status::success();
  }

  bool alive(SignalId id) const { return live(id) != nullptr; }

  std::uint64_t version(SignalId id) const {
    const auto *slot = live(id);
    return slot ? slot->version : 0;
  }

  std::size_t subscriber_count(SignalId id) const {
    const auto *slot = live(id);
    return slot ? slot->subscribers.size() : 0;
  }

  std::size_t live_count() const noexcept { return live_count_; }

  // Drops a cell. Later writes through old handles report
  // WriteAfterUnmount.
  void release(SignalId id) {
    auto *slot = live(id);
    if (!slot) {
      return;
    }
    unsubscribe_dependencies(Subscriber::of(id));
    slot->live = false;
    slot->cell.reset();
    slot->subscribers.clear();
    slot->stale = false;
    ++slot->generation;
    --live_count_;
    free_.push_back(id.index);
  }

  // Subscriptions are re-established by every render.
  void clear_subscriptions(ComponentId component) {
    unsubscribe_dependencies(Subscriber::of(component));
  }

  // RAII scope that makes `component` the subscriber of all reads.
  class TrackingScope {
  public:
    TrackingScope(Store &store, ComponentId component) : store_{store} {
      store_.frames_.push_back(Frame{Subscriber::of(component), {}});
    }
    TrackingScope(const TrackingScope &) = delete;
    TrackingScope &operator=(const TrackingScope &) = delete;
    ~TrackingScope() { store_.frames_.pop_back(); }

  private:
    Store &store_;
  };

private:
  struct Slot {
    std::uint32_t index{};
    std::uint32_t generation{1};
    bool live{};
    bool stale{};
    bool computing{};
    std::uint64_t version{};
    ComponentId owner{};
    std::unique_ptr<detail::CellBase> cell;
    std::unordered_set<Subscriber, SubscriberHash> subscribers;
  };

  struct Frame {
    Subscriber who;
    std::unordered_set<std::uint32_t> seen;
  };

  class ComputeScope {
  public:
    ComputeScope(Store &store, Slot &slot, SignalId id)
        : store_{store}, slot_{slot} {
      slot_.computing = true;
      store_.frames_.push_back(Frame{Subscriber::of(id), {}});
    }
    ComputeScope(const ComputeScope &) = delete;
    ComputeScope &operator=(const ComputeScope &) = delete;
    ~ComputeScope() {
      store_.frames_.pop_back();
      slot_.computing = false;
    }

  private:
    Store &store_;
    Slot &slot_;
  };

  Slot &allocate(ComponentId owner) {
    Slot *slot = nullptr;
    if (!free_.empty()) {
      slot = &slots_[free_.back()];
      free_.pop_back();
    } else {
      slots_.emplace_back();
      slot = &slots_.back();
      slot->index = static_cast<std::uint32_t>(slots_.size() - 1);
    }
    slot->live = true;
    slot->stale = false;
    slot->version = 0;
    slot->owner = owner;
    ++live_count_;
    return *slot;
  }

  static SignalId id_of(const Slot &slot) {
    return SignalId{slot.index, slot.generation};
  }

  Slot *live(SignalId id) {
    if (id.index >= slots_.size()) {
      return nullptr;
    }
    auto &slot = slots_[id.index];
    return slot.live && slot.generation == id.generation ? &slot : nullptr;
  }

  const Slot *live(SignalId id) const {
    if (id.index >= slots_.size()) {
      return nullptr;
    }
    const auto &slot = slots_[id.index];
    return slot.live && slot.generation == id.generation ? &slot : nullptr;
  }

  Slot &checked(SignalId id, const char *op) {
    auto *slot = live(id);
    if (!slot) {
      throw StoreError{
          fmt::format("{} of released signal {}", op, id.index)};
    }
    return *slot;
  }

  template <typename T>
  static detail::ValueCell<T> &value_cell(Slot &slot, SignalId id) {
    auto *cell = dynamic_cast<detail::ValueCell<T> *>(slot.cell.get());
    if (!cell) {
      throw StoreError{fmt::format("signal {} holds another type", id.index)};
    }
    return *cell;
  }

  void track(SignalId id, Slot &slot) {
    if (frames_.empty()) {
      return;
    }
    auto &frame = frames_.back();
    if (!frame.seen.insert(id.index).second) {
      return;
    }
    slot.subscribers.insert(frame.who);
    deps_[frame.who].push_back(id);
  }

  void refresh(SignalId id) {
    auto &slot = slots_[id.index];
    if (!slot.stale) {
      return;
    }
    if (slot.computing) {
      throw StoreError{fmt::format("computed cell {} depends on itself",
                                   id.index)};
    }
    unsubscribe_dependencies(Subscriber::of(id));
    {
      ComputeScope scope{*this, slot, id};
      slot.cell->recompute(*this);
    }
    slot.stale = false;
  }

  void unsubscribe_dependencies(const Subscriber &who) {
    const auto it = deps_.find(who);
    if (it == deps_.end()) {
      return;
    }
    for (const auto dep : it->second) {
      if (auto *slot = live(dep)) {
        slot->subscribers.erase(who);
      }
    }
    deps_.erase(it);
  }

  // Bumps the version, hands the subscriber set to the dirty sink and
  // clears it. Derived cells go stale and pass the change on.
  void changed(SignalId id) {
    auto &slot = slots_[id.index];
    ++slot.version;
    auto subscribers = std::move(slot.subscribers);
    slot.subscribers.clear();
    for (const auto &sub : subscribers) {
      if (sub.kind == Subscriber::Kind::Component) {
        if (on_dirty_) {
          on_dirty_(ComponentId{sub.index, sub.generation});
        }
        continue;
      }
      const SignalId derived{sub.index, sub.generation};
      auto *d = live(derived);
      if (!d || d->stale) {
        continue;
      }
      d->stale = true;
      changed(derived);
    }
  }

  Status write_after_release(SignalId id) {
    ComponentId owner{};
    if (id.index < slots_.size()) {
      owner = slots_[id.index].owner;
    }
    Error err{ErrorKind::WriteAfterUnmount, owner,
              fmt::format("write to released signal {} (generation {})",
                          id.index, id.generation)};
    logger()->warn("{}", err.message);
    if (on_error_) {
      on_error_(err);
    }
    return Status::failure(std::move(err));
  }

  std::deque<Slot> slots_;
  std::vector<std::uint32_t> free_;
  std::size_t live_count_{0};
  std::vector<Frame> frames_;
  std::unordered_map<Subscriber, std::vector<SignalId>, SubscriberHash> deps_;
  DirtySink on_dirty_;
  ErrorSink on_error_;
};

} // namespace arbor::ui
