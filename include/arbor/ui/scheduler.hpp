#pragma once

#include <arbor/ui/error.hpp>
#include <arbor/ui/log.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arbor::ui {

enum class SchedulerState { Idle, Pending, Flushing };

inline const char *to_string(SchedulerState s) {
  switch (s) {
  case SchedulerState::Idle:
    return "Idle";
  case SchedulerState::Pending:
    return "Pending";
  case SchedulerState::Flushing:
    return "Flushing";
  }
  return "?";
}

// Batches dirty marks into discrete passes. Marks taken while a pass is
// running land in the next batch.
class Scheduler {
public:
  using FlushRequest = std::function<void()>;
  using DepthFn = std::function<std::size_t(ComponentId)>;

  SchedulerState state() const noexcept { return state_; }

  bool has_pending() const noexcept {
    return !batch_.empty() || !deferred_.empty();
  }

  // Called once per Idle -> Pending transition so the host can schedule
  // flush() on its event loop.
  void set_flush_requested(FlushRequest fn) { on_request_ = std::move(fn); }

  void mark_dirty(ComponentId id) {
    switch (state_) {
    case SchedulerState::Flushing:
      add(deferred_, deferred_set_, id);
      return;
    case SchedulerState::Pending:
      add(batch_, batch_set_, id);
      return;
    case SchedulerState::Idle:
      add(batch_, batch_set_, id);
      state_ = SchedulerState::Pending;
      logger()->debug("scheduler: Idle -> Pending");
      if (on_request_) {
        on_request_();
      }
      return;
    }
  }

  // Pending -> Flushing. Returns the batch ordered parent before child
  // (by depth), ties broken by arena index.
  std::vector<ComponentId> begin_flush(const DepthFn &depth_of) {
    if (state_ != SchedulerState::Pending) {
      return {};
    }
    state_ = SchedulerState::Flushing;
    auto out = std::exchange(batch_, {});
    batch_set_.clear();

    std::vector<std::pair<std::size_t, ComponentId>> keyed;
    keyed.reserve(out.size());
    for (const auto id : out) {
      keyed.emplace_back(depth_of(id), id);
    }
    std::sort(keyed.begin(), keyed.end(), [](const auto &a, const auto &b) {
      if (a.first != b.first) {
        return a.first < b.first;
      }
      return a.second.index < b.second.index;
    });
    for (std::size_t i = 0; i < keyed.size(); ++i) {
      out[i] = keyed[i].second;
    }
    return out;
  }

  // Flushing -> Pending when the pass deferred work, else Idle.
  void end_flush() {
    if (state_ != SchedulerState::Flushing) {
      return;
    }
    batch_ = std::exchange(deferred_, {});
    batch_set_ = std::exchange(deferred_set_, {});
    if (batch_.empty()) {
      state_ = SchedulerState::Idle;
      return;
    }
    state_ = SchedulerState::Pending;
    logger()->debug("scheduler: {} component(s) deferred to the next pass",
                    batch_.size());
    if (on_request_) {
      on_request_();
    }
  }

private:
  static void add(std::vector<ComponentId> &list,
                  std::unordered_set<ComponentId> &set, ComponentId id) {
    if (set.insert(id).second) {
      list.push_back(id);
    }
  }

  SchedulerState state_{SchedulerState::Idle};
  std::vector<ComponentId> batch_;
  std::unordered_set<ComponentId> batch_set_;
  std::vector<ComponentId> deferred_;
  std::unordered_set<ComponentId> deferred_set_;
  FlushRequest on_request_;
};

} // namespace arbor::ui
