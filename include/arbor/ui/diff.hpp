#pragma once

#include <arbor/ui/node.hpp>
#include <arbor/ui/patch.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace arbor::ui {

struct DuplicateKey {
  Path parent_path;
  std::string key;
  std::size_t index{};
  bool in_new_tree{};
};

// Side information a caller may ask the diff to collect. The patch list
// itself never depends on it.
struct DiffReport {
  std::vector<DuplicateKey> duplicate_keys;
  std::size_t replaced_nodes{};
};

namespace detail {

// Prefix counts over slots [0, size).
class FenwickCounter {
public:
  explicit FenwickCounter(std::size_t size) : tree_(size + 1, 0) {}

  void add(std::size_t slot, std::int64_t delta) {
    for (auto i = slot + 1; i < tree_.size(); i += i & (~i + 1)) {
      tree_[i] += delta;
    }
  }

  // Sum of slots strictly below `slot`.
  std::int64_t below(std::size_t slot) const {
    std::int64_t sum = 0;
    for (auto i = slot; i > 0; i -= i & (~i + 1)) {
      sum += tree_[i];
    }
    return sum;
  }

private:
  std::vector<std::int64_t> tree_;
};

// Marks the members of one longest strictly increasing subsequence.
inline std::vector<bool>
longest_increasing_subsequence(const std::vector<std::size_t> &seq) {
  std::vector<bool> in_lis(seq.size(), false);
  if (seq.empty()) {
    return in_lis;
  }
  std::vector<std::size_t> tails;
  std::vector<std::ptrdiff_t> prev(seq.size(), -1);
  for (std::size_t i = 0; i < seq.size(); ++i) {
    const auto it = std::lower_bound(
        tails.begin(), tails.end(), seq[i],
        [&](std::size_t idx, std::size_t v) { return seq[idx] < v; });
    if (it != tails.begin()) {
      prev[i] = static_cast<std::ptrdiff_t>(*(it - 1));
    }
    if (it == tails.end()) {
      tails.push_back(i);
    } else {
      *it = i;
    }
  }
  auto cur = static_cast<std::ptrdiff_t>(tails.back());
  while (cur >= 0) {
    in_lis[static_cast<std::size_t>(cur)] = true;
    cur = prev[static_cast<std::size_t>(cur)];
  }
  return in_lis;
}

// Key lookup for one sibling list. The first occurrence of a key wins;
// later duplicates are treated as unkeyed.
struct SiblingKeys {
  std::unordered_map<std::string_view, std::size_t> index_of;
  std::vector<bool> keyed;

  SiblingKeys(const std::vector<Node> &children, const Path &parent,
              bool in_new_tree, DiffReport *report)
      : keyed(children.size(), false) {
    index_of.reserve(children.size());
    for (std::size_t i = 0; i < children.size(); ++i) {
      const auto &k = children[i].key();
      if (!k) {
        continue;
      }
      const auto inserted = index_of.emplace(std::string_view{*k}, i).second;
      if (inserted) {
        keyed[i] = true;
      } else if (report) {
        report->duplicate_keys.push_back(
            DuplicateKey{parent, *k, i, in_new_tree});
      }
    }
  }
};

inline void diff_node(const Node &old_node, const Node &new_node, Path &path,
                      PatchList &out, DiffReport *report);

inline void diff_attributes(const Element &old_el, const Element &new_el,
                            const Path &path, PatchList &out) {
  for (const auto &kv : new_el.attributes) {
    const auto it = old_el.attributes.find(kv.first);
    if (it == old_el.attributes.end() || it->second != kv.second) {
      out.push_back(PatchSetAttribute{path, kv.first, kv.second});
    }
  }

  for (const auto &kv : old_el.attributes) {
    if (!new_el.attributes.contains(kv.first)) {
      out.push_back(PatchRemoveAttribute{path, kv.first});
    }
  }
}

inline void diff_events(const Element &old_el, const Element &new_el,
                        const Path &path, PatchList &out) {
  for (const auto &kv : new_el.events) {
    const auto it = old_el.events.find(kv.first);
    if (it == old_el.events.end() || it->second != kv.second) {
      out.push_back(PatchUpdateEvent{path, kv.first, kv.second});
    }
  }

  for (const auto &kv : old_el.events) {
    if (!new_el.events.contains(kv.first)) {
      out.push_back(PatchUpdateEvent{path, kv.first, HandlerRef{}});
    }
  }
}

inline void diff_children(const std::vector<Node> &old_children,
                          const std::vector<Node> &new_children, Path &path,
                          PatchList &out, DiffReport *report) {
  const auto old_size = old_children.size();
  const auto new_size = new_children.size();
  if (old_size == 0 && new_size == 0) {
    return;
  }

  const SiblingKeys old_keys{old_children, path, false, report};
  const SiblingKeys new_keys{new_children, path, true, report};

  // Keyed children match by key, everything else by position.
  constexpr auto kUnmatched = static_cast<std::size_t>(-1);
  std::vector<std::size_t> new_to_old(new_size, kUnmatched);
  std::vector<bool> old_matched(old_size, false);
  for (std::size_t j = 0; j < new_size; ++j) {
    if (new_keys.keyed[j]) {
      const auto it = old_keys.index_of.find(*new_children[j].key());
      if (it != old_keys.index_of.end()) {
        new_to_old[j] = it->second;
        old_matched[it->second] = true;
      }
    } else if (j < old_size && !old_keys.keyed[j]) {
      new_to_old[j] = j;
      old_matched[j] = true;
    }
  }

  // Removals, ascending. Each index accounts for the removals before it.
  std::vector<std::size_t> rank(old_size, 0);
  std::size_t removed = 0;
  for (std::size_t i = 0; i < old_size; ++i) {
    if (!old_matched[i]) {
      out.push_back(PatchRemoveChild{path, i - removed});
      ++removed;
    } else {
      rank[i] = i - removed;
    }
  }

  // Survivors in new order, by their position after the removals.
  std::vector<std::size_t> seq;
  seq.reserve(new_size);
  for (std::size_t j = 0; j < new_size; ++j) {
    if (new_to_old[j] != kUnmatched) {
      seq.push_back(rank[new_to_old[j]]);
    }
  }

  // Children on the longest increasing run stay put. Every other survivor
  // moves directly in front of its successor, walking right to left.
  // A moved child is counted at the slot of the stable child its chain
  // ends on (slot m for the list end), which keeps current indices
  // answerable by prefix counts.
  const auto m = seq.size();
  const auto stable = longest_increasing_subsequence(seq);
  FenwickCounter slots{m + 1};
  for (std::size_t r = 0; r < m; ++r) {
    slots.add(r, 1);
  }
  std::vector<std::size_t> terminal(m, m);
  for (std::size_t k = m; k-- > 0;) {
    const auto anchor = k + 1 < m ? terminal[k + 1] : m;
    if (stable[k]) {
      terminal[k] = seq[k];
      continue;
    }
    const auto anchor_index = static_cast<std::size_t>(slots.below(anchor));
    const auto current = static_cast<std::size_t>(slots.below(seq[k]));
    const auto target = current < anchor_index ? anchor_index - 1 : anchor_index;
    if (target != current) {
      out.push_back(PatchMoveChild{path, current, target});
    }
    slots.add(seq[k], -1);
    slots.add(anchor, 1);
    terminal[k] = anchor;
  }

  for (std::size_t j = 0; j < new_size; ++j) {
    if (new_to_old[j] == kUnmatched) {
      out.push_back(PatchInsertChild{path, j, new_children[j]});
    }
  }

  for (std::size_t j = 0; j < new_size; ++j) {
    if (new_to_old[j] == kUnmatched) {
      continue;
    }
    path.push_back(j);
    diff_node(old_children[new_to_old[j]], new_children[j], path, out, report);
    path.pop_back();
  }
}

inline void replace(const Node &new_node, const Path &path, PatchList &out,
                    DiffReport *report) {
  out.push_back(PatchReplaceNode{path, new_node});
  if (report) {
    ++report->replaced_nodes;
  }
}

inline void diff_node(const Node &old_node, const Node &new_node, Path &path,
                      PatchList &out, DiffReport *report) {
  if (old_node.kind() != new_node.kind()) {
    replace(new_node, path, out, report);
    return;
  }

  switch (new_node.kind()) {
  case NodeKind::Text:
    if (old_node.as_text().value != new_node.as_text().value) {
      out.push_back(PatchUpdateText{path, new_node.as_text().value});
    }
    return;
  case NodeKind::Fragment:
    diff_children(old_node.children(), new_node.children(), path, out, report);
    return;
  case NodeKind::Component: {
    const auto &a = old_node.as_component();
    const auto &b = new_node.as_component();
    if (a.def != b.def || a.props != b.props) {
      replace(new_node, path, out, report);
    }
    return;
  }
  case NodeKind::Element: {
    const auto &a = old_node.as_element();
    const auto &b = new_node.as_element();
    if (a.tag != b.tag) {
      replace(new_node, path, out, report);
      return;
    }
    diff_attributes(a, b, path, out);
    diff_events(a, b, path, out);
    diff_children(a.children, b.children, path, out, report);
    return;
  }
  }
}

} // namespace detail

// Pure and total: mismatched node kinds or tags degrade to ReplaceNode.
// Patches are ordered parent before descendants; within one child list
// removals, then moves, then inserts, then the matched children's own
// patches in ascending index order.
inline PatchList diff(const Node &old_root, const Node &new_root,
                      DiffReport *report) {
  PatchList out;
  Path path;
  detail::diff_node(old_root, new_root, path, out, report);
  return out;
}

inline PatchList diff(const Node &old_root, const Node &new_root) {
  return diff(old_root, new_root, nullptr);
}

} // namespace arbor::ui
