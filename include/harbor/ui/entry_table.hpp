#pragma once

#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/view.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace harbor::ui {

struct Entry {
  std::weak_ptr<HostedView> hosted;
  std::weak_ptr<View> anchor;
  ViewId anchor_id{};
  bool visible_in_ui{false};
  int z_priority{0};
};

// Per-window association records: one Entry per hosted view, and at most one
// hosted view per anchor.
class EntryTable {
public:
  Entry *find(ViewId hosted_id) {
    const auto it = entries_.find(hosted_id);
    return it == entries_.end() ? nullptr : &it->second;
  }

  const Entry *find(ViewId hosted_id) const {
    const auto it = entries_.find(hosted_id);
    return it == entries_.end() ? nullptr : &it->second;
  }

  bool contains(ViewId hosted_id) const {
    return entries_.find(hosted_id) != entries_.end();
  }

  std::optional<ViewId> hosted_for_anchor(ViewId anchor_id) const {
    const auto it = hosted_by_anchor_.find(anchor_id);
    if (it == hosted_by_anchor_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  // Stores `entry` under `hosted_id` and maps its anchor to it. A stale
  // mapping from the entry's previous anchor is dropped. Returns the entry
  // that was replaced, if any.
  std::optional<Entry> upsert(ViewId hosted_id, Entry entry) {
    std::optional<Entry> previous;
    if (const auto it = entries_.find(hosted_id); it != entries_.end()) {
      previous = it->second;
      if (previous->anchor_id != entry.anchor_id) {
        erase_anchor_mapping(previous->anchor_id, hosted_id);
      }
    }
    hosted_by_anchor_.insert_or_assign(entry.anchor_id, hosted_id);
    entries_.insert_or_assign(hosted_id, std::move(entry));
    return previous;
  }

  std::optional<Entry> remove(ViewId hosted_id) {
    const auto it = entries_.find(hosted_id);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    Entry removed = std::move(it->second);
    entries_.erase(it);
    erase_anchor_mapping(removed.anchor_id, hosted_id);
    return removed;
  }

  // Drops anchor mappings whose anchor no longer belongs to a live entry.
  std::size_t retain_live_anchor_mappings() {
    std::unordered_set<ViewId> live;
    for (const auto &kv : entries_) {
      if (!kv.second.anchor.expired()) {
        live.insert(kv.second.anchor_id);
      }
    }
    std::size_t dropped = 0;
    for (auto it = hosted_by_anchor_.begin(); it != hosted_by_anchor_.end();) {
      if (live.count(it->first) == 0) {
        it = hosted_by_anchor_.erase(it);
        ++dropped;
      } else {
        ++it;
      }
    }
    return dropped;
  }

  std::vector<ViewId> hosted_ids() const {
    std::vector<ViewId> out;
    out.reserve(entries_.size());
    for (const auto &kv : entries_) {
      out.push_back(kv.first);
    }
    return out;
  }

  template <typename F> void for_each(F &&fn) const {
    for (const auto &kv : entries_) {
      fn(kv.first, kv.second);
    }
  }

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  std::size_t anchor_mapping_count() const { return hosted_by_anchor_.size(); }

  void clear() {
    entries_.clear();
    hosted_by_anchor_.clear();
  }

private:
  void erase_anchor_mapping(ViewId anchor_id, ViewId hosted_id) {
    const auto it = hosted_by_anchor_.find(anchor_id);
    if (it != hosted_by_anchor_.end() && it->second == hosted_id) {
      hosted_by_anchor_.erase(it);
    }
  }

  std::unordered_map<ViewId, Entry> entries_;
  std::unordered_map<ViewId, ViewId> hosted_by_anchor_;
};

} // namespace harbor::ui
