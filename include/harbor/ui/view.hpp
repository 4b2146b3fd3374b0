#pragma once

#include <harbor/ui/geometry.hpp>
#include <harbor/ui/signal.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harbor::ui {

using ViewId = std::uint64_t;
using WindowId = std::uint64_t;

class Window;

namespace detail {
inline std::atomic<ViewId> next_view_id{1};
inline int transaction_depth = 0;
} // namespace detail

// Frame/bounds/hidden writes inside a Transaction never start implicit
// animations.
class Transaction {
public:
  Transaction() { ++detail::transaction_depth; }
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;
  ~Transaction() { --detail::transaction_depth; }

  static bool actions_disabled() { return detail::transaction_depth > 0; }
};

enum class Placement : std::uint8_t {
  Above,
  Below,
};

class View : public std::enable_shared_from_this<View> {
public:
  using Ptr = std::shared_ptr<View>;

  explicit View(RectF frame = {})
      : id_{detail::next_view_id.fetch_add(1, std::memory_order_relaxed)},
        frame_{frame}, bounds_{0.0f, 0.0f, frame.w, frame.h} {}

  View(const View &) = delete;
  View &operator=(const View &) = delete;

  virtual ~View() {
    for (auto &child : subviews_) {
      child->superview_ = nullptr;
    }
  }

  ViewId id() const { return id_; }

  virtual std::string_view kind() const { return "View"; }

  const std::string &debug_name() const { return debug_name_; }
  void set_debug_name(std::string name) { debug_name_ = std::move(name); }

  const RectF &frame() const { return frame_; }

  void set_frame(RectF frame) {
    if (frame.x == frame_.x && frame.y == frame_.y && frame.w == frame_.w &&
        frame.h == frame_.h) {
      return;
    }
    const float dw = frame.w - frame_.w;
    const float dh = frame.h - frame_.h;
    frame_ = frame;
    bounds_.w = frame.w;
    bounds_.h = frame.h;
    note_implicit_animation();
    if (dw != 0.0f || dh != 0.0f) {
      resize_subviews(dw, dh);
    }
    frame_changed_.notify();
  }

  const RectF &bounds() const { return bounds_; }

  void set_bounds(RectF bounds) {
    if (bounds.x == bounds_.x && bounds.y == bounds_.y &&
        bounds.w == bounds_.w && bounds.h == bounds_.h) {
      return;
    }
    bounds_ = bounds;
    note_implicit_animation();
    frame_changed_.notify();
  }

  bool hidden() const { return hidden_; }

  void set_hidden(bool hidden) {
    if (hidden_ == hidden) {
      return;
    }
    hidden_ = hidden;
    note_implicit_animation();
  }

  bool autoresizes() const { return autoresizes_; }
  void set_autoresizes(bool v) { autoresizes_ = v; }

  bool animates_implicitly() const { return animates_implicitly_; }
  void set_animates_implicitly(bool v) { animates_implicitly_ = v; }
  std::size_t implicit_animation_count() const { return implicit_animations_; }

  Signal &frame_changed() { return frame_changed_; }

  View *superview() const { return superview_; }

  const std::vector<Ptr> &subviews() const { return subviews_; }

  std::optional<std::size_t> index_of_subview(const View *child) const {
    for (std::size_t i = 0; i < subviews_.size(); ++i) {
      if (subviews_[i].get() == child) {
        return i;
      }
    }
    return std::nullopt;
  }

  void add_subview(Ptr child) {
    add_subview(std::move(child), Placement::Above, nullptr);
  }

  // Mirrors the usual "positioned relative to" insertion: a null relative
  // view means the very top (Above) or very bottom (Below).
  void add_subview(Ptr child, Placement placement, const View *relative) {
    if (!child || child.get() == this) {
      return;
    }
    if (child->superview_ != nullptr) {
      child->detach_from_superview();
    }

    auto pos = subviews_.end();
    if (relative != nullptr) {
      if (const auto idx = index_of_subview(relative)) {
        pos = subviews_.begin() + static_cast<std::ptrdiff_t>(*idx);
        if (placement == Placement::Above) {
          ++pos;
        }
      }
    } else if (placement == Placement::Below) {
      pos = subviews_.begin();
    }

    child->superview_ = this;
    subviews_.insert(pos, std::move(child));
  }

  void remove_from_superview() {
    if (superview_ == nullptr) {
      return;
    }
    // Keep ourselves alive until the parent has let go.
    auto self = shared_from_this();
    detach_from_superview();
  }

  View *root() {
    View *cur = this;
    while (cur->superview_ != nullptr) {
      cur = cur->superview_;
    }
    return cur;
  }

  const View *root() const {
    const View *cur = this;
    while (cur->superview_ != nullptr) {
      cur = cur->superview_;
    }
    return cur;
  }

  Window *window() const { return root()->attached_window_; }

  bool is_descendant_of(const View &other) const {
    for (const View *cur = this; cur != nullptr; cur = cur->superview_) {
      if (cur == &other) {
        return true;
      }
    }
    return false;
  }

  bool hidden_or_ancestor_hidden() const {
    for (const View *cur = this; cur != nullptr; cur = cur->superview_) {
      if (cur->hidden_) {
        return true;
      }
    }
    return false;
  }

  // Window position of this view's bounds origin.
  PointF window_offset() const {
    float ox = 0.0f;
    float oy = 0.0f;
    for (const View *cur = this; cur != nullptr; cur = cur->superview_) {
      ox += cur->frame_.x - cur->bounds_.x;
      oy += cur->frame_.y - cur->bounds_.y;
    }
    return PointF{ox, oy};
  }

  RectF convert_to_window(RectF local) const {
    const auto o = window_offset();
    return offset_rect(local, o.x, o.y);
  }

  RectF convert_from_window(RectF r) const {
    const auto o = window_offset();
    return offset_rect(r, -o.x, -o.y);
  }

  PointF convert_to_window(PointF local) const {
    const auto o = window_offset();
    return PointF{local.x + o.x, local.y + o.y};
  }

  PointF convert_from_window(PointF p) const {
    const auto o = window_offset();
    return PointF{p.x - o.x, p.y - o.y};
  }

  RectF bounds_in_window() const { return convert_to_window(bounds_); }

  // `point` is in the superview's coordinate space.
  virtual View *hit_test(PointF point) {
    if (hidden_ || !rect_contains(frame_, point)) {
      return nullptr;
    }
    const PointF local{point.x - frame_.x + bounds_.x,
                       point.y - frame_.y + bounds_.y};
    for (auto it = subviews_.rbegin(); it != subviews_.rend(); ++it) {
      if (auto *hit = (*it)->hit_test(local)) {
        return hit;
      }
    }
    return this;
  }

private:
  friend class Window;

  void detach_from_superview() {
    auto *parent = superview_;
    superview_ = nullptr;
    auto &siblings = parent->subviews_;
    siblings.erase(std::remove_if(siblings.begin(), siblings.end(),
                                  [this](const Ptr &p) { return p.get() == this; }),
                   siblings.end());
  }

  void resize_subviews(float dw, float dh) {
    for (auto &child : subviews_) {
      if (!child->autoresizes_) {
        continue;
      }
      auto f = child->frame_;
      f.w = std::max(0.0f, f.w + dw);
      f.h = std::max(0.0f, f.h + dh);
      child->set_frame(f);
    }
  }

  void note_implicit_animation() {
    if (animates_implicitly_ && !Transaction::actions_disabled()) {
      ++implicit_animations_;
    }
  }

  ViewId id_{};
  std::string debug_name_;
  RectF frame_{};
  RectF bounds_{};
  bool hidden_{false};
  bool autoresizes_{false};
  bool animates_implicitly_{true};
  std::size_t implicit_animations_{0};
  View *superview_{};
  Window *attached_window_{};
  std::vector<Ptr> subviews_;
  Signal frame_changed_;
};

} // namespace harbor::ui
