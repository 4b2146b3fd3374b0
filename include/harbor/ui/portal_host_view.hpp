#pragma once

#include <harbor/ui/config.hpp>
#include <harbor/ui/drag_routing.hpp>
#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/log.hpp>
#include <harbor/ui/split_view.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harbor::ui {

enum class DividerCursorKind : std::uint8_t {
  Vertical,
  Horizontal,
};

struct CursorRect {
  RectF rect;
  DividerCursorKind kind{DividerCursorKind::Vertical};
};

struct DividerRegion {
  RectF rect_in_window;
  bool vertical{true};
};

// Divider rectangles of every visible split under `view`, skipping dividers
// whose neighbouring panes are both collapsed.
inline void collect_split_divider_regions(const View &view,
                                          float collapsed_threshold,
                                          std::vector<DividerRegion> &out) {
  if (view.hidden()) {
    return;
  }
  if (const auto *split = dynamic_cast<const SplitView *>(&view)) {
    for (std::size_t i = 0; i < split->divider_count(); ++i) {
      if (split->divider_is_collapsed(i, collapsed_threshold)) {
        continue;
      }
      const auto in_window = split->convert_to_window(split->divider_rect(i));
      if (!(in_window.w > 0.0f) || !(in_window.h > 0.0f)) {
        continue;
      }
      out.push_back(DividerRegion{in_window, split->is_vertical()});
    }
  }
  for (const auto &child : view.subviews()) {
    collect_split_divider_regions(*child, collapsed_threshold, out);
  }
}

inline std::optional<DividerCursorKind>
divider_cursor_kind_at(PointF window_point, const View &view,
                       const PortalConfig &config) {
  if (view.hidden()) {
    return std::nullopt;
  }

  if (const auto *split = dynamic_cast<const SplitView *>(&view)) {
    const auto p = split->convert_from_window(window_point);
    if (rect_contains_inclusive(split->bounds(), p)) {
      const float e = config.divider_hit_expansion;
      for (std::size_t i = 0; i < split->divider_count(); ++i) {
        if (split->divider_is_collapsed(i, config.collapsed_pane_threshold)) {
          continue;
        }
        const auto expanded = inset_rect(split->divider_rect(i), -e, -e);
        if (rect_contains(expanded, p)) {
          return split->is_vertical() ? DividerCursorKind::Vertical
                                      : DividerCursorKind::Horizontal;
        }
      }
    }
  }

  const auto &children = view.subviews();
  for (auto it = children.rbegin(); it != children.rend(); ++it) {
    if (auto kind = divider_cursor_kind_at(window_point, **it, config)) {
      return kind;
    }
  }
  return std::nullopt;
}

// The per-window container that hosted surfaces are parented to. It sits
// above the declarative content, so it gives way to the content's own
// interactive chrome (sidebar resizer, split dividers, tab drags) and never
// claims a hit for itself.
class PortalHostView : public View {
public:
  explicit PortalHostView(PortalConfig config = {}) : config_{config} {
    set_debug_name("portal-host");
  }

  std::string_view kind() const override { return "PortalHost"; }

  View *hit_test(PointF point) override {
    const PointF local{point.x - frame().x + bounds().x,
                       point.y - frame().y + bounds().y};
    update_divider_cursor(local);

    if (should_pass_through_to_sidebar_resizer(local)) {
      return nullptr;
    }
    if (split_divider_cursor_kind(local)) {
      return nullptr;
    }

    PointerContext ctx;
    if (auto *win = window()) {
      ctx = win->pointer_context();
    }
    if (should_pass_through_portal_hit_testing(ctx)) {
      log_drag_route(true, ctx, nullptr);
      return nullptr;
    }

    auto *hit = View::hit_test(point);
    log_drag_route(false, ctx, hit);
    return hit == this ? nullptr : hit;
  }

  void pointer_moved(PointF local) { update_divider_cursor(local); }

  void pointer_exited() { active_cursor_.reset(); }

  std::optional<DividerCursorKind> active_divider_cursor() const {
    return active_cursor_;
  }

  std::optional<float> cached_sidebar_divider_x() const {
    return cached_sidebar_divider_x_;
  }

  // Resize-cursor areas over split dividers, in this view's bounds space.
  std::vector<CursorRect> cursor_rects() const {
    std::vector<CursorRect> out;
    auto *win = window();
    if (win == nullptr) {
      return out;
    }
    std::vector<DividerRegion> regions;
    collect_split_divider_regions(win->content_view(),
                                  config_.collapsed_pane_threshold, regions);
    const float e = config_.cursor_rect_expansion;
    for (const auto &region : regions) {
      auto r = convert_from_window(region.rect_in_window);
      r = region.vertical ? inset_rect(r, -e, 0.0f) : inset_rect(r, 0.0f, -e);
      const auto clipped = rect_intersection(r, bounds());
      if (!clipped || !(clipped->w > 0.0f) || !(clipped->h > 0.0f)) {
        continue;
      }
      out.push_back(CursorRect{*clipped, region.vertical
                                             ? DividerCursorKind::Vertical
                                             : DividerCursorKind::Horizontal});
    }
    return out;
  }

  bool should_pass_through_to_sidebar_resizer(PointF local) {
    std::vector<RectF> frames;
    for (const auto &child : subviews()) {
      const auto *hosted = dynamic_cast<const HostedView *>(child.get());
      if (hosted == nullptr || hosted->hidden() || hosted->window() == nullptr) {
        continue;
      }
      const auto &f = hosted->frame();
      if (f.w > 1.0f && f.h > 1.0f) {
        frames.push_back(f);
      }
    }

    // Content flush with the leading edge means the sidebar is collapsed.
    const bool leading_content =
        std::any_of(frames.begin(), frames.end(), [this](const RectF &f) {
          return f.min_x() <= config_.sidebar_leading_edge_epsilon &&
                 f.max_x() > config_.minimum_visible_leading_content_width;
        });
    if (leading_content) {
      if (cached_sidebar_divider_x_) {
        note_sidebar_miss(config_.sidebar_flush_miss_limit);
      }
      return false;
    }

    std::optional<float> leftmost;
    for (const auto &f : frames) {
      if (f.min_x() > config_.sidebar_leading_edge_epsilon &&
          (!leftmost || f.min_x() < *leftmost)) {
        leftmost = f.min_x();
      }
    }
    if (leftmost) {
      cached_sidebar_divider_x_ = leftmost;
      sidebar_miss_count_ = 0;
    } else if (cached_sidebar_divider_x_) {
      note_sidebar_miss(config_.sidebar_candidate_miss_limit);
    }

    if (!cached_sidebar_divider_x_) {
      return false;
    }
    const float x = *cached_sidebar_divider_x_;
    const float w = config_.sidebar_hit_width_per_side;
    return local.x >= x - w && local.x <= x + w;
  }

  std::optional<DividerCursorKind> split_divider_cursor_kind(PointF local) const {
    auto *win = window();
    if (win == nullptr) {
      return std::nullopt;
    }
    return divider_cursor_kind_at(convert_to_window(local), win->content_view(),
                                  config_);
  }

private:
  void note_sidebar_miss(int limit) {
    ++sidebar_miss_count_;
    if (sidebar_miss_count_ >= limit) {
      cached_sidebar_divider_x_.reset();
      sidebar_miss_count_ = 0;
    }
  }

  void update_divider_cursor(PointF local) {
    if (should_pass_through_to_sidebar_resizer(local)) {
      active_cursor_.reset();
      return;
    }
    active_cursor_ = split_divider_cursor_kind(local);
  }

  void log_drag_route(bool pass_through, const PointerContext &ctx,
                      const View *hit) {
    const bool relevant =
        has_tab_transfer(ctx.drag_types) || has_sidebar_tab_reorder(ctx.drag_types);
    if (!pass_through && !relevant) {
      return;
    }
    const std::string types =
        ctx.drag_types.empty() ? std::string{"-"}
                               : fmt::format("{}", fmt::join(ctx.drag_types, ","));
    const std::string target = hit ? std::string{hit->kind()} : std::string{"nil"};
    auto signature = fmt::format("{}|{}|{}|{}", pass_through ? 1 : 0,
                                 event_name(ctx.event), types, target);
    if (signature == last_drag_route_signature_) {
      return;
    }
    last_drag_route_signature_ = std::move(signature);
    portal_log().debug("portal.dragRoute passThrough={} event={} target={} types={}",
                       pass_through ? 1 : 0, event_name(ctx.event), target,
                       types);
  }

  PortalConfig config_{};
  std::optional<float> cached_sidebar_divider_x_{};
  int sidebar_miss_count_{0};
  std::optional<DividerCursorKind> active_cursor_{};
  std::string last_drag_route_signature_;
};

} // namespace harbor::ui
