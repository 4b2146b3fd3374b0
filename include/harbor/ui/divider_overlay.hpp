#pragma once

#include <harbor/ui/geometry.hpp>
#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/render.hpp>
#include <harbor/ui/split_view.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace harbor::ui {

struct DividerSegment {
  RectF rect;
  ColorU8 color;
  bool vertical{true};
};

// A translucent divider is flattened over the split's background so the
// painted line matches what the split itself shows.
inline ColorU8 flatten_divider_color(ColorU8 divider,
                                     const std::optional<ColorU8> &background) {
  const float alpha = static_cast<float>(divider.a) / 255.0f;
  if (alpha >= 0.999f || !background) {
    return divider;
  }
  auto mix = [alpha](std::uint8_t bg, std::uint8_t fg) {
    const float v = static_cast<float>(bg) * (1.0f - alpha) +
                    static_cast<float>(fg) * alpha;
    return static_cast<std::uint8_t>(clampf(std::round(v), 0.0f, 255.0f));
  };
  return ColorU8{mix(background->r, divider.r), mix(background->g, divider.g),
                 mix(background->b, divider.b), 255};
}

inline RectF pixel_aligned_rect(const RectF &r) {
  return RectF{std::floor(r.x), std::floor(r.y), std::max(1.0f, std::round(r.w)),
               std::max(1.0f, std::round(r.h))};
}

// Every divider of every visible split under `view`, in `target`'s bounds
// space, that overlaps `target`.
inline void collect_divider_segments(const View &view, const View &target,
                                     std::vector<DividerSegment> &out) {
  if (view.hidden()) {
    return;
  }

  if (const auto *split = dynamic_cast<const SplitView *>(&view)) {
    const auto color =
        flatten_divider_color(split->divider_color(), split->background_color());
    const float thickness = std::max(split->divider_thickness(), 1.0f);
    for (std::size_t i = 0; i < split->divider_count(); ++i) {
      const auto &first = split->subviews()[i]->frame();
      const auto &b = split->bounds();
      const RectF in_split = split->is_vertical()
                                 ? RectF{first.max_x(), b.y, thickness, b.h}
                                 : RectF{b.x, first.max_y(), b.w, thickness};
      const auto in_target =
          target.convert_from_window(split->convert_to_window(in_split));
      if (rects_intersect(in_target, target.bounds())) {
        out.push_back(DividerSegment{in_target, color, split->is_vertical()});
      }
    }
  }

  for (const auto &child : view.subviews()) {
    collect_divider_segments(*child, target, out);
  }
}

// True when some hosted frame straddles the divider's centerline.
inline bool segment_is_occluded(const DividerSegment &segment,
                                const std::vector<RectF> &hosted_frames,
                                float axis_epsilon) {
  const float axis =
      segment.vertical ? segment.rect.mid_x() : segment.rect.mid_y();
  const auto extent = segment.vertical ? inset_rect(segment.rect, 0.0f, -1.0f)
                                       : inset_rect(segment.rect, -1.0f, 0.0f);
  for (const auto &frame : hosted_frames) {
    if (!rects_intersect(frame, extent)) {
      continue;
    }
    if (segment.vertical) {
      if (frame.min_x() < axis - axis_epsilon &&
          frame.max_x() > axis + axis_epsilon) {
        return true;
      }
    } else if (frame.min_y() < axis - axis_epsilon &&
               frame.max_y() > axis + axis_epsilon) {
      return true;
    }
  }
  return false;
}

// Transparent layer at the top of the portal host that repaints split
// dividers which hosted surfaces would otherwise cover. Never takes hits.
class DividerOverlayView : public View {
public:
  explicit DividerOverlayView(float axis_epsilon = 0.01f)
      : axis_epsilon_{axis_epsilon} {
    set_animates_implicitly(false);
    set_autoresizes(true);
    set_debug_name("divider-overlay");
  }

  std::string_view kind() const override { return "DividerOverlay"; }

  View *hit_test(PointF) override { return nullptr; }

  bool needs_display() const { return needs_display_; }
  void set_needs_display() { needs_display_ = true; }

  std::size_t paint_count() const { return paint_count_; }

  // Rectangles from the last paint, in overlay space.
  const std::vector<DrawRect> &painted() const { return painted_; }

  void display_if_needed() {
    if (!needs_display_) {
      return;
    }
    needs_display_ = false;
    paint();
  }

  void paint() {
    ++paint_count_;
    painted_.clear();
    auto *win = window();
    if (win == nullptr) {
      return;
    }

    std::vector<DividerSegment> segments;
    collect_divider_segments(win->content_view(), *this, segments);
    if (segments.empty()) {
      return;
    }
    const auto frames = hosted_frames();
    for (const auto &segment : segments) {
      if (!segment_is_occluded(segment, frames, axis_epsilon_)) {
        continue;
      }
      painted_.push_back(DrawRect{pixel_aligned_rect(segment.rect), segment.color});
    }
  }

  // Painted rectangles as window-space render ops.
  void append_render_ops(std::vector<RenderOp> &out) const {
    for (const auto &r : painted_) {
      out.push_back(DrawRect{convert_to_window(r.rect), r.fill});
    }
  }

private:
  std::vector<RectF> hosted_frames() const {
    std::vector<RectF> out;
    const auto *host = superview();
    if (host == nullptr) {
      return out;
    }
    for (const auto &child : host->subviews()) {
      const auto *hosted = dynamic_cast<const HostedView *>(child.get());
      if (hosted == nullptr || hosted->hidden() || hosted->window() == nullptr) {
        continue;
      }
      out.push_back(hosted->frame());
    }
    return out;
  }

  float axis_epsilon_{0.01f};
  bool needs_display_{false};
  std::size_t paint_count_{0};
  std::vector<DrawRect> painted_;
};

} // namespace harbor::ui
