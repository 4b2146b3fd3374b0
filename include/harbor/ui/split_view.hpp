#pragma once

#include <harbor/ui/render.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace harbor::ui {

// A container whose children are panes laid out along one axis with a
// divider between each neighbouring pair. "Vertical" means the dividers are
// vertical lines, i.e. panes sit side by side.
class SplitView : public View {
public:
  explicit SplitView(RectF frame = {}, bool vertical = true,
                     float divider_thickness = 1.0f)
      : View{frame}, vertical_{vertical},
        divider_thickness_{divider_thickness} {}

  std::string_view kind() const override { return "SplitView"; }

  bool is_vertical() const { return vertical_; }
  void set_vertical(bool v) { vertical_ = v; }

  float divider_thickness() const { return divider_thickness_; }
  void set_divider_thickness(float t) { divider_thickness_ = std::max(0.0f, t); }

  ColorU8 divider_color() const { return divider_color_; }
  void set_divider_color(ColorU8 c) { divider_color_ = c; }

  const std::optional<ColorU8> &background_color() const {
    return background_color_;
  }
  void set_background_color(std::optional<ColorU8> c) { background_color_ = c; }

  std::size_t divider_count() const {
    const auto n = subviews().size();
    return n > 0 ? n - 1 : 0;
  }

  // Divider after pane `index`, in this view's bounds space. Uses the raw
  // thickness; callers that paint use at least one unit.
  RectF divider_rect(std::size_t index) const {
    const auto &first = subviews()[index]->frame();
    const auto &b = bounds();
    if (vertical_) {
      return RectF{std::max(0.0f, first.max_x()), b.y, divider_thickness_, b.h};
    }
    return RectF{b.x, std::max(0.0f, first.max_y()), b.w, divider_thickness_};
  }

  // Both neighbours of divider `index` are no thicker than `threshold` along
  // the split axis (transient state during structural churn).
  bool divider_is_collapsed(std::size_t index, float threshold) const {
    const auto &first = subviews()[index]->frame();
    const auto &second = subviews()[index + 1]->frame();
    if (vertical_) {
      return !(first.w > threshold) && !(second.w > threshold);
    }
    return !(first.h > threshold) && !(second.h > threshold);
  }

  // Lays panes out by relative weight. Missing weights count as 1.
  void adjust_subviews(const std::vector<float> &weights = {}) {
    const auto &panes = subviews();
    if (panes.empty()) {
      return;
    }
    const auto &b = bounds();
    const float extent = vertical_ ? b.w : b.h;
    const float dividers =
        divider_thickness_ * static_cast<float>(panes.size() - 1);
    const float available = std::max(0.0f, extent - dividers);

    float total = 0.0f;
    for (std::size_t i = 0; i < panes.size(); ++i) {
      total += i < weights.size() ? std::max(0.0f, weights[i]) : 1.0f;
    }
    if (total <= 0.0f) {
      total = 1.0f;
    }

    float cursor = vertical_ ? b.x : b.y;
    for (std::size_t i = 0; i < panes.size(); ++i) {
      const float w = i < weights.size() ? std::max(0.0f, weights[i]) : 1.0f;
      const float size = available * w / total;
      if (vertical_) {
        panes[i]->set_frame(RectF{cursor, b.y, size, b.h});
      } else {
        panes[i]->set_frame(RectF{b.x, cursor, b.w, size});
      }
      cursor += size + divider_thickness_;
    }
    did_resize_subviews();
  }

  void did_resize_subviews() {
    if (auto *w = window()) {
      w->notify_split_view_resized();
    }
  }

private:
  bool vertical_{true};
  float divider_thickness_{1.0f};
  ColorU8 divider_color_{60, 60, 60, 255};
  std::optional<ColorU8> background_color_{};
};

} // namespace harbor::ui
