#pragma once

#include <harbor/ui/view.hpp>

#include <string_view>

namespace harbor::ui {

// Container view of an externally owned rendering surface. The portal only
// moves, hides and reorders it; the surface's internals stay with its owner.
class HostedView : public View {
public:
  using View::View;

  std::string_view kind() const override { return "HostedView"; }

  // Bring inner scroll/surface geometry in line with the current frame.
  virtual void reconcile_geometry_now() = 0;

  // Redraw the surface immediately with the current geometry.
  virtual void refresh_surface_now() = 0;

  // The drop target inside this view at `point` (bounds space), if any.
  virtual View *surface_for_drop(PointF point) {
    if (!rect_contains(bounds(), point)) {
      return nullptr;
    }
    return this;
  }
};

} // namespace harbor::ui
