#pragma once

#include <algorithm>
#include <cmath>
#include <optional>

namespace harbor::ui {

struct PointF {
  float x{};
  float y{};
};

struct SizeF {
  float w{};
  float h{};
};

struct RectF {
  float x{};
  float y{};
  float w{};
  float h{};

  float min_x() const { return x; }
  float min_y() const { return y; }
  float max_x() const { return x + w; }
  float max_y() const { return y + h; }
  float mid_x() const { return x + w * 0.5f; }
  float mid_y() const { return y + h * 0.5f; }
  SizeF size() const { return SizeF{w, h}; }
};

inline float clampf(float v, float lo, float hi) {
  return std::min(std::max(v, lo), hi);
}

inline bool rect_is_finite(const RectF &r) {
  return std::isfinite(r.x) && std::isfinite(r.y) && std::isfinite(r.w) &&
         std::isfinite(r.h);
}

inline bool rect_is_empty(const RectF &r) { return !(r.w > 0.0f) || !(r.h > 0.0f); }

inline bool rect_contains(const RectF &r, PointF p) {
  return p.x >= r.x && p.y >= r.y && p.x < r.max_x() && p.y < r.max_y();
}

inline bool rect_contains_inclusive(const RectF &r, PointF p) {
  return p.x >= r.x && p.y >= r.y && p.x <= r.max_x() && p.y <= r.max_y();
}

// Returns nullopt when the rectangles do not touch. Touching edges give a
// zero-area rectangle.
inline std::optional<RectF> rect_intersection(const RectF &a, const RectF &b) {
  const float x0 = std::max(a.x, b.x);
  const float y0 = std::max(a.y, b.y);
  const float x1 = std::min(a.max_x(), b.max_x());
  const float y1 = std::min(a.max_y(), b.max_y());
  if (!(x1 >= x0) || !(y1 >= y0)) {
    return std::nullopt;
  }
  return RectF{x0, y0, x1 - x0, y1 - y0};
}

inline RectF intersect_rect(RectF a, RectF b) {
  const float x0 = std::max(a.x, b.x);
  const float y0 = std::max(a.y, b.y);
  const float x1 = std::min(a.x + a.w, b.x + b.w);
  const float y1 = std::min(a.y + a.h, b.y + b.h);
  const float w = std::max(0.0f, x1 - x0);
  const float h = std::max(0.0f, y1 - y0);
  return RectF{x0, y0, w, h};
}

inline bool rects_intersect(const RectF &a, const RectF &b) {
  return a.x < b.max_x() && b.x < a.max_x() && a.y < b.max_y() &&
         b.y < a.max_y();
}

inline RectF inset_rect(RectF r, float dx, float dy) {
  return RectF{r.x + dx, r.y + dy, r.w - dx * 2.0f, r.h - dy * 2.0f};
}

inline RectF offset_rect(RectF r, float dx, float dy) {
  return RectF{r.x + dx, r.y + dy, r.w, r.h};
}

inline bool rect_approximately_equal(const RectF &a, const RectF &b,
                                     float epsilon = 0.01f) {
  return std::abs(a.x - b.x) <= epsilon && std::abs(a.y - b.y) <= epsilon &&
         std::abs(a.w - b.w) <= epsilon && std::abs(a.h - b.h) <= epsilon;
}

// Rounds to the device pixel grid. Non-finite input is returned untouched so
// callers can still detect it.
inline RectF pixel_snapped_rect(const RectF &r, float backing_scale) {
  if (!rect_is_finite(r)) {
    return r;
  }
  const float scale = std::isfinite(backing_scale)
                          ? std::max(1.0f, backing_scale)
                          : 1.0f;
  auto snap = [scale](float v) { return std::round(v * scale) / scale; };
  return RectF{snap(r.x), snap(r.y), std::max(0.0f, snap(r.w)),
               std::max(0.0f, snap(r.h))};
}

} // namespace harbor::ui
