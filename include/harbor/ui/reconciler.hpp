#pragma once

#include <harbor/ui/config.hpp>
#include <harbor/ui/geometry.hpp>
#include <harbor/ui/view.hpp>

#include <optional>
#include <vector>

namespace harbor::ui {

struct GeometryInput {
  // Anchor bounds converted to window space.
  RectF anchor_in_window;
  // Window-space bounds of the anchor's ancestors, innermost first, ending
  // with the portal's reference node.
  std::vector<RectF> ancestor_clips;
  // Window position of the host's bounds origin.
  PointF host_offset;
  RectF host_bounds;
  float backing_scale{1.0f};
};

struct GeometryResult {
  RectF raw;
  RectF target;
  bool host_ready{false};
  bool finite{false};
  bool visible_intersection{false};
  bool tiny{false};
};

// Walks from the anchor's parent up to and including `reference` (or the
// root when `reference` is not an ancestor).
inline std::vector<RectF> collect_clip_chain(const View &anchor,
                                             const View *reference) {
  std::vector<RectF> out;
  for (const View *cur = anchor.superview(); cur != nullptr;
       cur = cur->superview()) {
    out.push_back(cur->bounds_in_window());
    if (cur == reference) {
      break;
    }
  }
  return out;
}

inline RectF effective_frame_in_window(RectF anchor_in_window,
                                       const std::vector<RectF> &clips) {
  RectF frame = anchor_in_window;
  if (!rect_is_finite(frame)) {
    return frame;
  }
  for (const auto &clip : clips) {
    if (!rect_is_finite(clip)) {
      continue;
    }
    const auto next = rect_intersection(frame, clip);
    if (!next) {
      return RectF{};
    }
    frame = *next;
  }
  return frame;
}

inline bool host_bounds_ready(const RectF &host_bounds,
                              const PortalConfig &config) {
  return rect_is_finite(host_bounds) &&
         host_bounds.w > config.host_ready_threshold &&
         host_bounds.h > config.host_ready_threshold;
}

inline GeometryResult reconcile_geometry(const GeometryInput &in,
                                         const PortalConfig &config) {
  GeometryResult out;
  const auto in_window =
      effective_frame_in_window(in.anchor_in_window, in.ancestor_clips);
  const auto in_host =
      offset_rect(in_window, -in.host_offset.x, -in.host_offset.y);
  out.raw = pixel_snapped_rect(in_host, in.backing_scale);
  out.host_ready = host_bounds_ready(in.host_bounds, config);
  out.finite = rect_is_finite(out.raw);

  const auto clamped = rect_intersection(out.raw, in.host_bounds);
  out.visible_intersection = clamped &&
                             clamped->w > config.tiny_frame_threshold &&
                             clamped->h > config.tiny_frame_threshold;
  out.target = (out.finite && out.visible_intersection) ? *clamped : out.raw;
  out.tiny = !(out.target.w > config.tiny_frame_threshold) ||
             !(out.target.h > config.tiny_frame_threshold);
  return out;
}

inline bool should_hide(const GeometryResult &g, bool visible_in_ui,
                        bool anchor_hidden) {
  return !visible_in_ui || anchor_hidden || g.tiny || !g.finite ||
         !g.visible_intersection;
}

// Frame used to place a hosted view before it enters the host. nullopt when
// the anchor geometry is not finite yet.
inline std::optional<RectF> seeded_frame(const GeometryInput &in,
                                         const PortalConfig &config) {
  const auto in_window =
      effective_frame_in_window(in.anchor_in_window, in.ancestor_clips);
  const auto raw = pixel_snapped_rect(
      offset_rect(in_window, -in.host_offset.x, -in.host_offset.y),
      in.backing_scale);
  if (!rect_is_finite(raw)) {
    return std::nullopt;
  }
  if (rect_is_finite(in.host_bounds)) {
    const auto clamped = rect_intersection(raw, in.host_bounds);
    if (clamped && clamped->w > config.tiny_frame_threshold &&
        clamped->h > config.tiny_frame_threshold) {
      return *clamped;
    }
  }
  return raw;
}

} // namespace harbor::ui
