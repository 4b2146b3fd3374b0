#pragma once

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace harbor::ui {

struct PortalConfig {
  float rect_epsilon{0.01f};
  float tiny_frame_threshold{1.0f};
  float host_ready_threshold{1.0f};

  float divider_hit_expansion{5.0f};
  float cursor_rect_expansion{4.0f};
  float collapsed_pane_threshold{1.0f};

  float sidebar_hit_width_per_side{6.0f};
  float sidebar_leading_edge_epsilon{1.0f};
  float minimum_visible_leading_content_width{24.0f};
  int sidebar_flush_miss_limit{2};
  int sidebar_candidate_miss_limit{4};

  float overlay_axis_epsilon{0.01f};

  static PortalConfig from_env();
};

namespace detail {

inline float read_env_float_clamp(const char *name, float fallback, float lo,
                                  float hi) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || raw[0] == '\0') {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(raw, &end);
  if (end == raw || !std::isfinite(parsed)) {
    return fallback;
  }
  return std::clamp(static_cast<float>(parsed), lo, hi);
}

inline int read_env_int_clamp(const char *name, int fallback, int lo, int hi) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || raw[0] == '\0') {
    return fallback;
  }
  char *end = nullptr;
  const long parsed = std::strtol(raw, &end, 10);
  if (end == raw) {
    return fallback;
  }
  return static_cast<int>(std::clamp<long>(parsed, lo, hi));
}

} // namespace detail

inline PortalConfig PortalConfig::from_env() {
  PortalConfig c;
  c.rect_epsilon = detail::read_env_float_clamp("HARBOR_PORTAL_RECT_EPSILON",
                                                c.rect_epsilon, 0.0f, 1.0f);
  c.tiny_frame_threshold = detail::read_env_float_clamp(
      "HARBOR_PORTAL_TINY_FRAME", c.tiny_frame_threshold, 0.0f, 64.0f);
  c.host_ready_threshold = detail::read_env_float_clamp(
      "HARBOR_PORTAL_HOST_READY", c.host_ready_threshold, 0.0f, 64.0f);
  c.divider_hit_expansion = detail::read_env_float_clamp(
      "HARBOR_PORTAL_DIVIDER_EXPANSION", c.divider_hit_expansion, 0.0f, 32.0f);
  c.cursor_rect_expansion = detail::read_env_float_clamp(
      "HARBOR_PORTAL_CURSOR_EXPANSION", c.cursor_rect_expansion, 0.0f, 32.0f);
  c.collapsed_pane_threshold = detail::read_env_float_clamp(
      "HARBOR_PORTAL_COLLAPSED_PANE", c.collapsed_pane_threshold, 0.0f, 64.0f);
  c.sidebar_hit_width_per_side = detail::read_env_float_clamp(
      "HARBOR_PORTAL_SIDEBAR_HIT_WIDTH", c.sidebar_hit_width_per_side, 0.0f,
      64.0f);
  c.sidebar_leading_edge_epsilon = detail::read_env_float_clamp(
      "HARBOR_PORTAL_SIDEBAR_EDGE_EPSILON", c.sidebar_leading_edge_epsilon,
      0.0f, 16.0f);
  c.minimum_visible_leading_content_width = detail::read_env_float_clamp(
      "HARBOR_PORTAL_MIN_LEADING_WIDTH",
      c.minimum_visible_leading_content_width, 0.0f, 512.0f);
  c.sidebar_flush_miss_limit = detail::read_env_int_clamp(
      "HARBOR_PORTAL_SIDEBAR_FLUSH_MISSES", c.sidebar_flush_miss_limit, 1, 64);
  c.sidebar_candidate_miss_limit = detail::read_env_int_clamp(
      "HARBOR_PORTAL_SIDEBAR_CANDIDATE_MISSES", c.sidebar_candidate_miss_limit,
      1, 64);
  c.overlay_axis_epsilon = detail::read_env_float_clamp(
      "HARBOR_PORTAL_OVERLAY_EPSILON", c.overlay_axis_epsilon, 0.0f, 1.0f);
  return c;
}

} // namespace harbor::ui
