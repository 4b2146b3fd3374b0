#pragma once

#include <harbor/ui/geometry.hpp>
#include <harbor/ui/layout.hpp>
#include <harbor/ui/node.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace harbor::ui {

struct ColorU8 {
  std::uint8_t r{};
  std::uint8_t g{};
  std::uint8_t b{};
  std::uint8_t a{255};
};

inline bool operator==(const ColorU8 &a, const ColorU8 &b) {
  return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}

inline bool operator!=(const ColorU8 &a, const ColorU8 &b) { return !(a == b); }

struct DrawRect {
  RectF rect;
  ColorU8 fill;
};

struct DrawText {
  RectF rect;
  std::string text;
  ColorU8 color;
  float font_px{16.0f};
};

struct PushClip {
  RectF rect;
};

struct PopClip {};

using RenderOp = std::variant<PushClip, PopClip, DrawRect, DrawText>;

struct Renderer {
  virtual ~Renderer() = default;
  virtual void push_clip(const PushClip &c) = 0;
  virtual void pop_clip(const PopClip &c) = 0;
  virtual void draw_rect(const DrawRect &r) = 0;
  virtual void draw_text(const DrawText &t) = 0;
};

inline void render_with(Renderer &renderer, const std::vector<RenderOp> &ops) {
  for (const auto &op : ops) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, PushClip>) {
            renderer.push_clip(v);
          } else if constexpr (std::is_same_v<T, PopClip>) {
            renderer.pop_clip(v);
          } else if constexpr (std::is_same_v<T, DrawRect>) {
            renderer.draw_rect(v);
          } else if constexpr (std::is_same_v<T, DrawText>) {
            renderer.draw_text(v);
          }
        },
        op);
  }
}

namespace chrome {
inline constexpr ColorU8 sidebar_fill{40, 40, 48, 255};
inline constexpr ColorU8 divider_fill{140, 140, 140, 255};
inline constexpr ColorU8 anchor_fill{16, 16, 16, 255};
inline constexpr ColorU8 text_color{255, 255, 255, 255};
} // namespace chrome

// Chrome drawn by the declarative layer itself. Hosted surfaces paint on
// top of the anchor placeholders separately.
inline void build_render_ops(const ViewNode &v, const LayoutNode &l,
                             std::vector<RenderOp> &out) {
  const bool clips = v.type == "ScrollView" && prop_as_bool(v.props, "clip", true);
  if (clips) {
    out.push_back(PushClip{l.frame});
  }

  if (v.type == "Sidebar") {
    out.push_back(DrawRect{l.frame, chrome::sidebar_fill});
  } else if (v.type == "PortalAnchor") {
    out.push_back(DrawRect{l.frame, chrome::anchor_fill});
  } else if (v.type == "Text") {
    const auto text = prop_as_string(v.props, "value", "");
    const auto font_px = prop_as_float(v.props, "font_size", 16.0f);
    out.push_back(DrawText{l.frame, text, chrome::text_color, font_px});
  }

  const auto n = std::min(v.children.size(), l.children.size());
  for (std::size_t i = 0; i < n; ++i) {
    build_render_ops(v.children[i], l.children[i], out);
  }

  if (v.type == "Split") {
    const bool vertical = prop_as_bool(v.props, "vertical", true);
    const float thickness =
        std::max(1.0f, prop_as_float(v.props, "divider", 1.0f));
    for (std::size_t i = 0; i + 1 < l.children.size(); ++i) {
      const auto &f = l.children[i].frame;
      const RectF d = vertical ? RectF{f.max_x(), l.frame.y, thickness, l.frame.h}
                               : RectF{l.frame.x, f.max_y(), l.frame.w, thickness};
      out.push_back(DrawRect{d, chrome::divider_fill});
    }
  }

  if (clips) {
    out.push_back(PopClip{});
  }
}

inline std::vector<RenderOp> build_render_ops(const ViewNode &root,
                                              const LayoutNode &layout_root) {
  std::vector<RenderOp> out;
  build_render_ops(root, layout_root, out);
  return out;
}

inline void dump_render_ops(std::ostream &os,
                            const std::vector<RenderOp> &ops) {
  for (const auto &op : ops) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, PushClip>) {
            os << "PushClip [" << v.rect.x << "," << v.rect.y << " " << v.rect.w
               << "x" << v.rect.h << "]\n";
          } else if constexpr (std::is_same_v<T, PopClip>) {
            os << "PopClip\n";
          } else if constexpr (std::is_same_v<T, DrawRect>) {
            os << "Rect [" << v.rect.x << "," << v.rect.y << " " << v.rect.w
               << "x" << v.rect.h << "]\n";
          } else if constexpr (std::is_same_v<T, DrawText>) {
            os << "Text [" << v.rect.x << "," << v.rect.y << " " << v.rect.w
               << "x" << v.rect.h << "] '" << v.text << "'\n";
          }
        },
        op);
  }
}

struct AsciiSurface {
  int cols{};
  int rows{};
  std::vector<char> cells;

  AsciiSurface(int c, int r) : cols{c}, rows{r}, cells(c * r, ' ') {}

  void clear(char ch = ' ') { std::fill(cells.begin(), cells.end(), ch); }

  void set(int x, int y, char ch) {
    if (x < 0 || y < 0 || x >= cols || y >= rows) {
      return;
    }
    cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols) +
          static_cast<std::size_t>(x)] = ch;
  }

  char get(int x, int y) const {
    if (x < 0 || y < 0 || x >= cols || y >= rows) {
      return ' ';
    }
    return cells[static_cast<std::size_t>(y) * static_cast<std::size_t>(cols) +
                 static_cast<std::size_t>(x)];
  }
};

// Brightness ramp: dark fills stay blank so text on top stays readable.
inline char ascii_fill_for(ColorU8 c) {
  const int lum = (static_cast<int>(c.r) + c.g + c.b) / 3;
  if (lum < 32) {
    return ' ';
  }
  if (lum < 80) {
    return '.';
  }
  if (lum < 160) {
    return '+';
  }
  return '#';
}

inline void draw_rect_ascii(AsciiSurface &s, RectF r, char ch,
                            const std::optional<RectF> &clip = std::nullopt) {
  if (clip) {
    r = intersect_rect(r, *clip);
  }
  const auto x0 = static_cast<int>(std::floor(r.x));
  const auto y0 = static_cast<int>(std::floor(r.y));
  const auto x1 = static_cast<int>(std::ceil(r.x + r.w));
  const auto y1 = static_cast<int>(std::ceil(r.y + r.h));
  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      s.set(x, y, ch);
    }
  }
}

inline void draw_text_ascii(AsciiSurface &s, RectF r, std::string_view text,
                            const std::optional<RectF> &clip = std::nullopt) {
  const auto x0 = static_cast<int>(std::floor(r.x));
  const auto y0 = static_cast<int>(std::floor(r.y));
  if (y0 < 0 || y0 >= s.rows) {
    return;
  }
  int x = x0;
  for (char ch : text) {
    if (x >= s.cols) {
      break;
    }
    const bool clipped =
        clip && !rect_contains(*clip, PointF{static_cast<float>(x) + 0.5f,
                                             static_cast<float>(y0) + 0.5f});
    if (x >= 0 && !clipped) {
      s.set(x, y0, ch);
    }
    ++x;
  }
}

inline void render_ascii(std::ostream &os, const std::vector<RenderOp> &ops,
                         SizeF viewport_px, int cols = 80, int rows = 24) {
  if (cols <= 0 || rows <= 0) {
    return;
  }

  AsciiSurface surf{cols, rows};
  surf.clear(' ');

  const float sx =
      viewport_px.w > 0 ? static_cast<float>(cols) / viewport_px.w : 1.0f;
  const float sy =
      viewport_px.h > 0 ? static_cast<float>(rows) / viewport_px.h : 1.0f;

  auto map_rect = [&](RectF r) {
    return RectF{r.x * sx, r.y * sy, r.w * sx, r.h * sy};
  };

  std::vector<RectF> clips;
  auto current_clip = [&]() -> std::optional<RectF> {
    if (clips.empty()) {
      return std::nullopt;
    }
    return clips.back();
  };

  for (const auto &op : ops) {
    std::visit(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, PushClip>) {
            auto r = map_rect(v.rect);
            if (!clips.empty()) {
              r = intersect_rect(r, clips.back());
            }
            clips.push_back(r);
          } else if constexpr (std::is_same_v<T, PopClip>) {
            if (!clips.empty()) {
              clips.pop_back();
            }
          } else if constexpr (std::is_same_v<T, DrawRect>) {
            draw_rect_ascii(surf, map_rect(v.rect), ascii_fill_for(v.fill),
                            current_clip());
          } else if constexpr (std::is_same_v<T, DrawText>) {
            draw_text_ascii(surf, map_rect(v.rect), v.text, current_clip());
          }
        },
        op);
  }

  for (int y = 0; y < rows; ++y) {
    for (int x = 0; x < cols; ++x) {
      os.put(surf.get(x, y));
    }
    os.put('\n');
  }
}

} // namespace harbor::ui
