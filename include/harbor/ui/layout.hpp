#pragma once

#include <harbor/ui/geometry.hpp>
#include <harbor/ui/node.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace harbor::ui {

struct ConstraintsF {
  float max_w{};
  float max_h{};
};

// Absolute (content-space) frames for one ViewNode tree.
struct LayoutNode {
  NodeId id{};
  std::string key;
  std::string type;
  RectF frame;
  std::vector<LayoutNode> children;
};

inline const PropValue *find_prop(const Props &props, const std::string &key) {
  const auto it = props.find(key);
  if (it == props.end()) {
    return nullptr;
  }
  return &it->second;
}

inline float prop_as_float(const Props &props, const std::string &key,
                           float fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }

  if (const auto *d = std::get_if<double>(pv)) {
    return static_cast<float>(*d);
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return static_cast<float>(*i);
  }
  if (const auto *b = std::get_if<bool>(pv)) {
    return *b ? 1.0f : 0.0f;
  }
  return fallback;
}

inline std::string prop_as_string(const Props &props, const std::string &key,
                                  std::string fallback = {}) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *s = std::get_if<std::string>(pv)) {
    return *s;
  }
  return fallback;
}

inline bool prop_as_bool(const Props &props, const std::string &key,
                         bool fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *b = std::get_if<bool>(pv)) {
    return *b;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return *i != 0;
  }
  if (const auto *d = std::get_if<double>(pv)) {
    return *d != 0.0;
  }
  return fallback;
}

inline std::int64_t prop_as_int(const Props &props, const std::string &key,
                                std::int64_t fallback) {
  const auto *pv = find_prop(props, key);
  if (!pv) {
    return fallback;
  }
  if (const auto *i = std::get_if<std::int64_t>(pv)) {
    return *i;
  }
  if (const auto *d = std::get_if<double>(pv)) {
    return static_cast<std::int64_t>(*d);
  }
  return fallback;
}

// Share of leftover main-axis space a child takes in a Row/Column. Splits
// and anchors expand by default.
inline float grow_factor(const ViewNode &node) {
  const float fallback =
      (node.type == "Split" || node.type == "PortalAnchor") ? 1.0f : 0.0f;
  return std::max(0.0f, prop_as_float(node.props, "grow", fallback));
}

inline SizeF apply_explicit_size(const ViewNode &node, ConstraintsF constraints,
                                 SizeF s) {
  if (find_prop(node.props, "width")) {
    s.w = clampf(prop_as_float(node.props, "width", s.w), 0.0f,
                 constraints.max_w);
  }
  if (find_prop(node.props, "height")) {
    s.h = clampf(prop_as_float(node.props, "height", s.h), 0.0f,
                 constraints.max_h);
  }
  return s;
}

inline SizeF measure_leaf(const ViewNode &node, ConstraintsF constraints) {
  const auto font_size = prop_as_float(node.props, "font_size", 16.0f);
  const auto padding = prop_as_float(node.props, "padding", 0.0f);
  const auto char_w = font_size * 0.5f;
  const auto line_h = font_size * 1.2f;

  if (node.type == "Text") {
    const auto text = prop_as_string(node.props, "value", "");
    const auto w = static_cast<float>(text.size()) * char_w + padding * 2.0f;
    const auto h = line_h + padding * 2.0f;
    return apply_explicit_size(node, constraints,
                               SizeF{clampf(w, 0.0f, constraints.max_w),
                                     clampf(h, 0.0f, constraints.max_h)});
  }

  return apply_explicit_size(node, constraints, SizeF{0.0f, 0.0f});
}

inline SizeF measure_node(const ViewNode &node, ConstraintsF constraints) {
  const auto padding = prop_as_float(node.props, "padding", 0.0f);
  const auto spacing = prop_as_float(node.props, "spacing", 0.0f);
  const auto inner_max_w = std::max(0.0f, constraints.max_w - padding * 2.0f);
  const auto inner_max_h = std::max(0.0f, constraints.max_h - padding * 2.0f);
  const auto inner = ConstraintsF{inner_max_w, inner_max_h};

  if (node.type == "Split") {
    return apply_explicit_size(node, constraints, SizeF{0.0f, 0.0f});
  }

  if (node.type == "ScrollView") {
    const auto default_w = prop_as_float(node.props, "default_width", 160.0f);
    const auto default_h = prop_as_float(node.props, "default_height", 160.0f);
    return apply_explicit_size(node, constraints,
                               SizeF{clampf(default_w, 0.0f, constraints.max_w),
                                     clampf(default_h, 0.0f, constraints.max_h)});
  }

  if (node.type == "Column" || node.type == "Sidebar") {
    float w = 0.0f;
    float h = 0.0f;
    for (std::size_t i = 0; i < node.children.size(); ++i) {
      const auto cs = measure_node(node.children[i], inner);
      w = std::max(w, cs.w);
      h += cs.h;
      if (i + 1 < node.children.size()) {
        h += spacing;
      }
    }
    w += padding * 2.0f;
    h += padding * 2.0f;
    return apply_explicit_size(node, constraints,
                               SizeF{clampf(w, 0.0f, constraints.max_w),
                                     clampf(h, 0.0f, constraints.max_h)});
  }

  if (node.type == "Row") {
    float w = 0.0f;
    float h = 0.0f;
    for (std::size_t i = 0; i < node.children.size(); ++i) {
      const auto cs = measure_node(node.children[i], inner);
      w += cs.w;
      h = std::max(h, cs.h);
      if (i + 1 < node.children.size()) {
        w += spacing;
      }
    }
    w += padding * 2.0f;
    h += padding * 2.0f;
    return apply_explicit_size(node, constraints,
                               SizeF{clampf(w, 0.0f, constraints.max_w),
                                     clampf(h, 0.0f, constraints.max_h)});
  }

  return measure_leaf(node, constraints);
}

inline LayoutNode layout_node(const ViewNode &node, RectF frame);

// Stacks children along one axis; leftover space goes to children with a
// grow factor, the cross axis is stretched.
inline void layout_linear(const ViewNode &node, RectF inner, bool horizontal,
                          LayoutNode &out) {
  const auto spacing = prop_as_float(node.props, "spacing", 0.0f);
  const auto constraints = ConstraintsF{inner.w, inner.h};
  const auto n = node.children.size();

  std::vector<float> main(n, 0.0f);
  float used = 0.0f;
  float total_grow = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    const auto cs = measure_node(node.children[i], constraints);
    main[i] = horizontal ? cs.w : cs.h;
    used += main[i];
    total_grow += grow_factor(node.children[i]);
  }
  if (n > 1) {
    used += spacing * static_cast<float>(n - 1);
  }
  const float extent = horizontal ? inner.w : inner.h;
  const float leftover = std::max(0.0f, extent - used);
  if (total_grow > 0.0f && leftover > 0.0f) {
    for (std::size_t i = 0; i < n; ++i) {
      main[i] += leftover * grow_factor(node.children[i]) / total_grow;
    }
  }

  float cursor = horizontal ? inner.x : inner.y;
  for (std::size_t i = 0; i < n; ++i) {
    const RectF child_frame = horizontal
                                  ? RectF{cursor, inner.y, main[i], inner.h}
                                  : RectF{inner.x, cursor, inner.w, main[i]};
    out.children.push_back(layout_node(node.children[i], child_frame));
    cursor += main[i] + spacing;
  }
}

inline void layout_split(const ViewNode &node, RectF frame, LayoutNode &out) {
  const bool vertical = prop_as_bool(node.props, "vertical", true);
  const float thickness =
      std::max(0.0f, prop_as_float(node.props, "divider", 1.0f));
  const auto n = node.children.size();
  if (n == 0) {
    return;
  }

  const float extent = vertical ? frame.w : frame.h;
  const float available =
      std::max(0.0f, extent - thickness * static_cast<float>(n - 1));
  float total = 0.0f;
  for (const auto &c : node.children) {
    total += std::max(0.0f, prop_as_float(c.props, "weight", 1.0f));
  }
  if (total <= 0.0f) {
    total = 1.0f;
  }

  float cursor = vertical ? frame.x : frame.y;
  for (const auto &c : node.children) {
    const float size =
        available * std::max(0.0f, prop_as_float(c.props, "weight", 1.0f)) /
        total;
    const RectF pane = vertical ? RectF{cursor, frame.y, size, frame.h}
                                : RectF{frame.x, cursor, frame.w, size};
    out.children.push_back(layout_node(c, pane));
    cursor += size + thickness;
  }
}

inline void layout_scrollview(const ViewNode &node, RectF frame,
                              LayoutNode &out) {
  const auto padding = prop_as_float(node.props, "padding", 0.0f);
  const auto spacing = prop_as_float(node.props, "spacing", 0.0f);
  const auto scroll_y = prop_as_float(node.props, "scroll_y", 0.0f);

  const auto inner_x = frame.x + padding;
  const auto inner_y = frame.y + padding;
  const auto inner_w = std::max(0.0f, frame.w - padding * 2.0f);
  const auto inner = ConstraintsF{inner_w, 1000000.0f};

  float cursor_y = inner_y - scroll_y;
  for (std::size_t i = 0; i < node.children.size(); ++i) {
    const auto cs = measure_node(node.children[i], inner);
    RectF child_frame{inner_x, cursor_y, inner_w, cs.h};
    out.children.push_back(layout_node(node.children[i], child_frame));
    cursor_y += cs.h;
    if (i + 1 < node.children.size()) {
      cursor_y += spacing;
    }
  }
}

inline LayoutNode layout_node(const ViewNode &node, RectF frame) {
  LayoutNode out;
  out.id = node.id;
  out.key = node.key;
  out.type = node.type;
  out.frame = frame;

  const auto padding = prop_as_float(node.props, "padding", 0.0f);
  const RectF inner{frame.x + padding, frame.y + padding,
                    std::max(0.0f, frame.w - padding * 2.0f),
                    std::max(0.0f, frame.h - padding * 2.0f)};

  if (node.type == "Split") {
    layout_split(node, frame, out);
    return out;
  }

  if (node.type == "ScrollView") {
    layout_scrollview(node, frame, out);
    return out;
  }

  if (node.type == "Row") {
    layout_linear(node, inner, true, out);
    return out;
  }

  if (node.type == "Column" || node.type == "Sidebar") {
    layout_linear(node, inner, false, out);
    return out;
  }

  for (const auto &c : node.children) {
    const auto cs = measure_node(c, ConstraintsF{inner.w, inner.h});
    out.children.push_back(layout_node(c, RectF{inner.x, inner.y, cs.w, cs.h}));
  }
  return out;
}

inline LayoutNode layout_tree(const ViewNode &root, SizeF viewport) {
  RectF root_frame{0.0f, 0.0f, viewport.w, viewport.h};
  return layout_node(root, root_frame);
}

inline void dump_layout(std::ostream &os, const LayoutNode &node,
                        int indent_spaces = 0) {
  for (int i = 0; i < indent_spaces; ++i) {
    os.put(' ');
  }

  os << node.type << "#" << node.id << " [" << node.frame.x << ","
     << node.frame.y << " " << node.frame.w << "x" << node.frame.h << "]\n";

  for (const auto &c : node.children) {
    dump_layout(os, c, indent_spaces + 2);
  }
}

} // namespace harbor::ui
