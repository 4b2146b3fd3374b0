#pragma once

#include <harbor/ui/runtime.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace harbor::ui::examples {

inline std::string trim_ascii(std::string s) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) {
    s.erase(s.begin());
  }
  while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
  return s;
}

inline std::vector<std::string> split_ws(std::string_view s) {
  std::vector<std::string> out;
  std::string cur;
  for (char ch : s) {
    if (std::isspace(static_cast<unsigned char>(ch))) {
      if (!cur.empty()) {
        out.push_back(std::move(cur));
        cur.clear();
      }
      continue;
    }
    cur.push_back(ch);
  }
  if (!cur.empty()) {
    out.push_back(std::move(cur));
  }
  return out;
}

// Stand-in for an expensive terminal renderer: a scrollback buffer drawn into
// a character grid sized from the view's bounds. The portal only moves and
// hides it; the grid follows whatever frame it was given.
class TerminalSurface : public HostedView {
public:
  explicit TerminalSurface(std::string title, std::size_t scrollback = 400)
      : title_{std::move(title)}, scrollback_{scrollback} {
    set_debug_name("terminal:" + title_);
    push_line(title_);
  }

  std::string_view kind() const override { return "TerminalSurface"; }

  const std::string &title() const { return title_; }

  void reconcile_geometry_now() override {
    ++reconcile_count_;
    const auto b = bounds();
    cols_ = std::max(0, static_cast<int>(std::floor(b.w / cell_w_)));
    rows_ = std::max(0, static_cast<int>(std::floor(b.h / cell_h_)));
  }

  void refresh_surface_now() override { ++refresh_count_; }

  std::size_t reconcile_count() const { return reconcile_count_; }
  std::size_t refresh_count() const { return refresh_count_; }
  int cols() const { return cols_; }
  int rows() const { return rows_; }

  const std::vector<std::string> &lines() const { return lines_; }

  void push_line(std::string line) {
    lines_.push_back(std::move(line));
    if (lines_.size() > scrollback_) {
      lines_.erase(lines_.begin(),
                   lines_.begin() +
                       static_cast<std::ptrdiff_t>(lines_.size() - scrollback_));
    }
  }

  void submit(const std::string &raw) {
    const auto cmd_raw = trim_ascii(raw);
    if (cmd_raw.empty()) {
      return;
    }
    push_line("$ " + cmd_raw);
    if (history_.empty() || history_.back() != cmd_raw) {
      history_.push_back(cmd_raw);
    }

    const auto parts = split_ws(cmd_raw);
    const auto &cmd = parts.front();
    if (cmd == "help") {
      push_line("echo <text>: print text");
      push_line("clear: clear scrollback");
      push_line("size: show grid size");
      push_line("history: show recent commands");
    } else if (cmd == "echo") {
      push_line(cmd_raw.size() > 4 ? trim_ascii(cmd_raw.substr(4)) : std::string{});
    } else if (cmd == "clear") {
      lines_.clear();
    } else if (cmd == "size") {
      push_line(std::to_string(cols_) + "x" + std::to_string(rows_));
    } else if (cmd == "history") {
      for (std::size_t i = 0; i < history_.size(); ++i) {
        push_line(std::to_string(i) + ": " + history_[i]);
      }
    } else {
      push_line("unknown command: " + cmd);
    }
  }

  // Window-space ops for the visible tail of the scrollback.
  void append_render_ops(std::vector<RenderOp> &out) const {
    if (hidden_or_ancestor_hidden()) {
      return;
    }
    const auto area = bounds_in_window();
    out.push_back(PushClip{area});
    out.push_back(DrawRect{area, background_});
    const auto visible =
        std::min(lines_.size(), static_cast<std::size_t>(std::max(0, rows_)));
    const auto first = lines_.size() - visible;
    for (std::size_t i = 0; i < visible; ++i) {
      const RectF row{area.x, area.y + static_cast<float>(i) * cell_h_, area.w,
                      cell_h_};
      out.push_back(DrawText{row, lines_[first + i], foreground_, cell_h_ * 0.8f});
    }
    out.push_back(PopClip{});
  }

private:
  std::string title_;
  std::size_t scrollback_{};
  std::vector<std::string> lines_;
  std::vector<std::string> history_;
  std::size_t reconcile_count_{0};
  std::size_t refresh_count_{0};
  int cols_{0};
  int rows_{0};
  float cell_w_{8.0f};
  float cell_h_{16.0f};
  ColorU8 background_{20, 20, 28, 255};
  ColorU8 foreground_{220, 220, 220, 255};
};

// Owns the surfaces; the UI only ever refers to them by key.
class TerminalStore {
public:
  std::shared_ptr<TerminalSurface> open(const std::string &key) {
    auto &slot = surfaces_[key];
    if (!slot) {
      slot = std::make_shared<TerminalSurface>(key);
    }
    return slot;
  }

  std::shared_ptr<TerminalSurface> find(const std::string &key) const {
    const auto it = surfaces_.find(key);
    return it == surfaces_.end() ? nullptr : it->second;
  }

  void close(const std::string &key) { surfaces_.erase(key); }

  std::size_t size() const { return surfaces_.size(); }

  SurfaceResolver resolver() {
    return [this](const std::string &key) -> std::shared_ptr<HostedView> {
      return find(key);
    };
  }

private:
  std::map<std::string, std::shared_ptr<TerminalSurface>> surfaces_;
};

struct WorkspaceState {
  std::vector<std::string> panes;
  bool vertical{true};
  float sidebar_width{160.0f};
  bool sidebar_visible{true};
};

// Sidebar with one row per pane, then the panes split side by side (or
// stacked) with a portal anchor in each.
inline ViewNode workspace_view(const WorkspaceState &state) {
  std::vector<ViewNode> panes;
  for (const auto &key : state.panes) {
    panes.push_back(PortalAnchor(key));
  }

  std::vector<ViewNode> tabs;
  for (const auto &key : state.panes) {
    tabs.push_back(Text(key));
  }

  auto split = view("Split")
                   .key("panes")
                   .prop("vertical", state.vertical)
                   .prop("divider", 1.0)
                   .children(std::move(panes))
                   .build();

  auto root = view("Row").key("workspace");
  if (state.sidebar_visible) {
    auto sidebar = view("Sidebar")
                       .key("sidebar")
                       .prop("width", static_cast<double>(state.sidebar_width))
                       .prop("padding", 8.0)
                       .prop("spacing", 4.0)
                       .children(std::move(tabs))
                       .build();
    root.children({std::move(sidebar), std::move(split)});
  } else {
    root.children({std::move(split)});
  }
  return std::move(root).build();
}

// Chrome, then every visible hosted surface in host order, then the divider
// overlay on top.
inline std::vector<RenderOp> compose_frame(const std::vector<RenderOp> &chrome,
                                           Portal *portal) {
  std::vector<RenderOp> ops = chrome;
  if (portal == nullptr) {
    return ops;
  }
  for (const auto &child : portal->host().subviews()) {
    if (const auto *surface = dynamic_cast<const TerminalSurface *>(child.get())) {
      surface->append_render_ops(ops);
    }
  }
  portal->divider_overlay().append_render_ops(ops);
  return ops;
}

} // namespace harbor::ui::examples
