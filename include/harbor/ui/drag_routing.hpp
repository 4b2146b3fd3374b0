#pragma once

#include <harbor/ui/window.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace harbor::ui {

inline constexpr std::string_view tab_transfer_drag_type = "harbor.tab-transfer";
inline constexpr std::string_view sidebar_tab_reorder_drag_type =
    "harbor.sidebar-tab-reorder";

inline bool has_drag_type(const std::vector<std::string> &types,
                          std::string_view wanted) {
  return std::any_of(types.begin(), types.end(),
                     [wanted](const std::string &t) { return t == wanted; });
}

inline bool has_tab_transfer(const std::vector<std::string> &types) {
  return has_drag_type(types, tab_transfer_drag_type);
}

inline bool has_sidebar_tab_reorder(const std::vector<std::string> &types) {
  return has_drag_type(types, sidebar_tab_reorder_drag_type);
}

// Events that can be delivered while a drag session is in flight. Clicks and
// plain moves never are.
inline bool is_drag_phase_event(PointerEventKind kind) {
  switch (kind) {
  case PointerEventKind::None:
  case PointerEventKind::CursorUpdate:
  case PointerEventKind::LeftMouseDragged:
  case PointerEventKind::RightMouseDragged:
  case PointerEventKind::OtherMouseDragged:
  case PointerEventKind::Periodic:
  case PointerEventKind::ApplicationDefined:
    return true;
  case PointerEventKind::MouseMoved:
  case PointerEventKind::LeftMouseDown:
  case PointerEventKind::LeftMouseUp:
    return false;
  }
  return false;
}

// Tab and sidebar drags target drop zones owned by the declarative layer
// underneath the portal host, so the host must decline those hits.
inline bool should_pass_through_portal_hit_testing(const PointerContext &ctx) {
  if (!has_tab_transfer(ctx.drag_types) &&
      !has_sidebar_tab_reorder(ctx.drag_types)) {
    return false;
  }
  return is_drag_phase_event(ctx.event);
}

inline std::string_view event_name(PointerEventKind kind) {
  switch (kind) {
  case PointerEventKind::None:
    return "none";
  case PointerEventKind::CursorUpdate:
    return "cursorUpdate";
  case PointerEventKind::MouseMoved:
    return "mouseMoved";
  case PointerEventKind::LeftMouseDown:
    return "leftMouseDown";
  case PointerEventKind::LeftMouseUp:
    return "leftMouseUp";
  case PointerEventKind::LeftMouseDragged:
    return "leftMouseDragged";
  case PointerEventKind::RightMouseDragged:
    return "rightMouseDragged";
  case PointerEventKind::OtherMouseDragged:
    return "otherMouseDragged";
  case PointerEventKind::Periodic:
    return "periodic";
  case PointerEventKind::ApplicationDefined:
    return "applicationDefined";
  }
  return "other";
}

} // namespace harbor::ui
