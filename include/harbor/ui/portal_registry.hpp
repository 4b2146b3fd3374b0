#pragma once

#include <harbor/ui/config.hpp>
#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/portal.hpp>
#include <harbor/ui/run_loop.hpp>
#include <harbor/ui/signal.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace harbor::ui {

// Process-wide routing from windows to their portals. Callers talk to the
// registry with hosted views and anchors; it finds (or lazily creates) the
// right portal and follows hosted views that move between windows.
class PortalRegistry {
public:
  explicit PortalRegistry(RunLoop &loop = RunLoop::main(),
                          PortalConfig config = PortalConfig::from_env())
      : loop_{&loop}, config_{config} {}

  PortalRegistry(const PortalRegistry &) = delete;
  PortalRegistry &operator=(const PortalRegistry &) = delete;

  static PortalRegistry &shared() {
    static PortalRegistry registry;
    return registry;
  }

  // No-op while the anchor is not in a window or its window has closed.
  void bind(const std::shared_ptr<HostedView> &hosted,
            const std::shared_ptr<View> &anchor, bool visible_in_ui,
            int z_priority = 0) {
    if (!hosted || !anchor) {
      return;
    }
    auto *window = anchor->window();
    if (window == nullptr) {
      return;
    }
    auto *next = portal_for_window(*window);
    if (next == nullptr) {
      return;
    }

    const auto window_id = window->id();
    const auto hosted_id = hosted->id();

    if (const auto it = hosted_to_window_.find(hosted_id);
        it != hosted_to_window_.end() && it->second != window_id) {
      if (auto *old = portal_for_id(it->second)) {
        old->detach(hosted_id);
      }
    }

    next->bind(hosted, anchor, visible_in_ui, z_priority);
    hosted_to_window_.insert_or_assign(hosted_id, window_id);
    prune_hosted_mappings(window_id, next->hosted_ids());
  }

  void synchronize_for_anchor(const View &anchor) {
    auto *window = anchor.window();
    if (window == nullptr) {
      return;
    }
    if (auto *portal = portal_for_window(*window)) {
      portal->synchronize_for_anchor(anchor);
      prune_hosted_mappings(window->id(), portal->hosted_ids());
    }
  }

  void hide_entry(const HostedView &hosted) {
    if (auto *portal = portal_tracking(hosted.id())) {
      portal->hide_entry(hosted.id());
    }
  }

  void update_entry_visibility(const HostedView &hosted, bool visible_in_ui) {
    if (auto *portal = portal_tracking(hosted.id())) {
      portal->update_entry_visibility(hosted.id(), visible_in_ui);
    }
  }

  bool detach(const HostedView &hosted) {
    const auto it = hosted_to_window_.find(hosted.id());
    if (it == hosted_to_window_.end()) {
      return false;
    }
    auto *portal = portal_for_id(it->second);
    hosted_to_window_.erase(it);
    return portal != nullptr && portal->detach(hosted.id());
  }

  View *view_at_window_point(Window &window, PointF window_point) {
    auto *portal = portal_for_window(window);
    return portal != nullptr ? portal->view_at_window_point(window_point)
                             : nullptr;
  }

  View *surface_at_window_point(Window &window, PointF window_point) {
    auto *portal = portal_for_window(window);
    return portal != nullptr ? portal->surface_at_window_point(window_point)
                             : nullptr;
  }

  std::size_t portal_count() const { return contexts_.size(); }

  Portal *portal_for(const Window &window) const {
    return portal_for_id(window.id());
  }

  std::optional<WindowId> window_for_hosted(ViewId hosted_id) const {
    const auto it = hosted_to_window_.find(hosted_id);
    if (it == hosted_to_window_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  void remove_portal(WindowId window_id) {
    const auto it = contexts_.find(window_id);
    if (it != contexts_.end()) {
      // Moved out first: tearing down can run callbacks that reach back here.
      auto ctx = std::move(it->second);
      contexts_.erase(it);
      ctx.close_subscription.reset();
      ctx.portal->tear_down();
    }
    for (auto h = hosted_to_window_.begin(); h != hosted_to_window_.end();) {
      if (h->second == window_id) {
        h = hosted_to_window_.erase(h);
      } else {
        ++h;
      }
    }
  }

private:
  struct WindowContext {
    std::unique_ptr<Portal> portal;
    Subscription close_subscription;
  };

  Portal *portal_for_id(WindowId window_id) const {
    const auto it = contexts_.find(window_id);
    return it == contexts_.end() ? nullptr : it->second.portal.get();
  }

  Portal *portal_tracking(ViewId hosted_id) const {
    const auto it = hosted_to_window_.find(hosted_id);
    if (it == hosted_to_window_.end()) {
      return nullptr;
    }
    return portal_for_id(it->second);
  }

  // Closed windows never get a portal again; their will_close has already
  // fired.
  Portal *portal_for_window(Window &window) {
    if (window.closed()) {
      return nullptr;
    }
    const auto window_id = window.id();
    if (auto *existing = portal_for_id(window_id)) {
      return existing;
    }

    WindowContext ctx;
    ctx.portal =
        std::make_unique<Portal>(window.shared_from_this(), *loop_, config_);
    ctx.close_subscription = window.will_close().subscribe(
        [this, window_id]() { remove_portal(window_id); });
    auto *portal = ctx.portal.get();
    contexts_.emplace(window_id, std::move(ctx));
    return portal;
  }

  void prune_hosted_mappings(WindowId window_id,
                             const std::vector<ViewId> &valid_hosted_ids) {
    for (auto it = hosted_to_window_.begin(); it != hosted_to_window_.end();) {
      const bool stale =
          it->second == window_id &&
          std::find(valid_hosted_ids.begin(), valid_hosted_ids.end(),
                    it->first) == valid_hosted_ids.end();
      if (stale) {
        it = hosted_to_window_.erase(it);
      } else {
        ++it;
      }
    }
  }

  RunLoop *loop_{};
  PortalConfig config_{};
  std::unordered_map<WindowId, WindowContext> contexts_;
  std::unordered_map<ViewId, WindowId> hosted_to_window_;
};

} // namespace harbor::ui
