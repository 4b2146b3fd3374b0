#pragma once

#include <harbor/ui/config.hpp>
#include <harbor/ui/divider_overlay.hpp>
#include <harbor/ui/entry_table.hpp>
#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/log.hpp>
#include <harbor/ui/portal_host_view.hpp>
#include <harbor/ui/reconciler.hpp>
#include <harbor/ui/run_loop.hpp>
#include <harbor/ui/signal.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <climits>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace harbor::ui {

// Keeps externally owned hosted views parented to one host container per
// window and positioned over whatever placeholder (anchor) the declarative
// layer currently shows for them.
class Portal {
public:
  explicit Portal(const std::shared_ptr<Window> &window,
                  RunLoop &loop = RunLoop::main(),
                  PortalConfig config = PortalConfig::from_env())
      : window_{window}, config_{config},
        host_{std::make_shared<PortalHostView>(config)},
        overlay_{std::make_shared<DividerOverlayView>(config.overlay_axis_epsilon)},
        deferred_sync_{loop, [this]() { synchronize_all_hosted_views(std::nullopt); }},
        external_sync_{loop, [this]() { synchronize_from_external_geometry_change(); }},
        display_{loop, [this]() { overlay_->display_if_needed(); }} {
    host_->set_autoresizes(true);
    if (window) {
      install_geometry_observers(*window);
    }
    ensure_installed();
  }

  Portal(const Portal &) = delete;
  Portal &operator=(const Portal &) = delete;

  ~Portal() { tear_down(); }

  Window *window() const { return window_.lock().get(); }

  PortalHostView &host() { return *host_; }
  const PortalHostView &host() const { return *host_; }
  DividerOverlayView &divider_overlay() { return *overlay_; }

  const EntryTable &entries() const { return entries_; }
  std::size_t entry_count() const { return entries_.size(); }
  std::size_t hosted_subview_count() const {
    std::size_t n = 0;
    for (const auto &child : host_->subviews()) {
      if (dynamic_cast<const HostedView *>(child.get()) != nullptr) {
        ++n;
      }
    }
    return n;
  }
  std::vector<ViewId> hosted_ids() const { return entries_.hosted_ids(); }

  bool deferred_sync_pending() const { return deferred_sync_.pending(); }
  bool external_sync_pending() const { return external_sync_.pending(); }
  bool torn_down() const { return torn_down_; }

  // Places the host directly above the window's content view and below any
  // chrome overlay. Returns false when there is nothing to install into.
  bool ensure_installed() {
    if (torn_down_) {
      return false;
    }
    auto win = window_.lock();
    if (!win || win->closed()) {
      return false;
    }
    auto &container = win->container();
    const auto &reference = win->content_view_ptr();
    if (!reference || reference->superview() != &container) {
      return false;
    }

    if (host_->superview() != &container ||
        installed_container_.lock().get() != &container ||
        installed_reference_.lock() != reference) {
      host_->remove_from_superview();
      container.add_subview(host_, Placement::Above, reference.get());
      installed_container_ = container.shared_from_this();
      installed_reference_ = reference;
    } else if (!is_view_above(*host_, *reference, container)) {
      container.add_subview(host_, Placement::Above, reference.get());
    }

    if (auto *chrome = win->chrome_overlay();
        chrome != nullptr && chrome->superview() == &container &&
        !is_view_above(*chrome, *host_, container)) {
      container.add_subview(chrome->shared_from_this(), Placement::Above,
                            host_.get());
    }

    synchronize_host_frame_to_reference();
    ensure_divider_overlay_on_top();
    return true;
  }

  void bind(const std::shared_ptr<HostedView> &hosted,
            const std::shared_ptr<View> &anchor, bool visible_in_ui,
            int z_priority = 0) {
    if (!hosted || !anchor) {
      return;
    }
    if (!ensure_installed()) {
      return;
    }

    const auto hosted_id = hosted->id();
    const auto anchor_id = anchor->id();
    std::optional<Entry> previous;
    if (const auto *e = entries_.find(hosted_id)) {
      previous = *e;
    }

    if (const auto bound = entries_.hosted_for_anchor(anchor_id);
        bound && *bound != hosted_id) {
      portal_log().debug("portal.bind.replace anchor={} oldHosted={} newHosted={}",
                         format_token(anchor_id), format_token(*bound),
                         format_token(hosted_id));
      detach(*bound);
    }

    entries_.upsert(hosted_id,
                    Entry{hosted, anchor, anchor_id, visible_in_ui, z_priority});

    const bool did_change_anchor = !previous || previous->anchor_id != anchor_id;
    const bool became_visible =
        !(previous && previous->visible_in_ui) && visible_in_ui;
    const int previous_z = previous ? previous->z_priority : INT_MIN;
    const bool priority_increased = z_priority > previous_z;

    if (!previous || did_change_anchor || became_visible || priority_increased ||
        hosted->superview() != host_.get()) {
      portal_log().debug(
          "portal.bind hosted={} anchor={} prevAnchor={} visible={} "
          "prevVisible={} z={} prevZ={}",
          format_token(hosted_id), format_token(anchor_id),
          format_token(previous ? previous->anchor_id : 0),
          visible_in_ui ? 1 : 0, (previous && previous->visible_in_ui) ? 1 : 0,
          z_priority, previous_z);
    }

    synchronize_host_frame_to_reference();

    // Seed geometry before the hosted view enters the host so it never lays
    // out at a stale size.
    const auto seeded = seeded_frame(geometry_input_for(*anchor), config_);
    {
      Transaction tx;
      if (seeded && seeded->w > 0.0f && seeded->h > 0.0f) {
        hosted->set_frame(*seeded);
        hosted->set_bounds(RectF{0.0f, 0.0f, seeded->w, seeded->h});
      } else {
        hosted->set_frame(RectF{});
        hosted->set_bounds(RectF{});
        hosted->set_hidden(true);
      }
    }
    hosted->reconcile_geometry_now();

    if (hosted->superview() != host_.get()) {
      portal_log().debug("portal.reparent hosted={} reason=attach super={}",
                         format_token(hosted_id),
                         format_token(hosted->superview() ? hosted->superview()->id()
                                                          : 0));
      host_->add_subview(hosted);
    } else if ((became_visible || priority_increased) &&
               host_->subviews().back().get() != hosted.get()) {
      portal_log().debug(
          "portal.reparent hosted={} reason=raise didChangeAnchor={} "
          "becameVisible={} priorityIncreased={}",
          format_token(hosted_id), did_change_anchor ? 1 : 0,
          became_visible ? 1 : 0, priority_increased ? 1 : 0);
      host_->add_subview(hosted);
    }

    ensure_divider_overlay_on_top();
    synchronize_hosted_view(hosted_id);
    schedule_deferred_full_sync();
    prune_dead_entries();
  }

  // Forgets the hosted view and takes it out of the host. Its own state is
  // left alone.
  bool detach(ViewId hosted_id) {
    auto removed = entries_.remove(hosted_id);
    if (!removed) {
      return false;
    }
    auto hosted = removed->hosted.lock();
    const bool had_superview = hosted && hosted->superview() == host_.get();
    portal_log().debug("portal.detach hosted={} anchor={} hadSuperview={}",
                       format_token(hosted_id), format_token(removed->anchor_id),
                       had_superview ? 1 : 0);
    if (had_superview) {
      hosted->remove_from_superview();
    }
    return true;
  }

  // Terminal hide for a permanently unmounted section; later passes keep it
  // hidden.
  void hide_entry(ViewId hosted_id) {
    auto *entry = entries_.find(hosted_id);
    if (entry == nullptr || !entry->visible_in_ui) {
      return;
    }
    entry->visible_in_ui = false;
    if (auto hosted = entry->hosted.lock()) {
      Transaction tx;
      hosted->set_hidden(true);
    }
    portal_log().debug("portal.hideEntry hosted={} reason=unmount",
                       format_token(hosted_id));
  }

  // Updates the flag only. A remount may mark an entry visible before its
  // deferred bind supplies an anchor.
  void update_entry_visibility(ViewId hosted_id, bool visible_in_ui) {
    if (auto *entry = entries_.find(hosted_id)) {
      entry->visible_in_ui = visible_in_ui;
    }
  }

  void synchronize_for_anchor(const View &anchor) {
    if (!ensure_installed()) {
      return;
    }
    synchronize_host_frame_to_reference();
    prune_dead_entries();
    const auto primary = entries_.hosted_for_anchor(anchor.id());
    if (primary) {
      synchronize_hosted_view(*primary);
    }
    // One anchor can miss its geometry callback while a sibling fires, so
    // everything else is reconciled too.
    synchronize_all_hosted_views(primary);
    schedule_deferred_full_sync();
  }

  void synchronize_all() { synchronize_all_hosted_views(std::nullopt); }

  // Full pass after window/split/host geometry moved, followed by a forced
  // inner-geometry reconcile and redraw of every visible hosted view.
  void synchronize_from_external_geometry_change() {
    if (!ensure_installed()) {
      return;
    }
    synchronize_all_hosted_views(std::nullopt);

    std::vector<std::shared_ptr<HostedView>> visible;
    entries_.for_each([&visible](ViewId, const Entry &e) {
      if (auto hosted = e.hosted.lock(); hosted && !hosted->hidden()) {
        visible.push_back(std::move(hosted));
      }
    });
    for (auto &hosted : visible) {
      hosted->reconcile_geometry_now();
      hosted->refresh_surface_now();
    }
  }

  void prune_dead_entries() {
    auto win = window_.lock();
    auto reference = installed_reference_.lock();
    std::vector<ViewId> dead;
    entries_.for_each([&](ViewId id, const Entry &e) {
      auto hosted = e.hosted.lock();
      if (!hosted || released_by_owner(hosted)) {
        dead.push_back(id);
        return;
      }
      auto anchor = e.anchor.lock();
      if (!anchor) {
        dead.push_back(id);
        return;
      }
      if (anchor->window() != win.get() || anchor->superview() == nullptr) {
        dead.push_back(id);
        return;
      }
      if (reference && !anchor->is_descendant_of(*reference)) {
        dead.push_back(id);
      }
    });

    for (const auto id : dead) {
      portal_log().debug("portal.prune hosted={}", format_token(id));
      detach(id);
    }
    entries_.retain_live_anchor_mappings();
  }

  void tear_down() {
    if (torn_down_) {
      return;
    }
    torn_down_ = true;
    geometry_subscriptions_.clear();
    for (const auto id : entries_.hosted_ids()) {
      detach(id);
    }
    host_->remove_from_superview();
    installed_container_.reset();
    installed_reference_.reset();
    portal_log().debug("portal.teardown host={}", format_token(host_->id()));
  }

  // Top-most mapped, visible hosted view under a window point. Children of
  // the host that are no longer mapped never win.
  View *view_at_window_point(PointF window_point) {
    auto *hosted = hosted_view_at_window_point(window_point);
    if (hosted == nullptr) {
      return nullptr;
    }
    const auto point = host_->convert_from_window(window_point);
    if (auto *hit = hosted->hit_test(point)) {
      return hit;
    }
    return hosted;
  }

  View *surface_at_window_point(PointF window_point) {
    if (!ensure_installed()) {
      return nullptr;
    }
    const auto point = host_->convert_from_window(window_point);
    const auto &children = host_->subviews();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      auto *hosted = mapped_visible_hosted(**it, point);
      if (hosted == nullptr) {
        continue;
      }
      if (auto *surface =
              hosted->surface_for_drop(hosted->convert_from_window(window_point))) {
        return surface;
      }
    }
    return nullptr;
  }

private:
  static bool is_view_above(const View &view, const View &reference,
                            const View &container) {
    const auto vi = container.index_of_subview(&view);
    const auto ri = container.index_of_subview(&reference);
    return vi && ri && *vi > *ri;
  }

  // The host's child list is the last owner: whoever supplied the hosted
  // view has let go of it.
  bool released_by_owner(const std::shared_ptr<HostedView> &hosted) const {
    return hosted->superview() == host_.get() && hosted.use_count() <= 2;
  }

  HostedView *mapped_visible_hosted(View &child, PointF point_in_host) {
    auto *hosted = dynamic_cast<HostedView *>(&child);
    if (hosted == nullptr || !entries_.contains(hosted->id()) ||
        hosted->hidden() || !rect_contains(hosted->frame(), point_in_host)) {
      return nullptr;
    }
    return hosted;
  }

  HostedView *hosted_view_at_window_point(PointF window_point) {
    if (!ensure_installed()) {
      return nullptr;
    }
    const auto point = host_->convert_from_window(window_point);
    const auto &children = host_->subviews();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      if (auto *hosted = mapped_visible_hosted(**it, point)) {
        return hosted;
      }
    }
    return nullptr;
  }

  void install_geometry_observers(Window &window) {
    if (!geometry_subscriptions_.empty()) {
      return;
    }
    auto schedule = [this]() { schedule_external_geometry_sync(); };
    geometry_subscriptions_.push_back(window.did_resize().subscribe(schedule));
    geometry_subscriptions_.push_back(
        window.did_end_live_resize().subscribe(schedule));
    geometry_subscriptions_.push_back(
        window.split_view_did_resize().subscribe(schedule));
    geometry_subscriptions_.push_back(host_->frame_changed().subscribe(schedule));
  }

  void schedule_deferred_full_sync() { deferred_sync_.arm(); }

  void schedule_external_geometry_sync() {
    if (!torn_down_) {
      external_sync_.arm();
    }
  }

  // Matches the host frame to the reference node. Returns whether the host
  // has usable area.
  bool synchronize_host_frame_to_reference() {
    auto container = installed_container_.lock();
    auto reference = installed_reference_.lock();
    if (!container || !reference) {
      return false;
    }
    const auto frame = container->convert_from_window(
        reference->convert_to_window(reference->bounds()));
    if (!rect_is_finite(frame)) {
      return false;
    }
    if (!rect_approximately_equal(host_->frame(), frame, config_.rect_epsilon)) {
      {
        Transaction tx;
        host_->set_frame(frame);
      }
      portal_log().debug("portal.hostFrame.update host={} frame={}",
                         format_token(host_->id()), format_rect(frame));
    }
    return frame.w > config_.host_ready_threshold &&
           frame.h > config_.host_ready_threshold;
  }

  void ensure_divider_overlay_on_top() {
    if (overlay_->superview() != host_.get()) {
      overlay_->set_frame(host_->bounds());
      host_->add_subview(overlay_);
    } else if (host_->subviews().back() != overlay_) {
      host_->add_subview(overlay_);
    }
    if (!rect_approximately_equal(overlay_->frame(), host_->bounds(),
                                  config_.rect_epsilon)) {
      overlay_->set_frame(host_->bounds());
    }
    overlay_->set_needs_display();
    display_.arm();
  }

  GeometryInput geometry_input_for(const View &anchor) const {
    GeometryInput in;
    in.anchor_in_window = anchor.bounds_in_window();
    in.ancestor_clips =
        collect_clip_chain(anchor, installed_reference_.lock().get());
    in.host_offset = host_->window_offset();
    in.host_bounds = host_->bounds();
    if (auto win = window_.lock()) {
      in.backing_scale = win->backing_scale_factor();
    }
    return in;
  }

  void synchronize_all_hosted_views(std::optional<ViewId> excluding) {
    if (!ensure_installed()) {
      return;
    }
    synchronize_host_frame_to_reference();
    prune_dead_entries();
    for (const auto id : entries_.hosted_ids()) {
      if (excluding && id == *excluding) {
        continue;
      }
      synchronize_hosted_view(id);
    }
  }

  void synchronize_hosted_view(ViewId hosted_id) {
    if (!ensure_installed()) {
      return;
    }
    auto *entry = entries_.find(hosted_id);
    if (entry == nullptr) {
      return;
    }
    auto hosted = entry->hosted.lock();
    if (!hosted) {
      entries_.remove(hosted_id);
      return;
    }
    const bool visible_in_ui = entry->visible_in_ui;
    auto anchor = entry->anchor.lock();
    auto win = window_.lock();

    if (!anchor || !win) {
      if (!visible_in_ui) {
        set_hidden_logged(*hosted, true, "missingAnchorOrWindow");
      }
      return;
    }
    if (anchor->window() != win.get()) {
      set_hidden_logged(*hosted, true, "anchorWindowMismatch");
      return;
    }

    synchronize_host_frame_to_reference();
    const auto g = reconcile_geometry(geometry_input_for(*anchor), config_);
    const auto host_bounds = host_->bounds();
    if (!g.host_ready) {
      portal_log().debug(
          "portal.sync.defer hosted={} reason=hostBoundsNotReady host={} "
          "anchor={} visibleInUI={}",
          format_token(hosted_id), format_rect(host_bounds), format_rect(g.raw),
          visible_in_ui ? 1 : 0);
      {
        Transaction tx;
        hosted->set_hidden(true);
      }
      schedule_deferred_full_sync();
      return;
    }

    const bool anchor_hidden = anchor->hidden_or_ancestor_hidden();
    const bool hide = should_hide(g, visible_in_ui, anchor_hidden);

    if (g.finite &&
        !rect_approximately_equal(g.raw, g.target, config_.rect_epsilon)) {
      portal_log().debug("portal.frame.clamp hosted={} anchor={} raw={} "
                         "clamped={} host={}",
                         format_token(hosted_id), format_token(anchor->id()),
                         format_rect(g.raw), format_rect(g.target),
                         format_rect(host_bounds));
    }

    // Non-finite geometry is never written; the last good frame stays.
    if (g.finite && !rect_approximately_equal(hosted->frame(), g.target,
                                              config_.rect_epsilon)) {
      {
        Transaction tx;
        hosted->set_frame(g.target);
      }
      hosted->reconcile_geometry_now();
      hosted->refresh_surface_now();
    }

    if (g.finite) {
      const RectF expected{0.0f, 0.0f, g.target.w, g.target.h};
      if (!rect_approximately_equal(hosted->bounds(), expected,
                                    config_.rect_epsilon)) {
        Transaction tx;
        hosted->set_bounds(expected);
      }
    }

    if (hosted->hidden() != hide) {
      portal_log().debug(
          "portal.hidden hosted={} value={} visibleInUI={} anchorHidden={} "
          "tiny={} finite={} outside={} frame={} host={}",
          format_token(hosted_id), hide ? 1 : 0, visible_in_ui ? 1 : 0,
          anchor_hidden ? 1 : 0, g.tiny ? 1 : 0, g.finite ? 1 : 0,
          g.visible_intersection ? 0 : 1, format_rect(g.target),
          format_rect(host_bounds));
      Transaction tx;
      hosted->set_hidden(hide);
    }

    ensure_divider_overlay_on_top();
  }

  void set_hidden_logged(HostedView &hosted, bool hidden, const char *reason) {
    if (hosted.hidden() != hidden) {
      portal_log().debug("portal.hidden hosted={} value={} reason={}",
                         format_token(hosted.id()), hidden ? 1 : 0, reason);
    }
    Transaction tx;
    hosted.set_hidden(hidden);
  }

  std::weak_ptr<Window> window_;
  PortalConfig config_{};
  std::shared_ptr<PortalHostView> host_;
  std::shared_ptr<DividerOverlayView> overlay_;
  std::weak_ptr<View> installed_container_;
  std::weak_ptr<View> installed_reference_;
  EntryTable entries_;
  CoalescedTask deferred_sync_;
  CoalescedTask external_sync_;
  CoalescedTask display_;
  std::vector<Subscription> geometry_subscriptions_;
  bool torn_down_{false};
};

} // namespace harbor::ui
