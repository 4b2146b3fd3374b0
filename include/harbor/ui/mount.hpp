#pragma once

#include <harbor/ui/hosted_view.hpp>
#include <harbor/ui/layout.hpp>
#include <harbor/ui/log.hpp>
#include <harbor/ui/node.hpp>
#include <harbor/ui/portal_registry.hpp>
#include <harbor/ui/render.hpp>
#include <harbor/ui/split_view.hpp>
#include <harbor/ui/view.hpp>
#include <harbor/ui/window.hpp>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace harbor::ui {

using SurfaceResolver =
    std::function<std::shared_ptr<HostedView>(const std::string &surface_key)>;

// Materializes each rendered ViewNode tree as retained views under the
// window's content view and binds every PortalAnchor's surface through the
// registry. Containers are reused by key; anchors are rebuilt whenever their
// node id changes, which is every render for freshly built trees.
class SceneMount {
public:
  SceneMount(std::shared_ptr<Window> window, PortalRegistry &registry,
             SurfaceResolver resolver)
      : window_{std::move(window)}, registry_{&registry},
        resolver_{std::move(resolver)} {}

  SceneMount(const SceneMount &) = delete;
  SceneMount &operator=(const SceneMount &) = delete;

  void render(const ViewNode &root) {
    if (!window_) {
      return;
    }
    const auto viewport = window_->content_view().bounds().size();
    layout_ = layout_tree(root, viewport);
    chrome_ops_ = build_render_ops(root, layout_);

    std::unordered_set<std::string> live_containers;
    std::unordered_map<std::string, AnchorRecord> next_anchors;
    std::vector<PendingBind> binds;
    std::vector<SplitView *> resized_splits;

    auto &content = window_->content_view();
    std::vector<View::Ptr> top;
    if (auto v = mount_node(root, layout_, PointF{0.0f, 0.0f}, "0",
                            live_containers, next_anchors, binds,
                            resized_splits)) {
      top.push_back(std::move(v));
    }
    // Anything else under the content view belongs to someone else.
    reconcile_children(content, top, owned_roots_);
    owned_roots_.clear();
    for (const auto &v : top) {
      owned_roots_.insert(v.get());
    }

    for (auto it = containers_.begin(); it != containers_.end();) {
      if (live_containers.count(it->first) == 0) {
        it = containers_.erase(it);
      } else {
        ++it;
      }
    }
    anchors_ = std::move(next_anchors);

    for (auto *split : resized_splits) {
      split->did_resize_subviews();
    }

    for (const auto &b : binds) {
      auto hosted = resolver_ ? resolver_(b.surface_key) : nullptr;
      if (!hosted) {
        surface_log().debug("mount.bind.skip surface={} reason=unresolved",
                            b.surface_key);
        continue;
      }
      registry_->bind(hosted, b.anchor, b.visible, b.z_priority);
    }
  }

  // Permanent unmount: the surface stays hidden until it is bound visible
  // again.
  void unmount_surface(const std::string &surface_key) {
    if (!resolver_) {
      return;
    }
    if (auto hosted = resolver_(surface_key)) {
      registry_->hide_entry(*hosted);
    }
  }

  std::shared_ptr<View> anchor_for_surface(const std::string &surface_key) const {
    const auto it = anchors_.find(surface_key);
    return it == anchors_.end() ? nullptr : it->second.view;
  }

  std::shared_ptr<View> container_for_key(const std::string &key) const {
    const auto it = containers_.find(key);
    return it == containers_.end() ? nullptr : it->second;
  }

  std::size_t anchors_created() const { return anchors_created_; }

  const LayoutNode &layout() const { return layout_; }

  const std::vector<RenderOp> &chrome_ops() const { return chrome_ops_; }

  Window &window() { return *window_; }

private:
  struct AnchorRecord {
    NodeId node_id{};
    std::shared_ptr<View> view;
  };

  struct PendingBind {
    std::string surface_key;
    std::shared_ptr<View> anchor;
    bool visible{true};
    int z_priority{0};
  };

  static spdlog::logger &surface_log() {
    static const auto logger = ensure_named_logger("harbor.mount");
    return *logger;
  }

  static bool retains_view(const ViewNode &node) {
    return node.type == "PortalAnchor" || node.type == "Split" ||
           node.type == "ScrollView" || node.type == "Column" ||
           node.type == "Row" || node.type == "Sidebar";
  }

  // Puts `desired` under `parent` in order and removes the views in `owned`
  // that are no longer wanted. Unchanged child lists are left untouched.
  static void reconcile_children(View &parent,
                                 const std::vector<View::Ptr> &desired,
                                 const std::unordered_set<View *> &owned) {
    std::unordered_set<View *> keep;
    for (const auto &v : desired) {
      keep.insert(v.get());
    }
    std::vector<View::Ptr> stale;
    for (const auto &child : parent.subviews()) {
      if (keep.count(child.get()) == 0 && owned.count(child.get()) != 0) {
        stale.push_back(child);
      }
    }
    for (auto &v : stale) {
      v->remove_from_superview();
    }

    bool in_order = true;
    std::size_t next = 0;
    for (const auto &child : parent.subviews()) {
      if (keep.count(child.get()) == 0) {
        continue;
      }
      if (next >= desired.size() || desired[next] != child) {
        in_order = false;
        break;
      }
      ++next;
    }
    if (in_order && next == desired.size()) {
      return;
    }
    for (const auto &v : desired) {
      parent.add_subview(v);
    }
  }

  std::shared_ptr<View> mount_node(const ViewNode &node, const LayoutNode &l,
                                   PointF parent_origin, const std::string &path,
                                   std::unordered_set<std::string> &live,
                                   std::unordered_map<std::string, AnchorRecord> &anchors,
                                   std::vector<PendingBind> &binds,
                                   std::vector<SplitView *> &resized_splits) {
    if (!retains_view(node)) {
      return nullptr;
    }
    const RectF local{l.frame.x - parent_origin.x, l.frame.y - parent_origin.y,
                      l.frame.w, l.frame.h};

    if (node.type == "PortalAnchor") {
      const auto surface = prop_as_string(node.props, "surface", node.key);
      std::shared_ptr<View> anchor;
      if (const auto it = anchors_.find(surface);
          it != anchors_.end() && it->second.node_id == node.id) {
        anchor = it->second.view;
      } else {
        anchor = std::make_shared<View>(local);
        anchor->set_debug_name("anchor:" + surface);
        ++anchors_created_;
      }
      anchor->set_frame(local);
      anchors.insert_or_assign(surface, AnchorRecord{node.id, anchor});
      binds.push_back(PendingBind{
          surface, anchor, prop_as_bool(node.props, "visible", true),
          static_cast<int>(prop_as_int(node.props, "z", 0))});
      return anchor;
    }

    const auto key = node.key.empty() ? path + ":" + node.type : node.key;
    live.insert(key);
    std::shared_ptr<View> view = container_for_key(key);
    const bool is_split = node.type == "Split";
    if (view && is_split != (dynamic_cast<SplitView *>(view.get()) != nullptr)) {
      view.reset();
    }
    if (!view) {
      if (is_split) {
        view = std::make_shared<SplitView>(
            local, prop_as_bool(node.props, "vertical", true),
            prop_as_float(node.props, "divider", 1.0f));
      } else {
        view = std::make_shared<View>(local);
      }
      view->set_debug_name(key);
      containers_.insert_or_assign(key, view);
    }
    view->set_frame(local);

    // Children are laid out in absolute space; their local origin is this
    // view's absolute origin shifted by its scroll offset.
    PointF child_origin{l.frame.x, l.frame.y};
    if (node.type == "ScrollView") {
      const auto scroll_y = prop_as_float(node.props, "scroll_y", 0.0f);
      view->set_bounds(RectF{0.0f, scroll_y, l.frame.w, l.frame.h});
      child_origin.y -= scroll_y;
    }

    std::vector<RectF> before;
    for (const auto &c : view->subviews()) {
      before.push_back(c->frame());
    }

    std::vector<View::Ptr> kids;
    std::unordered_set<View *> owned;
    for (const auto &c : view->subviews()) {
      owned.insert(c.get());
    }
    const auto n = std::min(node.children.size(), l.children.size());
    for (std::size_t i = 0; i < n; ++i) {
      auto child = mount_node(node.children[i], l.children[i], child_origin,
                              path + "." + std::to_string(i), live, anchors,
                              binds, resized_splits);
      if (child) {
        kids.push_back(std::move(child));
      }
    }
    reconcile_children(*view, kids, owned);

    if (auto *split = dynamic_cast<SplitView *>(view.get())) {
      split->set_vertical(prop_as_bool(node.props, "vertical", true));
      split->set_divider_thickness(prop_as_float(node.props, "divider", 1.0f));
      bool moved = before.size() != split->subviews().size();
      for (std::size_t i = 0; !moved && i < before.size(); ++i) {
        moved = !rect_approximately_equal(before[i], split->subviews()[i]->frame());
      }
      if (moved) {
        resized_splits.push_back(split);
      }
    }
    return view;
  }

  std::shared_ptr<Window> window_;
  PortalRegistry *registry_{};
  SurfaceResolver resolver_;
  LayoutNode layout_{};
  std::vector<RenderOp> chrome_ops_;
  std::unordered_map<std::string, std::shared_ptr<View>> containers_;
  std::unordered_map<std::string, AnchorRecord> anchors_;
  std::unordered_set<View *> owned_roots_;
  std::size_t anchors_created_{0};
};

} // namespace harbor::ui
