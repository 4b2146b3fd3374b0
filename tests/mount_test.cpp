#include <gtest/gtest.h>

#include <harbor/ui/mount.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "support/fake_hosted_view.hpp"

namespace harbor::ui {
namespace {

using test::FakeHostedView;

class SceneMountTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeHostedView> surface(const std::string &key) {
    auto &slot = surfaces_[key];
    if (!slot) {
      slot = std::make_shared<FakeHostedView>(key);
    }
    return slot;
  }

  // Sidebar, then a keyed split with one anchor per surface key.
  static ViewNode workspace(const std::vector<std::string> &keys,
                            const std::vector<double> &weights = {}) {
    std::vector<ViewNode> panes;
    for (std::size_t i = 0; i < keys.size(); ++i) {
      auto pane = view("PortalAnchor").key(keys[i]).prop("surface", keys[i]);
      if (i < weights.size()) {
        pane.prop("weight", weights[i]);
      }
      panes.push_back(std::move(pane).build());
    }
    auto split = view("Split")
                     .key("panes")
                     .prop("vertical", true)
                     .children(std::move(panes))
                     .build();
    return Row({Sidebar(200, {Text("tabs")}), std::move(split)});
  }

  Portal &portal() { return *registry_.portal_for(*window_); }

  RunLoop loop_;
  std::shared_ptr<Window> window_ = Window::create(SizeF{800, 600});
  std::map<std::string, std::shared_ptr<FakeHostedView>> surfaces_;
  PortalRegistry registry_{loop_, PortalConfig{}};
  SceneMount mount_{window_, registry_,
                    [this](const std::string &key) -> std::shared_ptr<HostedView> {
                      const auto it = surfaces_.find(key);
                      return it == surfaces_.end() ? nullptr : it->second;
                    }};
};

TEST_F(SceneMountTest, MountsContainersAndBindsAnchors) {
  auto a = surface("a");
  auto b = surface("b");
  mount_.render(workspace({"a", "b"}));

  auto split = mount_.container_for_key("panes");
  ASSERT_NE(split, nullptr);
  EXPECT_NE(dynamic_cast<SplitView *>(split.get()), nullptr);
  EXPECT_TRUE(rect_approximately_equal(split->convert_to_window(split->bounds()),
                                       RectF{200, 0, 600, 600}));
  EXPECT_EQ(portal().entry_count(), 2u);
  EXPECT_EQ(mount_.anchors_created(), 2u);

  EXPECT_NEAR(a->frame().x, 200.0f, 1.0f);
  EXPECT_NEAR(a->frame().w, 300.0f, 1.0f);
  EXPECT_NEAR(b->frame().x, 500.0f, 1.0f);
  EXPECT_NEAR(b->frame().max_x(), 800.0f, 1.0f);
  EXPECT_FALSE(a->hidden());
  EXPECT_FALSE(b->hidden());
}

TEST_F(SceneMountTest, ChromeOpsFollowLayout) {
  surface("a");
  mount_.render(workspace({"a"}));
  ASSERT_FALSE(mount_.chrome_ops().empty());
  const auto *sidebar = std::get_if<DrawRect>(&mount_.chrome_ops().front());
  ASSERT_NE(sidebar, nullptr);
  EXPECT_TRUE(rect_approximately_equal(sidebar->rect, RectF{0, 0, 200, 600}));
  EXPECT_EQ(mount_.layout().children.size(), 2u);
}

TEST_F(SceneMountTest, RerenderRebuildsAnchorsWithoutMovingSurfaces) {
  auto a = surface("a");
  auto b = surface("b");
  mount_.render(workspace({"a", "b"}));
  loop_.run_until_idle();
  const auto split = mount_.container_for_key("panes");
  const auto first_anchor = mount_.anchor_for_surface("a");
  const auto frame = a->frame();
  const auto reconciles = a->reconcile_count();

  mount_.render(workspace({"a", "b"}));
  loop_.run_until_idle();

  EXPECT_EQ(mount_.anchors_created(), 4u);
  EXPECT_NE(mount_.anchor_for_surface("a"), first_anchor);
  EXPECT_EQ(first_anchor->superview(), nullptr);
  EXPECT_EQ(mount_.container_for_key("panes"), split);
  EXPECT_EQ(portal().entry_count(), 2u);
  EXPECT_TRUE(rect_approximately_equal(a->frame(), frame));
  EXPECT_EQ(a->implicit_animation_count(), 0u);
  // Anchor changes re-seed geometry; a same-size seed is still reconciled.
  EXPECT_GE(a->reconcile_count(), reconciles);
  EXPECT_FALSE(a->hidden());
}

TEST_F(SceneMountTest, SameNodeKeepsItsAnchor) {
  surface("a");
  const auto tree = workspace({"a"});
  mount_.render(tree);
  const auto anchor = mount_.anchor_for_surface("a");
  mount_.render(tree);
  EXPECT_EQ(mount_.anchor_for_surface("a"), anchor);
  EXPECT_EQ(mount_.anchors_created(), 1u);
}

TEST_F(SceneMountTest, RemovedPaneIsPrunedAndSurvivorWidens) {
  auto a = surface("a");
  auto b = surface("b");
  mount_.render(workspace({"a", "b"}));
  loop_.run_until_idle();

  mount_.render(workspace({"a"}));
  loop_.run_until_idle();

  EXPECT_EQ(portal().entry_count(), 1u);
  EXPECT_EQ(b->superview(), nullptr);
  EXPECT_EQ(mount_.anchor_for_surface("b"), nullptr);
  EXPECT_TRUE(rect_approximately_equal(a->frame(), RectF{200, 0, 600, 600}));
}

TEST_F(SceneMountTest, PaneResizeTriggersExternalRefresh) {
  auto a = surface("a");
  surface("b");
  mount_.render(workspace({"a", "b"}));
  loop_.run_until_idle();
  const auto refreshes = a->refresh_count();

  mount_.render(workspace({"a", "b"}, {3.0, 1.0}));
  EXPECT_TRUE(portal().external_sync_pending());
  loop_.run_until_idle();

  EXPECT_GT(a->refresh_count(), refreshes);
  EXPECT_NEAR(a->frame().w, 450.0f, 1.0f);
}

TEST_F(SceneMountTest, UnresolvedSurfaceLeavesAnchorEmpty) {
  mount_.render(workspace({"missing"}));
  EXPECT_NE(mount_.anchor_for_surface("missing"), nullptr);
  EXPECT_EQ(registry_.portal_for(*window_), nullptr);
}

TEST_F(SceneMountTest, UnmountHidesUntilBoundAgain) {
  auto a = surface("a");
  const auto tree = workspace({"a"});
  mount_.render(tree);
  mount_.unmount_surface("a");
  EXPECT_TRUE(a->hidden());
  EXPECT_EQ(portal().entry_count(), 1u);

  loop_.run_until_idle();
  EXPECT_TRUE(a->hidden());

  mount_.render(workspace({"a"}));
  EXPECT_FALSE(a->hidden());
}

TEST_F(SceneMountTest, InvisibleAnchorHidesSurface) {
  auto a = surface("a");
  mount_.render(Row({view("PortalAnchor")
                         .key("a")
                         .prop("surface", "a")
                         .prop("visible", false)
                         .build()}));
  EXPECT_TRUE(a->hidden());
}

TEST_F(SceneMountTest, ScrolledAnchorIsClippedToScrollView) {
  auto a = surface("a");
  auto scroller = view("ScrollView")
                      .key("scroll")
                      .prop("scroll_y", 30.0)
                      .children({view("PortalAnchor")
                                     .key("a")
                                     .prop("surface", "a")
                                     .prop("height", 200.0)
                                     .build()})
                      .build();
  mount_.render(scroller);
  EXPECT_TRUE(rect_approximately_equal(a->frame(), RectF{0, 0, 800, 170}));
}

TEST_F(SceneMountTest, ForeignContentIsLeftAlone) {
  auto foreign = std::make_shared<View>(RectF{0, 0, 10, 10});
  window_->content_view().add_subview(foreign);
  surface("a");
  mount_.render(workspace({"a"}));
  mount_.render(workspace({"a"}));
  EXPECT_EQ(foreign->superview(), &window_->content_view());
}

} // namespace
} // namespace harbor::ui
