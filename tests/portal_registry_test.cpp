#include <gtest/gtest.h>

#include <harbor/ui/portal_registry.hpp>

#include <memory>
#include <string>

#include "support/fake_hosted_view.hpp"

namespace harbor::ui {
namespace {

using test::FakeHostedView;

class PortalRegistryTest : public ::testing::Test {
protected:
  static std::shared_ptr<View> add_anchor(Window &window, RectF frame) {
    auto anchor = std::make_shared<View>(frame);
    window.content_view().add_subview(anchor);
    return anchor;
  }

  static std::shared_ptr<FakeHostedView> make_hosted(std::string name) {
    return std::make_shared<FakeHostedView>(std::move(name));
  }

  RunLoop loop_;
  std::shared_ptr<Window> w1_ = Window::create(SizeF{800, 600});
  std::shared_ptr<Window> w2_ = Window::create(SizeF{640, 480});
  PortalRegistry registry_{loop_, PortalConfig{}};
};

TEST_F(PortalRegistryTest, CreatesOnePortalPerWindowOnDemand) {
  EXPECT_EQ(registry_.portal_count(), 0u);
  EXPECT_EQ(registry_.portal_for(*w1_), nullptr);

  auto a = make_hosted("a");
  auto b = make_hosted("b");
  registry_.bind(a, add_anchor(*w1_, RectF{0, 0, 100, 100}), true);
  registry_.bind(b, add_anchor(*w1_, RectF{100, 0, 100, 100}), true);
  EXPECT_EQ(registry_.portal_count(), 1u);
  ASSERT_NE(registry_.portal_for(*w1_), nullptr);
  EXPECT_EQ(registry_.portal_for(*w1_)->entry_count(), 2u);

  auto c = make_hosted("c");
  registry_.bind(c, add_anchor(*w2_, RectF{0, 0, 100, 100}), true);
  EXPECT_EQ(registry_.portal_count(), 2u);
}

TEST_F(PortalRegistryTest, AnchorOutsideWindowIsIgnored) {
  auto loose = std::make_shared<View>(RectF{0, 0, 100, 100});
  auto hosted = make_hosted("h");
  registry_.bind(hosted, loose, true);
  EXPECT_EQ(registry_.portal_count(), 0u);
  EXPECT_FALSE(registry_.window_for_hosted(hosted->id()).has_value());
}

TEST_F(PortalRegistryTest, HostedViewFollowsAnchorToAnotherWindow) {
  auto hosted = make_hosted("h");
  registry_.bind(hosted, add_anchor(*w1_, RectF{0, 0, 200, 200}), true);
  ASSERT_EQ(*registry_.window_for_hosted(hosted->id()), w1_->id());

  registry_.bind(hosted, add_anchor(*w2_, RectF{50, 50, 200, 200}), true);
  EXPECT_EQ(*registry_.window_for_hosted(hosted->id()), w2_->id());
  EXPECT_EQ(registry_.portal_for(*w1_)->entry_count(), 0u);
  EXPECT_EQ(registry_.portal_for(*w2_)->entry_count(), 1u);
  EXPECT_EQ(hosted->superview(), &registry_.portal_for(*w2_)->host());
  EXPECT_TRUE(rect_approximately_equal(hosted->frame(), RectF{50, 50, 200, 200}));
}

TEST_F(PortalRegistryTest, WindowCloseTearsDownItsPortal) {
  auto hosted = make_hosted("h");
  registry_.bind(hosted, add_anchor(*w1_, RectF{0, 0, 200, 200}), true);
  auto other = make_hosted("other");
  registry_.bind(other, add_anchor(*w2_, RectF{0, 0, 200, 200}), true);

  w1_->close();
  EXPECT_EQ(registry_.portal_count(), 1u);
  EXPECT_EQ(registry_.portal_for(*w1_), nullptr);
  EXPECT_EQ(hosted->superview(), nullptr);
  EXPECT_FALSE(registry_.window_for_hosted(hosted->id()).has_value());
  EXPECT_NE(registry_.portal_for(*w2_), nullptr);
  loop_.run_until_idle();
}

TEST_F(PortalRegistryTest, ClosedWindowNeverGetsPortalBack) {
  auto anchor = add_anchor(*w1_, RectF{0, 0, 200, 200});
  auto hosted = make_hosted("h");
  registry_.bind(hosted, anchor, true);
  w1_->close();
  ASSERT_EQ(registry_.portal_count(), 0u);

  registry_.bind(hosted, anchor, true);
  registry_.synchronize_for_anchor(*anchor);
  EXPECT_EQ(registry_.view_at_window_point(*w1_, PointF{50, 50}), nullptr);
  EXPECT_EQ(registry_.surface_at_window_point(*w1_, PointF{50, 50}), nullptr);
  loop_.run_until_idle();

  EXPECT_EQ(registry_.portal_count(), 0u);
  EXPECT_EQ(registry_.portal_for(*w1_), nullptr);
  EXPECT_EQ(hosted->superview(), nullptr);
  EXPECT_FALSE(registry_.window_for_hosted(hosted->id()).has_value());

  // Another window still works.
  registry_.bind(hosted, add_anchor(*w2_, RectF{0, 0, 200, 200}), true);
  EXPECT_EQ(registry_.portal_count(), 1u);
  EXPECT_EQ(hosted->superview(), &registry_.portal_for(*w2_)->host());
}

TEST_F(PortalRegistryTest, ReleasedSurfaceLeavesItsWindow) {
  auto anchor = add_anchor(*w1_, RectF{0, 0, 200, 200});
  auto hosted = make_hosted("h");
  registry_.bind(hosted, anchor, true);
  const std::weak_ptr<FakeHostedView> weak = hosted;

  const auto released_id = hosted->id();
  hosted.reset();
  registry_.synchronize_for_anchor(*anchor);
  EXPECT_TRUE(weak.expired());
  EXPECT_FALSE(registry_.window_for_hosted(released_id).has_value());
  EXPECT_EQ(registry_.portal_for(*w1_)->entry_count(), 0u);
  EXPECT_EQ(registry_.portal_for(*w1_)->hosted_subview_count(), 0u);
}

TEST_F(PortalRegistryTest, VisibilityCallsReachOwningPortal) {
  auto anchor = add_anchor(*w1_, RectF{0, 0, 200, 200});
  auto hosted = make_hosted("h");
  registry_.bind(hosted, anchor, true);

  registry_.hide_entry(*hosted);
  EXPECT_TRUE(hosted->hidden());

  registry_.update_entry_visibility(*hosted, true);
  registry_.synchronize_for_anchor(*anchor);
  EXPECT_FALSE(hosted->hidden());
}

TEST_F(PortalRegistryTest, SynchronizeForAnchorFollowsMovedAnchor) {
  auto anchor = add_anchor(*w1_, RectF{0, 0, 200, 200});
  auto hosted = make_hosted("h");
  registry_.bind(hosted, anchor, true);

  anchor->set_frame(RectF{100, 120, 300, 200});
  registry_.synchronize_for_anchor(*anchor);
  EXPECT_TRUE(rect_approximately_equal(hosted->frame(), RectF{100, 120, 300, 200}));
}

TEST_F(PortalRegistryTest, DetachForgetsHostedView) {
  auto hosted = make_hosted("h");
  registry_.bind(hosted, add_anchor(*w1_, RectF{0, 0, 200, 200}), true);

  EXPECT_TRUE(registry_.detach(*hosted));
  EXPECT_EQ(hosted->superview(), nullptr);
  EXPECT_FALSE(registry_.detach(*hosted));
  EXPECT_FALSE(registry_.detach(*make_hosted("never-bound")));
}

TEST_F(PortalRegistryTest, PointQueriesAreScopedToWindow) {
  auto h1 = make_hosted("h1");
  auto h2 = make_hosted("h2");
  registry_.bind(h1, add_anchor(*w1_, RectF{0, 0, 100, 100}), true);
  registry_.bind(h2, add_anchor(*w2_, RectF{0, 0, 100, 100}), true);

  EXPECT_EQ(registry_.view_at_window_point(*w1_, PointF{50, 50}), h1.get());
  EXPECT_EQ(registry_.view_at_window_point(*w2_, PointF{50, 50}), h2.get());
  EXPECT_EQ(registry_.surface_at_window_point(*w2_, PointF{50, 50}), h2.get());
  EXPECT_EQ(registry_.view_at_window_point(*w2_, PointF{300, 300}), nullptr);
}

TEST_F(PortalRegistryTest, PrunedEntriesLoseWindowMapping) {
  auto gone_anchor = add_anchor(*w1_, RectF{0, 0, 100, 100});
  auto gone = make_hosted("gone");
  auto kept = make_hosted("kept");
  registry_.bind(gone, gone_anchor, true);
  registry_.bind(kept, add_anchor(*w1_, RectF{100, 0, 100, 100}), true);

  gone_anchor->remove_from_superview();
  registry_.bind(kept, add_anchor(*w1_, RectF{200, 0, 100, 100}), true);

  EXPECT_FALSE(registry_.window_for_hosted(gone->id()).has_value());
  EXPECT_EQ(*registry_.window_for_hosted(kept->id()), w1_->id());
  EXPECT_EQ(registry_.portal_for(*w1_)->entry_count(), 1u);
}

} // namespace
} // namespace harbor::ui
