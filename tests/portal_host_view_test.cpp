#include <gtest/gtest.h>

#include <harbor/ui/drag_routing.hpp>
#include <harbor/ui/portal.hpp>
#include <harbor/ui/split_view.hpp>

#include <memory>
#include <string>

#include "support/fake_hosted_view.hpp"

namespace harbor::ui {
namespace {

using test::FakeHostedView;

class PortalHostViewTest : public ::testing::Test {
protected:
  // Two panes side by side (or stacked) filling the content view, each with
  // a hosted view bound over it.
  void build_split(bool vertical) {
    split_ = std::make_shared<SplitView>(RectF{0, 0, 800, 600}, vertical, 1.0f);
    window_->content_view().add_subview(split_);
    left_ = std::make_shared<View>();
    right_ = std::make_shared<View>();
    split_->add_subview(left_);
    split_->add_subview(right_);
    split_->adjust_subviews();

    h1_ = std::make_shared<FakeHostedView>("h1");
    h2_ = std::make_shared<FakeHostedView>("h2");
    portal_.bind(h1_, left_, true);
    portal_.bind(h2_, right_, true);
  }

  View *hit(PointF window_point) { return portal_.host().hit_test(window_point); }

  RunLoop loop_;
  std::shared_ptr<Window> window_ = Window::create(SizeF{800, 600});
  PortalConfig config_{};
  Portal portal_{window_, loop_, config_};
  std::shared_ptr<SplitView> split_;
  std::shared_ptr<View> left_;
  std::shared_ptr<View> right_;
  std::shared_ptr<FakeHostedView> h1_;
  std::shared_ptr<FakeHostedView> h2_;
};

// =============================================================================
// Split dividers
// =============================================================================

TEST_F(PortalHostViewTest, PaneInteriorHitsHostedView) {
  build_split(true);
  EXPECT_EQ(hit(PointF{300, 300}), h1_.get());
  EXPECT_EQ(hit(PointF{600, 300}), h2_.get());
  EXPECT_FALSE(portal_.host().active_divider_cursor().has_value());
}

TEST_F(PortalHostViewTest, DividerHitPassesThroughWithCursor) {
  build_split(true);
  EXPECT_EQ(hit(PointF{400, 300}), nullptr);
  ASSERT_TRUE(portal_.host().active_divider_cursor().has_value());
  EXPECT_EQ(*portal_.host().active_divider_cursor(), DividerCursorKind::Vertical);

  // Within the expanded hit band, not only on the line itself.
  EXPECT_EQ(hit(PointF{404, 300}), nullptr);
  EXPECT_EQ(hit(PointF{410, 300}), h2_.get());
}

TEST_F(PortalHostViewTest, StackedSplitReportsHorizontalCursor) {
  build_split(false);
  portal_.host().pointer_moved(PointF{400, 300});
  ASSERT_TRUE(portal_.host().active_divider_cursor().has_value());
  EXPECT_EQ(*portal_.host().active_divider_cursor(),
            DividerCursorKind::Horizontal);

  portal_.host().pointer_exited();
  EXPECT_FALSE(portal_.host().active_divider_cursor().has_value());
}

TEST_F(PortalHostViewTest, CursorRectsCoverDividerBand) {
  build_split(true);
  const auto rects = portal_.host().cursor_rects();
  ASSERT_EQ(rects.size(), 1u);
  EXPECT_TRUE(rect_approximately_equal(rects[0].rect, RectF{395.5f, 0, 9, 600}));
  EXPECT_EQ(rects[0].kind, DividerCursorKind::Vertical);
}

TEST_F(PortalHostViewTest, CollapsedPanesHaveNoDivider) {
  build_split(true);
  left_->set_frame(RectF{0, 0, 0, 600});
  right_->set_frame(RectF{1, 0, 0, 600});
  EXPECT_TRUE(portal_.host().cursor_rects().empty());
  EXPECT_FALSE(portal_.host().split_divider_cursor_kind(PointF{0, 300}).has_value());
}

TEST_F(PortalHostViewTest, HiddenSplitHasNoDivider) {
  build_split(true);
  split_->set_hidden(true);
  EXPECT_TRUE(portal_.host().cursor_rects().empty());
  EXPECT_FALSE(
      portal_.host().split_divider_cursor_kind(PointF{400, 300}).has_value());
}

// =============================================================================
// Drags
// =============================================================================

TEST_F(PortalHostViewTest, TabTransferDragPassesThrough) {
  build_split(true);
  window_->set_pointer_context(PointerContext{
      PointerEventKind::LeftMouseDragged, {std::string{tab_transfer_drag_type}}});
  EXPECT_EQ(hit(PointF{100, 300}), nullptr);

  window_->set_pointer_context(PointerContext{
      PointerEventKind::LeftMouseDown, {std::string{tab_transfer_drag_type}}});
  EXPECT_EQ(hit(PointF{100, 300}), h1_.get());
}

TEST_F(PortalHostViewTest, SidebarReorderDragPassesThrough) {
  build_split(true);
  window_->set_pointer_context(PointerContext{
      PointerEventKind::None, {std::string{sidebar_tab_reorder_drag_type}}});
  EXPECT_EQ(hit(PointF{100, 300}), nullptr);
}

TEST_F(PortalHostViewTest, UnrelatedDragTypesStillHit) {
  build_split(true);
  window_->set_pointer_context(
      PointerContext{PointerEventKind::LeftMouseDragged, {"public.file-url"}});
  EXPECT_EQ(hit(PointF{100, 300}), h1_.get());
}

TEST(DragRoutingTest, DragPhaseEvents) {
  EXPECT_TRUE(is_drag_phase_event(PointerEventKind::None));
  EXPECT_TRUE(is_drag_phase_event(PointerEventKind::CursorUpdate));
  EXPECT_TRUE(is_drag_phase_event(PointerEventKind::RightMouseDragged));
  EXPECT_TRUE(is_drag_phase_event(PointerEventKind::Periodic));
  EXPECT_FALSE(is_drag_phase_event(PointerEventKind::MouseMoved));
  EXPECT_FALSE(is_drag_phase_event(PointerEventKind::LeftMouseDown));
  EXPECT_FALSE(is_drag_phase_event(PointerEventKind::LeftMouseUp));
}

TEST(DragRoutingTest, PassThroughNeedsKnownTypeAndDragEvent) {
  EXPECT_FALSE(should_pass_through_portal_hit_testing(
      PointerContext{PointerEventKind::LeftMouseDragged, {}}));
  EXPECT_FALSE(should_pass_through_portal_hit_testing(PointerContext{
      PointerEventKind::MouseMoved, {std::string{tab_transfer_drag_type}}}));
  EXPECT_TRUE(should_pass_through_portal_hit_testing(
      PointerContext{PointerEventKind::OtherMouseDragged,
                     {"x-other", std::string{sidebar_tab_reorder_drag_type}}}));
}

// =============================================================================
// Sidebar resizer
// =============================================================================

class SidebarRoutingTest : public PortalHostViewTest {
protected:
  void SetUp() override {
    anchor_ = std::make_shared<View>(RectF{200, 0, 600, 600});
    window_->content_view().add_subview(anchor_);
    hosted_ = std::make_shared<FakeHostedView>("main");
    portal_.bind(hosted_, anchor_, true);
  }

  std::shared_ptr<View> anchor_;
  std::shared_ptr<FakeHostedView> hosted_;
};

TEST_F(SidebarRoutingTest, LeadingEdgeOfContentPassesThrough) {
  EXPECT_EQ(hit(PointF{200, 300}), nullptr);
  ASSERT_TRUE(portal_.host().cached_sidebar_divider_x().has_value());
  EXPECT_FLOAT_EQ(*portal_.host().cached_sidebar_divider_x(), 200.0f);

  EXPECT_EQ(hit(PointF{205, 300}), nullptr);
  EXPECT_EQ(hit(PointF{400, 300}), hosted_.get());
}

TEST_F(SidebarRoutingTest, FlushContentClearsCacheAfterMisses) {
  auto &host = portal_.host();
  ASSERT_TRUE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));

  anchor_->set_frame(RectF{0, 0, 800, 600});
  portal_.synchronize_for_anchor(*anchor_);

  EXPECT_FALSE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));
  EXPECT_TRUE(host.cached_sidebar_divider_x().has_value());
  EXPECT_FALSE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));
  EXPECT_FALSE(host.cached_sidebar_divider_x().has_value());
}

TEST_F(SidebarRoutingTest, MissingCandidatesKeepCacheForAWhile) {
  auto &host = portal_.host();
  ASSERT_TRUE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));

  portal_.hide_entry(hosted_->id());
  for (int i = 0; i < 3; ++i) {
    EXPECT_TRUE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));
  }
  EXPECT_FALSE(host.should_pass_through_to_sidebar_resizer(PointF{200, 300}));
  EXPECT_FALSE(host.cached_sidebar_divider_x().has_value());
}

TEST_F(SidebarRoutingTest, HostNeverClaimsEmptyArea) {
  anchor_->set_frame(RectF{200, 0, 300, 300});
  portal_.synchronize_for_anchor(*anchor_);
  EXPECT_EQ(hit(PointF{700, 500}), nullptr);
}

} // namespace
} // namespace harbor::ui
