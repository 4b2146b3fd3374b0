#include <gtest/gtest.h>

#include <harbor/ui/geometry.hpp>

#include <limits>

namespace harbor::ui {
namespace {

class GeometryTest : public ::testing::Test {};

TEST_F(GeometryTest, IntersectionOfOverlappingRects) {
  const auto r = rect_intersection(RectF{0, 0, 100, 100}, RectF{50, 25, 100, 100});
  ASSERT_TRUE(r.has_value());
  EXPECT_FLOAT_EQ(r->x, 50.0f);
  EXPECT_FLOAT_EQ(r->y, 25.0f);
  EXPECT_FLOAT_EQ(r->w, 50.0f);
  EXPECT_FLOAT_EQ(r->h, 75.0f);
}

TEST_F(GeometryTest, TouchingEdgesGiveZeroAreaIntersection) {
  const auto r = rect_intersection(RectF{0, 0, 10, 10}, RectF{10, 0, 10, 10});
  ASSERT_TRUE(r.has_value());
  EXPECT_FLOAT_EQ(r->w, 0.0f);
  EXPECT_TRUE(rect_is_empty(*r));
}

TEST_F(GeometryTest, DisjointRectsHaveNoIntersection) {
  EXPECT_FALSE(rect_intersection(RectF{0, 0, 10, 10}, RectF{20, 0, 10, 10}));
  EXPECT_FALSE(rects_intersect(RectF{0, 0, 10, 10}, RectF{20, 0, 10, 10}));
  const auto clamped = intersect_rect(RectF{0, 0, 10, 10}, RectF{20, 0, 10, 10});
  EXPECT_FLOAT_EQ(clamped.w, 0.0f);
}

TEST_F(GeometryTest, ContainsIsHalfOpen) {
  const RectF r{0, 0, 10, 10};
  EXPECT_TRUE(rect_contains(r, PointF{0, 0}));
  EXPECT_FALSE(rect_contains(r, PointF{10, 5}));
  EXPECT_TRUE(rect_contains_inclusive(r, PointF{10, 5}));
}

TEST_F(GeometryTest, FinitenessDetectsNanAndInfinity) {
  EXPECT_TRUE(rect_is_finite(RectF{1, 2, 3, 4}));
  EXPECT_FALSE(rect_is_finite(
      RectF{std::numeric_limits<float>::quiet_NaN(), 0, 1, 1}));
  EXPECT_FALSE(rect_is_finite(
      RectF{0, 0, std::numeric_limits<float>::infinity(), 1}));
}

TEST_F(GeometryTest, ApproximateEqualityUsesEpsilon) {
  EXPECT_TRUE(rect_approximately_equal(RectF{0, 0, 10, 10},
                                       RectF{0.005f, 0, 10, 10.009f}));
  EXPECT_FALSE(rect_approximately_equal(RectF{0, 0, 10, 10},
                                        RectF{0.05f, 0, 10, 10}));
}

TEST_F(GeometryTest, InsetWithNegativeAmountsExpands) {
  const auto r = inset_rect(RectF{10, 10, 2, 20}, -5.0f, 0.0f);
  EXPECT_FLOAT_EQ(r.x, 5.0f);
  EXPECT_FLOAT_EQ(r.w, 12.0f);
  EXPECT_FLOAT_EQ(r.h, 20.0f);
}

TEST_F(GeometryTest, PixelSnapRoundsOnDeviceGrid) {
  const auto r = pixel_snapped_rect(RectF{10.3f, 10.2f, 100.4f, 50.1f}, 2.0f);
  EXPECT_FLOAT_EQ(r.x, 10.5f);
  EXPECT_FLOAT_EQ(r.y, 10.0f);
  EXPECT_FLOAT_EQ(r.w, 100.5f);
  EXPECT_FLOAT_EQ(r.h, 50.0f);
}

TEST_F(GeometryTest, PixelSnapTreatsSubUnitScaleAsOne) {
  const auto r = pixel_snapped_rect(RectF{10.4f, 0.6f, 3.5f, 2.0f}, 0.5f);
  EXPECT_FLOAT_EQ(r.x, 10.0f);
  EXPECT_FLOAT_EQ(r.y, 1.0f);
  EXPECT_FLOAT_EQ(r.w, 4.0f);
}

TEST_F(GeometryTest, PixelSnapClampsNegativeSizes) {
  const auto r = pixel_snapped_rect(RectF{0, 0, -3.0f, 5.0f}, 1.0f);
  EXPECT_FLOAT_EQ(r.w, 0.0f);
  EXPECT_FLOAT_EQ(r.h, 5.0f);
}

TEST_F(GeometryTest, PixelSnapPassesNonFiniteThrough) {
  const auto r = pixel_snapped_rect(
      RectF{std::numeric_limits<float>::quiet_NaN(), 0, 1, 1}, 1.0f);
  EXPECT_FALSE(rect_is_finite(r));
}

} // namespace
} // namespace harbor::ui
