#include <gtest/gtest.h>

#include <harbor/ui/config.hpp>

#include <cstdlib>

namespace harbor::ui {
namespace {

class ConfigTest : public ::testing::Test {
protected:
  void TearDown() override {
    unsetenv("HARBOR_PORTAL_DIVIDER_EXPANSION");
    unsetenv("HARBOR_PORTAL_SIDEBAR_HIT_WIDTH");
    unsetenv("HARBOR_PORTAL_SIDEBAR_FLUSH_MISSES");
    unsetenv("HARBOR_PORTAL_HOST_READY");
    unsetenv("HARBOR_PORTAL_COLLAPSED_PANE");
    unsetenv("HARBOR_PORTAL_SIDEBAR_EDGE_EPSILON");
    unsetenv("HARBOR_PORTAL_OVERLAY_EPSILON");
  }
};

TEST_F(ConfigTest, DefaultsMatchPortalBehaviour) {
  const PortalConfig c;
  EXPECT_FLOAT_EQ(c.rect_epsilon, 0.01f);
  EXPECT_FLOAT_EQ(c.tiny_frame_threshold, 1.0f);
  EXPECT_FLOAT_EQ(c.divider_hit_expansion, 5.0f);
  EXPECT_FLOAT_EQ(c.cursor_rect_expansion, 4.0f);
  EXPECT_FLOAT_EQ(c.sidebar_hit_width_per_side, 6.0f);
  EXPECT_FLOAT_EQ(c.minimum_visible_leading_content_width, 24.0f);
  EXPECT_EQ(c.sidebar_flush_miss_limit, 2);
  EXPECT_EQ(c.sidebar_candidate_miss_limit, 4);
}

TEST_F(ConfigTest, EnvironmentOverridesValues) {
  setenv("HARBOR_PORTAL_DIVIDER_EXPANSION", "7.5", 1);
  setenv("HARBOR_PORTAL_SIDEBAR_FLUSH_MISSES", "3", 1);
  const auto c = PortalConfig::from_env();
  EXPECT_FLOAT_EQ(c.divider_hit_expansion, 7.5f);
  EXPECT_EQ(c.sidebar_flush_miss_limit, 3);
}

TEST_F(ConfigTest, EnvironmentOverridesThresholds) {
  setenv("HARBOR_PORTAL_HOST_READY", "2", 1);
  setenv("HARBOR_PORTAL_COLLAPSED_PANE", "3.5", 1);
  setenv("HARBOR_PORTAL_SIDEBAR_EDGE_EPSILON", "0.5", 1);
  setenv("HARBOR_PORTAL_OVERLAY_EPSILON", "5", 1);
  const auto c = PortalConfig::from_env();
  EXPECT_FLOAT_EQ(c.host_ready_threshold, 2.0f);
  EXPECT_FLOAT_EQ(c.collapsed_pane_threshold, 3.5f);
  EXPECT_FLOAT_EQ(c.sidebar_leading_edge_epsilon, 0.5f);
  EXPECT_FLOAT_EQ(c.overlay_axis_epsilon, 1.0f);
}

TEST_F(ConfigTest, UnparsableValuesKeepDefaults) {
  setenv("HARBOR_PORTAL_DIVIDER_EXPANSION", "wide", 1);
  setenv("HARBOR_PORTAL_SIDEBAR_FLUSH_MISSES", "", 1);
  const auto c = PortalConfig::from_env();
  EXPECT_FLOAT_EQ(c.divider_hit_expansion, 5.0f);
  EXPECT_EQ(c.sidebar_flush_miss_limit, 2);
}

TEST_F(ConfigTest, OutOfRangeValuesAreClamped) {
  setenv("HARBOR_PORTAL_SIDEBAR_HIT_WIDTH", "1000", 1);
  setenv("HARBOR_PORTAL_SIDEBAR_FLUSH_MISSES", "0", 1);
  const auto c = PortalConfig::from_env();
  EXPECT_FLOAT_EQ(c.sidebar_hit_width_per_side, 64.0f);
  EXPECT_EQ(c.sidebar_flush_miss_limit, 1);
}

} // namespace
} // namespace harbor::ui
