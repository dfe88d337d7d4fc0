#include <gtest/gtest.h>
#include <telesample/render_hints.hpp>

using namespace telesample;

TEST(RenderHints, MarkerBoundary)
{
    EXPECT_TRUE(should_show_markers(0));
    EXPECT_TRUE(should_show_markers(1));
    EXPECT_TRUE(should_show_markers(100));
    EXPECT_FALSE(should_show_markers(101));
    EXPECT_FALSE(should_show_markers(10'000));
}

TEST(RenderHints, UsableAtCompileTime)
{
    static_assert(should_show_markers(MARKER_DENSITY_LIMIT));
    static_assert(!should_show_markers(MARKER_DENSITY_LIMIT + 1));
}

TEST(SamplingSummaryTest, Unchanged)
{
    auto s = summarize_sampling(50, 50);
    EXPECT_EQ(s.original_points, 50u);
    EXPECT_EQ(s.rendered_points, 50u);
    EXPECT_DOUBLE_EQ(s.reduction_percent, 0.0);
    EXPECT_FALSE(s.sampled);
}

TEST(SamplingSummaryTest, Reductions)
{
    EXPECT_DOUBLE_EQ(summarize_sampling(2000, 500).reduction_percent, 75.0);
    EXPECT_DOUBLE_EQ(summarize_sampling(10'000, 500).reduction_percent, 95.0);
    EXPECT_TRUE(summarize_sampling(2000, 500).sampled);
}

TEST(SamplingSummaryTest, EmptyInput)
{
    auto s = summarize_sampling(0, 0);
    EXPECT_DOUBLE_EQ(s.reduction_percent, 0.0);
    EXPECT_FALSE(s.sampled);
}
