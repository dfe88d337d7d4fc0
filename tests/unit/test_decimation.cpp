#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <numeric>
#include <vector>

#include "data/decimation.hpp"

using namespace telesample;
using namespace telesample::data;

namespace
{

PointAccessor accessor_for(const std::vector<double>& x, const std::vector<double>& y)
{
    return [&x, &y](std::size_t i) { return Point{x[i], y[i]}; };
}

std::vector<double> iota_x(std::size_t n, double step = 1.0)
{
    std::vector<double> x(n);
    for (std::size_t i = 0; i < n; ++i)
        x[i] = static_cast<double>(i) * step;
    return x;
}

}   // namespace

// --- Bucket partitioner ---

TEST(BucketPartitioner, ExactWidthBoundaries)
{
    // n = 12, threshold = 6: width = 10 / 4 = 2.5
    BucketPartitioner p(12, 6);
    ASSERT_EQ(p.count(), 4u);
    EXPECT_DOUBLE_EQ(p.width(), 2.5);

    EXPECT_EQ(p.bucket(0).start, 1u);
    EXPECT_EQ(p.bucket(0).end, 3u);
    EXPECT_EQ(p.bucket(1).start, 3u);
    EXPECT_EQ(p.bucket(1).end, 6u);
    EXPECT_EQ(p.bucket(2).start, 6u);
    EXPECT_EQ(p.bucket(2).end, 8u);
    EXPECT_EQ(p.bucket(3).start, 8u);
    EXPECT_EQ(p.bucket(3).end, 11u);
}

TEST(BucketPartitioner, SizesDifferByAtMostOne)
{
    BucketPartitioner p(1003, 17);
    std::size_t       lo = std::numeric_limits<std::size_t>::max();
    std::size_t       hi = 0;
    for (std::size_t i = 0; i < p.count(); ++i)
    {
        lo = std::min(lo, p.bucket(i).size());
        hi = std::max(hi, p.bucket(i).size());
    }
    EXPECT_LE(hi - lo, 1u);
}

TEST(BucketPartitioner, CoversInteriorExactlyOnce)
{
    // Includes shapes where floor(k * (m / k)) in doubles falls one short of m.
    const std::pair<std::size_t, std::size_t> shapes[] = {
        {17, 13}, {17, 15}, {28, 25}, {32, 13}, {41, 39}, {1000, 7}, {10'001, 500}};

    for (auto [n, t] : shapes)
    {
        BucketPartitioner p(n, t);
        EXPECT_EQ(p.bucket(0).start, 1u) << "n=" << n << " t=" << t;
        for (std::size_t i = 0; i + 1 < p.count(); ++i)
        {
            EXPECT_EQ(p.bucket(i).end, p.bucket(i + 1).start) << "n=" << n << " t=" << t;
            EXPECT_FALSE(p.bucket(i).empty());
        }
        EXPECT_EQ(p.bucket(p.count() - 1).end, n - 1) << "n=" << n << " t=" << t;
    }
}

TEST(BucketPartitioner, NextBucketIsShiftedAndClipped)
{
    BucketPartitioner p(12, 6);
    EXPECT_EQ(p.next_bucket(0).start, p.bucket(1).start);
    EXPECT_EQ(p.next_bucket(0).end, p.bucket(1).end);

    // Past the final bucket only the last data point remains.
    const Bucket last_next = p.next_bucket(p.count() - 1);
    EXPECT_EQ(last_next.start, 11u);
    EXPECT_EQ(last_next.end, 12u);

    // Further out the range is empty rather than reading past n.
    const Bucket beyond = p.next_bucket(p.count());
    EXPECT_TRUE(beyond.empty());
    EXPECT_LE(beyond.end, 12u);
}

// --- Centroid and triangle score ---

TEST(BucketCentroid, AveragesRange)
{
    std::vector<double> x = {0, 10, 20, 30};
    std::vector<double> y = {1, 2, 4, 8};
    Point               c = bucket_centroid({1, 4}, accessor_for(x, y));
    EXPECT_DOUBLE_EQ(c.x, 20.0);
    EXPECT_DOUBLE_EQ(c.y, 14.0 / 3.0);
}

// Regression pin: an empty averaging range falls back to the origin rather
// than to the last data point.
TEST(BucketCentroid, EmptyRangeFallsBackToOrigin)
{
    std::vector<double> x = {5, 6};
    std::vector<double> y = {7, 8};
    Point               c = bucket_centroid({2, 2}, accessor_for(x, y));
    EXPECT_DOUBLE_EQ(c.x, 0.0);
    EXPECT_DOUBLE_EQ(c.y, 0.0);
}

TEST(TriangleArea, MatchesCrossProductFormula)
{
    const Point prev{0.0, 0.0};
    const Point avg{4.0, 0.0};
    EXPECT_DOUBLE_EQ(triangle_area(prev, avg, {2.0, 3.0}), 6.0);
    EXPECT_DOUBLE_EQ(triangle_area(prev, avg, {2.0, -3.0}), 6.0);
    EXPECT_DOUBLE_EQ(triangle_area(prev, avg, {1.0, 0.0}), 0.0);
}

TEST(SelectLargestTriangle, PicksLargestArea)
{
    std::vector<double> x = {0, 1, 2, 3, 4};
    std::vector<double> y = {0, 1, 9, 2, 0};
    auto best = select_largest_triangle({1, 4}, {0, 0}, {4, 0}, accessor_for(x, y));
    EXPECT_EQ(best, 2u);
}

TEST(SelectLargestTriangle, TiesKeepEarliestIndex)
{
    std::vector<double> x = {0, 1, 2, 3};
    std::vector<double> y = {0, 5, 5, 5};
    auto best = select_largest_triangle({1, 4}, {0, 0}, {4, 0}, accessor_for(x, y));
    EXPECT_EQ(best, 1u);
}

// Regression pin: with the (0, 0) fallback average the score is taken
// against the origin.
TEST(SelectLargestTriangle, OriginFallbackAverage)
{
    std::vector<double> x = {10, 11, 12};
    std::vector<double> y = {1, 1, 4};
    auto best = select_largest_triangle({1, 3}, {10, 1}, Point{}, accessor_for(x, y));
    // area(1) = 0.5*|10*0 - (-1)*(-1)| = 0.5, area(2) = 0.5*|10*3 - (-2)*(-1)| = 14
    EXPECT_EQ(best, 2u);
}

TEST(SelectLargestTriangle, AllNaNKeepsBucketStart)
{
    const double        nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> x   = {0, nan, nan, nan};
    std::vector<double> y   = {0, 1, 2, 3};
    auto best = select_largest_triangle({1, 4}, {0, 0}, {4, 0}, accessor_for(x, y));
    EXPECT_EQ(best, 1u);
}

// --- lttb_indices ---

TEST(LttbIndices, EmptyInput)
{
    auto result = lttb_indices(0, 10, [](std::size_t) { return Point{}; });
    EXPECT_TRUE(result.empty());
}

TEST(LttbIndices, SmallInputReturnsAllIndices)
{
    std::vector<double> x = iota_x(5);
    std::vector<double> y = {0, 1, 4, 9, 16};
    auto                result = lttb_indices(5, 100, accessor_for(x, y));
    ASSERT_EQ(result.size(), 5u);
    for (std::size_t i = 0; i < 5; ++i)
        EXPECT_EQ(result[i], i);
}

TEST(LttbIndices, ThresholdBelowThreeIsClamped)
{
    std::vector<double> x = iota_x(5);
    std::vector<double> y = {0, 1, 2, 3, 4};
    auto                result = lttb_indices(5, 1, accessor_for(x, y));
    EXPECT_EQ(result, (std::vector<std::size_t>{0, 1, 4}));
}

TEST(LttbIndices, KnownSelection)
{
    std::vector<double> x = iota_x(12, 1000.0);
    std::vector<double> y = {0, 1, 5, 2, 8, 3, 3, 9, 1, 4, 7, 2};
    auto                result = lttb_indices(12, 6, accessor_for(x, y));
    EXPECT_EQ(result, (std::vector<std::size_t>{0, 2, 3, 7, 8, 11}));
}

TEST(LttbIndices, FlatTailTiesPickFirst)
{
    std::vector<double> x = iota_x(7);
    std::vector<double> y = {0, 1, 1, 1, 1, 1, 1};
    auto                result = lttb_indices(7, 4, accessor_for(x, y));
    EXPECT_EQ(result, (std::vector<std::size_t>{0, 1, 3, 6}));
}

TEST(LttbIndices, PreservesSpike)
{
    std::vector<double> x = iota_x(100);
    std::vector<double> y(100, 0.0);
    y[50] = 100.0;

    auto result = lttb_indices(100, 20, accessor_for(x, y));
    ASSERT_EQ(result.size(), 20u);
    EXPECT_NE(std::find(result.begin(), result.end(), 50u), result.end())
        << "LTTB should preserve prominent spike";
}

TEST(LttbIndices, StrictlyAscending)
{
    std::vector<double> x = iota_x(5000);
    std::vector<double> y(5000);
    for (std::size_t i = 0; i < y.size(); ++i)
        y[i] = std::sin(static_cast<double>(i) * 0.01);

    auto result = lttb_indices(5000, 137, accessor_for(x, y));
    ASSERT_EQ(result.size(), 137u);
    EXPECT_EQ(result.front(), 0u);
    EXPECT_EQ(result.back(), 4999u);
    for (std::size_t i = 1; i < result.size(); ++i)
        EXPECT_LT(result[i - 1], result[i]);
}
