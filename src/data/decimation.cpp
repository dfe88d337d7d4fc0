#include "data/decimation.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <telesample/logger.hpp>

namespace telesample::data
{

BucketPartitioner::BucketPartitioner(std::size_t n, std::size_t threshold)
    : n_(n),
      count_(threshold - 2),
      width_(static_cast<double>(n - 2) / static_cast<double>(threshold - 2))
{
}

// floor(i * width) + 1, evaluated in integers: (i * (n - 2)) / (threshold - 2)
// is the exact floor, where the double product can land just below an integer
// and drop the last interior index.
std::size_t BucketPartitioner::boundary(std::size_t i) const
{
    return (i * (n_ - 2)) / count_ + 1;
}

Bucket BucketPartitioner::bucket(std::size_t i) const
{
    return {boundary(i), boundary(i + 1)};
}

Bucket BucketPartitioner::next_bucket(std::size_t i) const
{
    const std::size_t end   = std::min(boundary(i + 2), n_);
    const std::size_t start = std::min(boundary(i + 1), end);
    return {start, end};
}

Point bucket_centroid(const Bucket& range, const PointAccessor& point_at)
{
    if (range.empty())
        return {};

    double sum_x = 0.0;
    double sum_y = 0.0;
    for (std::size_t i = range.start; i < range.end; ++i)
    {
        const Point p = point_at(i);
        sum_x += p.x;
        sum_y += p.y;
    }
    const auto count = static_cast<double>(range.size());
    return {sum_x / count, sum_y / count};
}

double triangle_area(const Point& prev, const Point& avg, const Point& candidate)
{
    return 0.5
           * std::abs((prev.x - avg.x) * (candidate.y - prev.y)
                      - (prev.x - candidate.x) * (avg.y - prev.y));
}

std::size_t select_largest_triangle(const Bucket&        bucket,
                                    const Point&         prev,
                                    const Point&         avg,
                                    const PointAccessor& point_at)
{
    double      max_area = -1.0;
    std::size_t best     = bucket.start;

    for (std::size_t i = bucket.start; i < bucket.end; ++i)
    {
        const double area = triangle_area(prev, avg, point_at(i));
        if (area > max_area)
        {
            max_area = area;
            best     = i;
        }
    }
    return best;
}

}   // namespace telesample::data

namespace telesample
{

std::vector<std::size_t> lttb_indices(std::size_t          n,
                                      std::size_t          threshold,
                                      const PointAccessor& point_at)
{
    if (threshold < MIN_THRESHOLD)
    {
        TELESAMPLE_LOG_DEBUG("sampling", "threshold {} clamped to {}", threshold, MIN_THRESHOLD);
        threshold = MIN_THRESHOLD;
    }

    std::vector<std::size_t> out;
    if (n <= threshold)
    {
        out.resize(n);
        std::iota(out.begin(), out.end(), std::size_t{0});
        return out;
    }

    out.reserve(threshold);
    out.push_back(0);

    const data::BucketPartitioner partitioner(n, threshold);
    Point                         prev = point_at(0);

    for (std::size_t b = 0; b < partitioner.count(); ++b)
    {
        const Point avg = data::bucket_centroid(partitioner.next_bucket(b), point_at);
        const std::size_t best =
            data::select_largest_triangle(partitioner.bucket(b), prev, avg, point_at);

        out.push_back(best);
        prev = point_at(best);
    }

    out.push_back(n - 1);

    TELESAMPLE_LOG_DEBUG("sampling", "lttb reduced {} points to {}", n, out.size());
    return out;
}

}   // namespace telesample
