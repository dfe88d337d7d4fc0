#pragma once

#include <cstddef>
#include <telesample/sampling.hpp>

namespace telesample::data
{

/// Half-open index range [start, end).
struct Bucket
{
    std::size_t start = 0;
    std::size_t end   = 0;

    std::size_t size() const { return end > start ? end - start : 0; }
    bool        empty() const { return end <= start; }
};

/// Splits the interior indices [1, n-1) of an n-point series into
/// `threshold - 2` contiguous buckets, one per output slot.
/// Bucket width is the real value (n - 2) / (threshold - 2); boundaries are
/// floored, so neighbouring buckets may differ in size by one.
class BucketPartitioner
{
   public:
    /// Requires n > threshold >= 3.
    BucketPartitioner(std::size_t n, std::size_t threshold);

    std::size_t count() const { return count_; }
    double      width() const { return width_; }

    /// Bucket i, for i in [0, count()).
    Bucket bucket(std::size_t i) const;

    /// The range averaged against when selecting from bucket i: bucket i + 1,
    /// clipped to [*, n).  May be empty past the final bucket.
    Bucket next_bucket(std::size_t i) const;

   private:
    std::size_t boundary(std::size_t i) const;

    std::size_t n_;
    std::size_t count_;
    double      width_;
};

/// Mean of the points in `range`.  An empty range yields (0, 0).
[[nodiscard]] Point bucket_centroid(const Bucket& range, const PointAccessor& point_at);

/// 0.5 * |(prev.x - avg.x) * (c.y - prev.y) - (prev.x - c.x) * (avg.y - prev.y)|
/// Used only to rank candidates; x and y units are mixed.
[[nodiscard]] double triangle_area(const Point& prev, const Point& avg, const Point& candidate);

/// Index in `bucket` with the strictly largest triangle_area against `prev`
/// and `avg`; ties keep the earliest index.  When no candidate scores
/// (all NaN), returns bucket.start.
[[nodiscard]] std::size_t select_largest_triangle(const Bucket&        bucket,
                                                  const Point&         prev,
                                                  const Point&         avg,
                                                  const PointAccessor& point_at);

}   // namespace telesample::data
