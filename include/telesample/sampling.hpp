#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <telesample/record.hpp>
#include <utility>
#include <vector>

namespace telesample
{

// Geometric projection of one reading.  x is epoch milliseconds (or whatever
// numeric unit the x field carries), y the metric value.
struct Point
{
    double x = 0.0;
    double y = 0.0;
};

// Thrown when neither an explicit key nor an inferable default field
// determines the x or y accessor.
class ResolutionError : public std::runtime_error
{
   public:
    using std::runtime_error::runtime_error;
};

inline constexpr std::size_t MIN_THRESHOLD = 3;

// ─── Requests ───────────────────────────────────────────────────────────────

struct SampleRequest
{
    std::size_t                threshold = 500;   // clamped up to MIN_THRESHOLD
    std::optional<std::string> x_key;             // default: "time", then "timestamp"
    std::optional<std::string> y_key;             // default: first numeric field

    // Battery telemetry: x from "timestamp", y from "voltage".
    static SampleRequest timestamp_voltage(std::size_t threshold = 500)
    {
        return SampleRequest{threshold, std::string("timestamp"), std::string("voltage")};
    }
};

struct AdaptiveOptions
{
    std::size_t threshold     = 500;   // sampling starts above this many readings
    std::size_t target_points = 300;   // output size once sampling kicks in
};

// Non-owning, ordered references into the caller's readings.
using SampledSequence = std::vector<const Record*>;

// ─── Engine ─────────────────────────────────────────────────────────────────

// Returns the point for the reading at a given index.
using PointAccessor = std::function<Point(std::size_t)>;

// Core LTTB selection over `n` points reached through `point_at`.
// Returns ascending indices: all of [0, n) when n <= threshold, otherwise
// exactly max(threshold, 3) indices starting with 0 and ending with n - 1.
std::vector<std::size_t> lttb_indices(std::size_t          n,
                                      std::size_t          threshold,
                                      const PointAccessor& point_at);

// Generic entry point with a declared accessor: `point_of(const T&) -> Point`.
// Returns pointers into `data`; `data` must outlive the result.
template <typename T, typename PointOf>
std::vector<const T*> downsample_by(std::span<const T> data,
                                    std::size_t        threshold,
                                    PointOf&&          point_of)
{
    std::vector<const T*> out;
    if (data.size() <= std::max(threshold, MIN_THRESHOLD))
    {
        out.reserve(data.size());
        for (const T& item : data)
            out.push_back(&item);
        return out;
    }

    const auto indices = lttb_indices(data.size(),
                                      threshold,
                                      [&](std::size_t i) -> Point { return point_of(data[i]); });
    out.reserve(indices.size());
    for (std::size_t i : indices)
        out.push_back(&data[i]);
    return out;
}

template <typename T, typename PointOf>
std::vector<const T*> downsample_by(const std::vector<T>& data,
                                    std::size_t           threshold,
                                    PointOf&&             point_of)
{
    return downsample_by(std::span<const T>(data), threshold, std::forward<PointOf>(point_of));
}

// Record entry point.  Keys not supplied are inferred from data[0]; throws
// ResolutionError when inference fails.
SampledSequence downsample(std::span<const Record>    data,
                           std::size_t                threshold,
                           std::optional<std::string> x_key = std::nullopt,
                           std::optional<std::string> y_key = std::nullopt);

SampledSequence downsample(std::span<const Record> data, const SampleRequest& request);

// Leaves data at or below options.threshold untouched and reduces anything
// larger to options.target_points.
SampledSequence adaptive_sample(std::span<const Record>    data,
                                const AdaptiveOptions&     options = {},
                                std::optional<std::string> x_key   = std::nullopt,
                                std::optional<std::string> y_key   = std::nullopt);

}   // namespace telesample
