#include <telesample/logger.hpp>
#include <telesample/sampling.hpp>

#include "data/key_resolver.hpp"

namespace telesample
{

namespace
{

SampledSequence passthrough(std::span<const Record> data)
{
    SampledSequence out;
    out.reserve(data.size());
    for (const Record& record : data)
        out.push_back(&record);
    return out;
}

}   // namespace

SampledSequence downsample(std::span<const Record>    data,
                           std::size_t                threshold,
                           std::optional<std::string> x_key,
                           std::optional<std::string> y_key)
{
    if (data.size() <= std::max(threshold, MIN_THRESHOLD))
        return passthrough(data);

    const data::RecordProjector project(data::resolve_keys(data.front(), x_key, y_key));
    return downsample_by(data, threshold, project);
}

SampledSequence downsample(std::span<const Record> data, const SampleRequest& request)
{
    return downsample(data, request.threshold, request.x_key, request.y_key);
}

SampledSequence adaptive_sample(std::span<const Record>    data,
                                const AdaptiveOptions&     options,
                                std::optional<std::string> x_key,
                                std::optional<std::string> y_key)
{
    if (data.size() <= options.threshold)
    {
        TELESAMPLE_LOG_TRACE("sampling",
                             "{} readings within threshold {}, passing through",
                             data.size(),
                             options.threshold);
        return passthrough(data);
    }

    TELESAMPLE_LOG_DEBUG("sampling",
                         "{} readings exceed threshold {}, reducing to {}",
                         data.size(),
                         options.threshold,
                         options.target_points);
    return downsample(data, options.target_points, std::move(x_key), std::move(y_key));
}

}   // namespace telesample
