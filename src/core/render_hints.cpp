#include <algorithm>
#include <telesample/render_hints.hpp>

namespace telesample
{

SamplingSummary summarize_sampling(std::size_t original_length, std::size_t rendered_length)
{
    SamplingSummary summary;
    summary.original_points = original_length;
    summary.rendered_points = std::min(rendered_length, original_length);
    summary.sampled         = summary.rendered_points < original_length;

    if (original_length > 0)
    {
        const double kept =
            static_cast<double>(summary.rendered_points) / static_cast<double>(original_length);
        summary.reduction_percent = (1.0 - kept) * 100.0;
    }
    return summary;
}

}   // namespace telesample
