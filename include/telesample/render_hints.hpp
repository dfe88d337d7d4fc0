#pragma once

#include <cstddef>

namespace telesample
{

// Series longer than this are drawn as plain lines without per-point markers.
inline constexpr std::size_t MARKER_DENSITY_LIMIT = 100;

// Whether a renderer should mark individual points.  Pass the length of the
// data as loaded, not the length after sampling.
constexpr bool should_show_markers(std::size_t original_length)
{
    return original_length <= MARKER_DENSITY_LIMIT;
}

// Figures for a "showing X of Y points" status line.
struct SamplingSummary
{
    std::size_t original_points   = 0;
    std::size_t rendered_points   = 0;
    double      reduction_percent = 0.0;   // 0 when nothing was dropped
    bool        sampled           = false;
};

SamplingSummary summarize_sampling(std::size_t original_length, std::size_t rendered_length);

}   // namespace telesample
