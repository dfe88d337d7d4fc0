#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <telesample/telesample.hpp>
#include <vector>

// Synthesizes a battery log, reduces it the way a chart would, and prints
// what the renderer would receive.
//
//   downsample_demo [readings]

int main(int argc, char** argv)
{
    telesample::Logger::instance().add_sink(telesample::sinks::console_sink());

    telesample::SamplingConfig config;
    if (!config.load(telesample::SamplingConfig::default_path()))
        TELESAMPLE_LOG_DEBUG("demo", "using built-in sampling defaults");
    config.apply_log_level();

    std::size_t count = 10'000;
    if (argc > 1)
        count = static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10));

    // One reading per minute starting 2024-03-01T00:00:00Z.
    const double start_ms = 1'709'251'200'000.0;
    std::vector<telesample::Record> readings;
    readings.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        const double t       = static_cast<double>(i);
        const double voltage = 12.6 - 0.0001 * t + 0.05 * std::sin(t * 0.02);
        readings.push_back(telesample::Record{{"time", start_ms + t * 60'000.0},
                                              {"voltage", voltage},
                                              {"temperature", 24.0 + 3.0 * std::sin(t * 0.004)}});
    }

    telesample::SampledSequence shown;
    try
    {
        shown = telesample::adaptive_sample(readings, config.adaptive, config.x_key, config.y_key);
    }
    catch (const telesample::ResolutionError& e)
    {
        std::fprintf(stderr, "cannot sample: %s\n", e.what());
        return 1;
    }

    const auto summary = telesample::summarize_sampling(readings.size(), shown.size());
    std::printf("showing %zu of %zu readings (%.1f%% reduction), markers %s\n",
                summary.rendered_points,
                summary.original_points,
                summary.reduction_percent,
                telesample::should_show_markers(readings.size()) ? "on" : "off");

    const std::size_t preview = std::min<std::size_t>(shown.size(), 5);
    for (std::size_t i = 0; i < preview; ++i)
    {
        const auto* r = shown[i];
        std::printf("  #%-6td time=%.0f voltage=%.4f\n",
                    r - readings.data(),
                    r->number("time").value_or(NAN),
                    r->number("voltage").value_or(NAN));
    }

    return 0;
}
