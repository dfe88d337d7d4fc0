#pragma once

#include <optional>
#include <string>
#include <telesample/logger.hpp>
#include <telesample/sampling.hpp>

namespace telesample
{

// Persistent sampling defaults: save/load to a small JSON file.
//
//   {
//     "version": 1,
//     "threshold": 500,
//     "target_points": 300,
//     "x_key": "timestamp",
//     "y_key": "voltage",
//     "log_level": "info"
//   }
//
// Every key is optional; missing keys keep their current value.
class SamplingConfig
{
   public:
    AdaptiveOptions            adaptive;
    std::optional<std::string> x_key;
    std::optional<std::string> y_key;
    LogLevel                   log_level = LogLevel::Info;

    // Request for a plain downsample call at the adaptive target size.
    SampleRequest sample_request() const;

    // Pushes log_level into the global Logger.
    void apply_log_level() const;

    // Serialize to a JSON string.
    std::string serialize() const;

    // Deserialize from a JSON string.  On failure (malformed value, newer
    // version) returns false and leaves the config untouched.
    bool deserialize(const std::string& json);

    // Save to / load from a JSON file.  Returns true on success.
    bool save(const std::string& path) const;
    bool load(const std::string& path);

    // $XDG_CONFIG_HOME/telesample/sampling.json, falling back to
    // ~/.config/telesample/sampling.json.
    static std::string default_path();
};

}   // namespace telesample
