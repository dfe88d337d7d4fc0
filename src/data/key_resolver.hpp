#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <telesample/record.hpp>
#include <telesample/sampling.hpp>
#include <utility>

namespace telesample::data
{

inline constexpr std::string_view PRIMARY_X_KEY  = "time";
inline constexpr std::string_view FALLBACK_X_KEY = "timestamp";

struct ResolvedKeys
{
    std::string x_key;
    std::string y_key;
};

/// Chooses the x and y fields for a sequence from one representative record.
/// x: explicit key, else "time", else "timestamp".
/// y: explicit key, else the first numeric field (in declaration order) that
///    is not the x field.
/// Throws ResolutionError when an explicit key is absent from `sample` or
/// when no default applies.
[[nodiscard]] ResolvedKeys resolve_keys(const Record&                     sample,
                                        const std::optional<std::string>& x_key,
                                        const std::optional<std::string>& y_key);

/// x coordinate of a record: a numeric field as-is, a date/time string as
/// epoch milliseconds.  NaN if missing or unparseable.
[[nodiscard]] double x_coordinate(const Record& record, std::string_view key);

/// y coordinate of a record.  NaN if missing or not numeric.
[[nodiscard]] double y_coordinate(const Record& record, std::string_view key);

// Projects records through a fixed pair of keys.
class RecordProjector
{
   public:
    explicit RecordProjector(ResolvedKeys keys) : keys_(std::move(keys)) {}

    Point operator()(const Record& record) const
    {
        return {x_coordinate(record, keys_.x_key), y_coordinate(record, keys_.y_key)};
    }

    const ResolvedKeys& keys() const { return keys_; }

   private:
    ResolvedKeys keys_;
};

}   // namespace telesample::data
