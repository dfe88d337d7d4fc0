#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace telesample::data
{

/// Parses an ISO-8601 date or date-time into milliseconds since the Unix epoch.
/// Accepts `YYYY-MM-DD`, optionally followed by `T` (or one space) and
/// `HH:MM[:SS[.fraction]]`, optionally followed by `Z`, `±HH:MM` or `±HHMM`.
/// Values without an offset are taken as UTC.  Fractions finer than a
/// millisecond are truncated.  Returns nullopt for anything else, including
/// out-of-range calendar fields (2023-02-29, 24:00, ...).
[[nodiscard]] std::optional<double> parse_epoch_ms(std::string_view text);

/// Formats epoch milliseconds as `YYYY-MM-DDTHH:MM:SS.mmmZ`.
/// Non-finite input yields "invalid".
[[nodiscard]] std::string format_epoch_ms(double epoch_ms);

}   // namespace telesample::data
