#include "data/time_parse.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>

namespace telesample::data
{

namespace
{

constexpr int64_t kMsPerSecond = 1000;
constexpr int64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr int64_t kMsPerHour   = 60 * kMsPerMinute;
constexpr int64_t kMsPerDay    = 24 * kMsPerHour;

// Four-digit years only: [0000-01-01, 10000-01-01).
constexpr double kMinFormattableMs = -62'167'219'200'000.0;
constexpr double kMaxFormattableMs = 253'402'300'800'000.0;

// Cursor over the input; every read either consumes exactly what it matched
// or reports failure.
class Scanner
{
   public:
    explicit Scanner(std::string_view text) : text_(text) {}

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[pos_]; }

    bool consume(char c)
    {
        if (peek() != c)
            return false;
        ++pos_;
        return true;
    }

    // Reads exactly `count` decimal digits.
    bool digits(std::size_t count, int& out)
    {
        if (pos_ + count > text_.size())
            return false;
        int value = 0;
        for (std::size_t i = 0; i < count; ++i)
        {
            const char c = text_[pos_ + i];
            if (c < '0' || c > '9')
                return false;
            value = value * 10 + (c - '0');
        }
        pos_ += count;
        out = value;
        return true;
    }

    // Reads one or more digits as a fraction of a second, in milliseconds.
    bool fraction_ms(int& out)
    {
        std::size_t start = pos_;
        int         ms    = 0;
        int         scale = 100;
        while (!at_end() && peek() >= '0' && peek() <= '9')
        {
            ms += (peek() - '0') * scale;
            scale /= 10;
            ++pos_;
        }
        out = ms;
        return pos_ > start;
    }

   private:
    std::string_view text_;
    std::size_t      pos_ = 0;
};

std::optional<int64_t> days_since_epoch(int y, int m, int d)
{
    using namespace std::chrono;
    const year_month_day ymd{year{y}, month{static_cast<unsigned>(m)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok())
        return std::nullopt;
    return static_cast<int64_t>(sys_days{ymd}.time_since_epoch().count());
}

// Parses `Z`, `+HH:MM`, `+HHMM` (or `-`) into an offset east of UTC.
bool parse_offset(Scanner& s, int64_t& offset_ms)
{
    if (s.consume('Z') || s.consume('z'))
    {
        offset_ms = 0;
        return true;
    }

    int sign = 0;
    if (s.consume('+'))
        sign = 1;
    else if (s.consume('-'))
        sign = -1;
    else
        return false;

    int hh = 0;
    int mm = 0;
    if (!s.digits(2, hh))
        return false;
    s.consume(':');
    if (!s.digits(2, mm))
        return false;
    if (hh > 23 || mm > 59)
        return false;

    offset_ms = sign * (hh * kMsPerHour + mm * kMsPerMinute);
    return true;
}

}   // namespace

std::optional<double> parse_epoch_ms(std::string_view text)
{
    Scanner s(text);

    int year  = 0;
    int month = 0;
    int day   = 0;
    if (!s.digits(4, year) || !s.consume('-') || !s.digits(2, month) || !s.consume('-')
        || !s.digits(2, day))
        return std::nullopt;

    auto days = days_since_epoch(year, month, day);
    if (!days)
        return std::nullopt;

    int64_t ms = *days * kMsPerDay;
    if (s.at_end())
        return static_cast<double>(ms);

    if (!s.consume('T') && !s.consume('t') && !s.consume(' '))
        return std::nullopt;

    int hour   = 0;
    int minute = 0;
    int second = 0;
    int millis = 0;
    if (!s.digits(2, hour) || !s.consume(':') || !s.digits(2, minute))
        return std::nullopt;
    if (s.consume(':'))
    {
        if (!s.digits(2, second))
            return std::nullopt;
        if ((s.consume('.') || s.consume(',')) && !s.fraction_ms(millis))
            return std::nullopt;
    }
    if (hour > 23 || minute > 59 || second > 60)
        return std::nullopt;

    ms += hour * kMsPerHour + minute * kMsPerMinute + second * kMsPerSecond + millis;

    if (!s.at_end())
    {
        int64_t offset_ms = 0;
        if (!parse_offset(s, offset_ms) || !s.at_end())
            return std::nullopt;
        ms -= offset_ms;
    }

    return static_cast<double>(ms);
}

std::string format_epoch_ms(double epoch_ms)
{
    if (!std::isfinite(epoch_ms) || epoch_ms < kMinFormattableMs || epoch_ms >= kMaxFormattableMs)
        return "invalid";

    using namespace std::chrono;
    const auto    total   = static_cast<int64_t>(std::floor(epoch_ms));
    int64_t       day_idx = total / kMsPerDay;
    int64_t       rem     = total % kMsPerDay;
    if (rem < 0)
    {
        rem += kMsPerDay;
        --day_idx;
    }

    const year_month_day ymd{sys_days{days{day_idx}}};

    char buffer[40];
    std::snprintf(buffer,
                  sizeof(buffer),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(rem / kMsPerHour),
                  static_cast<int>((rem % kMsPerHour) / kMsPerMinute),
                  static_cast<int>((rem % kMsPerMinute) / kMsPerSecond),
                  static_cast<int>(rem % kMsPerSecond));
    return std::string(buffer);
}

}   // namespace telesample::data
