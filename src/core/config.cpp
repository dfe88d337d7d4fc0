#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string_view>
#include <telesample/config.hpp>

namespace telesample
{

namespace
{

constexpr std::size_t CONFIG_VERSION = 1;

std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

constexpr std::string_view kWhitespace = " \t\r\n";

bool ends_token(std::string_view raw, std::size_t pos)
{
    return pos >= raw.size() || raw[pos] == ',' || raw[pos] == '}'
           || kWhitespace.find(raw[pos]) != std::string_view::npos;
}

// Index one past the closing quote of the string opening at `pos`, or npos.
std::size_t skip_string(std::string_view json, std::size_t pos)
{
    for (std::size_t i = pos + 1; i < json.size(); ++i)
    {
        if (json[i] == '\\')
            ++i;
        else if (json[i] == '"')
            return i + 1;
    }
    return std::string_view::npos;
}

// Minimal reader for the flat object written by serialize(): walks the
// members, matching `key` only in key position (after `{` or `,`, followed
// by `:`), and returns the text after the colon with leading whitespace
// skipped.  Nested objects are not supported.
std::optional<std::string_view> find_value(std::string_view json, std::string_view key)
{
    bool expect_key = false;
    for (std::size_t i = 0; i < json.size();)
    {
        const char c = json[i];
        if (c == '"')
        {
            const std::size_t end = skip_string(json, i);
            if (end == std::string_view::npos)
                return std::nullopt;
            if (!expect_key)
            {
                i = end;
                continue;
            }

            const std::size_t colon = json.find_first_not_of(kWhitespace, end);
            if (colon == std::string_view::npos || json[colon] != ':')
                return std::nullopt;
            if (json.substr(i + 1, end - i - 2) == key)
            {
                const std::size_t value = json.find_first_not_of(kWhitespace, colon + 1);
                if (value == std::string_view::npos)
                    return std::string_view{};
                return json.substr(value);
            }
            expect_key = false;
            i          = colon + 1;
            continue;
        }

        if (c == '{' || c == ',')
            expect_key = true;
        else if (kWhitespace.find(c) == std::string_view::npos)
            expect_key = false;
        ++i;
    }
    return std::nullopt;
}

bool is_null(std::string_view raw)
{
    return raw.substr(0, 4) == "null" && ends_token(raw, 4);
}

// Parses a non-negative integer token ending at `,`, `}` or whitespace.
// Fails on signs, fractions, exponents and trailing characters.
std::optional<std::size_t> parse_count(std::string_view raw)
{
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (ec != std::errc{})
        return std::nullopt;
    if (!ends_token(raw, static_cast<std::size_t>(ptr - raw.data())))
        return std::nullopt;
    return value;
}

// Parses a quoted JSON string token, unescaping the sequences escape_json writes.
std::optional<std::string> parse_string(std::string_view raw)
{
    if (raw.empty() || raw.front() != '"')
        return std::nullopt;

    std::string out;
    for (std::size_t i = 1; i < raw.size(); ++i)
    {
        const char c = raw[i];
        if (c == '"')
            return out;
        if (c != '\\')
        {
            out += c;
            continue;
        }
        if (++i >= raw.size())
            break;
        switch (raw[i])
        {
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            default:
                out += raw[i];
                break;
        }
    }
    return std::nullopt;   // unterminated
}

// Reads an optional string key.  `null` clears it, absence keeps `current`.
bool read_optional_key(std::string_view                  json,
                       std::string_view                  key,
                       const std::optional<std::string>& current,
                       std::optional<std::string>&       out)
{
    out      = current;
    auto raw = find_value(json, key);
    if (!raw)
        return true;
    if (is_null(*raw))
    {
        out.reset();
        return true;
    }
    auto value = parse_string(*raw);
    if (!value)
        return false;
    out = std::move(*value);
    return true;
}

bool read_count(std::string_view json, std::string_view key, std::size_t& out)
{
    auto raw = find_value(json, key);
    if (!raw)
        return true;
    auto value = parse_count(*raw);
    if (!value)
        return false;
    out = *value;
    return true;
}

}   // namespace

SampleRequest SamplingConfig::sample_request() const
{
    return SampleRequest{adaptive.target_points, x_key, y_key};
}

void SamplingConfig::apply_log_level() const
{
    Logger::instance().set_level(log_level);
}

std::string SamplingConfig::serialize() const
{
    auto optional_string = [](const std::optional<std::string>& v)
    { return v ? "\"" + escape_json(*v) + "\"" : std::string("null"); };

    std::string level = Logger::level_to_string(log_level);
    for (char& c : level)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"threshold\": " << adaptive.threshold << ",\n";
    os << "  \"target_points\": " << adaptive.target_points << ",\n";
    os << "  \"x_key\": " << optional_string(x_key) << ",\n";
    os << "  \"y_key\": " << optional_string(y_key) << ",\n";
    os << "  \"log_level\": \"" << level << "\"\n";
    os << "}\n";
    return os.str();
}

bool SamplingConfig::deserialize(const std::string& json)
{
    if (json.find('{') == std::string::npos)
    {
        TELESAMPLE_LOG_WARN("config", "sampling config is not a JSON object");
        return false;
    }

    std::size_t version = CONFIG_VERSION;
    if (!read_count(json, "version", version) || version > CONFIG_VERSION)
    {
        TELESAMPLE_LOG_WARN("config", "unsupported sampling config version");
        return false;
    }

    SamplingConfig next = *this;
    if (!read_count(json, "threshold", next.adaptive.threshold)
        || !read_count(json, "target_points", next.adaptive.target_points))
    {
        TELESAMPLE_LOG_WARN("config", "threshold and target_points must be non-negative integers");
        return false;
    }

    if (!read_optional_key(json, "x_key", x_key, next.x_key)
        || !read_optional_key(json, "y_key", y_key, next.y_key))
    {
        TELESAMPLE_LOG_WARN("config", "x_key and y_key must be strings or null");
        return false;
    }

    if (auto raw = find_value(json, "log_level"))
    {
        auto name  = parse_string(*raw);
        auto level = name ? Logger::level_from_string(*name) : std::nullopt;
        if (!level)
        {
            TELESAMPLE_LOG_WARN("config", "unknown log_level in sampling config");
            return false;
        }
        next.log_level = *level;
    }

    *this = std::move(next);
    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool SamplingConfig::save(const std::string& path) const
{
    std::error_code ec;
    auto            dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
        TELESAMPLE_LOG_WARN("config", "could not create {}: {}", dir.string(), ec.message());

    std::ofstream f(path);
    if (!f.is_open())
    {
        TELESAMPLE_LOG_WARN("config", "could not open {} for writing", path);
        return false;
    }
    f << serialize();
    return f.good();
}

bool SamplingConfig::load(const std::string& path)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TELESAMPLE_LOG_DEBUG("config", "no sampling config at {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize(json))
    {
        TELESAMPLE_LOG_WARN("config", "ignoring malformed sampling config {}", path);
        return false;
    }
    TELESAMPLE_LOG_INFO("config", "loaded sampling config from {}", path);
    return true;
}

std::string SamplingConfig::default_path()
{
    std::filesystem::path dir;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        dir = std::filesystem::path(xdg);
    else if (const char* home = std::getenv("HOME"); home && *home)
        dir = std::filesystem::path(home) / ".config";
    else
        return "sampling.json";

    return (dir / "telesample" / "sampling.json").string();
}

}   // namespace telesample
