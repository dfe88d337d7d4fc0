#include "data/key_resolver.hpp"

#include <limits>
#include <telesample/logger.hpp>

#include "data/time_parse.hpp"

namespace telesample::data
{

namespace
{

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

[[noreturn]] void fail(const std::string& message)
{
    TELESAMPLE_LOG_ERROR("resolver", "{}", message);
    throw ResolutionError(message);
}

std::string resolve_x_key(const Record& sample, const std::optional<std::string>& x_key)
{
    if (x_key)
    {
        if (!sample.has(*x_key))
            fail("x key '" + *x_key + "' not present in record");
        return *x_key;
    }
    if (sample.has(PRIMARY_X_KEY))
        return std::string(PRIMARY_X_KEY);
    if (sample.has(FALLBACK_X_KEY))
        return std::string(FALLBACK_X_KEY);
    fail("cannot infer x key: record has neither 'time' nor 'timestamp'");
}

std::string resolve_y_key(const Record&                     sample,
                          const std::string&                x_key,
                          const std::optional<std::string>& y_key)
{
    if (y_key)
    {
        if (!sample.has(*y_key))
            fail("y key '" + *y_key + "' not present in record");
        return *y_key;
    }
    for (const auto& [name, value] : sample.fields())
    {
        if (name != x_key && is_numeric(value))
            return name;
    }
    fail("cannot infer y key: record has no numeric field besides '" + x_key + "'");
}

}   // namespace

ResolvedKeys resolve_keys(const Record&                     sample,
                          const std::optional<std::string>& x_key,
                          const std::optional<std::string>& y_key)
{
    ResolvedKeys keys;
    keys.x_key = resolve_x_key(sample, x_key);
    keys.y_key = resolve_y_key(sample, keys.x_key, y_key);

    TELESAMPLE_LOG_DEBUG("resolver",
                         "x='{}'{} y='{}'{}",
                         keys.x_key,
                         x_key ? "" : " (inferred)",
                         keys.y_key,
                         y_key ? "" : " (inferred)");
    return keys;
}

double x_coordinate(const Record& record, std::string_view key)
{
    const FieldValue* value = record.find(key);
    if (!value)
        return NaN;
    if (const double* d = std::get_if<double>(value))
        return *d;
    return parse_epoch_ms(std::get<std::string>(*value)).value_or(NaN);
}

double y_coordinate(const Record& record, std::string_view key)
{
    return record.number(key).value_or(NaN);
}

}   // namespace telesample::data
