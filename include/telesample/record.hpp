#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace telesample
{

// A field holds either a number or text (e.g. an ISO-8601 timestamp).
using FieldValue = std::variant<double, std::string>;

// ─── Record ─────────────────────────────────────────────────────────────────
// One telemetry reading: named fields in declaration order.
//
//   Record r{{"timestamp", "2024-03-01T10:00:00Z"}, {"voltage", 12.6}};
//
// Field order is significant: y-key inference picks the first numeric field.

class Record
{
   public:
    using Field = std::pair<std::string, FieldValue>;

    Record() = default;
    Record(std::initializer_list<Field> fields);

    // Appends a field, or replaces the value in place if the name exists
    // (the original position is kept).
    Record& set(std::string name, FieldValue value);

    bool              has(std::string_view name) const;
    const FieldValue* find(std::string_view name) const;

    // Typed lookups. Empty if the field is missing or holds the other type.
    std::optional<double>           number(std::string_view name) const;
    std::optional<std::string_view> text(std::string_view name) const;

    const std::vector<Field>& fields() const { return fields_; }
    std::size_t               size() const { return fields_.size(); }
    bool                      empty() const { return fields_.empty(); }

   private:
    std::vector<Field> fields_;
};

inline bool is_numeric(const FieldValue& value)
{
    return std::holds_alternative<double>(value);
}

}   // namespace telesample
