#include <algorithm>
#include <telesample/record.hpp>

namespace telesample
{

Record::Record(std::initializer_list<Field> fields)
{
    fields_.reserve(fields.size());
    for (const auto& f : fields)
        set(f.first, f.second);
}

Record& Record::set(std::string name, FieldValue value)
{
    auto it = std::find_if(fields_.begin(),
                           fields_.end(),
                           [&](const Field& f) { return f.first == name; });
    if (it != fields_.end())
        it->second = std::move(value);
    else
        fields_.emplace_back(std::move(name), std::move(value));
    return *this;
}

const FieldValue* Record::find(std::string_view name) const
{
    for (const auto& f : fields_)
    {
        if (f.first == name)
            return &f.second;
    }
    return nullptr;
}

bool Record::has(std::string_view name) const
{
    return find(name) != nullptr;
}

std::optional<double> Record::number(std::string_view name) const
{
    const FieldValue* v = find(name);
    if (!v)
        return std::nullopt;
    if (const double* d = std::get_if<double>(v))
        return *d;
    return std::nullopt;
}

std::optional<std::string_view> Record::text(std::string_view name) const
{
    const FieldValue* v = find(name);
    if (!v)
        return std::nullopt;
    if (const std::string* s = std::get_if<std::string>(v))
        return std::string_view(*s);
    return std::nullopt;
}

}   // namespace telesample
