#include <algorithm>
#include <geofacet/axis_options.hpp>
#include <sstream>

namespace geofacet
{

AxisOptions::AxisOptions(std::initializer_list<Entry> entries)
{
    for (const auto& [key, value] : entries)
        set(key, value);
}

AxisOptions& AxisOptions::set(std::string_view key, OptionValue value)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    if (it != entries_.end())
        it->second = std::move(value);
    else
        entries_.emplace_back(std::string(key), std::move(value));
    return *this;
}

const OptionValue* AxisOptions::find(std::string_view key) const
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    return it == entries_.end() ? nullptr : &it->second;
}

bool AxisOptions::erase(std::string_view key)
{
    auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
    if (it == entries_.end())
        return false;
    entries_.erase(it);
    return true;
}

std::optional<bool> AxisOptions::get_bool(std::string_view key) const
{
    if (const auto* v = find(key))
    {
        if (const auto* b = std::get_if<bool>(v))
            return *b;
    }
    return std::nullopt;
}

std::optional<double> AxisOptions::get_number(std::string_view key) const
{
    if (const auto* v = find(key))
    {
        if (const auto* d = std::get_if<double>(v))
            return *d;
    }
    return std::nullopt;
}

std::optional<std::string> AxisOptions::get_string(std::string_view key) const
{
    if (const auto* v = find(key))
    {
        if (const auto* s = std::get_if<std::string>(v))
            return *s;
    }
    return std::nullopt;
}

AxisOptions AxisOptions::merged(const AxisOptions& overlay) const
{
    AxisOptions out = *this;
    for (const auto& [key, value] : overlay)
        out.set(key, value);
    return out;
}

std::string to_string(const OptionValue& value)
{
    if (const auto* b = std::get_if<bool>(&value))
        return *b ? "true" : "false";
    if (const auto* d = std::get_if<double>(&value))
    {
        std::ostringstream ss;
        ss << *d;
        return ss.str();
    }
    return std::get<std::string>(value);
}

}   // namespace geofacet
