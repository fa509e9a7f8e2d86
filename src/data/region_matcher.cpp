#include <algorithm>
#include <cctype>
#include <geofacet/region_matcher.hpp>

namespace geofacet
{

std::string to_upper(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

RegionSet available_regions(const GroupedTable& grouped)
{
    RegionSet out;
    out.reserve(grouped.size());
    for (const auto& group : grouped)
        out.insert(to_upper(group.key()));
    return out;
}

bool has_data(const RegionSet& available, std::string_view entity)
{
    return available.count(to_upper(entity)) > 0;
}

std::optional<RegionData> data_for(const GroupedTable& grouped, std::string_view entity)
{
    return RegionMatcher(grouped).data_for(entity);
}

// --- RegionMatcher ---

RegionMatcher::RegionMatcher(const GroupedTable& grouped)
{
    for (const auto& group : grouped)
    {
        auto  upper   = to_upper(group.key());
        auto& matches = by_upper_[upper];
        if (matches.empty())
            spellings_.push_back(group.key());
        matches.push_back(&group);
        available_.insert(std::move(upper));
    }
}

bool RegionMatcher::has_data(std::string_view entity) const
{
    return geofacet::has_data(available_, entity);
}

std::optional<RegionData> RegionMatcher::data_for(std::string_view entity) const
{
    auto it = by_upper_.find(to_upper(entity));
    if (it == by_upper_.end())
        return std::nullopt;

    const auto& matches = it->second;
    if (matches.size() == 1)
        return *matches.front();

    std::vector<size_t> rows;
    for (const auto* group : matches)
        rows.insert(rows.end(), group->rows().begin(), group->rows().end());
    std::sort(rows.begin(), rows.end());
    return RegionData(matches.front()->table(), matches.front()->key(), std::move(rows));
}

}   // namespace geofacet
