#pragma once

#include <geofacet/data_table.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace geofacet
{

// Upper-cased region codes present in the data.
using RegionSet = std::unordered_set<std::string>;

std::string to_upper(std::string_view s);

RegionSet available_regions(const GroupedTable& grouped);
bool      has_data(const RegionSet& available, std::string_view entity);

// Case-insensitive partition lookup. When the data spells one region several
// ways ("ca", "CA") the result covers all of their rows, in table order.
std::optional<RegionData> data_for(const GroupedTable& grouped, std::string_view entity);

// Matches grid region codes against one grouped table. Built once per
// geofacet() call so that per-cell lookups never rescan the groups.
class RegionMatcher
{
   public:
    explicit RegionMatcher(const GroupedTable& grouped);

    const RegionSet& available() const { return available_; }
    bool             has_data(std::string_view entity) const;

    std::optional<RegionData> data_for(std::string_view entity) const;

    // One spelling per distinct region (the first seen), in data order.
    const std::vector<std::string>& data_entities() const { return spellings_; }

   private:
    RegionSet                                                       available_;
    std::unordered_map<std::string, std::vector<const RegionData*>> by_upper_;
    std::vector<std::string>                                        spellings_;
};

}   // namespace geofacet
