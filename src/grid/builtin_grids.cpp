#include <algorithm>
#include <geofacet/error.hpp>
#include <geofacet/grid_loader.hpp>
#include <geofacet/logger.hpp>
#include <iterator>

namespace geofacet
{

namespace
{

struct Placement
{
    const char* code;
    int         row;
    int         col;
    const char* name;
};

// 50 states plus DC, one cell each.
constexpr Placement us_state_grid1[] = {
        {"AK", 1, 1, "Alaska"},
        {"ME", 1, 11, "Maine"},
        {"VT", 2, 10, "Vermont"},
        {"NH", 2, 11, "New Hampshire"},
        {"WA", 3, 1, "Washington"},
        {"ID", 3, 2, "Idaho"},
        {"MT", 3, 3, "Montana"},
        {"ND", 3, 4, "North Dakota"},
        {"MN", 3, 5, "Minnesota"},
        {"IL", 3, 6, "Illinois"},
        {"WI", 3, 7, "Wisconsin"},
        {"MI", 3, 8, "Michigan"},
        {"NY", 3, 9, "New York"},
        {"RI", 3, 10, "Rhode Island"},
        {"MA", 3, 11, "Massachusetts"},
        {"OR", 4, 1, "Oregon"},
        {"NV", 4, 2, "Nevada"},
        {"WY", 4, 3, "Wyoming"},
        {"SD", 4, 4, "South Dakota"},
        {"IA", 4, 5, "Iowa"},
        {"IN", 4, 6, "Indiana"},
        {"OH", 4, 7, "Ohio"},
        {"PA", 4, 8, "Pennsylvania"},
        {"NJ", 4, 9, "New Jersey"},
        {"CT", 4, 10, "Connecticut"},
        {"CA", 5, 1, "California"},
        {"UT", 5, 2, "Utah"},
        {"CO", 5, 3, "Colorado"},
        {"NE", 5, 4, "Nebraska"},
        {"MO", 5, 5, "Missouri"},
        {"KY", 5, 6, "Kentucky"},
        {"WV", 5, 7, "West Virginia"},
        {"VA", 5, 8, "Virginia"},
        {"MD", 5, 9, "Maryland"},
        {"DE", 5, 10, "Delaware"},
        {"AZ", 6, 2, "Arizona"},
        {"NM", 6, 3, "New Mexico"},
        {"KS", 6, 4, "Kansas"},
        {"AR", 6, 5, "Arkansas"},
        {"TN", 6, 6, "Tennessee"},
        {"NC", 6, 7, "North Carolina"},
        {"SC", 6, 8, "South Carolina"},
        {"DC", 6, 9, "District of Columbia"},
        {"OK", 7, 4, "Oklahoma"},
        {"LA", 7, 5, "Louisiana"},
        {"MS", 7, 6, "Mississippi"},
        {"AL", 7, 7, "Alabama"},
        {"GA", 7, 8, "Georgia"},
        {"HI", 8, 1, "Hawaii"},
        {"TX", 8, 4, "Texas"},
        {"FL", 8, 9, "Florida"},
};

GeoGrid build_us_state_grid1()
{
    std::vector<GridEntry> entries;
    entries.reserve(std::size(us_state_grid1));
    for (const auto& p : us_state_grid1)
        entries.emplace_back(p.code, p.row, p.col, p.name);
    GeoGrid grid(std::move(entries), "us_state_grid1");
    GEOFACET_LOG_DEBUG("grid", "built-in grid {} ready ({} regions)", grid.name(), grid.size());
    return grid;
}

}   // anonymous namespace

std::vector<std::string> builtin_grid_names()
{
    return {"us_state_grid1"};
}

const GeoGrid& builtin_grid(std::string_view name)
{
    if (name == "us_state_grid1")
    {
        static const GeoGrid grid = build_us_state_grid1();
        return grid;
    }
    throw GeofacetError(ErrorKind::GridLoad, "Unknown built-in grid '" + std::string(name) + "'");
}

}   // namespace geofacet
