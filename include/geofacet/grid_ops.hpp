#pragma once

#include <geofacet/grid.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace geofacet
{

// Pure queries over a GeoGrid. None of these throw for unknown regions.

struct GridDimensions
{
    int rows = 0;
    int cols = 0;

    bool operator==(const GridDimensions&) const = default;
};

enum class Direction
{
    Above,
    Below,
    Left,
    Right,
};

// (max_row, max_col); (0, 0) for an empty grid.
GridDimensions grid_dimensions(const GeoGrid& grid);

bool                        has_entity(const GeoGrid& grid, std::string_view entity);
std::optional<GridPosition> position_of(const GeoGrid& grid, std::string_view entity);
std::optional<std::string>  entity_at(const GeoGrid& grid, int row, int col);
std::vector<std::string>    entities(const GeoGrid& grid);

// True iff every cell of the bounding rectangle is occupied. An empty grid
// is complete.
bool is_complete_rectangle(const GeoGrid& grid);

// Re-runs the construction checks. Returns true or throws GeofacetError.
bool validate_grid(const GeoGrid& grid);

// Whether any other entry lies on the half-line leaving `entity` in the given
// direction: for Below, any entry with the same column and a greater row.
// The entry need not be adjacent, so a gap in a sparse grid still counts.
bool has_neighbor(const GeoGrid& grid, std::string_view entity, Direction dir);

inline bool has_neighbor_above(const GeoGrid& grid, std::string_view entity)
{
    return has_neighbor(grid, entity, Direction::Above);
}
inline bool has_neighbor_below(const GeoGrid& grid, std::string_view entity)
{
    return has_neighbor(grid, entity, Direction::Below);
}
inline bool has_neighbor_left(const GeoGrid& grid, std::string_view entity)
{
    return has_neighbor(grid, entity, Direction::Left);
}
inline bool has_neighbor_right(const GeoGrid& grid, std::string_view entity)
{
    return has_neighbor(grid, entity, Direction::Right);
}

// Entries whose upper-cased entity is in `available` (a RegionSet).
GeoGrid filter_to_available(const GeoGrid& grid, const std::unordered_set<std::string>& available);

}   // namespace geofacet
