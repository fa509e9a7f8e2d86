#include <algorithm>
#include <geofacet/grid_ops.hpp>
#include <geofacet/region_matcher.hpp>

namespace geofacet
{

GridDimensions grid_dimensions(const GeoGrid& grid)
{
    GridDimensions dims;
    for (const auto& e : grid)
    {
        dims.rows = std::max(dims.rows, e.row());
        dims.cols = std::max(dims.cols, e.col());
    }
    return dims;
}

bool has_entity(const GeoGrid& grid, std::string_view entity)
{
    return grid.find(entity) != nullptr;
}

std::optional<GridPosition> position_of(const GeoGrid& grid, std::string_view entity)
{
    if (const auto* e = grid.find(entity))
        return e->position();
    return std::nullopt;
}

std::optional<std::string> entity_at(const GeoGrid& grid, int row, int col)
{
    if (const auto* e = grid.at({row, col}))
        return e->entity();
    return std::nullopt;
}

std::vector<std::string> entities(const GeoGrid& grid)
{
    std::vector<std::string> out;
    out.reserve(grid.size());
    for (const auto& e : grid)
        out.push_back(e.entity());
    return out;
}

bool is_complete_rectangle(const GeoGrid& grid)
{
    if (grid.empty())
        return true;
    auto dims = grid_dimensions(grid);
    return static_cast<size_t>(dims.rows) * static_cast<size_t>(dims.cols) == grid.size();
}

bool validate_grid(const GeoGrid& grid)
{
    GeoGrid::validate(grid.entries());
    return true;
}

bool has_neighbor(const GeoGrid& grid, std::string_view entity, Direction dir)
{
    const auto* self = grid.find(entity);
    if (!self)
        return false;
    const int r = self->row();
    const int c = self->col();

    return std::any_of(grid.begin(),
                       grid.end(),
                       [&](const GridEntry& e)
                       {
                           switch (dir)
                           {
                               case Direction::Above:
                                   return e.col() == c && e.row() < r;
                               case Direction::Below:
                                   return e.col() == c && e.row() > r;
                               case Direction::Left:
                                   return e.row() == r && e.col() < c;
                               case Direction::Right:
                                   return e.row() == r && e.col() > c;
                           }
                           return false;
                       });
}

GeoGrid filter_to_available(const GeoGrid& grid, const std::unordered_set<std::string>& available)
{
    return grid.filtered([&](const GridEntry& e) { return has_data(available, e.entity()); });
}

}   // namespace geofacet
