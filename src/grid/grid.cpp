#include <algorithm>
#include <cctype>
#include <geofacet/error.hpp>
#include <geofacet/grid.hpp>
#include <geofacet/logger.hpp>

namespace geofacet
{

namespace
{

bool is_blank(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

}   // namespace

std::string to_string(const GridPosition& pos)
{
    return "(" + std::to_string(pos.row) + ", " + std::to_string(pos.col) + ")";
}

// --- GridEntry ---

GridEntry::GridEntry(std::string entity, int row, int col, std::string display_name, Metadata metadata)
    : entity_(std::move(entity)),
      row_(row),
      col_(col),
      display_name_(std::move(display_name)),
      metadata_(std::move(metadata))
{
    if (is_blank(entity_))
    {
        throw GeofacetError(ErrorKind::InvalidEntity,
                            "Region names cannot be empty or whitespace-only, got '" + entity_ + "'",
                            {entity_});
    }
    if (row_ < 1 || col_ < 1)
    {
        throw GeofacetError(ErrorKind::InvalidPosition,
                            "Grid positions must be positive integers (>= 1), got " + to_string(position())
                                + " for region '" + entity_ + "'",
                            {entity_});
    }
    if (is_blank(display_name_))
        display_name_ = entity_;
}

// --- GeoGrid ---

GeoGrid::GeoGrid(std::vector<GridEntry> entries, std::string name)
    : name_(std::move(name)), entries_(std::move(entries))
{
    validate(entries_);
    build_index();
}

GeoGrid GeoGrid::from_positions(std::initializer_list<std::pair<std::string, GridPosition>> positions,
                                std::string                                                  name)
{
    return from_positions(std::vector<std::pair<std::string, GridPosition>>(positions), std::move(name));
}

GeoGrid GeoGrid::from_positions(const std::vector<std::pair<std::string, GridPosition>>& positions,
                                std::string                                              name)
{
    std::vector<GridEntry> entries;
    entries.reserve(positions.size());
    for (const auto& [entity, pos] : positions)
        entries.emplace_back(entity, pos.row, pos.col);
    return GeoGrid(std::move(entries), std::move(name));
}

GeoGrid GeoGrid::from_positions(const std::map<std::string, GridPosition>& positions, std::string name)
{
    return from_positions(std::vector<std::pair<std::string, GridPosition>>(positions.begin(), positions.end()),
                          std::move(name));
}

GeoGrid GeoGrid::from_columns(const std::vector<std::string>& entities,
                              const std::vector<int>&         rows,
                              const std::vector<int>&         cols,
                              const std::vector<std::string>& names,
                              const std::vector<Metadata>&    metadata,
                              std::string                     name)
{
    const size_t n = entities.size();
    bool         same_shape = rows.size() == n && cols.size() == n;
    if (!names.empty() && names.size() != n)
        same_shape = false;
    if (!metadata.empty() && metadata.size() != n)
        same_shape = false;
    if (!same_shape)
    {
        throw GeofacetError(ErrorKind::ShapeMismatch,
                            "All input vectors must have the same length (entities=" + std::to_string(n)
                                + ", rows=" + std::to_string(rows.size()) + ", cols="
                                + std::to_string(cols.size()) + ", names=" + std::to_string(names.size())
                                + ", metadata=" + std::to_string(metadata.size()) + ")");
    }

    std::vector<GridEntry> entries;
    entries.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        entries.emplace_back(entities[i],
                             rows[i],
                             cols[i],
                             names.empty() ? std::string() : names[i],
                             metadata.empty() ? Metadata{} : metadata[i]);
    }
    return GeoGrid(std::move(entries), std::move(name));
}

void GeoGrid::validate(std::span<const GridEntry> entries)
{
    std::unordered_map<uint64_t, const GridEntry*>    seen_positions;
    std::unordered_map<std::string, const GridEntry*> seen_entities;
    seen_positions.reserve(entries.size());
    seen_entities.reserve(entries.size());

    for (const auto& entry : entries)
    {
        auto [pos_it, pos_inserted] = seen_positions.emplace(position_key(entry.position()), &entry);
        if (!pos_inserted)
        {
            const auto& existing = pos_it->second->entity();
            throw GeofacetError(ErrorKind::PositionConflict,
                                "Position conflict: regions '" + existing + "' and '" + entry.entity()
                                    + "' both at position " + to_string(entry.position()),
                                {existing, entry.entity()});
        }

        if (!seen_entities.emplace(entry.entity(), &entry).second)
        {
            throw GeofacetError(ErrorKind::InvalidEntity,
                                "Region '" + entry.entity() + "' appears more than once in the grid",
                                {entry.entity()});
        }
    }
}

void GeoGrid::build_index()
{
    by_entity_.clear();
    by_position_.clear();
    by_entity_.reserve(entries_.size());
    by_position_.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i)
    {
        by_entity_.emplace(entries_[i].entity(), i);
        by_position_.emplace(position_key(entries_[i].position()), i);
    }
    GEOFACET_LOG_TRACE("grid", "indexed grid '{}' with {} entries", name_, entries_.size());
}

const GridEntry* GeoGrid::find(std::string_view entity) const
{
    auto it = by_entity_.find(std::string(entity));
    return it == by_entity_.end() ? nullptr : &entries_[it->second];
}

const GridEntry* GeoGrid::at(GridPosition pos) const
{
    if (pos.row < 1 || pos.col < 1)
        return nullptr;
    auto it = by_position_.find(position_key(pos));
    return it == by_position_.end() ? nullptr : &entries_[it->second];
}

}   // namespace geofacet
