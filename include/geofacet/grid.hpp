#pragma once

#include <cstdint>
#include <geofacet/fwd.hpp>
#include <initializer_list>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace geofacet
{

struct GridPosition
{
    int row = 0;
    int col = 0;

    bool operator==(const GridPosition&) const = default;
};

std::string to_string(const GridPosition& pos);   // "(row, col)"

// Extra per-entry attributes, typically auxiliary CSV columns.
using MetadataValue = std::variant<std::string, double, bool>;
using Metadata      = std::map<std::string, MetadataValue>;

// One placed region. Immutable once constructed; the constructor rejects
// blank entities (InvalidEntity) and non-positive coordinates
// (InvalidPosition).
class GridEntry
{
   public:
    GridEntry(std::string entity, int row, int col, std::string display_name = {}, Metadata metadata = {});

    const std::string& entity() const { return entity_; }
    int                row() const { return row_; }
    int                col() const { return col_; }
    GridPosition       position() const { return {row_, col_}; }
    const std::string& display_name() const { return display_name_; }
    const Metadata&    metadata() const { return metadata_; }

    bool operator==(const GridEntry&) const = default;

   private:
    std::string entity_;
    int         row_ = 0;
    int         col_ = 0;
    std::string display_name_;
    Metadata    metadata_;
};

// Ordered collection of GridEntry, indexed by entity and by position.
//
// Every construction path goes through validate(), so a GeoGrid that exists
// is well formed: no two entries share a position or an entity. Filtering
// returns a new grid.
class GeoGrid
{
   public:
    using const_iterator = std::vector<GridEntry>::const_iterator;

    GeoGrid() = default;
    explicit GeoGrid(std::vector<GridEntry> entries, std::string name = {});

    // {"CA", {1, 1}}, {"NY", {1, 2}}, ...
    static GeoGrid from_positions(std::initializer_list<std::pair<std::string, GridPosition>> positions,
                                  std::string name = {});
    static GeoGrid from_positions(const std::vector<std::pair<std::string, GridPosition>>& positions,
                                  std::string name = {});
    static GeoGrid from_positions(const std::map<std::string, GridPosition>& positions, std::string name = {});

    // Parallel arrays. names / metadata may be left empty; otherwise every
    // array must have the same length (ShapeMismatch).
    static GeoGrid from_columns(const std::vector<std::string>&  entities,
                                const std::vector<int>&          rows,
                                const std::vector<int>&          cols,
                                const std::vector<std::string>& names    = {},
                                const std::vector<Metadata>&     metadata = {},
                                std::string                      name     = {});

    // Throws PositionConflict naming both regions, or InvalidEntity for a
    // repeated entity.
    static void validate(std::span<const GridEntry> entries);

    const std::string& name() const { return name_; }
    size_t             size() const { return entries_.size(); }
    bool               empty() const { return entries_.empty(); }

    const_iterator                begin() const { return entries_.begin(); }
    const_iterator                end() const { return entries_.end(); }
    const GridEntry&              operator[](size_t i) const { return entries_[i]; }
    const std::vector<GridEntry>& entries() const { return entries_; }

    // nullptr when absent
    const GridEntry* find(std::string_view entity) const;
    const GridEntry* at(GridPosition pos) const;

    template <typename Pred>
    GeoGrid filtered(Pred&& keep) const
    {
        std::vector<GridEntry> kept;
        kept.reserve(entries_.size());
        for (const auto& e : entries_)
        {
            if (keep(e))
                kept.push_back(e);
        }
        return GeoGrid(std::move(kept), name_);
    }

   private:
    static uint64_t position_key(GridPosition pos)
    {
        return (static_cast<uint64_t>(static_cast<uint32_t>(pos.row)) << 32)
               | static_cast<uint32_t>(pos.col);
    }

    void build_index();

    std::string                               name_;
    std::vector<GridEntry>                    entries_;
    std::unordered_map<std::string, size_t>   by_entity_;
    std::unordered_map<uint64_t, size_t>      by_position_;
};

}   // namespace geofacet
