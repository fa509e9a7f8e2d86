#pragma once

#include <geofacet/fwd.hpp>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace geofacet
{

// Minimal columnar table: named numeric or text columns of equal length.
// Only what the facet orchestrator needs; not a query engine.
class DataTable
{
   public:
    using NumberColumn = std::vector<double>;
    using TextColumn   = std::vector<std::string>;
    using Column       = std::variant<NumberColumn, TextColumn>;

    DataTable() = default;

    // Column length must match the existing rows (ShapeMismatch); names must
    // be unique (std::invalid_argument).
    DataTable& add_number_column(std::string name, std::vector<double> values);
    DataTable& add_text_column(std::string name, std::vector<std::string> values);

    size_t num_rows() const { return rows_; }
    size_t num_columns() const { return columns_.size(); }
    bool   empty() const { return rows_ == 0; }

    bool                            has_column(std::string_view name) const;
    bool                            is_numeric(std::string_view name) const;
    const std::vector<std::string>& column_names() const { return names_; }

    // Throw ColumnNotFound when the column is missing or of the other type.
    std::span<const double>      numbers(std::string_view name) const;
    std::span<const std::string> texts(std::string_view name) const;

    // Cell as text; numbers print without a trailing ".0" when integral.
    std::string text_at(std::string_view name, size_t row) const;

    GroupedTable group_by(std::string_view name) const;

   private:
    const Column& column(std::string_view name) const;
    void          check_new_column(const std::string& name, size_t length) const;

    std::vector<std::string> names_;
    std::vector<Column>      columns_;
    size_t                   rows_ = 0;
};

// A row-index view into a DataTable: one region's partition. Holds indices
// only; the table must outlive it.
class RegionData
{
   public:
    RegionData(const DataTable& table, std::string key, std::vector<size_t> rows);

    const DataTable&        table() const { return *table_; }
    const std::string&      key() const { return key_; }
    std::span<const size_t> rows() const { return rows_; }
    size_t                  size() const { return rows_.size(); }
    bool                    empty() const { return rows_.empty(); }

    // Gather this partition's values from a column.
    std::vector<double>      numbers(std::string_view column) const;
    std::vector<float>       floats(std::string_view column) const;
    std::vector<std::string> texts(std::string_view column) const;

   private:
    const DataTable*    table_;
    std::string         key_;
    std::vector<size_t> rows_;
};

// Result of DataTable::group_by. Groups are keyed by the exact cell text and
// kept in order of first appearance.
class GroupedTable
{
   public:
    using const_iterator = std::vector<RegionData>::const_iterator;

    const std::string& column() const { return column_; }
    size_t             size() const { return groups_.size(); }
    bool               empty() const { return groups_.empty(); }
    const_iterator     begin() const { return groups_.begin(); }
    const_iterator     end() const { return groups_.end(); }

    const RegionData* find(std::string_view key) const;

   private:
    friend class DataTable;

    std::string                             column_;
    std::vector<RegionData>                 groups_;
    std::unordered_map<std::string, size_t> index_;
};

}   // namespace geofacet
