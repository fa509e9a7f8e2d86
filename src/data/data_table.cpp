#include <algorithm>
#include <cmath>
#include <geofacet/data_table.hpp>
#include <geofacet/error.hpp>
#include <sstream>
#include <stdexcept>

namespace geofacet
{

namespace
{

std::string format_number(double v)
{
    if (std::isfinite(v) && v == std::trunc(v) && std::fabs(v) < 1e15)
        return std::to_string(static_cast<long long>(v));
    std::ostringstream ss;
    ss.precision(15);
    ss << v;
    return ss.str();
}

}   // namespace

// --- DataTable ---

void DataTable::check_new_column(const std::string& name, size_t length) const
{
    if (has_column(name))
        throw std::invalid_argument("duplicate column '" + name + "'");
    if (!columns_.empty() && length != rows_)
    {
        throw GeofacetError(ErrorKind::ShapeMismatch,
                            "Column '" + name + "' has " + std::to_string(length) + " rows, table has "
                                + std::to_string(rows_));
    }
}

DataTable& DataTable::add_number_column(std::string name, std::vector<double> values)
{
    check_new_column(name, values.size());
    rows_ = values.size();
    names_.push_back(std::move(name));
    columns_.emplace_back(std::move(values));
    return *this;
}

DataTable& DataTable::add_text_column(std::string name, std::vector<std::string> values)
{
    check_new_column(name, values.size());
    rows_ = values.size();
    names_.push_back(std::move(name));
    columns_.emplace_back(std::move(values));
    return *this;
}

bool DataTable::has_column(std::string_view name) const
{
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

bool DataTable::is_numeric(std::string_view name) const
{
    return std::holds_alternative<NumberColumn>(column(name));
}

const DataTable::Column& DataTable::column(std::string_view name) const
{
    auto it = std::find(names_.begin(), names_.end(), name);
    if (it == names_.end())
    {
        throw GeofacetError(ErrorKind::ColumnNotFound, "Column " + std::string(name) + " not found in data");
    }
    return columns_[static_cast<size_t>(it - names_.begin())];
}

std::span<const double> DataTable::numbers(std::string_view name) const
{
    const auto* col = std::get_if<NumberColumn>(&column(name));
    if (!col)
        throw GeofacetError(ErrorKind::ColumnNotFound, "Column " + std::string(name) + " is not numeric");
    return *col;
}

std::span<const std::string> DataTable::texts(std::string_view name) const
{
    const auto* col = std::get_if<TextColumn>(&column(name));
    if (!col)
        throw GeofacetError(ErrorKind::ColumnNotFound, "Column " + std::string(name) + " is not text");
    return *col;
}

std::string DataTable::text_at(std::string_view name, size_t row) const
{
    const auto& col = column(name);
    if (row >= rows_)
        throw std::out_of_range("row index out of range");
    if (const auto* nums = std::get_if<NumberColumn>(&col))
        return format_number((*nums)[row]);
    return std::get<TextColumn>(col)[row];
}

GroupedTable DataTable::group_by(std::string_view name) const
{
    (void)column(name);   // ColumnNotFound before any work

    GroupedTable                     grouped;
    std::vector<std::vector<size_t>> rows_per_group;
    grouped.column_ = std::string(name);

    std::vector<std::string> keys;
    for (size_t r = 0; r < rows_; ++r)
    {
        auto key          = text_at(name, r);
        auto [it, is_new] = grouped.index_.emplace(key, keys.size());
        if (is_new)
        {
            keys.push_back(std::move(key));
            rows_per_group.emplace_back();
        }
        rows_per_group[it->second].push_back(r);
    }

    grouped.groups_.reserve(keys.size());
    for (size_t g = 0; g < keys.size(); ++g)
        grouped.groups_.emplace_back(*this, std::move(keys[g]), std::move(rows_per_group[g]));
    return grouped;
}

// --- RegionData ---

RegionData::RegionData(const DataTable& table, std::string key, std::vector<size_t> rows)
    : table_(&table), key_(std::move(key)), rows_(std::move(rows))
{
}

std::vector<double> RegionData::numbers(std::string_view column) const
{
    auto                src = table_->numbers(column);
    std::vector<double> out;
    out.reserve(rows_.size());
    for (size_t r : rows_)
        out.push_back(src[r]);
    return out;
}

std::vector<float> RegionData::floats(std::string_view column) const
{
    auto               src = table_->numbers(column);
    std::vector<float> out;
    out.reserve(rows_.size());
    for (size_t r : rows_)
        out.push_back(static_cast<float>(src[r]));
    return out;
}

std::vector<std::string> RegionData::texts(std::string_view column) const
{
    std::vector<std::string> out;
    out.reserve(rows_.size());
    for (size_t r : rows_)
        out.push_back(table_->text_at(column, r));
    return out;
}

// --- GroupedTable ---

const RegionData* GroupedTable::find(std::string_view key) const
{
    auto it = index_.find(std::string(key));
    return it == index_.end() ? nullptr : &groups_[it->second];
}

}   // namespace geofacet
