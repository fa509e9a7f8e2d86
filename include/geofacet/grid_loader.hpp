#pragma once

#include <filesystem>
#include <geofacet/grid.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace geofacet
{

// Reads a grid layout from CSV. Required columns are `row`, `col` and a code
// column (named exactly "code", else the first header containing "code").
// An optional `name` column gives display names; every other column becomes
// metadata, stored as a number when the field parses as one.
// Raises GridLoad with file and line for malformed input.
GeoGrid load_grid_from_csv(const std::filesystem::path& path);

// `<directory>/<name>.csv`; the extension is optional in `name`.
GeoGrid load_grid_from_csv(std::string_view name, const std::filesystem::path& directory);

// Sorted base names of the *.csv files in `directory`; empty if it is missing.
std::vector<std::string> list_available_grids(const std::filesystem::path& directory);

// $GEOFACET_GRID_DIR when set, else the directory configured at build time.
std::filesystem::path default_grid_directory();

// ─── Built-in grids ──────────────────────────────────────────────────────────

std::vector<std::string> builtin_grid_names();

// Grids compiled into the library, built on first use. GridLoad for an
// unknown name.
const GeoGrid& builtin_grid(std::string_view name);

// A built-in grid if `name` is one, else load_grid_from_csv(name,
// default_grid_directory()).
GeoGrid load_grid(std::string_view name);

}   // namespace geofacet
