#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <geofacet/error.hpp>
#include <geofacet/grid_loader.hpp>
#include <geofacet/logger.hpp>
#include <limits>
#include <optional>

#ifndef GEOFACET_DEFAULT_GRID_DIR
#define GEOFACET_DEFAULT_GRID_DIR "grids"
#endif

namespace geofacet
{

namespace
{

struct CsvLine
{
    size_t      number;   // 1-based line in the file
    std::string text;
};

std::string trim(std::string s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    return s;
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Detect delimiter by scanning the header line.
char detect_delimiter(const std::string& line)
{
    int commas = 0, semicolons = 0, tabs = 0;
    for (char c : line)
    {
        if (c == ',')
            ++commas;
        else if (c == ';')
            ++semicolons;
        else if (c == '\t')
            ++tabs;
    }
    if (tabs > commas && tabs >= semicolons)
        return '\t';
    if (semicolons > commas)
        return ';';
    return ',';
}

// Split a line by delimiter, respecting quoted fields ("" is a literal quote).
std::vector<std::string> split_line(const std::string& line, char delim)
{
    std::vector<std::string> fields;
    std::string              field;
    bool                     in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i)
    {
        char c = line[i];
        if (c == '"')
        {
            if (in_quotes && i + 1 < line.size() && line[i + 1] == '"')
            {
                field += '"';
                ++i;
            }
            else
            {
                in_quotes = !in_quotes;
            }
        }
        else if (c == delim && !in_quotes)
        {
            fields.push_back(trim(std::move(field)));
            field.clear();
        }
        else
        {
            field += c;
        }
    }
    fields.push_back(trim(std::move(field)));
    return fields;
}

std::optional<double> parse_number(const std::string& s)
{
    if (s.empty())
        return std::nullopt;
    char*  end = nullptr;
    double val = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0')
        return std::nullopt;
    return val;
}

std::optional<int> parse_int(const std::string& s)
{
    if (s.empty())
        return std::nullopt;
    char* end = nullptr;
    errno     = 0;
    long val  = std::strtol(s.c_str(), &end, 10);
    if (end == s.c_str() || *end != '\0' || errno == ERANGE)
        return std::nullopt;
    if (val < std::numeric_limits<int>::min() || val > std::numeric_limits<int>::max())
        return std::nullopt;
    return static_cast<int>(val);
}

[[noreturn]] void load_error(const std::filesystem::path& path, size_t line, const std::string& what)
{
    std::string msg = "Failed to load grid " + path.string();
    if (line > 0)
        msg += ":" + std::to_string(line);
    throw GeofacetError(ErrorKind::GridLoad, msg + ": " + what);
}

// Column named exactly "code", else the first one containing it.
std::optional<size_t> find_code_column(const std::vector<std::string>& headers)
{
    for (size_t i = 0; i < headers.size(); ++i)
    {
        if (lower(headers[i]) == "code")
            return i;
    }
    for (size_t i = 0; i < headers.size(); ++i)
    {
        if (lower(headers[i]).find("code") != std::string::npos)
            return i;
    }
    return std::nullopt;
}

std::optional<size_t> find_column(const std::vector<std::string>& headers, std::string_view name)
{
    for (size_t i = 0; i < headers.size(); ++i)
    {
        if (lower(headers[i]) == name)
            return i;
    }
    return std::nullopt;
}

}   // anonymous namespace

GeoGrid load_grid_from_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
        load_error(path, 0, "cannot open file");

    std::vector<CsvLine> lines;
    std::string          line;
    size_t               number = 0;
    while (std::getline(file, line))
    {
        ++number;
        // Strip trailing \r (Windows line endings)
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (!trim(line).empty())
            lines.push_back({number, line});
    }

    if (lines.empty())
        load_error(path, 0, "file is empty");

    const char delim   = detect_delimiter(lines[0].text);
    const auto headers = split_line(lines[0].text, delim);

    const auto code_col = find_code_column(headers);
    const auto row_col  = find_column(headers, "row");
    const auto col_col  = find_column(headers, "col");
    const auto name_col = find_column(headers, "name");
    if (!code_col)
        load_error(path, lines[0].number, "no code column in header");
    if (!row_col)
        load_error(path, lines[0].number, "missing required column 'row'");
    if (!col_col)
        load_error(path, lines[0].number, "missing required column 'col'");

    std::vector<GridEntry> entries;
    entries.reserve(lines.size() - 1);
    for (size_t i = 1; i < lines.size(); ++i)
    {
        const auto& [ln, text] = lines[i];
        auto fields            = split_line(text, delim);
        if (fields.size() != headers.size())
        {
            load_error(path,
                       ln,
                       "expected " + std::to_string(headers.size()) + " fields, found "
                           + std::to_string(fields.size()));
        }

        auto row = parse_int(fields[*row_col]);
        auto col = parse_int(fields[*col_col]);
        if (!row || !col)
            load_error(path, ln, "row and col must be integers, got '" + fields[*row_col] + "', '" + fields[*col_col] + "'");

        Metadata metadata;
        for (size_t c = 0; c < headers.size(); ++c)
        {
            if (c == *code_col || c == *row_col || c == *col_col || (name_col && c == *name_col))
                continue;
            if (fields[c].empty())
                continue;
            if (auto num = parse_number(fields[c]))
                metadata.emplace(headers[c], *num);
            else
                metadata.emplace(headers[c], fields[c]);
        }

        entries.emplace_back(fields[*code_col],
                             *row,
                             *col,
                             name_col ? fields[*name_col] : std::string{},
                             std::move(metadata));
    }

    GeoGrid grid(std::move(entries), path.stem().string());
    GEOFACET_LOG_DEBUG("grid.loader", "loaded grid '{}' with {} regions from {}", grid.name(), grid.size(), path.string());
    return grid;
}

GeoGrid load_grid_from_csv(std::string_view name, const std::filesystem::path& directory)
{
    std::string file(name);
    if (std::filesystem::path(file).extension() != ".csv")
        file += ".csv";
    return load_grid_from_csv(directory / file);
}

std::vector<std::string> list_available_grids(const std::filesystem::path& directory)
{
    std::vector<std::string> names;
    std::error_code          ec;
    if (!std::filesystem::is_directory(directory, ec))
        return names;

    for (const auto& entry : std::filesystem::directory_iterator(directory, ec))
    {
        if (!entry.is_regular_file())
            continue;
        if (lower(entry.path().extension().string()) == ".csv")
            names.push_back(entry.path().stem().string());
    }
    if (ec)
        GEOFACET_LOG_WARN("grid.loader", "listing {} stopped early: {}", directory.string(), ec.message());

    std::sort(names.begin(), names.end());
    return names;
}

std::filesystem::path default_grid_directory()
{
    if (const char* env = std::getenv("GEOFACET_GRID_DIR"); env && *env)
        return env;
    return GEOFACET_DEFAULT_GRID_DIR;
}

GeoGrid load_grid(std::string_view name)
{
    const auto names = builtin_grid_names();
    if (std::find(names.begin(), names.end(), name) != names.end())
        return builtin_grid(name);
    return load_grid_from_csv(name, default_grid_directory());
}

}   // namespace geofacet
