#include <cmath>
#include <cstdio>
#include <geofacet/geofacet.hpp>
#include <vector>

using namespace geofacet;

int main()
{
    Logger::instance().set_level(LogLevel::Info);

    // Population-like series for a handful of states, spelled in mixed case
    std::vector<std::string> state;
    std::vector<double>      year, value;
    const char*              codes[] = {"CA", "ny", "TX", "WA", "FL", "IL", "CO"};
    for (int s = 0; s < 7; ++s)
    {
        for (int y = 0; y < 20; ++y)
        {
            state.push_back(codes[s]);
            year.push_back(2000.0 + y);
            value.push_back(10.0 + s + std::sin(0.3 * y + s));
        }
    }

    DataTable table;
    table.add_text_column("state", std::move(state));
    table.add_number_column("year", std::move(year));
    table.add_number_column("value", std::move(value));

    auto plot = [](FacetCell& cell, const RegionData& data, const FacetContext& ctx, const AxisOptions& opts)
    {
        auto& ax = cell.add_axes();
        ax.apply(opts);
        ax.title(ctx.entry.display_name());
        ax.line(data.floats("year"), data.floats("value")).label("value");
    };

    GeofacetOptions options;
    options.link_mode       = LinkMode::Both;
    options.missing_regions = MissingRegionPolicy::Skip;
    options.legend          = LegendOptions{.title = "Series"};
    options.title           = "Demo values by state";
    options.common_axis_options.set("xlabel", "year").set("grid", false);

    auto fig = geofacet::geofacet(table, "state", plot, options);

    std::printf("%s (%ux%u px)\n", fig->title().c_str(), fig->width(), fig->height());
    for (const auto& cell : fig->facets())
    {
        const Axes& ax = cell->axes(0);
        auto        xl = ax.x_limits();
        std::printf("  %-3s at %-8s %-14s x=[%.1f, %.1f] xticks=%s yticks=%s\n",
                    cell->entity().c_str(),
                    to_string(cell->position()).c_str(),
                    ax.title().c_str(),
                    xl.min,
                    xl.max,
                    ax.x_decorations().ticks_visible ? "on" : "off",
                    ax.y_decorations().ticks_visible ? "on" : "off");
    }
    if (const Legend* legend = fig->legend())
    {
        std::printf("legend '%s' at rows %d-%d, col %d with %zu entries\n",
                    legend->title.c_str(),
                    legend->rows.first,
                    legend->rows.last,
                    legend->cols.first,
                    legend->entries.size());
    }

    // Grids can also come from CSV files in the grid directory
    for (const auto& name : list_available_grids(default_grid_directory()))
        GEOFACET_LOG_INFO("example", "grid available on disk: {}", name);

    return 0;
}
