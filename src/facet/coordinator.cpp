#include <algorithm>
#include <geofacet/facet.hpp>
#include <geofacet/logger.hpp>
#include <unordered_set>

namespace geofacet
{

// ─── Axis linking ────────────────────────────────────────────────────────────

std::vector<std::vector<Axes*>> axes_by_position(const Figure& figure)
{
    std::vector<std::vector<Axes*>> groups;
    for (const auto& cell : figure.facets())
    {
        auto cell_axes = cell->all_axes();
        if (cell_axes.size() > groups.size())
            groups.resize(cell_axes.size());
        for (size_t i = 0; i < cell_axes.size(); ++i)
            groups[i].push_back(cell_axes[i]);
    }
    return groups;
}

size_t link_facet_axes(Figure& figure, LinkMode mode)
{
    if (mode == LinkMode::None)
        return 0;

    LinkAxis axis = LinkAxis::Both;
    if (mode == LinkMode::X)
        axis = LinkAxis::X;
    else if (mode == LinkMode::Y)
        axis = LinkAxis::Y;

    size_t created  = 0;
    auto   by_index = axes_by_position(figure);
    for (size_t i = 0; i < by_index.size(); ++i)
    {
        const auto& members = by_index[i];
        if (members.empty())
            continue;
        auto id = figure.links().link_all(members, axis, "Facet axis " + std::to_string(i + 1));
        if (id != 0)
            ++created;
    }

    GEOFACET_LOG_DEBUG("facet.link", "linked {} axes position(s) on {}", created, to_string(mode));
    return created;
}

// ─── Legend ──────────────────────────────────────────────────────────────────

std::vector<LegendEntry> collect_legend_entries(const Figure& figure)
{
    std::vector<LegendEntry>        entries;
    std::unordered_set<std::string> seen;
    for (const auto& cell : figure.facets())
    {
        for (const Axes* ax : cell->all_axes())
        {
            for (const auto& s : ax->series())
            {
                if (s->label().empty() || !seen.insert(s->label()).second)
                    continue;
                entries.push_back({s->label(), s->color()});
            }
        }
    }
    return entries;
}

bool attach_legend(Figure& figure, const std::optional<LegendOptions>& request, int grid_rows, int grid_cols)
{
    auto entries = collect_legend_entries(figure);
    if (entries.empty())
    {
        if (request)
        {
            const std::string msg =
                "Legend requested but no plots with labels found; give series a label to list them";
            GEOFACET_LOG_WARN("facet.legend", "{}", msg);
            figure.add_diagnostic({ErrorKind::NoLabeledPlots, {}, msg});
        }
        return false;
    }

    Legend legend;
    legend.rows    = GridSpan{1, std::max(grid_rows, 1)};
    legend.cols    = GridSpan{grid_cols + 1, grid_cols + 1};
    legend.entries = std::move(entries);
    if (request)
    {
        legend.title = request->title;
        if (request->rows)
            legend.rows = *request->rows;
        if (request->cols)
            legend.cols = *request->cols;
    }

    GEOFACET_LOG_DEBUG("facet.legend",
                       "legend with {} entries at rows {}-{}, cols {}-{}",
                       legend.entries.size(),
                       legend.rows.first,
                       legend.rows.last,
                       legend.cols.first,
                       legend.cols.last);
    figure.set_legend(std::move(legend));
    return true;
}

}   // namespace geofacet
