#include <algorithm>
#include <geofacet/facet.hpp>
#include <geofacet/grid_loader.hpp>
#include <geofacet/grid_ops.hpp>
#include <geofacet/logger.hpp>
#include <geofacet/region_matcher.hpp>

namespace geofacet
{

namespace
{

void validate_span(const char* what, const std::optional<GridSpan>& span)
{
    if (span && (span->first < 1 || span->last < span->first))
    {
        throw GeofacetError(ErrorKind::InvalidOption,
                            std::string("legend ") + what + " span must satisfy 1 <= first <= last; got "
                                + std::to_string(span->first) + ".." + std::to_string(span->last));
    }
}

bool valid_enum(LinkMode m)
{
    return m == LinkMode::None || m == LinkMode::X || m == LinkMode::Y || m == LinkMode::Both;
}
bool valid_enum(MissingRegionPolicy p)
{
    return p == MissingRegionPolicy::Skip || p == MissingRegionPolicy::Placeholder || p == MissingRegionPolicy::Error;
}
bool valid_enum(ExtraRegionPolicy p)
{
    return p == ExtraRegionPolicy::Warn || p == ExtraRegionPolicy::Error;
}

void validate_options(const DataTable&       data,
                      std::string_view       region_column,
                      const FacetRenderer&   render,
                      const GeofacetOptions& options)
{
    if (data.empty())
        throw GeofacetError(ErrorKind::EmptyInput, "Input data cannot be empty");

    if (!data.has_column(region_column))
    {
        throw GeofacetError(ErrorKind::ColumnNotFound,
                            "Column " + std::string(region_column) + " not found in data");
    }

    if (!valid_enum(options.link_mode))
        throw GeofacetError(ErrorKind::InvalidOption, "link_mode must be one of none, x, y, both");
    if (!valid_enum(options.missing_regions))
        throw GeofacetError(ErrorKind::InvalidOption, "missing_regions must be one of skip, placeholder, error");
    if (!valid_enum(options.extra_regions))
        throw GeofacetError(ErrorKind::InvalidOption, "extra_regions must be one of warn, error");

    if (render.empty())
        throw GeofacetError(ErrorKind::InvalidOption, "render callback is empty");

    if (render.is_single_axis() && options.per_axis_options.size() > 1)
    {
        throw GeofacetError(ErrorKind::InvalidOption,
                            "a single-axis render callback cannot take "
                                + std::to_string(options.per_axis_options.size()) + " per-axis option maps");
    }

    if (options.legend)
    {
        validate_span("row", options.legend->rows);
        validate_span("column", options.legend->cols);
    }

    // Value types of recognised keys are checked once here, so that a bad
    // option fails before any cell is drawn.
    const size_t n = std::max<size_t>(1, options.per_axis_options.size());
    for (size_t i = 0; i < n; ++i)
    {
        const AxisOptions* own = i < options.per_axis_options.size() ? &options.per_axis_options[i] : nullptr;
        Axes               scratch;
        scratch.apply(merge_axis_options(options.common_axis_options, own, {}));
    }
}

}   // anonymous namespace

std::unique_ptr<Figure> geofacet(const DataTable&       data,
                                 std::string_view       region_column,
                                 const FacetRenderer&   render,
                                 const GeofacetOptions& options)
{
    // ── Validate ─────────────────────────────────────────────────────────
    validate_options(data, region_column, render, options);

    const GeoGrid& grid = options.grid ? *options.grid : builtin_grid("us_state_grid1");

    // ── Partition ────────────────────────────────────────────────────────
    const GroupedTable  grouped = data.group_by(region_column);
    const RegionMatcher matcher(grouped);

    // ── Cross-check regions ──────────────────────────────────────────────
    std::vector<std::string> missing;
    RegionSet                on_grid;
    for (const auto& entry : grid)
    {
        on_grid.insert(to_upper(entry.entity()));
        if (!matcher.has_data(entry.entity()))
            missing.push_back(entry.entity());
    }

    std::vector<std::string> extra;
    for (const auto& spelling : matcher.data_entities())
    {
        if (!on_grid.contains(to_upper(spelling)))
            extra.push_back(spelling);
    }

    if (options.missing_regions == MissingRegionPolicy::Error && !missing.empty())
    {
        throw GeofacetError(ErrorKind::MissingRegions,
                            "Regions without data: " + join_regions(missing)
                                + "; use missing_regions = skip or placeholder to draw the grid anyway",
                            missing);
    }

    std::vector<FacetDiagnostic> pending;
    if (!extra.empty())
    {
        const std::string msg = "Data regions not on grid '" + grid.name() + "': " + join_regions(extra);
        if (options.extra_regions == ExtraRegionPolicy::Error)
            throw GeofacetError(ErrorKind::ExtraRegions, msg, extra);

        GEOFACET_LOG_WARN("facet", "{}", msg);
        pending.push_back({ErrorKind::ExtraRegions, {}, msg});
    }

    // ── Neighbor-detection grid ──────────────────────────────────────────
    // Placeholders fill every position, so only then does the full grid
    // decide which decorations are covered.
    const GeoGrid detection_grid = options.missing_regions == MissingRegionPolicy::Placeholder
                                       ? grid
                                       : filter_to_available(grid, matcher.available());

    auto figure = std::make_unique<Figure>(options.figure);
    for (auto& d : pending)
        figure->add_diagnostic(std::move(d));

    const GridDimensions dims = grid_dimensions(grid);
    figure->set_grid_shape(dims.rows, dims.cols);
    figure->title(options.title);

    GEOFACET_LOG_DEBUG("facet",
                       "faceting {} rows over grid '{}' ({} regions, {} with data)",
                       data.num_rows(),
                       grid.name(),
                       grid.size(),
                       detection_grid.size());

    // ── Per-cell loop ────────────────────────────────────────────────────
    for (const auto& entry : grid)
    {
        const std::string& entity  = entry.entity();
        auto               configs = compute_axis_configs(detection_grid,
                                            entity,
                                            options.link_mode,
                                            options.hide_inner_decorations,
                                            options.common_axis_options,
                                            options.per_axis_options);

        if (auto region = matcher.data_for(entity))
        {
            FacetCell&   cell = figure->add_facet(entity, entry.position());
            FacetContext ctx{entry, options.user_args};
            try
            {
                render(cell, *region, ctx, configs);
            }
            catch (const std::exception& e)
            {
                const std::string msg = "Error plotting region " + entity + ": " + e.what();
                GEOFACET_LOG_WARN("facet", "{}", msg);
                figure->add_diagnostic({ErrorKind::RenderFailure, entity, msg});
                figure->remove_facet(entity);
            }
        }
        else if (options.missing_regions == MissingRegionPolicy::Placeholder)
        {
            FacetCell& cell = figure->add_facet(entity, entry.position());
            cell.set_placeholder(true);
            for (const auto& config : configs)
            {
                Axes& ax = cell.add_axes();
                ax.title(entity);
                ax.apply(config);
            }
        }
        // Skip: nothing at this position.
    }

    // ── Cross-facet passes ───────────────────────────────────────────────
    link_facet_axes(*figure, options.link_mode);
    attach_legend(*figure, options.legend, dims.rows, dims.cols);

    figure->compute_layout();
    return figure;
}

}   // namespace geofacet
