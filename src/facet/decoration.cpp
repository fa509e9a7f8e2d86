#include <algorithm>
#include <geofacet/facet.hpp>
#include <geofacet/grid_ops.hpp>

namespace geofacet
{

AxisOptions decoration_options(const GeoGrid&   detection_grid,
                               std::string_view entity,
                               LinkMode         link_mode,
                               YAxisSide        y_side)
{
    AxisOptions deco;

    if (links_x(link_mode) && has_neighbor_below(detection_grid, entity))
    {
        deco.set(option_keys::xticksvisible, false);
        deco.set(option_keys::xticklabelsvisible, false);
        deco.set(option_keys::xlabelvisible, false);
    }

    if (links_y(link_mode))
    {
        const bool covered = y_side == YAxisSide::Right ? has_neighbor_right(detection_grid, entity)
                                                        : has_neighbor_left(detection_grid, entity);
        if (covered)
        {
            deco.set(option_keys::yticksvisible, false);
            deco.set(option_keys::yticklabelsvisible, false);
            deco.set(option_keys::ylabelvisible, false);
        }
    }

    return deco;
}

AxisOptions merge_axis_options(const AxisOptions& common, const AxisOptions* per_axis, const AxisOptions& decoration)
{
    AxisOptions merged = common;
    if (per_axis)
        merged = merged.merged(*per_axis);
    return merged.merged(decoration);
}

std::vector<AxisOptions> compute_axis_configs(const GeoGrid&               detection_grid,
                                              std::string_view             entity,
                                              LinkMode                     link_mode,
                                              bool                         hide_inner_decorations,
                                              const AxisOptions&           common,
                                              std::span<const AxisOptions> per_axis)
{
    const size_t n = std::max<size_t>(1, per_axis.size());

    std::vector<AxisOptions> configs;
    configs.reserve(n);
    for (size_t i = 0; i < n; ++i)
    {
        const AxisOptions* own = i < per_axis.size() ? &per_axis[i] : nullptr;

        AxisOptions deco;
        if (hide_inner_decorations)
        {
            // The side the y axis sits on decides which neighbor covers it.
            AxisOptions base = own ? common.merged(*own) : common;
            YAxisSide   side = YAxisSide::Left;
            if (auto pos = base.get_string(option_keys::yaxisposition))
                side = parse_y_axis_side(*pos);
            deco = decoration_options(detection_grid, entity, link_mode, side);
        }

        configs.push_back(merge_axis_options(common, own, deco));
    }
    return configs;
}

}   // namespace geofacet
