#pragma once

#include <functional>
#include <geofacet/axis_options.hpp>
#include <geofacet/data_table.hpp>
#include <geofacet/figure.hpp>
#include <geofacet/grid.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace geofacet
{

// Which axis dimensions are shared across facets.
enum class LinkMode
{
    None,
    X,
    Y,
    Both,
};

// What to draw for a grid region with no rows in the data.
enum class MissingRegionPolicy
{
    Skip,
    Placeholder,
    Error,
};

// What to do with data rows whose region is not on the grid.
enum class ExtraRegionPolicy
{
    Warn,
    Error,
};

// Case-insensitive; InvalidOption for anything unrecognised.
// "primary"/"secondary" are accepted for x/y, "empty" for placeholder.
LinkMode            parse_link_mode(std::string_view text);
MissingRegionPolicy parse_missing_region_policy(std::string_view text);
ExtraRegionPolicy   parse_extra_region_policy(std::string_view text);

const char* to_string(LinkMode mode);
const char* to_string(MissingRegionPolicy policy);
const char* to_string(ExtraRegionPolicy policy);

inline bool links_x(LinkMode mode)
{
    return mode == LinkMode::X || mode == LinkMode::Both;
}
inline bool links_y(LinkMode mode)
{
    return mode == LinkMode::Y || mode == LinkMode::Both;
}

struct LegendOptions
{
    std::string             title;
    std::optional<GridSpan> rows;   // default: every grid row
    std::optional<GridSpan> cols;   // default: one column right of the grid
};

// Everything a render callback may want to know about the cell it fills.
struct FacetContext
{
    const GridEntry&   entry;
    const AxisOptions& user_args;
};

using FacetRenderFn = std::function<
    void(FacetCell& cell, const RegionData& data, const FacetContext& ctx, std::span<const AxisOptions> axis_options)>;

using SingleAxisRenderFn =
    std::function<void(FacetCell& cell, const RegionData& data, const FacetContext& ctx, const AxisOptions& options)>;

// A render callback together with the form it was written in. The
// single-axis form receives the one merged option map directly.
class FacetRenderer
{
   public:
    FacetRenderer(FacetRenderFn fn) : list_fn_(std::move(fn)) {}
    FacetRenderer(SingleAxisRenderFn fn) : single_fn_(std::move(fn)) {}

    // Any callable; the form is picked from the signature it accepts.
    template <typename F>
        requires(!std::is_same_v<std::decay_t<F>, FacetRenderer> && !std::is_same_v<std::decay_t<F>, FacetRenderFn>
                 && !std::is_same_v<std::decay_t<F>, SingleAxisRenderFn>)
    FacetRenderer(F&& fn)
    {
        if constexpr (std::is_invocable_v<F&,
                                          FacetCell&,
                                          const RegionData&,
                                          const FacetContext&,
                                          std::span<const AxisOptions>>)
        {
            list_fn_ = std::forward<F>(fn);
        }
        else
        {
            static_assert(std::is_invocable_v<F&, FacetCell&, const RegionData&, const FacetContext&, const AxisOptions&>,
                          "render callback must accept (FacetCell&, const RegionData&, const FacetContext&, "
                          "std::span<const AxisOptions>) or (..., const AxisOptions&)");
            single_fn_ = std::forward<F>(fn);
        }
    }

    static FacetRenderer single_axis(SingleAxisRenderFn fn) { return FacetRenderer(std::move(fn)); }
    static FacetRenderer per_axis(FacetRenderFn fn) { return FacetRenderer(std::move(fn)); }

    bool is_single_axis() const { return static_cast<bool>(single_fn_); }
    bool empty() const { return !list_fn_ && !single_fn_; }

    void operator()(FacetCell&                   cell,
                    const RegionData&            data,
                    const FacetContext&          ctx,
                    std::span<const AxisOptions> axis_options) const;

   private:
    FacetRenderFn      list_fn_;
    SingleAxisRenderFn single_fn_;
};

struct GeofacetOptions
{
    std::optional<GeoGrid>       grid;   // default: builtin_grid("us_state_grid1")
    LinkMode                     link_mode              = LinkMode::None;
    MissingRegionPolicy          missing_regions        = MissingRegionPolicy::Skip;
    ExtraRegionPolicy            extra_regions          = ExtraRegionPolicy::Error;
    bool                         hide_inner_decorations = true;
    AxisOptions                  common_axis_options;
    std::vector<AxisOptions>     per_axis_options;
    AxisOptions                  user_args;
    std::optional<LegendOptions> legend;
    std::string                  title;
    FigureConfig                 figure;
};

// Lays out one facet per grid region that has data, calling `render` for each.
//
//   auto fig = geofacet(table, "state", render, {.link_mode = LinkMode::Both});
//
// Throws GeofacetError for invalid input before any cell is rendered. Render
// failures of single cells are recorded in Figure::diagnostics() instead.
std::unique_ptr<Figure> geofacet(const DataTable&       data,
                                 std::string_view       region_column,
                                 const FacetRenderer&   render,
                                 const GeofacetOptions& options = {});

// ─── Option merging ──────────────────────────────────────────────────────────

// Decoration-hiding entries for one axis of `entity`: x chrome goes when x is
// linked and a region lies below, y chrome when y is linked and a region lies
// on the side the y axis is drawn on.
AxisOptions decoration_options(const GeoGrid&   detection_grid,
                               std::string_view entity,
                               LinkMode         link_mode,
                               YAxisSide        y_side);

// common, then per_axis (may be null), then decoration; later entries win.
AxisOptions merge_axis_options(const AxisOptions& common, const AxisOptions* per_axis, const AxisOptions& decoration);

// One merged option map per axis of `entity`'s cell:
// max(1, per_axis.size()) of them, in axis order.
std::vector<AxisOptions> compute_axis_configs(const GeoGrid&               detection_grid,
                                              std::string_view             entity,
                                              LinkMode                     link_mode,
                                              bool                         hide_inner_decorations,
                                              const AxisOptions&           common,
                                              std::span<const AxisOptions> per_axis);

// ─── Cross-facet passes ──────────────────────────────────────────────────────

// Axes of every facet grouped by creation order: result[i] holds each
// facet's i-th axes.
std::vector<std::vector<Axes*>> axes_by_position(const Figure& figure);

// Links each position group on the dimensions `mode` names. Returns the
// number of link groups created.
size_t link_facet_axes(Figure& figure, LinkMode mode);

// Labeled series of every facet, unique by label, in first-seen order.
std::vector<LegendEntry> collect_legend_entries(const Figure& figure);

// Attaches a legend when any series is labeled; otherwise, if one was
// requested, records a NoLabeledPlots diagnostic. Returns true if a legend
// was attached.
bool attach_legend(Figure& figure, const std::optional<LegendOptions>& request, int grid_rows, int grid_cols);

}   // namespace geofacet
