#pragma once

#include <cstdint>
#include <geofacet/axes.hpp>
#include <geofacet/axis_link.hpp>
#include <geofacet/error.hpp>
#include <geofacet/fwd.hpp>
#include <geofacet/grid.hpp>
#include <memory>
#include <string>
#include <vector>

namespace geofacet
{

struct FigureConfig
{
    uint32_t width  = 0;   // 0 = 200 px per grid column
    uint32_t height = 0;   // 0 = 150 px per grid row
};

struct FigureStyle
{
    float margin_top    = 20.0f;
    float margin_bottom = 24.0f;
    float margin_left   = 30.0f;
    float margin_right  = 8.0f;
    float cell_width    = 200.0f;
    float cell_height   = 150.0f;
};

// Inclusive 1-based range of grid rows or columns.
struct GridSpan
{
    int first = 1;
    int last  = 1;

    int  count() const { return last - first + 1; }
    bool operator==(const GridSpan&) const = default;
};

struct LegendEntry
{
    std::string label;
    Color       color;
};

// One legend shared by every facet of a figure.
struct Legend
{
    std::string              title;
    GridSpan                 rows;
    GridSpan                 cols;
    std::vector<LegendEntry> entries;
    Rect                     viewport;

    bool contains(const std::string& label) const;
};

// Non-fatal problem met while building a figure.
struct FacetDiagnostic
{
    ErrorKind   kind = ErrorKind::RenderFailure;
    std::string entity;
    std::string message;
};

// One grid position of a Figure. Holds the Axes the render callback creates,
// in creation order; several Axes may share a sub-position (twin y axes).
class FacetCell
{
   public:
    FacetCell(std::string entity, GridPosition position);

    FacetCell(const FacetCell&)            = delete;
    FacetCell& operator=(const FacetCell&) = delete;

    // Sub-positions are 1-based within the cell; std::out_of_range below 1.
    Axes& add_axes(int sub_row = 1, int sub_col = 1);

    const std::string& entity() const { return entity_; }
    GridPosition       position() const { return position_; }

    size_t             axes_count() const { return slots_.size(); }
    Axes&              axes(size_t index);
    const Axes&        axes(size_t index) const;
    std::vector<Axes*> all_axes() const;
    GridPosition       sub_position(size_t index) const;
    int                sub_rows() const;
    int                sub_cols() const;

    bool is_placeholder() const { return placeholder_; }
    void set_placeholder(bool placeholder) { placeholder_ = placeholder; }

    bool has_labeled_series() const;

    void        set_viewport(const Rect& r) { viewport_ = r; }
    const Rect& viewport() const { return viewport_; }

   private:
    struct Slot
    {
        std::unique_ptr<Axes> axes;
        GridPosition          sub;
    };

    std::string       entity_;
    GridPosition      position_;
    std::vector<Slot> slots_;
    bool              placeholder_ = false;
    Rect              viewport_;
};

class Figure
{
   public:
    explicit Figure(const FigureConfig& config = {});

    Figure(const Figure&)            = delete;
    Figure& operator=(const Figure&) = delete;

    // Adds a cell at `position`; std::invalid_argument when the position or
    // the entity is already taken.
    FacetCell& add_facet(const std::string& entity, GridPosition position);
    FacetCell* find_facet(const std::string& entity);
    const FacetCell* find_facet(const std::string& entity) const;
    FacetCell*       facet_at(GridPosition position);
    const FacetCell* facet_at(GridPosition position) const;

    // Drops the cell and unlinks its axes. Returns false if absent.
    bool remove_facet(const std::string& entity);

    const std::vector<std::unique_ptr<FacetCell>>& facets() const { return facets_; }
    size_t                                         facet_count() const { return facets_.size(); }

    // Grid shape the facets are laid out on; grows with add_facet.
    void set_grid_shape(int rows, int cols);
    int  grid_rows() const { return grid_rows_; }
    int  grid_cols() const { return grid_cols_; }

    void               title(const std::string& t) { title_ = t; }
    const std::string& title() const { return title_; }

    Legend&       set_legend(Legend legend);
    bool          has_legend() const { return legend_ != nullptr; }
    const Legend* legend() const { return legend_.get(); }

    AxisLinkManager&       links() { return links_; }
    const AxisLinkManager& links() const { return links_; }

    void                                add_diagnostic(FacetDiagnostic diagnostic);
    const std::vector<FacetDiagnostic>& diagnostics() const { return diagnostics_; }

    FigureStyle&       style() { return style_; }
    const FigureStyle& style() const { return style_; }

    // Effective size; unset dimensions follow the grid shape and legend span.
    uint32_t width() const;
    uint32_t height() const;

    // Assigns viewports to cells, their axes and the legend.
    void compute_layout();

   private:
    int layout_rows() const;
    int layout_cols() const;

    FigureConfig                            config_;
    FigureStyle                             style_;
    std::vector<std::unique_ptr<FacetCell>> facets_;
    std::unique_ptr<Legend>                 legend_;
    AxisLinkManager                         links_;
    std::vector<FacetDiagnostic>            diagnostics_;
    std::string                             title_;
    int                                     grid_rows_ = 0;
    int                                     grid_cols_ = 0;
};

}   // namespace geofacet
