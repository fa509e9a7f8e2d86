#include <algorithm>
#include <cmath>
#include <geofacet/figure.hpp>
#include <geofacet/logger.hpp>
#include <stdexcept>

#include "layout.hpp"

namespace geofacet
{

// --- Legend ---

bool Legend::contains(const std::string& label) const
{
    return std::any_of(entries.begin(),
                       entries.end(),
                       [&](const LegendEntry& e) { return e.label == label; });
}

// --- FacetCell ---

FacetCell::FacetCell(std::string entity, GridPosition position)
    : entity_(std::move(entity)), position_(position)
{
}

Axes& FacetCell::add_axes(int sub_row, int sub_col)
{
    if (sub_row < 1 || sub_col < 1)
    {
        throw std::out_of_range("axes sub-position out of range");
    }
    slots_.push_back({std::make_unique<Axes>(), GridPosition{sub_row, sub_col}});
    return *slots_.back().axes;
}

Axes& FacetCell::axes(size_t index)
{
    return *slots_.at(index).axes;
}

const Axes& FacetCell::axes(size_t index) const
{
    return *slots_.at(index).axes;
}

std::vector<Axes*> FacetCell::all_axes() const
{
    std::vector<Axes*> result;
    result.reserve(slots_.size());
    for (const auto& slot : slots_)
        result.push_back(slot.axes.get());
    return result;
}

GridPosition FacetCell::sub_position(size_t index) const
{
    return slots_.at(index).sub;
}

int FacetCell::sub_rows() const
{
    int rows = 0;
    for (const auto& slot : slots_)
        rows = std::max(rows, slot.sub.row);
    return rows;
}

int FacetCell::sub_cols() const
{
    int cols = 0;
    for (const auto& slot : slots_)
        cols = std::max(cols, slot.sub.col);
    return cols;
}

bool FacetCell::has_labeled_series() const
{
    return std::any_of(slots_.begin(),
                       slots_.end(),
                       [](const Slot& s) { return s.axes->has_labeled_series(); });
}

// --- Figure ---

Figure::Figure(const FigureConfig& config) : config_(config) {}

FacetCell& Figure::add_facet(const std::string& entity, GridPosition position)
{
    if (position.row < 1 || position.col < 1)
    {
        throw std::out_of_range("facet position out of range: " + to_string(position));
    }
    if (facet_at(position))
    {
        throw std::invalid_argument("facet position already taken: " + to_string(position));
    }
    if (find_facet(entity))
    {
        throw std::invalid_argument("facet already exists: " + entity);
    }

    grid_rows_ = std::max(grid_rows_, position.row);
    grid_cols_ = std::max(grid_cols_, position.col);

    facets_.push_back(std::make_unique<FacetCell>(entity, position));
    return *facets_.back();
}

FacetCell* Figure::find_facet(const std::string& entity)
{
    auto it = std::find_if(facets_.begin(),
                           facets_.end(),
                           [&](const auto& f) { return f->entity() == entity; });
    return it != facets_.end() ? it->get() : nullptr;
}

const FacetCell* Figure::find_facet(const std::string& entity) const
{
    return const_cast<Figure*>(this)->find_facet(entity);
}

FacetCell* Figure::facet_at(GridPosition position)
{
    auto it = std::find_if(facets_.begin(),
                           facets_.end(),
                           [&](const auto& f) { return f->position() == position; });
    return it != facets_.end() ? it->get() : nullptr;
}

const FacetCell* Figure::facet_at(GridPosition position) const
{
    return const_cast<Figure*>(this)->facet_at(position);
}

bool Figure::remove_facet(const std::string& entity)
{
    auto it = std::find_if(facets_.begin(),
                           facets_.end(),
                           [&](const auto& f) { return f->entity() == entity; });
    if (it == facets_.end())
        return false;

    for (Axes* ax : (*it)->all_axes())
        links_.remove_from_all(ax);
    facets_.erase(it);
    return true;
}

void Figure::set_grid_shape(int rows, int cols)
{
    grid_rows_ = std::max(rows, 0);
    grid_cols_ = std::max(cols, 0);
}

Legend& Figure::set_legend(Legend legend)
{
    legend_ = std::make_unique<Legend>(std::move(legend));
    return *legend_;
}

void Figure::add_diagnostic(FacetDiagnostic diagnostic)
{
    diagnostics_.push_back(std::move(diagnostic));
}

int Figure::layout_rows() const
{
    int rows = grid_rows_;
    if (legend_)
        rows = std::max(rows, legend_->rows.last);
    return std::max(rows, 1);
}

int Figure::layout_cols() const
{
    int cols = grid_cols_;
    if (legend_)
        cols = std::max(cols, legend_->cols.last);
    return std::max(cols, 1);
}

uint32_t Figure::width() const
{
    if (config_.width > 0)
        return config_.width;
    return static_cast<uint32_t>(std::lround(style_.cell_width * static_cast<float>(layout_cols())));
}

uint32_t Figure::height() const
{
    if (config_.height > 0)
        return config_.height;
    return static_cast<uint32_t>(std::lround(style_.cell_height * static_cast<float>(layout_rows())));
}

void Figure::compute_layout()
{
    Margins fig_margins;
    fig_margins.left   = style_.margin_left;
    fig_margins.right  = style_.margin_right;
    fig_margins.top    = style_.margin_top;
    fig_margins.bottom = style_.margin_bottom;

    const int rows  = layout_rows();
    const int cols  = layout_cols();
    auto      rects = compute_subplot_layout(static_cast<float>(width()),
                                        static_cast<float>(height()),
                                        rows,
                                        cols,
                                        fig_margins);

    auto rect_at = [&](int row, int col) -> const Rect&
    { return rects[static_cast<size_t>((row - 1) * cols + (col - 1))]; };

    for (auto& cell : facets_)
    {
        const Rect& cell_rect = rect_at(cell->position().row, cell->position().col);
        cell->set_viewport(cell_rect);

        // Axes of one cell split the plot area evenly by sub-position.
        const int sub_rows = std::max(cell->sub_rows(), 1);
        const int sub_cols = std::max(cell->sub_cols(), 1);
        auto      sub      = compute_subplot_layout(cell_rect.w,
                                          cell_rect.h,
                                          sub_rows,
                                          sub_cols,
                                          Margins{0.0f, 0.0f, 0.0f, 0.0f},
                                          cell_rect.x,
                                          cell_rect.y);
        for (size_t i = 0; i < cell->axes_count(); ++i)
        {
            GridPosition sp = cell->sub_position(i);
            cell->axes(i).set_viewport(sub[static_cast<size_t>((sp.row - 1) * sub_cols + (sp.col - 1))]);
        }
    }

    if (legend_)
    {
        int r0 = std::clamp(legend_->rows.first, 1, rows);
        int r1 = std::clamp(legend_->rows.last, r0, rows);
        int c0 = std::clamp(legend_->cols.first, 1, cols);
        int c1 = std::clamp(legend_->cols.last, c0, cols);

        legend_->viewport = union_rect(rect_at(r0, c0), rect_at(r1, c1));
    }

    GEOFACET_LOG_TRACE("facet", "layout {}x{} cells at {}x{} px", rows, cols, width(), height());
}

}   // namespace geofacet
