#pragma once

#include <geofacet/series.hpp>
#include <vector>

namespace geofacet
{

// Margins in pixels around each cell's plot area.
struct Margins
{
    float left   = 30.0f;
    float right  = 8.0f;
    float bottom = 24.0f;
    float top    = 20.0f;
};

// Compute viewport rectangles for a grid of cells.
// Returns one Rect per cell, ordered row-major (row 0 col 0, row 0 col 1, ...),
// inside a region of figure_width x figure_height starting at (origin_x, origin_y).
std::vector<Rect> compute_subplot_layout(float          figure_width,
                                         float          figure_height,
                                         int            rows,
                                         int            cols,
                                         const Margins& margins  = {},
                                         float          origin_x = 0.0f,
                                         float          origin_y = 0.0f);

// Smallest rectangle covering both a and b.
Rect union_rect(const Rect& a, const Rect& b);

}   // namespace geofacet
