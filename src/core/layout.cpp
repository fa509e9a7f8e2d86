#include "layout.hpp"

#include <algorithm>

namespace geofacet
{

std::vector<Rect> compute_subplot_layout(float          figure_width,
                                         float          figure_height,
                                         int            rows,
                                         int            cols,
                                         const Margins& margins,
                                         float          origin_x,
                                         float          origin_y)
{
    std::vector<Rect> rects;
    if (rows <= 0 || cols <= 0)
        return rects;
    rects.reserve(static_cast<size_t>(rows * cols));

    // Each cell gets an equal share of the region, then margins are applied inside it.
    float cell_width  = figure_width / static_cast<float>(cols);
    float cell_height = figure_height / static_cast<float>(rows);

    // Row 0 at top: y increases downward in screen coords
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            float cell_x = static_cast<float>(c) * cell_width;
            float cell_y = static_cast<float>(r) * cell_height;

            Rect plot_area;
            plot_area.x = origin_x + cell_x + margins.left;
            plot_area.y = origin_y + cell_y + margins.top;
            plot_area.w = std::max(0.0f, cell_width - margins.left - margins.right);
            plot_area.h = std::max(0.0f, cell_height - margins.top - margins.bottom);

            rects.push_back(plot_area);
        }
    }

    return rects;
}

Rect union_rect(const Rect& a, const Rect& b)
{
    float x0 = std::min(a.x, b.x);
    float y0 = std::min(a.y, b.y);
    float x1 = std::max(a.x + a.w, b.x + b.w);
    float y1 = std::max(a.y + a.h, b.y + b.h);
    return {x0, y0, x1 - x0, y1 - y0};
}

}   // namespace geofacet
