#pragma once

#include <geofacet/axis_options.hpp>
#include <geofacet/fwd.hpp>
#include <geofacet/series.hpp>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace geofacet
{

struct AxisLimits
{
    float min = 0.0f;
    float max = 1.0f;

    bool operator==(const AxisLimits&) const = default;
};

// Visibility of one axis' chrome.
struct AxisDecorations
{
    bool ticks_visible      = true;
    bool ticklabels_visible = true;
    bool label_visible      = true;

    bool all_visible() const { return ticks_visible && ticklabels_visible && label_visible; }
    bool none_visible() const { return !ticks_visible && !ticklabels_visible && !label_visible; }
};

enum class YAxisSide
{
    Left,
    Right,
};

// "left" / "right"; anything else is InvalidOption.
YAxisSide   parse_y_axis_side(std::string_view text);
const char* to_string(YAxisSide side);

class Axes
{
   public:
    Axes() = default;

    // Series creation, returns reference for fluent API
    LineSeries&    line(std::span<const float> x, std::span<const float> y);
    LineSeries&    line();
    ScatterSeries& scatter(std::span<const float> x, std::span<const float> y);
    ScatterSeries& scatter();

    const std::vector<std::unique_ptr<Series>>& series() const { return series_; }

    // Axis configuration
    void xlim(float min, float max);
    void ylim(float min, float max);
    void title(const std::string& t) { title_ = t; }
    void xlabel(const std::string& lbl) { xlabel_ = lbl; }
    void ylabel(const std::string& lbl) { ylabel_ = lbl; }
    void grid(bool enabled) { grid_enabled_ = enabled; }
    void show_border(bool enabled) { border_enabled_ = enabled; }
    void y_axis_side(YAxisSide side) { y_axis_side_ = side; }

    // Explicit limits if set, otherwise the data extent with 5% padding.
    AxisLimits x_limits() const;
    AxisLimits y_limits() const;

    // Same as x_limits()/y_limits() but empty for an axes with neither data
    // nor explicit limits.
    std::optional<AxisLimits> x_extent() const;
    std::optional<AxisLimits> y_extent() const;
    bool       has_explicit_xlim() const { return xlim_.has_value(); }
    bool       has_explicit_ylim() const { return ylim_.has_value(); }

    // Drop explicit limits and go back to fitting the data.
    void auto_fit();

    const std::string& title() const { return title_; }
    const std::string& xlabel() const { return xlabel_; }
    const std::string& ylabel() const { return ylabel_; }
    bool               grid_enabled() const { return grid_enabled_; }
    bool               border_enabled() const { return border_enabled_; }
    YAxisSide          y_axis_side() const { return y_axis_side_; }

    AxisDecorations&       x_decorations() { return x_decorations_; }
    const AxisDecorations& x_decorations() const { return x_decorations_; }
    AxisDecorations&       y_decorations() { return y_decorations_; }
    const AxisDecorations& y_decorations() const { return y_decorations_; }

    // Applies every recognised key of `options` (see option_keys); keys with
    // the wrong value type raise InvalidOption, unknown keys land in
    // extra_options().
    void               apply(const AxisOptions& options);
    const AxisOptions& extra_options() const { return extra_options_; }

    bool has_labeled_series() const;

    void        set_viewport(const Rect& r) { viewport_ = r; }
    const Rect& viewport() const { return viewport_; }

   private:
    template <typename S>
    S& add_series(std::unique_ptr<S> s);

    std::vector<std::unique_ptr<Series>> series_;
    std::optional<AxisLimits>            xlim_;
    std::optional<AxisLimits>            ylim_;
    std::string                          title_;
    std::string                          xlabel_;
    std::string                          ylabel_;
    bool                                 grid_enabled_   = true;
    bool                                 border_enabled_ = true;
    YAxisSide                            y_axis_side_    = YAxisSide::Left;
    AxisDecorations                      x_decorations_;
    AxisDecorations                      y_decorations_;
    AxisOptions                          extra_options_;
    Rect                                 viewport_;
};

}   // namespace geofacet
