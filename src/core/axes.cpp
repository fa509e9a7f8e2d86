#include <algorithm>
#include <cmath>
#include <geofacet/axes.hpp>
#include <geofacet/error.hpp>
#include <geofacet/logger.hpp>
#include <limits>

namespace geofacet
{

YAxisSide parse_y_axis_side(std::string_view text)
{
    if (text == "left")
        return YAxisSide::Left;
    if (text == "right")
        return YAxisSide::Right;
    throw GeofacetError(ErrorKind::InvalidOption,
                        "yaxisposition must be one of left, right; got '" + std::string(text) + "'");
}

const char* to_string(YAxisSide side)
{
    return side == YAxisSide::Right ? "right" : "left";
}

// --- Series creation ---

template <typename S>
S& Axes::add_series(std::unique_ptr<S> s)
{
    auto& ref = *s;
    ref.color(palette::default_cycle[series_.size() % palette::default_cycle_size]);
    series_.push_back(std::move(s));
    return ref;
}

LineSeries& Axes::line(std::span<const float> x, std::span<const float> y)
{
    return add_series(std::make_unique<LineSeries>(x, y));
}

LineSeries& Axes::line()
{
    return add_series(std::make_unique<LineSeries>());
}

ScatterSeries& Axes::scatter(std::span<const float> x, std::span<const float> y)
{
    return add_series(std::make_unique<ScatterSeries>(x, y));
}

ScatterSeries& Axes::scatter()
{
    return add_series(std::make_unique<ScatterSeries>());
}

// --- Limits ---

void Axes::xlim(float min, float max)
{
    xlim_ = AxisLimits{min, max};
}

void Axes::ylim(float min, float max)
{
    ylim_ = AxisLimits{min, max};
}

void Axes::auto_fit()
{
    xlim_.reset();
    ylim_.reset();
}

// Extent of one coordinate across all series, NaNs skipped, padded by 5%
// (0.5 for a degenerate range). Empty when there is no data.
static std::optional<AxisLimits> padded_extent(const std::vector<std::unique_ptr<Series>>& series, bool use_x)
{
    float lo = std::numeric_limits<float>::max();
    float hi = -std::numeric_limits<float>::max();
    for (const auto& s : series)
    {
        for (float v : use_x ? s->x_data() : s->y_data())
        {
            if (std::isnan(v))
                continue;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }

    if (lo > hi)
        return std::nullopt;

    float pad = (hi - lo) * 0.05f;
    if (pad == 0.0f)
        pad = 0.5f;
    return AxisLimits{lo - pad, hi + pad};
}

std::optional<AxisLimits> Axes::x_extent() const
{
    if (xlim_.has_value())
        return xlim_;
    return padded_extent(series_, true);
}

std::optional<AxisLimits> Axes::y_extent() const
{
    if (ylim_.has_value())
        return ylim_;
    return padded_extent(series_, false);
}

AxisLimits Axes::x_limits() const
{
    return x_extent().value_or(AxisLimits{0.0f, 1.0f});
}

AxisLimits Axes::y_limits() const
{
    return y_extent().value_or(AxisLimits{0.0f, 1.0f});
}

// --- Decorations ---

bool Axes::has_labeled_series() const
{
    return std::any_of(series_.begin(), series_.end(), [](const auto& s) { return !s->label().empty(); });
}

// --- Options ---

namespace
{

template <typename T>
const T& expect(const std::string& key, const OptionValue& value, const char* type_name)
{
    if (const auto* v = std::get_if<T>(&value))
        return *v;
    throw GeofacetError(ErrorKind::InvalidOption,
                        "axis option '" + key + "' expects a " + type_name + ", got '" + to_string(value) + "'");
}

}   // namespace

void Axes::apply(const AxisOptions& options)
{
    namespace k = option_keys;

    std::optional<float> xmin, xmax, ymin, ymax;

    for (const auto& [key, value] : options)
    {
        if (key == k::title)
            title_ = expect<std::string>(key, value, "string");
        else if (key == k::xlabel)
            xlabel_ = expect<std::string>(key, value, "string");
        else if (key == k::ylabel)
            ylabel_ = expect<std::string>(key, value, "string");
        else if (key == k::grid)
            grid_enabled_ = expect<bool>(key, value, "bool");
        else if (key == k::border)
            border_enabled_ = expect<bool>(key, value, "bool");
        else if (key == k::xmin)
            xmin = static_cast<float>(expect<double>(key, value, "number"));
        else if (key == k::xmax)
            xmax = static_cast<float>(expect<double>(key, value, "number"));
        else if (key == k::ymin)
            ymin = static_cast<float>(expect<double>(key, value, "number"));
        else if (key == k::ymax)
            ymax = static_cast<float>(expect<double>(key, value, "number"));
        else if (key == k::xticksvisible)
            x_decorations_.ticks_visible = expect<bool>(key, value, "bool");
        else if (key == k::xticklabelsvisible)
            x_decorations_.ticklabels_visible = expect<bool>(key, value, "bool");
        else if (key == k::xlabelvisible)
            x_decorations_.label_visible = expect<bool>(key, value, "bool");
        else if (key == k::yticksvisible)
            y_decorations_.ticks_visible = expect<bool>(key, value, "bool");
        else if (key == k::yticklabelsvisible)
            y_decorations_.ticklabels_visible = expect<bool>(key, value, "bool");
        else if (key == k::ylabelvisible)
            y_decorations_.label_visible = expect<bool>(key, value, "bool");
        else if (key == k::yaxisposition)
            y_axis_side_ = parse_y_axis_side(expect<std::string>(key, value, "string"));
        else
        {
            GEOFACET_LOG_DEBUG("axes", "keeping unrecognised axis option '{}'", key);
            extra_options_.set(key, value);
        }
    }

    // A single bound completes from the current limits.
    if (xmin || xmax)
    {
        auto cur = x_limits();
        xlim(xmin.value_or(cur.min), xmax.value_or(cur.max));
    }
    if (ymin || ymax)
    {
        auto cur = y_limits();
        ylim(ymin.value_or(cur.min), ymax.value_or(cur.max));
    }
}

}   // namespace geofacet
