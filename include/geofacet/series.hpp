#pragma once

#include <geofacet/color.hpp>
#include <geofacet/fwd.hpp>
#include <span>
#include <string>
#include <vector>

namespace geofacet
{

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
};

// A plotted visual inside an Axes. Only label and data extent matter to the
// facet passes: a non-empty label makes the series a legend candidate.
class Series
{
   public:
    virtual ~Series() = default;

    Series& label(const std::string& lbl)
    {
        label_ = lbl;
        return *this;
    }
    Series& color(const Color& c)
    {
        color_ = c;
        return *this;
    }
    Series& visible(bool v)
    {
        visible_ = v;
        return *this;
    }

    const std::string& label() const { return label_; }
    const Color&       color() const { return color_; }
    bool               visible() const { return visible_; }

    std::span<const float> x_data() const { return x_; }
    std::span<const float> y_data() const { return y_; }
    size_t                 point_count() const { return x_.size(); }

    void append(float x, float y);

   protected:
    Series() = default;
    Series(std::span<const float> x, std::span<const float> y);

    std::string        label_;
    Color              color_ = palette::default_cycle[0];
    bool               visible_ = true;
    std::vector<float> x_;
    std::vector<float> y_;
};

class LineSeries : public Series
{
   public:
    LineSeries() = default;
    LineSeries(std::span<const float> x, std::span<const float> y) : Series(x, y) {}

    LineSeries& width(float w)
    {
        line_width_ = w;
        return *this;
    }
    float width() const { return line_width_; }

    // Bring base-class getters into scope (setters below would otherwise hide them)
    using Series::color;
    using Series::label;

    LineSeries& label(const std::string& lbl)
    {
        Series::label(lbl);
        return *this;
    }
    LineSeries& color(const Color& c)
    {
        Series::color(c);
        return *this;
    }

   private:
    float line_width_ = 2.0f;
};

class ScatterSeries : public Series
{
   public:
    ScatterSeries() = default;
    ScatterSeries(std::span<const float> x, std::span<const float> y) : Series(x, y) {}

    ScatterSeries& size(float s)
    {
        point_size_ = s;
        return *this;
    }
    float size() const { return point_size_; }

    using Series::color;
    using Series::label;

    ScatterSeries& label(const std::string& lbl)
    {
        Series::label(lbl);
        return *this;
    }
    ScatterSeries& color(const Color& c)
    {
        Series::color(c);
        return *this;
    }

   private:
    float point_size_ = 4.0f;
};

}   // namespace geofacet
