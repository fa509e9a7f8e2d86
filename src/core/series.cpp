#include <geofacet/error.hpp>
#include <geofacet/series.hpp>

namespace geofacet
{

Series::Series(std::span<const float> x, std::span<const float> y) : x_(x.begin(), x.end()), y_(y.begin(), y.end())
{
    if (x.size() != y.size())
    {
        throw GeofacetError(ErrorKind::ShapeMismatch,
                            "series x has " + std::to_string(x.size()) + " points, y has "
                                + std::to_string(y.size()));
    }
}

void Series::append(float x, float y)
{
    x_.push_back(x);
    y_.push_back(y);
}

}   // namespace geofacet
