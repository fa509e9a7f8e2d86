#pragma once

#include <cstddef>

namespace geofacet
{

struct Color
{
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;
    float a = 1.0f;

    constexpr Color() = default;
    constexpr Color(float r, float g, float b, float a = 1.0f) : r(r), g(g), b(b), a(a) {}

    constexpr bool operator==(const Color&) const = default;
};

// Series colors cycle through this list per Axes, so the n-th series of
// every facet gets the same color and one legend entry describes them all.
namespace palette
{
inline constexpr Color default_cycle[] = {
    {0.122f, 0.467f, 0.706f},   // steel blue
    {1.000f, 0.498f, 0.055f},   // orange
    {0.173f, 0.627f, 0.173f},   // green
    {0.839f, 0.153f, 0.157f},   // red
    {0.580f, 0.404f, 0.741f},   // purple
    {0.549f, 0.337f, 0.294f},   // brown
    {0.890f, 0.467f, 0.761f},   // pink
    {0.498f, 0.498f, 0.498f},   // gray
};
inline constexpr size_t default_cycle_size = sizeof(default_cycle) / sizeof(default_cycle[0]);
}   // namespace palette

}   // namespace geofacet
