#include <algorithm>
#include <cctype>
#include <geofacet/error.hpp>
#include <geofacet/facet.hpp>

namespace geofacet
{

namespace
{

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[noreturn]] void invalid_option(const char* option, std::string_view allowed, std::string_view got)
{
    throw GeofacetError(ErrorKind::InvalidOption,
                        std::string(option) + " must be one of " + std::string(allowed) + "; got '"
                            + std::string(got) + "'");
}

}   // anonymous namespace

// --- Parsing ---

LinkMode parse_link_mode(std::string_view text)
{
    const std::string t = to_lower(text);
    if (t == "none")
        return LinkMode::None;
    if (t == "x" || t == "primary")
        return LinkMode::X;
    if (t == "y" || t == "secondary")
        return LinkMode::Y;
    if (t == "both")
        return LinkMode::Both;
    invalid_option("link_mode", "none, x, y, both", text);
}

MissingRegionPolicy parse_missing_region_policy(std::string_view text)
{
    const std::string t = to_lower(text);
    if (t == "skip")
        return MissingRegionPolicy::Skip;
    if (t == "placeholder" || t == "empty")
        return MissingRegionPolicy::Placeholder;
    if (t == "error")
        return MissingRegionPolicy::Error;
    invalid_option("missing_regions", "skip, placeholder, error", text);
}

ExtraRegionPolicy parse_extra_region_policy(std::string_view text)
{
    const std::string t = to_lower(text);
    if (t == "warn")
        return ExtraRegionPolicy::Warn;
    if (t == "error")
        return ExtraRegionPolicy::Error;
    invalid_option("extra_regions", "warn, error", text);
}

const char* to_string(LinkMode mode)
{
    switch (mode)
    {
        case LinkMode::None:
            return "none";
        case LinkMode::X:
            return "x";
        case LinkMode::Y:
            return "y";
        case LinkMode::Both:
            return "both";
    }
    return "unknown";
}

const char* to_string(MissingRegionPolicy policy)
{
    switch (policy)
    {
        case MissingRegionPolicy::Skip:
            return "skip";
        case MissingRegionPolicy::Placeholder:
            return "placeholder";
        case MissingRegionPolicy::Error:
            return "error";
    }
    return "unknown";
}

const char* to_string(ExtraRegionPolicy policy)
{
    switch (policy)
    {
        case ExtraRegionPolicy::Warn:
            return "warn";
        case ExtraRegionPolicy::Error:
            return "error";
    }
    return "unknown";
}

// --- FacetRenderer ---

void FacetRenderer::operator()(FacetCell&                   cell,
                               const RegionData&            data,
                               const FacetContext&          ctx,
                               std::span<const AxisOptions> axis_options) const
{
    if (single_fn_)
    {
        // geofacet() rejects more than one map for this form; an empty span
        // still gets an (empty) option map.
        static const AxisOptions none;
        single_fn_(cell, data, ctx, axis_options.empty() ? none : axis_options.front());
        return;
    }
    if (list_fn_)
        list_fn_(cell, data, ctx, axis_options);
}

}   // namespace geofacet
