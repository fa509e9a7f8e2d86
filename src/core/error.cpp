#include <geofacet/error.hpp>

namespace geofacet
{

const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::EmptyInput:
            return "EmptyInput";
        case ErrorKind::ColumnNotFound:
            return "ColumnNotFound";
        case ErrorKind::InvalidOption:
            return "InvalidOption";
        case ErrorKind::MissingRegions:
            return "MissingRegions";
        case ErrorKind::ExtraRegions:
            return "ExtraRegions";
        case ErrorKind::InvalidEntity:
            return "InvalidEntity";
        case ErrorKind::InvalidPosition:
            return "InvalidPosition";
        case ErrorKind::PositionConflict:
            return "PositionConflict";
        case ErrorKind::ShapeMismatch:
            return "ShapeMismatch";
        case ErrorKind::GridLoad:
            return "GridLoad";
        case ErrorKind::RenderFailure:
            return "RenderFailure";
        case ErrorKind::NoLabeledPlots:
            return "NoLabeledPlots";
    }
    return "Unknown";
}

GeofacetError::GeofacetError(ErrorKind kind, const std::string& message, std::vector<std::string> regions)
    : std::runtime_error(message), kind_(kind), regions_(std::move(regions))
{
}

std::string join_regions(const std::vector<std::string>& regions, std::string_view sep)
{
    std::string out;
    for (size_t i = 0; i < regions.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += regions[i];
    }
    return out;
}

}   // namespace geofacet
