#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace geofacet
{

enum class ErrorKind
{
    // Orchestration
    EmptyInput,
    ColumnNotFound,
    InvalidOption,
    MissingRegions,
    ExtraRegions,

    // Grid construction
    InvalidEntity,
    InvalidPosition,
    PositionConflict,
    ShapeMismatch,
    GridLoad,

    // Non-fatal, only ever reported as a FacetDiagnostic
    RenderFailure,
    NoLabeledPlots,
};

const char* to_string(ErrorKind kind);

// Every error raised by the library. regions() lists the offending region
// codes for MissingRegions / ExtraRegions / PositionConflict and friends.
class GeofacetError : public std::runtime_error
{
   public:
    GeofacetError(ErrorKind kind, const std::string& message, std::vector<std::string> regions = {});

    ErrorKind                       kind() const { return kind_; }
    const std::vector<std::string>& regions() const { return regions_; }

   private:
    ErrorKind                kind_;
    std::vector<std::string> regions_;
};

// "A, B, C"
std::string join_regions(const std::vector<std::string>& regions, std::string_view sep = ", ");

}   // namespace geofacet
