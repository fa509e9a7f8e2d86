#pragma once

#include <cstddef>

namespace geofacet
{

class Logger;
class GeofacetError;

struct GridPosition;
class GridEntry;
class GeoGrid;

class DataTable;
class RegionData;
class GroupedTable;
class RegionMatcher;

class AxisOptions;

class Figure;
class FacetCell;
class Axes;
class Series;
class LineSeries;
class ScatterSeries;
class AxisLinkManager;
class FacetRenderer;

struct Color;
struct Rect;
struct GridSpan;
struct Legend;
struct LegendEntry;
struct FacetDiagnostic;
struct FacetContext;
struct FigureConfig;
struct FigureStyle;
struct GeofacetOptions;
struct LegendOptions;

}   // namespace geofacet
