#pragma once

#include <geofacet/axes.hpp>
#include <geofacet/axis_link.hpp>
#include <geofacet/axis_options.hpp>
#include <geofacet/color.hpp>
#include <geofacet/data_table.hpp>
#include <geofacet/error.hpp>
#include <geofacet/facet.hpp>
#include <geofacet/figure.hpp>
#include <geofacet/fwd.hpp>
#include <geofacet/grid.hpp>
#include <geofacet/grid_loader.hpp>
#include <geofacet/grid_ops.hpp>
#include <geofacet/logger.hpp>
#include <geofacet/region_matcher.hpp>
#include <geofacet/series.hpp>

// ─── Quick start ─────────────────────────────────────────────────────────────
//
//   geofacet::DataTable table;
//   table.add_text_column("state", {"CA", "CA", "NY", "NY"});
//   table.add_number_column("year", {2000, 2010, 2000, 2010});
//   table.add_number_column("pop", {33.9, 37.3, 19.0, 19.4});
//
//   auto fig = geofacet::geofacet(
//       table, "state",
//       [](geofacet::FacetCell& cell, const geofacet::RegionData& d,
//          const geofacet::FacetContext& ctx, const geofacet::AxisOptions& opts)
//       {
//           auto& ax = cell.add_axes();
//           ax.apply(opts);
//           ax.title(ctx.entry.display_name());
//           ax.line(d.floats("year"), d.floats("pop")).label("population");
//       },
//       {.link_mode = geofacet::LinkMode::Both});
