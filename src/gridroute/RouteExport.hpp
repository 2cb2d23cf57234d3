#pragma once

#include "gridroute/DeliveryConfig.hpp"
#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteStrategy.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace gridroute {

// Report outputs for an optimized route.
//
// All writers are read-only over the grid/route. Node metadata (display names and
// types) is optional; when a POI has no matching DeliveryNode its id is used as label.

// Multi-line console summary: sequence, intersections traversed, total distance
// (2 decimals), algorithm + iterations and (if non-empty) the report file.
std::string FormatRouteSummary(const OptimizedRoute& route, const std::string& outputFile);

// "a -> b -> c"
std::string FormatPoiSequence(const std::vector<std::string>& poiPath, const char* sep = " -> ");

// Escape &, <, >, " and ' for XML/HTML text and attribute values.
std::string XmlEscape(const std::string& s);

// -----------------------------------------------------------------------------------------------
// JSON
// -----------------------------------------------------------------------------------------------

bool WriteRouteJson(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route, std::string& outError);
bool WriteRouteJsonFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                        std::string& outError);

// -----------------------------------------------------------------------------------------------
// SVG / HTML
// -----------------------------------------------------------------------------------------------

struct RouteSvgOptions {
  // Draw every intersection as a small dot.
  bool drawIntersections = true;

  // Draw POI labels next to their markers.
  bool labels = true;

  // Pixel size of POI markers.
  double markerRadius = 9.0;
};

// Standalone SVG document (viewBox = grid pixel bounds).
//
// Layers, bottom to top: roads (blocked ones dashed), intersections (blocked ones
// crossed out), route polyline, POI markers (start, visited deliveries with their
// visit number, unrouted POIs), labels.
void WriteRouteSvg(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route,
                   const std::vector<DeliveryNode>& nodes, const RouteSvgOptions& opt = {});

bool WriteRouteSvgFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                       const std::vector<DeliveryNode>& nodes, std::string& outError,
                       const RouteSvgOptions& opt = {});

// Self-contained HTML report: statistics, visiting order, the SVG map and a legend.
void WriteRouteHtml(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route,
                    const std::vector<DeliveryNode>& nodes);

bool WriteRouteHtmlFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                        const std::vector<DeliveryNode>& nodes, std::string& outError);

} // namespace gridroute
