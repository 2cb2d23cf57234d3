#include "gridroute/RouteExport.hpp"

#include "gridroute/Json.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace gridroute {

namespace {

constexpr const char* kRoadColor = "#999999";
constexpr const char* kBlockedColor = "#c0392b";
constexpr const char* kRouteColor = "#3498db";
constexpr const char* kStartColor = "#e74c3c";
constexpr const char* kDeliveryColor = "#27ae60";
constexpr const char* kIdleColor = "#7f8c8d";

std::string LabelFor(const std::vector<DeliveryNode>& nodes, const std::string& id)
{
  const DeliveryNode* n = FindDeliveryNode(nodes, id);
  return (n && !n->name.empty()) ? n->name : id;
}

std::string Fixed2(double v)
{
  std::ostringstream oss;
  oss.setf(std::ios::fixed);
  oss << std::setprecision(2) << v;
  return oss.str();
}

bool OpenForWrite(const std::string& path, std::ofstream& os, std::string& outError)
{
  os.open(path, std::ios::binary | std::ios::trunc);
  if (!os) {
    outError = "unable to open '" + path + "' for writing";
    return false;
  }
  return true;
}

bool FinishWrite(const std::string& path, std::ofstream& os, std::string& outError)
{
  os.flush();
  if (!os) {
    outError = "write failed: " + path;
    return false;
  }
  outError.clear();
  return true;
}

} // namespace

std::string FormatPoiSequence(const std::vector<std::string>& poiPath, const char* sep)
{
  std::string out;
  for (std::size_t i = 0; i < poiPath.size(); ++i) {
    if (i > 0) out += sep;
    out += poiPath[i];
  }
  return out;
}

std::string FormatRouteSummary(const OptimizedRoute& route, const std::string& outputFile)
{
  const std::string rule(60, '=');

  std::ostringstream oss;
  oss << rule << "\n";
  oss << "Route optimization complete\n";
  oss << rule << "\n";
  oss << "Route: " << FormatPoiSequence(route.poiPath) << "\n";
  oss << "Intersections traversed: " << route.fullPath.size() << "\n";
  oss << "Total distance: " << Fixed2(route.totalDistance) << " px\n";
  oss << "Algorithm: " << route.algorithmName;
  if (route.iterations > 0) oss << " (" << route.iterations << " iterations)";
  oss << "\n";
  if (!outputFile.empty()) oss << "Output file: " << outputFile << "\n";
  oss << rule << "\n";
  return oss.str();
}

std::string XmlEscape(const std::string& s)
{
  std::string out;
  out.reserve(s.size());
  for (const char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      case '\'': out += "&#39;"; break;
      default: out.push_back(c); break;
    }
  }
  return out;
}

bool WriteRouteJson(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route, std::string& outError)
{
  JsonWriter jw(os);
  jw.beginObject();

  jw.key("algorithm");
  jw.stringValue(route.algorithmName);
  jw.key("iterations");
  jw.intValue(route.iterations);
  jw.key("total_distance");
  jw.numberValue(route.totalDistance);

  jw.key("grid");
  jw.beginObject();
  jw.key("width");
  jw.intValue(grid.width());
  jw.key("height");
  jw.intValue(grid.height());
  jw.key("cell_size");
  jw.numberValue(grid.cellSize());
  jw.endObject();

  jw.key("poi_path");
  jw.beginArray();
  for (const std::string& id : route.poiPath) jw.stringValue(id);
  jw.endArray();

  jw.key("stops");
  jw.beginArray();
  for (std::size_t i = 0; i < route.poiPath.size(); ++i) {
    const std::string& id = route.poiPath[i];
    const int node = grid.poiIntersection(id);

    jw.beginObject();
    jw.key("order");
    jw.intValue(static_cast<std::int64_t>(i));
    jw.key("id");
    jw.stringValue(id);
    if (node >= 0) {
      const Point p = grid.coordsOf(node);
      jw.key("intersection");
      jw.stringValue(IntersectionName(grid, node));
      jw.key("grid");
      jw.beginArray();
      jw.intValue(p.x);
      jw.intValue(p.y);
      jw.endArray();
    }
    jw.endObject();
  }
  jw.endArray();

  jw.key("path");
  jw.beginArray();
  for (const int id : route.fullPath) {
    const Point p = grid.coordsOf(id);
    jw.beginArray();
    jw.intValue(p.x);
    jw.intValue(p.y);
    jw.endArray();
  }
  jw.endArray();

  jw.endObject();
  os << "\n";

  if (!jw.ok()) {
    outError = jw.error();
    return false;
  }
  outError.clear();
  return true;
}

bool WriteRouteJsonFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                        std::string& outError)
{
  std::ofstream os;
  if (!OpenForWrite(path, os, outError)) return false;
  if (!WriteRouteJson(os, grid, route, outError)) return false;
  return FinishWrite(path, os, outError);
}

void WriteRouteSvg(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route,
                   const std::vector<DeliveryNode>& nodes, const RouteSvgOptions& opt)
{
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;
  grid.boundsPx(minX, minY, maxX, maxY);

  const auto oldFlags = os.flags();
  const auto oldPrecision = os.precision();
  os.setf(std::ios::fixed);
  os << std::setprecision(2);

  os << "<svg xmlns=\"http://www.w3.org/2000/svg\" class=\"map\" viewBox=\"" << minX << " " << minY << " "
     << (maxX - minX) << " " << (maxY - minY) << "\" width=\"" << (maxX - minX) << "\" height=\"" << (maxY - minY)
     << "\">\n";
  os << "  <rect x=\"" << minX << "\" y=\"" << minY << "\" width=\"" << (maxX - minX) << "\" height=\""
     << (maxY - minY) << "\" fill=\"#f5f7fa\"/>\n";

  // Roads: one line per undirected pair. A road is shown blocked if either direction is.
  os << "  <g id=\"roads\" stroke-linecap=\"round\">\n";
  const std::vector<RoadSegment>& slots = grid.segmentSlots();
  for (const RoadSegment& s : slots) {
    if (!s.exists() || s.from > s.to) continue;
    const RoadSegment* back = grid.findSegment(s.to, s.from);
    const bool blocked = !s.passable || (back && !back->passable);

    const Intersection& a = grid.intersection(s.from);
    const Intersection& b = grid.intersection(s.to);
    os << "    <line x1=\"" << a.pixelX << "\" y1=\"" << a.pixelY << "\" x2=\"" << b.pixelX << "\" y2=\"" << b.pixelY
       << "\"";
    if (blocked) {
      os << " stroke=\"" << kBlockedColor << "\" stroke-width=\"2\" stroke-dasharray=\"5,5\" opacity=\"0.7\"";
    } else {
      os << " stroke=\"" << kRoadColor << "\" stroke-width=\"2\"";
    }
    os << "/>\n";
  }
  os << "  </g>\n";

  const double r = std::max(1.0, grid.cellSize() * 0.06);
  os << "  <g id=\"intersections\">\n";
  for (int id = 0; id < grid.intersectionCount(); ++id) {
    const Intersection& n = grid.intersection(id);
    if (!n.passable) {
      const double d = r * 2.0;
      os << "    <path d=\"M " << n.pixelX - d << " " << n.pixelY - d << " L " << n.pixelX + d << " " << n.pixelY + d
         << " M " << n.pixelX - d << " " << n.pixelY + d << " L " << n.pixelX + d << " " << n.pixelY - d
         << "\" stroke=\"" << kBlockedColor << "\" stroke-width=\"2\"/>\n";
      continue;
    }
    if (!opt.drawIntersections) continue;
    os << "    <circle cx=\"" << n.pixelX << "\" cy=\"" << n.pixelY << "\" r=\"" << r
       << "\" fill=\"#ffffff\" stroke=\"" << kRoadColor << "\" stroke-width=\"1\"/>\n";
  }
  os << "  </g>\n";

  if (route.fullPath.size() >= 2) {
    os << "  <path id=\"route\" d=\"";
    for (std::size_t i = 0; i < route.fullPath.size(); ++i) {
      const Intersection& n = grid.intersection(route.fullPath[i]);
      os << (i == 0 ? "M " : " L ") << n.pixelX << " " << n.pixelY;
    }
    os << "\" fill=\"none\" stroke=\"" << kRouteColor
       << "\" stroke-width=\"4\" stroke-linecap=\"round\" stroke-linejoin=\"round\" opacity=\"0.9\"/>\n";
  }

  // POI markers. Route stops get their visit number; other mapped POIs are drawn muted.
  os << "  <g id=\"pois\" font-family=\"sans-serif\" font-size=\"11\">\n";
  for (const PoiMapping& m : grid.pois()) {
    const auto it = std::find(route.poiPath.begin(), route.poiPath.end(), m.poiId);
    const bool onRoute = it != route.poiPath.end();
    const long order = onRoute ? static_cast<long>(it - route.poiPath.begin()) : -1;

    const char* fill = kIdleColor;
    if (order == 0) {
      fill = kStartColor;
    } else if (onRoute) {
      fill = kDeliveryColor;
    }

    const Intersection& n = grid.intersection(m.intersection);
    os << "    <circle cx=\"" << n.pixelX << "\" cy=\"" << n.pixelY << "\" r=\"" << opt.markerRadius << "\" fill=\""
       << fill << "\" stroke=\"#ffffff\" stroke-width=\"2\"><title>" << XmlEscape(LabelFor(nodes, m.poiId))
       << "</title></circle>\n";

    if (order > 0) {
      os << "    <text x=\"" << n.pixelX << "\" y=\"" << n.pixelY + 4.0
         << "\" text-anchor=\"middle\" font-weight=\"bold\" fill=\"#ffffff\">" << order << "</text>\n";
    }
    if (opt.labels) {
      os << "    <text x=\"" << n.pixelX + opt.markerRadius + 3.0 << "\" y=\"" << n.pixelY - opt.markerRadius
         << "\" fill=\"#333333\">" << XmlEscape(LabelFor(nodes, m.poiId)) << "</text>\n";
    }
  }
  os << "  </g>\n";
  os << "</svg>\n";

  os.flags(oldFlags);
  os.precision(oldPrecision);
}

bool WriteRouteSvgFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                       const std::vector<DeliveryNode>& nodes, std::string& outError, const RouteSvgOptions& opt)
{
  std::ofstream os;
  if (!OpenForWrite(path, os, outError)) return false;
  os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  WriteRouteSvg(os, grid, route, nodes, opt);
  return FinishWrite(path, os, outError);
}

void WriteRouteHtml(std::ostream& os, const RoadGrid& grid, const OptimizedRoute& route,
                    const std::vector<DeliveryNode>& nodes)
{
  const std::size_t deliveries = route.poiPath.empty() ? 0 : route.poiPath.size() - 1;

  os << "<!DOCTYPE html>\n";
  os << "<html lang=\"en\">\n<head>\n";
  os << "<meta charset=\"UTF-8\">\n";
  os << "<meta name=\"viewport\" content=\"width=device-width, initial-scale=1.0\">\n";
  os << "<title>Optimized Delivery Route</title>\n";
  os << "<style>\n"
     << "  body { font-family: 'Segoe UI', Tahoma, sans-serif; background: #eef1f6; margin: 0; padding: 20px; }\n"
     << "  .container { background: #fff; border-radius: 10px; padding: 24px; max-width: 1400px; margin: 0 auto;"
     << " box-shadow: 0 10px 30px rgba(0,0,0,0.15); }\n"
     << "  h1 { text-align: center; color: #333; }\n"
     << "  .cards { display: grid; grid-template-columns: repeat(auto-fit, minmax(280px, 1fr)); gap: 14px;"
     << " margin-bottom: 24px; }\n"
     << "  .card { background: #f8f9fa; border-left: 4px solid " << kRouteColor << "; padding: 12px 16px; }\n"
     << "  .card h3 { margin: 0 0 8px 0; color: " << kRouteColor << "; }\n"
     << "  .card p { margin: 4px 0; color: #555; font-size: 14px; }\n"
     << "  .sequence { font-weight: bold; word-break: break-word; color: #333; }\n"
     << "  .map-container { border: 2px solid #ddd; border-radius: 8px; overflow: hidden; }\n"
     << "  .map-container svg { width: 100%; height: auto; display: block; }\n"
     << "  .legend { display: flex; flex-wrap: wrap; gap: 18px; margin-top: 16px; font-size: 14px; }\n"
     << "  .legend-item { display: flex; align-items: center; gap: 6px; }\n"
     << "  .swatch { width: 18px; height: 18px; border-radius: 3px; }\n"
     << "  ol { margin: 4px 0 0 20px; padding: 0; color: #555; font-size: 14px; }\n"
     << "</style>\n";
  os << "</head>\n<body>\n<div class=\"container\">\n";
  os << "<h1>Optimized Delivery Route</h1>\n";

  os << "<div class=\"cards\">\n";
  os << "  <div class=\"card\">\n    <h3>Statistics</h3>\n";
  os << "    <p><strong>Total distance:</strong> " << Fixed2(route.totalDistance) << " px</p>\n";
  os << "    <p><strong>Intersections:</strong> " << route.fullPath.size() << "</p>\n";
  os << "    <p><strong>Deliveries:</strong> " << deliveries << "</p>\n";
  os << "    <p><strong>Grid:</strong> " << grid.width() << "x" << grid.height() << " @ " << Fixed2(grid.cellSize())
     << " px</p>\n";
  os << "  </div>\n";

  os << "  <div class=\"card\">\n    <h3>Route</h3>\n";
  os << "    <p class=\"sequence\">" << XmlEscape(FormatPoiSequence(route.poiPath)) << "</p>\n";
  os << "    <ol start=\"0\">\n";
  for (const std::string& id : route.poiPath) {
    os << "      <li>" << XmlEscape(LabelFor(nodes, id));
    const int node = grid.poiIntersection(id);
    if (node >= 0) os << " <small>(" << IntersectionName(grid, node) << ")</small>";
    os << "</li>\n";
  }
  os << "    </ol>\n  </div>\n";

  os << "  <div class=\"card\">\n    <h3>Algorithm</h3>\n";
  os << "    <p><strong>Shortest paths:</strong> Dijkstra</p>\n";
  os << "    <p><strong>Tour:</strong> " << XmlEscape(route.algorithmName) << "</p>\n";
  if (route.iterations > 0) os << "    <p><strong>2-opt rounds:</strong> " << route.iterations << "</p>\n";
  os << "  </div>\n";
  os << "</div>\n";

  os << "<div class=\"map-container\">\n";
  WriteRouteSvg(os, grid, route, nodes);
  os << "</div>\n";

  struct LegendEntry {
    const char* color;
    const char* label;
  };
  const LegendEntry legend[] = {
      {kRoadColor, "Open road"},          {kBlockedColor, "Blocked road / intersection"},
      {kRouteColor, "Optimized route"},   {kStartColor, "Distribution center"},
      {kDeliveryColor, "Delivery stop"},  {kIdleColor, "Other point of interest"},
  };
  os << "<div class=\"legend\">\n";
  for (const LegendEntry& e : legend) {
    os << "  <div class=\"legend-item\"><div class=\"swatch\" style=\"background: " << e.color << ";\"></div><span>"
       << e.label << "</span></div>\n";
  }
  os << "</div>\n";

  os << "</div>\n</body>\n</html>\n";
}

bool WriteRouteHtmlFile(const std::string& path, const RoadGrid& grid, const OptimizedRoute& route,
                        const std::vector<DeliveryNode>& nodes, std::string& outError)
{
  std::ofstream os;
  if (!OpenForWrite(path, os, outError)) return false;
  WriteRouteHtml(os, grid, route, nodes);
  return FinishWrite(path, os, outError);
}

} // namespace gridroute
