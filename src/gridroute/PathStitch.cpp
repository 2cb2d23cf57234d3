#include "gridroute/PathStitch.hpp"

#include "gridroute/GridPathfinding.hpp"

#include <cstddef>
#include <utility>

namespace gridroute {

bool StitchTourPath(const RoadGrid& grid, const std::vector<std::string>& poiOrder, std::vector<int>& outPath,
                    double& outDistance, RouteFailure& outFailure)
{
  outPath.clear();
  outDistance = 0.0;

  std::vector<int> nodes;
  nodes.reserve(poiOrder.size());
  for (const std::string& id : poiOrder) {
    const int node = grid.poiIntersection(id);
    if (node < 0) {
      return Fail(outFailure, RouteError::UnmappedPoi, "POI '" + id + "' is not mapped to an intersection");
    }
    nodes.push_back(node);
  }

  if (nodes.size() == 1) {
    outPath.push_back(nodes.front());
    outFailure.clear();
    return true;
  }

  std::vector<int> path;
  std::vector<int> segment;
  double total = 0.0;

  for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
    double d = 0.0;
    if (!FindGridPath(grid, nodes[i], nodes[i + 1], segment, &d)) {
      return Fail(outFailure, RouteError::Unreachable,
                  "no path from '" + poiOrder[i] + "' (" + IntersectionName(grid, nodes[i]) + ") to '" +
                      poiOrder[i + 1] + "' (" + IntersectionName(grid, nodes[i + 1]) + ")");
    }

    const std::size_t skip = path.empty() ? 0 : 1;
    path.insert(path.end(), segment.begin() + static_cast<std::ptrdiff_t>(skip), segment.end());
    total += d;
  }

  outPath = std::move(path);
  outDistance = total;
  outFailure.clear();
  return true;
}

} // namespace gridroute
