#include "gridroute/PoiDistanceMatrix.hpp"

#include "gridroute/GridPathfinding.hpp"

#include <utility>

namespace gridroute {

int PoiDistanceMatrix::indexOf(const std::string& poiId) const
{
  for (std::size_t i = 0; i < m_pois.size(); ++i) {
    if (m_pois[i] == poiId) return static_cast<int>(i);
  }
  return -1;
}

double PoiDistanceMatrix::distance(const std::string& fromPoi, const std::string& toPoi) const
{
  const int a = indexOf(fromPoi);
  const int b = indexOf(toPoi);
  if (a < 0 || b < 0) return kUnreachable;
  return at(a, b);
}

bool BuildPoiDistanceMatrix(const RoadGrid& grid, const std::vector<std::string>& pois,
                            PoiDistanceMatrix& outMatrix, RouteFailure& outFailure)
{
  outMatrix = PoiDistanceMatrix{};

  std::vector<int> nodes;
  nodes.reserve(pois.size());
  for (const std::string& id : pois) {
    const int node = grid.poiIntersection(id);
    if (node < 0) {
      return Fail(outFailure, RouteError::UnmappedPoi, "POI '" + id + "' is not mapped to an intersection");
    }
    nodes.push_back(node);
  }

  const std::size_t k = pois.size();
  std::vector<double> cost(k * k, 0.0);

  for (std::size_t i = 0; i < k; ++i) {
    const ShortestPathTree tree = ComputeShortestPathTree(grid, nodes[i]);
    for (std::size_t j = 0; j < k; ++j) {
      if (i == j) continue;
      cost[i * k + j] = tree.dist[static_cast<std::size_t>(nodes[j])];
    }
  }

  outMatrix.m_pois = pois;
  outMatrix.m_intersections = std::move(nodes);
  outMatrix.m_cost = std::move(cost);
  outFailure.clear();
  return true;
}

} // namespace gridroute
