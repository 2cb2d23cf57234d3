#pragma once

#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteError.hpp"

#include <string>
#include <vector>

namespace gridroute {

// Pairwise shortest-path costs between an ordered list of POIs.
//
// Row/column i corresponds to pois()[i]. The diagonal is 0 and unreachable pairs
// hold kUnreachable. A matrix is a snapshot: it is not updated when the grid's
// blocking state changes afterwards.
class PoiDistanceMatrix {
public:
  PoiDistanceMatrix() = default;

  int size() const { return static_cast<int>(m_pois.size()); }
  const std::vector<std::string>& pois() const { return m_pois; }
  const std::vector<int>& intersections() const { return m_intersections; }

  // -1 when poiId is not part of the matrix.
  int indexOf(const std::string& poiId) const;

  double at(int from, int to) const { return m_cost[static_cast<std::size_t>(from * size() + to)]; }

  // Lookup by id; kUnreachable when either id is unknown.
  double distance(const std::string& fromPoi, const std::string& toPoi) const;

private:
  friend bool BuildPoiDistanceMatrix(const RoadGrid& grid, const std::vector<std::string>& pois,
                                     PoiDistanceMatrix& outMatrix, RouteFailure& outFailure);

  std::vector<std::string> m_pois;
  std::vector<int> m_intersections;
  std::vector<double> m_cost; // size()*size(), row-major
};

// Compute the matrix against the grid's current passability.
//
// One shortest-path tree is grown per source POI. Fails with UnmappedPoi when a POI
// has no intersection mapping (outMatrix is left empty).
bool BuildPoiDistanceMatrix(const RoadGrid& grid, const std::vector<std::string>& pois,
                            PoiDistanceMatrix& outMatrix, RouteFailure& outFailure);

} // namespace gridroute
