#pragma once

#include "gridroute/RouteError.hpp"
#include "gridroute/Types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridroute {

// Fixed slot order for the (up to) four outgoing segments of an intersection.
// Neighbor enumeration always follows N, E, S, W so routing stays deterministic.
enum class GridDir : std::uint8_t {
  North = 0,
  East = 1,
  South = 2,
  West = 3,
};

constexpr int kGridDirCount = 4;

// Upper bound on width*height accepted by RoadGrid::build (e.g. 4000x4000).
constexpr std::int64_t kMaxGridIntersections = 16'000'000;

struct Intersection {
  Point grid{};

  // Pixel center, only used by renderers.
  double pixelX = 0.0;
  double pixelY = 0.0;

  bool passable = true;
};

// Directed road segment between two 4-adjacent intersections.
//
// Slots without a neighbor (map border) keep from/to == -1.
struct RoadSegment {
  int from = -1;
  int to = -1;
  double weight = 0.0;
  bool passable = true;

  bool exists() const { return to >= 0; }
};

struct GridNeighbor {
  int id = -1;
  double weight = 0.0;
};

struct PoiMapping {
  std::string poiId;
  int intersection = -1;
};

// Rectangular road network: width*height intersections connected to their
// horizontal/vertical neighbors by one directed segment per direction.
//
// Intersection ids are derived from coordinates (y * width + x) and never change
// after build(). Blocking state is mutated in place; callers must not mutate the
// grid while a routing query is running.
class RoadGrid {
public:
  RoadGrid() = default;

  // (Re)build the network. Fails with InvalidDimension for width/height <= 0, more
  // than kMaxGridIntersections intersections or a non-positive/non-finite cell size;
  // the grid is left empty in that case.
  bool build(int width, int height, double cellSize, RouteFailure& outFailure);

  int width() const { return m_w; }
  int height() const { return m_h; }
  double cellSize() const { return m_cellSize; }
  bool empty() const { return m_nodes.empty(); }

  int intersectionCount() const { return static_cast<int>(m_nodes.size()); }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }
  bool validId(int id) const { return id >= 0 && id < intersectionCount(); }

  // -1 when (x,y) is outside the grid.
  int intersectionId(int x, int y) const;
  Point coordsOf(int id) const;

  const Intersection& intersection(int id) const { return m_nodes[static_cast<std::size_t>(id)]; }
  bool isPassable(int id) const { return validId(id) && intersection(id).passable; }

  // Map a POI onto the grid. Out-of-range coordinates are clamped into bounds.
  // Re-adding an existing poiId overwrites its mapping.
  // Returns the assigned intersection id (-1 if the grid is empty).
  int addPoi(const std::string& poiId, int x, int y);

  // -1 when the POI is not mapped.
  int poiIntersection(const std::string& poiId) const;
  bool hasPoi(const std::string& poiId) const { return poiIntersection(poiId) >= 0; }

  // Mappings in first-insertion order.
  const std::vector<PoiMapping>& pois() const { return m_pois; }

  // Passable outgoing segments whose destination is passable, in N,E,S,W order.
  std::vector<GridNeighbor> neighbors(int id) const;

  // Allocation-free variant for hot loops (clears outNeighbors first).
  void neighbors(int id, std::vector<GridNeighbor>& outNeighbors) const;

  // nullptr when from/to are not adjacent (or invalid).
  const RoadSegment* findSegment(int from, int to) const;

  // Toggle one directed segment. Returns false when from/to are not adjacent.
  bool blockSegment(int from, int to) { return setSegmentPassable(from, to, false); }
  bool unblockSegment(int from, int to) { return setSegmentPassable(from, to, true); }

  // Toggle both directions of a road.
  bool blockRoad(int a, int b);
  bool unblockRoad(int a, int b);

  bool blockIntersection(int id) { return setIntersectionPassable(id, false); }
  bool unblockIntersection(int id) { return setIntersectionPassable(id, true); }

  // All segment slots, kGridDirCount per intersection (id * kGridDirCount + dir).
  const std::vector<RoadSegment>& segmentSlots() const { return m_segments; }

  // Number of existing directed segments.
  int segmentCount() const;

  // Pixel extent of the grid: (0, 0, width*cell, height*cell).
  void boundsPx(double& minX, double& minY, double& maxX, double& maxY) const;

private:
  RoadSegment* mutableSegment(int from, int to);
  bool setSegmentPassable(int from, int to, bool passable);
  bool setIntersectionPassable(int id, bool passable);

  int m_w = 0;
  int m_h = 0;
  double m_cellSize = 0.0;

  std::vector<Intersection> m_nodes;
  std::vector<RoadSegment> m_segments;
  std::vector<PoiMapping> m_pois;
};

// "grid_<x>_<y>"
std::string IntersectionName(const RoadGrid& grid, int id);

// Parse "grid_<x>_<y>" into an in-bounds intersection id.
bool ParseIntersectionName(const RoadGrid& grid, const std::string& name, int& outId);

} // namespace gridroute
