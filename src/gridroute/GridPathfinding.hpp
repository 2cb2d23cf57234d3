#pragma once

#include "gridroute/RoadGrid.hpp"

#include <limits>
#include <vector>

namespace gridroute {

constexpr double kUnreachable = std::numeric_limits<double>::infinity();

inline bool IsReachable(double distance) { return distance < kUnreachable; }

// Single-source shortest paths over the passable part of a RoadGrid.
struct ShortestPathTree {
  int source = -1;

  // Parallel to grid intersections. dist == kUnreachable for nodes never reached,
  // prev == -1 for the source and unreached nodes.
  std::vector<double> dist;
  std::vector<int> prev;
};

// Dijkstra with a binary heap (all segment weights are non-negative).
//
// stopAt >= 0 stops as soon as that intersection is settled; its distance and
// predecessor chain are final at that point. stopAt < 0 runs until the queue is
// exhausted. An invalid source yields an empty tree.
ShortestPathTree ComputeShortestPathTree(const RoadGrid& grid, int source, int stopAt = -1);

// Walk prev pointers back from target. Empty when target was not reached.
std::vector<int> ReconstructPath(const ShortestPathTree& tree, int target);

// Shortest cumulative weight from -> to. Returns kUnreachable when no path exists
// (including invalid ids); this is an expected outcome, not an error.
double GridDistance(const RoadGrid& grid, int from, int to);

// Find a shortest path (inclusive of both endpoints).
//
// Returns true and fills outPath when a path exists; otherwise outPath is cleared.
// outDistance (if non-null) receives the path weight, or kUnreachable.
bool FindGridPath(const RoadGrid& grid, int from, int to, std::vector<int>& outPath, double* outDistance = nullptr);

} // namespace gridroute
