#pragma once

#include "gridroute/PoiDistanceMatrix.hpp"

#include <vector>

namespace gridroute {

constexpr int kDefaultTwoOptMaxIterations = 1000;

// Open-tour cost of an order of matrix indices (sum of consecutive entries).
double TourCost(const PoiDistanceMatrix& matrix, const std::vector<int>& order);

// Greedy nearest-neighbor construction.
//
// Starts at `start` and repeatedly appends the unvisited destination closest to the
// last visited stop. Ties resolve to the earliest destination in input order.
// Unreachable candidates are still taken once nothing finite remains.
// Result size == destinations.size() + 1.
std::vector<int> BuildNearestNeighborTour(const PoiDistanceMatrix& matrix, int start,
                                          const std::vector<int>& destinations);

struct TwoOptResult {
  std::vector<int> order;
  double cost = 0.0;

  // Rounds executed, including the final round that found no improvement.
  int iterations = 0;
};

// First-improvement 2-opt over an open tour.
//
// Each round scans (i, j) with 1 <= i < j < n and j - i > 1, reverses [i, j) and
// keeps the first strictly cheaper order; the next round starts from the top.
// Position 0 never moves. Stops after a round without improvement or after
// maxIterations rounds (the best order so far is returned either way).
TwoOptResult ImproveTourTwoOpt(const PoiDistanceMatrix& matrix, std::vector<int> order,
                               int maxIterations = kDefaultTwoOptMaxIterations);

} // namespace gridroute
