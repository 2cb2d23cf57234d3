#include "gridroute/TourHeuristics.hpp"

#include "gridroute/GridPathfinding.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace gridroute {

double TourCost(const PoiDistanceMatrix& matrix, const std::vector<int>& order)
{
  double total = 0.0;
  for (std::size_t i = 1; i < order.size(); ++i) {
    total += matrix.at(order[i - 1], order[i]);
  }
  return total;
}

std::vector<int> BuildNearestNeighborTour(const PoiDistanceMatrix& matrix, int start,
                                          const std::vector<int>& destinations)
{
  std::vector<int> path;
  path.reserve(destinations.size() + 1);
  path.push_back(start);

  std::vector<int> unvisited = destinations;
  int current = start;

  while (!unvisited.empty()) {
    std::size_t best = 0;
    double bestDist = kUnreachable;
    bool found = false;

    for (std::size_t i = 0; i < unvisited.size(); ++i) {
      const double d = matrix.at(current, unvisited[i]);
      if (!found || d < bestDist) {
        best = i;
        bestDist = d;
        found = true;
      }
    }

    current = unvisited[best];
    path.push_back(current);
    // erase (not swap-remove) keeps input order for later tie-breaks.
    unvisited.erase(unvisited.begin() + static_cast<std::ptrdiff_t>(best));
  }

  return path;
}

TwoOptResult ImproveTourTwoOpt(const PoiDistanceMatrix& matrix, std::vector<int> order, int maxIterations)
{
  TwoOptResult out;
  out.cost = TourCost(matrix, order);

  const std::size_t n = order.size();
  std::vector<int> candidate;
  candidate.reserve(n);

  bool improved = true;
  while (improved && out.iterations < maxIterations) {
    improved = false;
    ++out.iterations;

    for (std::size_t i = 1; i + 2 < n && !improved; ++i) {
      for (std::size_t j = i + 2; j < n; ++j) {
        candidate = order;
        std::reverse(candidate.begin() + static_cast<std::ptrdiff_t>(i),
                     candidate.begin() + static_cast<std::ptrdiff_t>(j));

        const double c = TourCost(matrix, candidate);
        if (c < out.cost) {
          order.swap(candidate);
          out.cost = c;
          improved = true;
          break;
        }
      }
    }
  }

  out.order = std::move(order);
  return out;
}

} // namespace gridroute
