#pragma once

#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteError.hpp"
#include "gridroute/TourHeuristics.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridroute {

// Result of one optimization run. Produced whole or not at all.
struct OptimizedRoute {
  std::vector<std::string> poiPath; // visiting order, starts with the start POI
  std::vector<int> fullPath;        // intersection ids traversed, no consecutive duplicates
  double totalDistance = 0.0;       // sum of the stitched segment distances
  std::string algorithmName;
  int iterations = 0;               // 2-opt rounds (0 for pure construction)
};

struct RouteOptimizeConfig {
  // Round cap for local-search strategies.
  int maxIterations = kDefaultTwoOptMaxIterations;
};

// A tour-building algorithm.
//
// Implementations receive a start POI and a non-empty, duplicate-free list of
// destinations (RouteOptimizer normalizes the input before dispatching).
class RouteStrategy {
public:
  virtual ~RouteStrategy() = default;

  virtual const char* algorithmName() const = 0;

  virtual bool optimize(const RoadGrid& grid, const std::string& startPoi,
                        const std::vector<std::string>& destinationPois, OptimizedRoute& outRoute,
                        RouteFailure& outFailure) const = 0;
};

class NearestNeighborStrategy final : public RouteStrategy {
public:
  const char* algorithmName() const override { return "TSP Nearest Neighbor"; }

  bool optimize(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                OptimizedRoute& outRoute, RouteFailure& outFailure) const override;
};

// Nearest neighbor followed by first-improvement 2-opt.
class TwoOptStrategy final : public RouteStrategy {
public:
  explicit TwoOptStrategy(int maxIterations = kDefaultTwoOptMaxIterations) : m_maxIterations(maxIterations) {}

  const char* algorithmName() const override { return "TSP + 2-Opt Local Search"; }
  int maxIterations() const { return m_maxIterations; }

  bool optimize(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                OptimizedRoute& outRoute, RouteFailure& outFailure) const override;

private:
  int m_maxIterations = kDefaultTwoOptMaxIterations;
};

// Name -> factory table for strategies.
//
// The registry is a plain value owned by whoever builds the optimizer; there is no
// process-wide instance. Names keep registration order for listings.
class RouteStrategyRegistry {
public:
  using Factory = std::function<std::unique_ptr<RouteStrategy>(const RouteOptimizeConfig&)>;

  // Registers or replaces `name`.
  void registerStrategy(const std::string& name, Factory fn);

  bool contains(const std::string& name) const { return m_factories.count(name) != 0; }

  // nullptr for unknown names.
  std::unique_ptr<RouteStrategy> create(const std::string& name, const RouteOptimizeConfig& cfg) const;

  const std::vector<std::string>& names() const { return m_order; }

  // "nearest_neighbor" and "2opt".
  static RouteStrategyRegistry WithBuiltins();

private:
  std::unordered_map<std::string, Factory> m_factories;
  std::vector<std::string> m_order;
};

// Dispatches optimization requests to registered strategies.
class RouteOptimizer {
public:
  explicit RouteOptimizer(RouteStrategyRegistry registry, RouteOptimizeConfig cfg = {});

  const RouteStrategyRegistry& registry() const { return m_registry; }
  const RouteOptimizeConfig& config() const { return m_cfg; }

  // Validates and normalizes the request, then runs the named strategy.
  //
  // Destinations are de-duplicated (first occurrence wins) and any entry equal to
  // the start POI is dropped. Failures: UnknownStrategy (message lists valid names),
  // EmptyDestinations, UnmappedPoi, Unreachable.
  bool optimize(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                const std::string& strategy, OptimizedRoute& outRoute, RouteFailure& outFailure) const;

private:
  RouteStrategyRegistry m_registry;
  RouteOptimizeConfig m_cfg;
};

// Convenience: optimize with the built-in registry and default config.
bool OptimizeRoute(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                   const std::string& strategy, OptimizedRoute& outRoute, RouteFailure& outFailure);

} // namespace gridroute
