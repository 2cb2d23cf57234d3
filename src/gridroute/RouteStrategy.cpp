#include "gridroute/RouteStrategy.hpp"

#include "gridroute/PathStitch.hpp"
#include "gridroute/PoiDistanceMatrix.hpp"

#include <algorithm>
#include <utility>

namespace gridroute {

namespace {

struct TourInputs {
  PoiDistanceMatrix matrix;
  int start = 0;
  std::vector<int> destinations;
};

bool PrepareTourInputs(const RoadGrid& grid, const std::string& startPoi,
                       const std::vector<std::string>& destinationPois, TourInputs& out, RouteFailure& outFailure)
{
  std::vector<std::string> all;
  all.reserve(destinationPois.size() + 1);
  all.push_back(startPoi);
  all.insert(all.end(), destinationPois.begin(), destinationPois.end());

  if (!BuildPoiDistanceMatrix(grid, all, out.matrix, outFailure)) return false;

  out.start = 0;
  out.destinations.clear();
  for (int i = 1; i < out.matrix.size(); ++i) out.destinations.push_back(i);
  return true;
}

bool FinishRoute(const RoadGrid& grid, const PoiDistanceMatrix& matrix, const std::vector<int>& order,
                 const char* algorithmName, int iterations, OptimizedRoute& outRoute, RouteFailure& outFailure)
{
  OptimizedRoute route;
  route.poiPath.reserve(order.size());
  for (const int idx : order) route.poiPath.push_back(matrix.pois()[static_cast<std::size_t>(idx)]);

  if (!StitchTourPath(grid, route.poiPath, route.fullPath, route.totalDistance, outFailure)) return false;

  route.algorithmName = algorithmName;
  route.iterations = iterations;
  outRoute = std::move(route);
  return true;
}

} // namespace

bool NearestNeighborStrategy::optimize(const RoadGrid& grid, const std::string& startPoi,
                                       const std::vector<std::string>& destinationPois, OptimizedRoute& outRoute,
                                       RouteFailure& outFailure) const
{
  TourInputs in;
  if (!PrepareTourInputs(grid, startPoi, destinationPois, in, outFailure)) return false;

  const std::vector<int> order = BuildNearestNeighborTour(in.matrix, in.start, in.destinations);
  return FinishRoute(grid, in.matrix, order, algorithmName(), 0, outRoute, outFailure);
}

bool TwoOptStrategy::optimize(const RoadGrid& grid, const std::string& startPoi,
                              const std::vector<std::string>& destinationPois, OptimizedRoute& outRoute,
                              RouteFailure& outFailure) const
{
  TourInputs in;
  if (!PrepareTourInputs(grid, startPoi, destinationPois, in, outFailure)) return false;

  std::vector<int> order = BuildNearestNeighborTour(in.matrix, in.start, in.destinations);
  const TwoOptResult refined = ImproveTourTwoOpt(in.matrix, std::move(order), m_maxIterations);
  return FinishRoute(grid, in.matrix, refined.order, algorithmName(), refined.iterations, outRoute, outFailure);
}

void RouteStrategyRegistry::registerStrategy(const std::string& name, Factory fn)
{
  if (m_factories.count(name) == 0) m_order.push_back(name);
  m_factories[name] = std::move(fn);
}

std::unique_ptr<RouteStrategy> RouteStrategyRegistry::create(const std::string& name,
                                                             const RouteOptimizeConfig& cfg) const
{
  const auto it = m_factories.find(name);
  if (it == m_factories.end() || !it->second) return nullptr;
  return it->second(cfg);
}

RouteStrategyRegistry RouteStrategyRegistry::WithBuiltins()
{
  RouteStrategyRegistry reg;
  reg.registerStrategy("nearest_neighbor", [](const RouteOptimizeConfig&) -> std::unique_ptr<RouteStrategy> {
    return std::make_unique<NearestNeighborStrategy>();
  });
  reg.registerStrategy("2opt", [](const RouteOptimizeConfig& cfg) -> std::unique_ptr<RouteStrategy> {
    return std::make_unique<TwoOptStrategy>(cfg.maxIterations);
  });
  return reg;
}

RouteOptimizer::RouteOptimizer(RouteStrategyRegistry registry, RouteOptimizeConfig cfg)
    : m_registry(std::move(registry))
    , m_cfg(cfg)
{
}

bool RouteOptimizer::optimize(const RoadGrid& grid, const std::string& startPoi,
                              const std::vector<std::string>& destinationPois, const std::string& strategy,
                              OptimizedRoute& outRoute, RouteFailure& outFailure) const
{
  const std::unique_ptr<RouteStrategy> impl = m_registry.create(strategy, m_cfg);
  if (!impl) {
    std::string msg = "unknown strategy '" + strategy + "'. Available:";
    for (const std::string& n : m_registry.names()) msg += " " + n;
    return Fail(outFailure, RouteError::UnknownStrategy, msg);
  }

  std::vector<std::string> dests;
  dests.reserve(destinationPois.size());
  for (const std::string& d : destinationPois) {
    if (d == startPoi) continue;
    if (std::find(dests.begin(), dests.end(), d) != dests.end()) continue;
    dests.push_back(d);
  }

  if (dests.empty()) {
    return Fail(outFailure, RouteError::EmptyDestinations, "no destination POIs to visit from '" + startPoi + "'");
  }

  if (!grid.hasPoi(startPoi)) {
    return Fail(outFailure, RouteError::UnmappedPoi, "start POI '" + startPoi + "' is not mapped to an intersection");
  }

  if (!impl->optimize(grid, startPoi, dests, outRoute, outFailure)) return false;
  outFailure.clear();
  return true;
}

bool OptimizeRoute(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                   const std::string& strategy, OptimizedRoute& outRoute, RouteFailure& outFailure)
{
  const RouteOptimizer optimizer(RouteStrategyRegistry::WithBuiltins());
  return optimizer.optimize(grid, startPoi, destinationPois, strategy, outRoute, outFailure);
}

} // namespace gridroute
