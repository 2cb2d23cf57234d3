#include "gridroute/GridPathfinding.hpp"
#include "gridroute/PathStitch.hpp"
#include "gridroute/PoiDistanceMatrix.hpp"
#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteError.hpp"
#include "gridroute/RouteStrategy.hpp"
#include "gridroute/TourHeuristics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define EXPECT_NEAR(a, b, eps)                                                                                        \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    const auto _e = (eps);                                                                                           \
    if (std::fabs((_a) - (_b)) > (_e)) {                                                                             \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_NEAR failed: " << #a << " ~= " << #b << " (eps=" << _e   \
                << ")\n";                                                                                            \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

namespace {

using namespace gridroute;

RoadGrid MakeGrid(int w, int h, double cell)
{
  RoadGrid grid;
  RouteFailure failure;
  if (!grid.build(w, h, cell, failure)) {
    std::cerr << "MakeGrid failed: " << DescribeFailure(failure) << "\n";
    std::exit(1);
  }
  return grid;
}

// Center depot with two opposite corners, cell 50.
RoadGrid MakeThreeByThreeScenario()
{
  RoadGrid grid = MakeGrid(3, 3, 50.0);
  grid.addPoi("center", 1, 1);
  grid.addPoi("a", 0, 0);
  grid.addPoi("b", 2, 2);
  return grid;
}

// One row, cell 10. Nearest neighbor is lured toward "a" first and pays for it.
RoadGrid MakeLineScenario()
{
  RoadGrid grid = MakeGrid(10, 1, 10.0);
  grid.addPoi("depot", 5, 0);
  grid.addPoi("a", 4, 0);
  grid.addPoi("b", 7, 0);
  grid.addPoi("c", 0, 0);
  return grid;
}

bool IsValidPath(const RoadGrid& grid, const std::vector<int>& path, double* outWeight)
{
  double total = 0.0;
  for (std::size_t i = 1; i < path.size(); ++i) {
    const RoadSegment* seg = grid.findSegment(path[i - 1], path[i]);
    if (!seg || !seg->passable) return false;
    if (!grid.isPassable(path[i])) return false;
    total += seg->weight;
  }
  if (outWeight) *outWeight = total;
  return true;
}

bool HasConsecutiveDuplicates(const std::vector<int>& path)
{
  return std::adjacent_find(path.begin(), path.end()) != path.end();
}

void TestBuildRejectsInvalidDimensions()
{
  RoadGrid grid;
  RouteFailure failure;

  EXPECT_FALSE(grid.build(0, 5, 50.0, failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);
  EXPECT_TRUE(grid.empty());

  failure.clear();
  EXPECT_FALSE(grid.build(4, -1, 50.0, failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);

  failure.clear();
  EXPECT_FALSE(grid.build(100000, 100000, 50.0, failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);
  EXPECT_TRUE(grid.empty());

  failure.clear();
  EXPECT_FALSE(grid.build(4001, 4000, 50.0, failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);

  failure.clear();
  EXPECT_FALSE(grid.build(4, 4, 0.0, failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);

  failure.clear();
  EXPECT_FALSE(grid.build(4, 4, std::nan(""), failure));
  EXPECT_EQ(failure.error, RouteError::InvalidDimension);

  failure.clear();
  EXPECT_TRUE(grid.build(4, 3, 25.0, failure));
  EXPECT_FALSE(failure.failed());
  EXPECT_EQ(grid.intersectionCount(), 12);
  EXPECT_EQ(std::string(RouteErrorName(RouteError::InvalidDimension)), std::string("invalid_dimension"));
}

void TestIntersectionGeometry()
{
  const RoadGrid grid = MakeGrid(4, 3, 50.0);

  const int id = grid.intersectionId(2, 1);
  ASSERT_TRUE(grid.validId(id));
  EXPECT_EQ(grid.coordsOf(id).x, 2);
  EXPECT_EQ(grid.coordsOf(id).y, 1);
  EXPECT_NEAR(grid.intersection(id).pixelX, 125.0, 1e-9);
  EXPECT_NEAR(grid.intersection(id).pixelY, 75.0, 1e-9);
  EXPECT_EQ(grid.intersectionId(4, 0), -1);
  EXPECT_EQ(grid.intersectionId(0, -1), -1);

  double minX = -1.0;
  double minY = -1.0;
  double maxX = 0.0;
  double maxY = 0.0;
  grid.boundsPx(minX, minY, maxX, maxY);
  EXPECT_NEAR(minX, 0.0, 1e-9);
  EXPECT_NEAR(minY, 0.0, 1e-9);
  EXPECT_NEAR(maxX, 200.0, 1e-9);
  EXPECT_NEAR(maxY, 150.0, 1e-9);

  EXPECT_EQ(IntersectionName(grid, id), std::string("grid_2_1"));
  int parsed = -1;
  EXPECT_TRUE(ParseIntersectionName(grid, "grid_2_1", parsed));
  EXPECT_EQ(parsed, id);
  EXPECT_FALSE(ParseIntersectionName(grid, "grid_9_9", parsed));
  EXPECT_FALSE(ParseIntersectionName(grid, "grid_1", parsed));
  EXPECT_FALSE(ParseIntersectionName(grid, "house_1", parsed));
}

void TestNeighborCountsByPosition()
{
  const RoadGrid grid = MakeGrid(4, 4, 50.0);

  EXPECT_EQ(grid.neighbors(grid.intersectionId(1, 1)).size(), static_cast<std::size_t>(4));
  EXPECT_EQ(grid.neighbors(grid.intersectionId(2, 2)).size(), static_cast<std::size_t>(4));
  EXPECT_EQ(grid.neighbors(grid.intersectionId(1, 0)).size(), static_cast<std::size_t>(3));
  EXPECT_EQ(grid.neighbors(grid.intersectionId(0, 2)).size(), static_cast<std::size_t>(3));
  EXPECT_EQ(grid.neighbors(grid.intersectionId(0, 0)).size(), static_cast<std::size_t>(2));
  EXPECT_EQ(grid.neighbors(grid.intersectionId(3, 3)).size(), static_cast<std::size_t>(2));

  // 4x4 => 2 * (3*4 + 4*3) directed segments.
  EXPECT_EQ(grid.segmentCount(), 48);

  // Deterministic N, E, S, W order.
  const std::vector<GridNeighbor> nb = grid.neighbors(grid.intersectionId(1, 1));
  ASSERT_TRUE(nb.size() == 4);
  EXPECT_EQ(nb[0].id, grid.intersectionId(1, 0));
  EXPECT_EQ(nb[1].id, grid.intersectionId(2, 1));
  EXPECT_EQ(nb[2].id, grid.intersectionId(1, 2));
  EXPECT_EQ(nb[3].id, grid.intersectionId(0, 1));
  EXPECT_NEAR(nb[0].weight, 50.0, 1e-9);
}

void TestPoiMappingClampsAndOverwrites()
{
  RoadGrid grid = MakeGrid(3, 3, 50.0);

  EXPECT_EQ(grid.addPoi("far", -5, 99), grid.intersectionId(0, 2));
  EXPECT_EQ(grid.addPoi("east", 7, 1), grid.intersectionId(2, 1));
  EXPECT_EQ(grid.poiIntersection("far"), grid.intersectionId(0, 2));

  grid.addPoi("far", 1, 1);
  EXPECT_EQ(grid.poiIntersection("far"), grid.intersectionId(1, 1));
  EXPECT_EQ(grid.pois().size(), static_cast<std::size_t>(2));

  EXPECT_EQ(grid.poiIntersection("missing"), -1);
  EXPECT_FALSE(grid.hasPoi("missing"));

  RoadGrid empty;
  EXPECT_EQ(empty.addPoi("x", 0, 0), -1);
}

void TestDistancesSymmetricWithoutBlocks()
{
  const RoadGrid grid = MakeGrid(6, 5, 40.0);

  const int ids[] = {
      grid.intersectionId(0, 0), grid.intersectionId(5, 4), grid.intersectionId(2, 3),
      grid.intersectionId(4, 1), grid.intersectionId(3, 3),
  };
  for (const int a : ids) {
    for (const int b : ids) {
      const double ab = GridDistance(grid, a, b);
      const double ba = GridDistance(grid, b, a);
      EXPECT_NEAR(ab, ba, 1e-9);

      const Point pa = grid.coordsOf(a);
      const Point pb = grid.coordsOf(b);
      const double manhattan = 40.0 * (std::abs(pa.x - pb.x) + std::abs(pa.y - pb.y));
      EXPECT_NEAR(ab, manhattan, 1e-9);
    }
  }
  EXPECT_NEAR(GridDistance(grid, ids[2], ids[2]), 0.0, 1e-12);
}

void TestFindGridPathIsValidAndShortest()
{
  RoadGrid grid = MakeGrid(5, 5, 50.0);
  // Wall on column 2 with a gap at the bottom.
  for (int y = 0; y < 4; ++y) grid.blockIntersection(grid.intersectionId(2, y));

  const int from = grid.intersectionId(0, 0);
  const int to = grid.intersectionId(4, 0);

  std::vector<int> path;
  double dist = 0.0;
  ASSERT_TRUE(FindGridPath(grid, from, to, path, &dist));
  ASSERT_TRUE(!path.empty());
  EXPECT_EQ(path.front(), from);
  EXPECT_EQ(path.back(), to);
  EXPECT_FALSE(HasConsecutiveDuplicates(path));

  double weight = 0.0;
  EXPECT_TRUE(IsValidPath(grid, path, &weight));
  EXPECT_NEAR(weight, dist, 1e-9);
  EXPECT_NEAR(dist, GridDistance(grid, from, to), 1e-9);

  // Down 4, across 4, up 4.
  EXPECT_NEAR(dist, 12 * 50.0, 1e-9);
  EXPECT_EQ(path.size(), static_cast<std::size_t>(13));

  std::vector<int> self;
  EXPECT_TRUE(FindGridPath(grid, from, from, self));
  EXPECT_EQ(self.size(), static_cast<std::size_t>(1));
}

void TestShortestPathTreeReconstruct()
{
  const RoadGrid grid = MakeGrid(3, 3, 10.0);
  const int src = grid.intersectionId(0, 0);
  const ShortestPathTree tree = ComputeShortestPathTree(grid, src);

  EXPECT_EQ(tree.source, src);
  EXPECT_NEAR(tree.dist[static_cast<std::size_t>(grid.intersectionId(2, 2))], 40.0, 1e-9);

  const std::vector<int> p = ReconstructPath(tree, grid.intersectionId(2, 1));
  ASSERT_TRUE(p.size() == 4);
  EXPECT_EQ(p.front(), src);
  EXPECT_EQ(p.back(), grid.intersectionId(2, 1));
  EXPECT_TRUE(IsValidPath(grid, p, nullptr));
}

void TestBlockingIsolatesIntersection()
{
  RoadGrid grid = MakeThreeByThreeScenario();
  const int c = grid.intersectionId(1, 1);

  for (const GridNeighbor& nb : grid.neighbors(c)) {
    EXPECT_TRUE(grid.blockRoad(c, nb.id));
  }
  EXPECT_TRUE(grid.neighbors(c).empty());
  EXPECT_FALSE(IsReachable(GridDistance(grid, grid.intersectionId(0, 0), c)));
  EXPECT_FALSE(IsReachable(GridDistance(grid, c, grid.intersectionId(2, 2))));

  std::vector<int> path;
  EXPECT_FALSE(FindGridPath(grid, grid.intersectionId(0, 0), c, path));
  EXPECT_TRUE(path.empty());

  OptimizedRoute route;
  RouteFailure failure;
  EXPECT_FALSE(OptimizeRoute(grid, "a", {"center", "b"}, "nearest_neighbor", route, failure));
  EXPECT_EQ(failure.error, RouteError::Unreachable);
  EXPECT_TRUE(route.poiPath.empty());

  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "a", {"center", "b"}, "2opt", route, failure));
  EXPECT_EQ(failure.error, RouteError::Unreachable);

  // Unblocking restores the original distance.
  for (const int nb : {grid.intersectionId(1, 0), grid.intersectionId(2, 1), grid.intersectionId(1, 2),
                       grid.intersectionId(0, 1)}) {
    EXPECT_TRUE(grid.unblockRoad(c, nb));
  }
  EXPECT_NEAR(GridDistance(grid, grid.intersectionId(0, 0), c), 100.0, 1e-9);

  // Non-adjacent pairs are rejected.
  EXPECT_FALSE(grid.blockRoad(grid.intersectionId(0, 0), grid.intersectionId(2, 2)));
}

void TestBlockedIntersectionForcesDetour()
{
  RoadGrid grid = MakeGrid(3, 3, 50.0);
  const int west = grid.intersectionId(0, 1);
  const int east = grid.intersectionId(2, 1);
  EXPECT_NEAR(GridDistance(grid, west, east), 100.0, 1e-9);

  EXPECT_TRUE(grid.blockIntersection(grid.intersectionId(1, 1)));
  EXPECT_FALSE(grid.isPassable(grid.intersectionId(1, 1)));
  EXPECT_NEAR(GridDistance(grid, west, east), 200.0, 1e-9);

  std::vector<int> path;
  ASSERT_TRUE(FindGridPath(grid, west, east, path));
  EXPECT_TRUE(std::find(path.begin(), path.end(), grid.intersectionId(1, 1)) == path.end());

  EXPECT_TRUE(grid.unblockIntersection(grid.intersectionId(1, 1)));
  EXPECT_TRUE(grid.isPassable(grid.intersectionId(1, 1)));
  EXPECT_NEAR(GridDistance(grid, west, east), 100.0, 1e-9);
  EXPECT_FALSE(grid.unblockIntersection(-1));
}

void TestOneWayBlockIsDirectional()
{
  RoadGrid grid = MakeGrid(3, 1, 10.0);
  const int a = grid.intersectionId(0, 0);
  const int b = grid.intersectionId(1, 0);

  EXPECT_TRUE(grid.blockSegment(a, b));
  const RoadSegment* ab = grid.findSegment(a, b);
  const RoadSegment* ba = grid.findSegment(b, a);
  ASSERT_TRUE(ab != nullptr && ba != nullptr);
  EXPECT_FALSE(ab->passable);
  EXPECT_TRUE(ba->passable);

  EXPECT_FALSE(IsReachable(GridDistance(grid, a, b)));
  EXPECT_NEAR(GridDistance(grid, b, a), 10.0, 1e-9);

  EXPECT_TRUE(grid.unblockSegment(a, b));
  EXPECT_TRUE(grid.findSegment(a, b)->passable);
  EXPECT_NEAR(GridDistance(grid, a, b), 10.0, 1e-9);
  EXPECT_FALSE(grid.unblockSegment(a, grid.intersectionId(2, 0)));
}

void TestDistanceMatrix()
{
  const RoadGrid grid = MakeThreeByThreeScenario();

  PoiDistanceMatrix m;
  RouteFailure failure;
  ASSERT_TRUE(BuildPoiDistanceMatrix(grid, {"center", "a", "b"}, m, failure));
  EXPECT_EQ(m.size(), 3);
  EXPECT_EQ(m.indexOf("b"), 2);
  EXPECT_EQ(m.indexOf("zzz"), -1);

  for (int i = 0; i < m.size(); ++i) EXPECT_NEAR(m.at(i, i), 0.0, 1e-12);
  EXPECT_NEAR(m.distance("center", "a"), 100.0, 1e-9);
  EXPECT_NEAR(m.distance("center", "b"), 100.0, 1e-9);
  EXPECT_NEAR(m.distance("a", "b"), 200.0, 1e-9);
  EXPECT_NEAR(m.distance("b", "a"), 200.0, 1e-9);

  PoiDistanceMatrix bad;
  EXPECT_FALSE(BuildPoiDistanceMatrix(grid, {"center", "ghost"}, bad, failure));
  EXPECT_EQ(failure.error, RouteError::UnmappedPoi);
}

void TestNearestNeighborTieBreaksByInputOrder()
{
  const RoadGrid grid = MakeThreeByThreeScenario();

  PoiDistanceMatrix m;
  RouteFailure failure;
  ASSERT_TRUE(BuildPoiDistanceMatrix(grid, {"center", "b", "a"}, m, failure));

  // center -> a and center -> b tie at 100: the first listed destination wins.
  const std::vector<int> order = BuildNearestNeighborTour(m, 0, {1, 2});
  ASSERT_TRUE(order.size() == 3);
  EXPECT_EQ(order[0], 0);
  EXPECT_EQ(order[1], 1);
  EXPECT_EQ(order[2], 2);
  EXPECT_NEAR(TourCost(m, order), 300.0, 1e-9);
}

void TestThreeByThreeScenarioTotals()
{
  const RoadGrid grid = MakeThreeByThreeScenario();

  for (const char* strategy : {"nearest_neighbor", "2opt"}) {
    OptimizedRoute route;
    RouteFailure failure;
    ASSERT_TRUE(OptimizeRoute(grid, "center", {"a", "b"}, strategy, route, failure));
    EXPECT_FALSE(failure.failed());

    EXPECT_NEAR(route.totalDistance, 300.0, 1e-9);
    ASSERT_TRUE(route.poiPath.size() == 3);
    EXPECT_EQ(route.poiPath[0], std::string("center"));
    EXPECT_EQ(route.poiPath[1], std::string("a"));
    EXPECT_EQ(route.poiPath[2], std::string("b"));

    // center->a (3 nodes) + a->b (5 nodes, first shared).
    EXPECT_EQ(route.fullPath.size(), static_cast<std::size_t>(7));
    EXPECT_EQ(route.fullPath.front(), grid.poiIntersection("center"));
    EXPECT_EQ(route.fullPath.back(), grid.poiIntersection("b"));
    EXPECT_FALSE(HasConsecutiveDuplicates(route.fullPath));

    double weight = 0.0;
    EXPECT_TRUE(IsValidPath(grid, route.fullPath, &weight));
    EXPECT_NEAR(weight, route.totalDistance, 1e-9);
  }
}

void TestTwoOptImprovesOnNearestNeighbor()
{
  const RoadGrid grid = MakeLineScenario();
  const std::vector<std::string> dests = {"a", "b", "c"};

  OptimizedRoute nn;
  OptimizedRoute opt;
  RouteFailure failure;
  ASSERT_TRUE(OptimizeRoute(grid, "depot", dests, "nearest_neighbor", nn, failure));
  ASSERT_TRUE(OptimizeRoute(grid, "depot", dests, "2opt", opt, failure));

  EXPECT_EQ(nn.algorithmName, std::string("TSP Nearest Neighbor"));
  EXPECT_EQ(nn.iterations, 0);
  EXPECT_NEAR(nn.totalDistance, 110.0, 1e-9);
  ASSERT_TRUE(nn.poiPath.size() == 4);
  EXPECT_EQ(nn.poiPath[1], std::string("a"));

  EXPECT_EQ(opt.algorithmName, std::string("TSP + 2-Opt Local Search"));
  EXPECT_NEAR(opt.totalDistance, 90.0, 1e-9);
  EXPECT_TRUE(opt.totalDistance <= nn.totalDistance);
  ASSERT_TRUE(opt.poiPath.size() == 4);
  EXPECT_EQ(opt.poiPath[0], std::string("depot"));
  EXPECT_EQ(opt.poiPath[1], std::string("b"));
  EXPECT_EQ(opt.poiPath[2], std::string("a"));
  EXPECT_EQ(opt.poiPath[3], std::string("c"));

  // One improving round plus the round that confirms the local optimum.
  EXPECT_EQ(opt.iterations, 2);
}

void TestTwoOptRespectsIterationCap()
{
  const RoadGrid grid = MakeLineScenario();

  PoiDistanceMatrix m;
  RouteFailure failure;
  ASSERT_TRUE(BuildPoiDistanceMatrix(grid, {"depot", "a", "b", "c"}, m, failure));

  const std::vector<int> nn = BuildNearestNeighborTour(m, 0, {1, 2, 3});
  EXPECT_NEAR(TourCost(m, nn), 110.0, 1e-9);

  const TwoOptResult one = ImproveTourTwoOpt(m, nn, 1);
  EXPECT_EQ(one.iterations, 1);
  EXPECT_NEAR(one.cost, 90.0, 1e-9);
  EXPECT_NEAR(TourCost(m, one.order), one.cost, 1e-9);
  EXPECT_EQ(one.order.front(), 0);

  // Too short to reverse anything: a single empty round.
  const TwoOptResult tiny = ImproveTourTwoOpt(m, {0, 1, 2}, 50);
  EXPECT_EQ(tiny.iterations, 1);

  const TwoOptResult none = ImproveTourTwoOpt(m, nn, 0);
  EXPECT_EQ(none.iterations, 0);
  EXPECT_TRUE(none.order == nn);
}

void TestTourVisitsEveryDestinationOnce()
{
  RoadGrid grid = MakeGrid(8, 6, 30.0);
  grid.addPoi("depot", 0, 0);
  const std::vector<std::string> dests = {"h1", "h2", "h3", "h4", "h5", "h6"};
  const int coords[][2] = {{7, 5}, {3, 2}, {6, 0}, {1, 4}, {4, 4}, {2, 1}};
  for (std::size_t i = 0; i < dests.size(); ++i) grid.addPoi(dests[i], coords[i][0], coords[i][1]);

  grid.blockRoad(grid.intersectionId(3, 2), grid.intersectionId(4, 2));
  grid.blockIntersection(grid.intersectionId(5, 3));

  double nnTotal = 0.0;
  double twoOptTotal = 0.0;
  for (const char* strategy : {"nearest_neighbor", "2opt"}) {
    OptimizedRoute route;
    RouteFailure failure;
    ASSERT_TRUE(OptimizeRoute(grid, "depot", dests, strategy, route, failure));
    (std::string(strategy) == "2opt" ? twoOptTotal : nnTotal) = route.totalDistance;

    ASSERT_TRUE(route.poiPath.size() == dests.size() + 1);
    EXPECT_EQ(route.poiPath.front(), std::string("depot"));
    for (const std::string& d : dests) {
      EXPECT_EQ(std::count(route.poiPath.begin(), route.poiPath.end(), d), 1);
    }

    EXPECT_FALSE(HasConsecutiveDuplicates(route.fullPath));
    double weight = 0.0;
    EXPECT_TRUE(IsValidPath(grid, route.fullPath, &weight));
    EXPECT_NEAR(weight, route.totalDistance, 1e-6);
  }

  EXPECT_TRUE(twoOptTotal <= nnTotal + 1e-9);
}

void TestOptimizerInputErrors()
{
  const RoadGrid grid = MakeThreeByThreeScenario();
  OptimizedRoute route;
  RouteFailure failure;

  EXPECT_FALSE(OptimizeRoute(grid, "center", {}, "nearest_neighbor", route, failure));
  EXPECT_EQ(failure.error, RouteError::EmptyDestinations);

  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "center", {"center"}, "2opt", route, failure));
  EXPECT_EQ(failure.error, RouteError::EmptyDestinations);

  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "center", {"a"}, "simulated_annealing", route, failure));
  EXPECT_EQ(failure.error, RouteError::UnknownStrategy);
  EXPECT_TRUE(failure.message.find("nearest_neighbor") != std::string::npos);
  EXPECT_TRUE(failure.message.find("2opt") != std::string::npos);

  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "center", {"a", "ghost"}, "nearest_neighbor", route, failure));
  EXPECT_EQ(failure.error, RouteError::UnmappedPoi);
  EXPECT_TRUE(failure.message.find("ghost") != std::string::npos);

  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "nowhere", {"a"}, "nearest_neighbor", route, failure));
  EXPECT_EQ(failure.error, RouteError::UnmappedPoi);

  // Duplicates and the start itself are dropped.
  failure.clear();
  ASSERT_TRUE(OptimizeRoute(grid, "center", {"a", "center", "a", "b"}, "nearest_neighbor", route, failure));
  EXPECT_EQ(route.poiPath.size(), static_cast<std::size_t>(3));
  EXPECT_NEAR(route.totalDistance, 300.0, 1e-9);
}

// Visits destinations exactly as given.
class InputOrderStrategy final : public RouteStrategy {
public:
  const char* algorithmName() const override { return "Input Order"; }

  bool optimize(const RoadGrid& grid, const std::string& startPoi, const std::vector<std::string>& destinationPois,
                OptimizedRoute& outRoute, RouteFailure& outFailure) const override
  {
    OptimizedRoute route;
    route.poiPath.push_back(startPoi);
    route.poiPath.insert(route.poiPath.end(), destinationPois.begin(), destinationPois.end());
    if (!StitchTourPath(grid, route.poiPath, route.fullPath, route.totalDistance, outFailure)) return false;
    route.algorithmName = algorithmName();
    outRoute = route;
    return true;
  }
};

void TestRegistryAcceptsCustomStrategy()
{
  RouteStrategyRegistry reg = RouteStrategyRegistry::WithBuiltins();
  EXPECT_EQ(reg.names().size(), static_cast<std::size_t>(2));
  EXPECT_TRUE(reg.contains("nearest_neighbor"));
  EXPECT_TRUE(reg.contains("2opt"));
  EXPECT_TRUE(reg.create("nope", RouteOptimizeConfig{}) == nullptr);

  reg.registerStrategy("input_order", [](const RouteOptimizeConfig&) -> std::unique_ptr<RouteStrategy> {
    return std::make_unique<InputOrderStrategy>();
  });
  ASSERT_TRUE(reg.names().size() == 3);
  EXPECT_EQ(reg.names()[2], std::string("input_order"));

  const RouteOptimizer optimizer(reg);
  const RoadGrid grid = MakeThreeByThreeScenario();

  OptimizedRoute route;
  RouteFailure failure;
  ASSERT_TRUE(optimizer.optimize(grid, "a", {"b", "center"}, "input_order", route, failure));
  EXPECT_EQ(route.algorithmName, std::string("Input Order"));
  ASSERT_TRUE(route.poiPath.size() == 3);
  EXPECT_EQ(route.poiPath[1], std::string("b"));
  EXPECT_NEAR(route.totalDistance, 300.0, 1e-9);

  // Optimizers built from separate registries do not see each other's entries.
  failure.clear();
  EXPECT_FALSE(OptimizeRoute(grid, "a", {"b"}, "input_order", route, failure));
  EXPECT_EQ(failure.error, RouteError::UnknownStrategy);
}

void TestRegistryPassesConfigToFactory()
{
  RouteOptimizeConfig cfg;
  cfg.maxIterations = 1;
  const RouteOptimizer optimizer(RouteStrategyRegistry::WithBuiltins(), cfg);

  const RoadGrid grid = MakeLineScenario();
  OptimizedRoute route;
  RouteFailure failure;
  ASSERT_TRUE(optimizer.optimize(grid, "depot", {"a", "b", "c"}, "2opt", route, failure));
  EXPECT_EQ(route.iterations, 1);
  EXPECT_NEAR(route.totalDistance, 90.0, 1e-9);
}

void TestStitchReportsUnreachablePair()
{
  RoadGrid grid = MakeGrid(3, 1, 10.0);
  grid.addPoi("left", 0, 0);
  grid.addPoi("right", 2, 0);
  grid.blockIntersection(grid.intersectionId(1, 0));

  std::vector<int> path;
  double dist = 0.0;
  RouteFailure failure;
  EXPECT_FALSE(StitchTourPath(grid, {"left", "right"}, path, dist, failure));
  EXPECT_EQ(failure.error, RouteError::Unreachable);
  EXPECT_TRUE(failure.message.find("left") != std::string::npos);
  EXPECT_TRUE(failure.message.find("right") != std::string::npos);

  failure.clear();
  EXPECT_FALSE(StitchTourPath(grid, {"left", "ghost"}, path, dist, failure));
  EXPECT_EQ(failure.error, RouteError::UnmappedPoi);
}

} // namespace

int main()
{
  TestBuildRejectsInvalidDimensions();
  TestIntersectionGeometry();
  TestNeighborCountsByPosition();
  TestPoiMappingClampsAndOverwrites();
  TestDistancesSymmetricWithoutBlocks();
  TestFindGridPathIsValidAndShortest();
  TestShortestPathTreeReconstruct();
  TestBlockingIsolatesIntersection();
  TestBlockedIntersectionForcesDetour();
  TestOneWayBlockIsDirectional();
  TestDistanceMatrix();
  TestNearestNeighborTieBreaksByInputOrder();
  TestThreeByThreeScenarioTotals();
  TestTwoOptImprovesOnNearestNeighbor();
  TestTwoOptRespectsIterationCap();
  TestTourVisitsEveryDestinationOnce();
  TestOptimizerInputErrors();
  TestRegistryAcceptsCustomStrategy();
  TestRegistryPassesConfigToFactory();
  TestStitchReportsUnreachablePair();

  if (g_failures == 0) {
    std::cout << "gridroute_tests: OK\n";
    return 0;
  }

  std::cerr << "gridroute_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
