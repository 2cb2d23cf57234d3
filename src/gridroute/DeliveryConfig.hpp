#pragma once

#include "gridroute/Json.hpp"
#include "gridroute/RoadGrid.hpp"
#include "gridroute/TourHeuristics.hpp"

#include <string>
#include <vector>

namespace gridroute {

// Delivery scenario loaded from JSON.
//
// Layout (snake_case keys):
//   {
//     "grid": {"width": 15, "height": 12, "cell_size": 50,
//              "blocked_roads": [["grid_3_4", "grid_4_4"], ...],
//              "blocked_intersections": ["grid_7_7", ...]},
//     "nodes": [{"id": "distribution_center", "grid_x": 1, "grid_y": 1,
//                "type": "distribution_center", "name": "Central depot"}, ...],
//     "delivery_addresses": ["house_1", ...],
//     "start": "distribution_center",
//     "strategy": "2opt",
//     "max_iterations": 1000
//   }
//
// "nodes" and "delivery_addresses" are required; everything else falls back to the
// defaults below. Blocked road endpoints may be intersection names (grid_x_y) or
// node ids.

struct DeliveryNode {
  std::string id;
  int gridX = 0;
  int gridY = 0;
  std::string type;
  std::string name;
};

struct BlockedRoad {
  std::string from;
  std::string to;
};

struct GridSettings {
  int width = 15;
  int height = 12;
  double cellSize = 50.0;

  std::vector<BlockedRoad> blockedRoads;
  std::vector<std::string> blockedIntersections;
};

struct DeliveryConfig {
  GridSettings grid;
  std::vector<DeliveryNode> nodes;
  std::vector<std::string> deliveryAddresses;

  std::string startPoi = "distribution_center";
  std::string strategy = "nearest_neighbor";
  int maxIterations = kDefaultTwoOptMaxIterations;
};

// nullptr when no node has that id.
const DeliveryNode* FindDeliveryNode(const std::vector<DeliveryNode>& nodes, const std::string& id);
const DeliveryNode* FindDeliveryNode(const DeliveryConfig& cfg, const std::string& id);

// Parse a full scenario. Reports missing required keys and type mismatches.
bool ParseDeliveryConfigJson(const JsonValue& root, DeliveryConfig& outCfg, std::string& outError);

bool LoadDeliveryConfigJsonFile(const std::string& path, DeliveryConfig& outCfg, std::string& outError);

// Build the road grid for a scenario: dimensions, node POI mappings (clamped into
// bounds), then blocked roads (both directions) and blocked intersections.
bool BuildRoadGridFromConfig(const DeliveryConfig& cfg, RoadGrid& outGrid, std::string& outError);

// Resolve a blocked-road endpoint: grid_x_y name first, then a mapped POI id.
bool ResolveGridEndpoint(const RoadGrid& grid, const std::string& ref, int& outId);

} // namespace gridroute
