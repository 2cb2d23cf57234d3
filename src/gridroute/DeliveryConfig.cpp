#include "gridroute/DeliveryConfig.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace gridroute {

namespace {

bool ApplyI32(const JsonValue& obj, const char* key, int& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true; // missing => keep default
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  const double d = v->numberValue;
  if (d < static_cast<double>(std::numeric_limits<int>::min()) ||
      d > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(std::lround(d));
  return true;
}

bool ApplyF64(const JsonValue& obj, const char* key, double& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isNumber() || !std::isfinite(v->numberValue)) {
    err = std::string("expected number for key '") + key + "'";
    return false;
  }
  io = v->numberValue;
  return true;
}

bool ApplyString(const JsonValue& obj, const char* key, std::string& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(obj, key);
  if (!v) return true;
  if (!v->isString()) {
    err = std::string("expected string for key '") + key + "'";
    return false;
  }
  io = v->stringValue;
  return true;
}

bool ReadStringList(const JsonValue& arr, const std::string& what, std::vector<std::string>& out, std::string& err)
{
  out.clear();
  for (std::size_t i = 0; i < arr.arrayValue.size(); ++i) {
    const JsonValue& item = arr.arrayValue[i];
    if (!item.isString()) {
      err = what + "[" + std::to_string(i) + "] must be a string";
      return false;
    }
    out.push_back(item.stringValue);
  }
  return true;
}

bool ParseNode(const JsonValue& v, std::size_t index, DeliveryNode& out, std::string& err)
{
  const std::string where = "nodes[" + std::to_string(index) + "]";
  if (!v.isObject()) {
    err = where + " must be an object";
    return false;
  }

  const JsonValue* id = FindJsonMember(v, "id");
  if (!id || !id->isString() || id->stringValue.empty()) {
    err = where + ": missing required string 'id'";
    return false;
  }
  out.id = id->stringValue;

  for (const char* k : {"grid_x", "grid_y"}) {
    if (!FindJsonMember(v, k)) {
      err = where + " ('" + out.id + "'): missing required key '" + k + "'";
      return false;
    }
  }

  std::string e;
  if (!ApplyI32(v, "grid_x", out.gridX, e) || !ApplyI32(v, "grid_y", out.gridY, e) ||
      !ApplyString(v, "type", out.type, e) || !ApplyString(v, "name", out.name, e)) {
    err = where + " ('" + out.id + "'): " + e;
    return false;
  }
  if (out.name.empty()) out.name = out.id;
  return true;
}

bool ParseGridSettings(const JsonValue& g, GridSettings& io, std::string& err)
{
  if (!g.isObject()) {
    err = "'grid' must be an object";
    return false;
  }

  if (!ApplyI32(g, "width", io.width, err)) return false;
  if (!ApplyI32(g, "height", io.height, err)) return false;
  if (!ApplyF64(g, "cell_size", io.cellSize, err)) return false;

  if (const JsonValue* roads = FindJsonMember(g, "blocked_roads")) {
    if (!roads->isArray()) {
      err = "'grid.blocked_roads' must be an array";
      return false;
    }
    io.blockedRoads.clear();
    for (std::size_t i = 0; i < roads->arrayValue.size(); ++i) {
      const JsonValue& pair = roads->arrayValue[i];
      if (!pair.isArray() || pair.arrayValue.size() != 2 || !pair.arrayValue[0].isString() ||
          !pair.arrayValue[1].isString()) {
        err = "grid.blocked_roads[" + std::to_string(i) + "] must be a [from, to] pair of strings";
        return false;
      }
      io.blockedRoads.push_back(BlockedRoad{pair.arrayValue[0].stringValue, pair.arrayValue[1].stringValue});
    }
  }

  if (const JsonValue* nodes = FindJsonMember(g, "blocked_intersections")) {
    if (!nodes->isArray()) {
      err = "'grid.blocked_intersections' must be an array";
      return false;
    }
    if (!ReadStringList(*nodes, "grid.blocked_intersections", io.blockedIntersections, err)) return false;
  }

  return true;
}

} // namespace

const DeliveryNode* FindDeliveryNode(const std::vector<DeliveryNode>& nodes, const std::string& id)
{
  for (const DeliveryNode& n : nodes) {
    if (n.id == id) return &n;
  }
  return nullptr;
}

const DeliveryNode* FindDeliveryNode(const DeliveryConfig& cfg, const std::string& id)
{
  return FindDeliveryNode(cfg.nodes, id);
}

bool ParseDeliveryConfigJson(const JsonValue& root, DeliveryConfig& outCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "config root must be a JSON object";
    return false;
  }

  DeliveryConfig cfg;

  const JsonValue* nodes = FindJsonMember(root, "nodes");
  if (!nodes) {
    outError = "missing required key 'nodes'";
    return false;
  }
  if (!nodes->isArray()) {
    outError = "'nodes' must be an array";
    return false;
  }

  const JsonValue* addresses = FindJsonMember(root, "delivery_addresses");
  if (!addresses) {
    outError = "missing required key 'delivery_addresses'";
    return false;
  }
  if (!addresses->isArray()) {
    outError = "'delivery_addresses' must be an array";
    return false;
  }

  for (std::size_t i = 0; i < nodes->arrayValue.size(); ++i) {
    DeliveryNode n;
    if (!ParseNode(nodes->arrayValue[i], i, n, outError)) return false;
    if (FindDeliveryNode(cfg, n.id)) {
      outError = "duplicate node id '" + n.id + "'";
      return false;
    }
    cfg.nodes.push_back(std::move(n));
  }

  if (!ReadStringList(*addresses, "delivery_addresses", cfg.deliveryAddresses, outError)) return false;

  if (const JsonValue* g = FindJsonMember(root, "grid")) {
    if (!ParseGridSettings(*g, cfg.grid, outError)) return false;
  }

  if (!ApplyString(root, "start", cfg.startPoi, outError)) return false;
  if (!ApplyString(root, "strategy", cfg.strategy, outError)) return false;
  if (!ApplyI32(root, "max_iterations", cfg.maxIterations, outError)) return false;
  if (cfg.maxIterations < 1) {
    outError = "'max_iterations' must be >= 1";
    return false;
  }

  outCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool LoadDeliveryConfigJsonFile(const std::string& path, DeliveryConfig& outCfg, std::string& outError)
{
  JsonValue root;
  if (!LoadJsonFile(path, root, outError)) return false;
  if (!ParseDeliveryConfigJson(root, outCfg, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

bool ResolveGridEndpoint(const RoadGrid& grid, const std::string& ref, int& outId)
{
  if (ParseIntersectionName(grid, ref, outId)) return true;
  const int poi = grid.poiIntersection(ref);
  if (poi < 0) return false;
  outId = poi;
  return true;
}

bool BuildRoadGridFromConfig(const DeliveryConfig& cfg, RoadGrid& outGrid, std::string& outError)
{
  RouteFailure failure;
  if (!outGrid.build(cfg.grid.width, cfg.grid.height, cfg.grid.cellSize, failure)) {
    outError = DescribeFailure(failure);
    return false;
  }

  for (const DeliveryNode& n : cfg.nodes) {
    outGrid.addPoi(n.id, n.gridX, n.gridY);
  }

  for (const BlockedRoad& r : cfg.grid.blockedRoads) {
    int a = -1;
    int b = -1;
    if (!ResolveGridEndpoint(outGrid, r.from, a)) {
      outError = "blocked road endpoint '" + r.from + "' is neither an intersection nor a node";
      return false;
    }
    if (!ResolveGridEndpoint(outGrid, r.to, b)) {
      outError = "blocked road endpoint '" + r.to + "' is neither an intersection nor a node";
      return false;
    }
    if (!outGrid.blockRoad(a, b)) {
      std::ostringstream oss;
      oss << "blocked road [" << r.from << ", " << r.to << "] does not join adjacent intersections ("
          << IntersectionName(outGrid, a) << " / " << IntersectionName(outGrid, b) << ")";
      outError = oss.str();
      return false;
    }
  }

  for (const std::string& ref : cfg.grid.blockedIntersections) {
    int id = -1;
    if (!ResolveGridEndpoint(outGrid, ref, id)) {
      outError = "blocked intersection '" + ref + "' is neither an intersection nor a node";
      return false;
    }
    outGrid.blockIntersection(id);
  }

  outError.clear();
  return true;
}

} // namespace gridroute
