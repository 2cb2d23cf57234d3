#include "cli/CliParse.hpp"

#include "gridroute/DeliveryConfig.hpp"
#include "gridroute/LogTee.hpp"
#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteExport.hpp"
#include "gridroute/RouteStrategy.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace gridroute;

struct CliOptions {
  std::string configPath = "data/config.json";

  // Overrides (empty / <= 0 => keep the config file value).
  std::string strategy;
  std::string start;
  int maxIterations = 0;
  int width = 0;
  int height = 0;
  double cellSize = 0.0;
  std::vector<BlockedRoad> extraBlocks;

  std::string outJson;
  std::string outSvg;
  std::string outHtml = "output.html";

  std::string logPath;

  bool listStrategies = false;
  bool compare = false;
};

void PrintHelp()
{
  std::cout
      << "gridroute_cli (delivery route optimizer on a grid road network)\n\n"
      << "Loads a delivery scenario, computes a visiting order from the distribution center through\n"
      << "every delivery address, stitches the shortest intersection path and writes a report.\n\n"
      << "Usage:\n"
      << "  gridroute_cli [--config <file.json>] [options]\n\n"
      << "Scenario:\n"
      << "  --config <file>            Scenario JSON (default: data/config.json)\n"
      << "  --start <poi>              Override the start POI\n"
      << "  --size <WxH>               Override grid dimensions\n"
      << "  --cell <px>                Override cell size in pixels\n"
      << "  --block <from,to>          Block a road in both directions (repeatable).\n"
      << "                             Endpoints are grid_x_y names or node ids.\n\n"
      << "Optimization:\n"
      << "  --strategy <name>          nearest_neighbor | 2opt (default: from config)\n"
      << "  --max-iterations <N>       2-opt round cap (default: 1000)\n"
      << "  --compare                  Run every registered strategy and print a table\n"
      << "  --list-strategies          Print registered strategies and exit\n\n"
      << "Outputs:\n"
      << "  --out-html <file>          HTML report (default: output.html)\n"
      << "  --no-html                  Skip the HTML report\n"
      << "  --out-svg <file>           Standalone SVG map\n"
      << "  --out-json <file>          Route as JSON\n"
      << "  --log <file>               Mirror stdout/stderr into a log file\n\n"
      << "Exit codes: 0 ok, 1 optimization failed, 2 usage/config/io error.\n";
}

void PrintStrategies(const RouteStrategyRegistry& registry, const RouteOptimizeConfig& cfg)
{
  std::cout << "Strategies:\n";
  for (const std::string& name : registry.names()) {
    const std::unique_ptr<RouteStrategy> s = registry.create(name, cfg);
    std::cout << "  " << std::left << std::setw(18) << name << (s ? s->algorithmName() : "") << "\n";
  }
}

// Returns false if any strategy failed.
bool RunComparison(const RouteOptimizer& optimizer, const RoadGrid& grid, const DeliveryConfig& cfg)
{
  bool allOk = true;

  std::cout << std::left << std::setw(18) << "strategy" << std::setw(28) << "algorithm" << std::right
            << std::setw(12) << "distance" << std::setw(8) << "nodes" << std::setw(8) << "iters" << "\n";

  for (const std::string& name : optimizer.registry().names()) {
    OptimizedRoute route;
    RouteFailure failure;
    if (!optimizer.optimize(grid, cfg.startPoi, cfg.deliveryAddresses, name, route, failure)) {
      std::cout << std::left << std::setw(18) << name << "FAILED (" << DescribeFailure(failure) << ")\n";
      allOk = false;
      continue;
    }

    std::ostringstream dist;
    dist << std::fixed << std::setprecision(2) << route.totalDistance;
    std::cout << std::left << std::setw(18) << name << std::setw(28) << route.algorithmName << std::right
              << std::setw(12) << dist.str() << std::setw(8) << route.fullPath.size() << std::setw(8)
              << route.iterations << "\n";
  }
  std::cout << "\n";
  return allOk;
}

} // namespace

int main(int argc, char** argv)
{
  using namespace gridroute;
  using namespace gridroute::cli;

  CliOptions opt;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--config") {
      if (!requireValue(i, val)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
      opt.configPath = val;
    } else if (arg == "--strategy") {
      if (!requireValue(i, val) || val.empty()) {
        std::cerr << "--strategy requires a name\n";
        return 2;
      }
      opt.strategy = val;
    } else if (arg == "--max-iterations") {
      if (!requireValue(i, val) || !ParseI32(val, &opt.maxIterations) || opt.maxIterations < 1) {
        std::cerr << "--max-iterations requires a positive integer\n";
        return 2;
      }
    } else if (arg == "--start") {
      if (!requireValue(i, val) || val.empty()) {
        std::cerr << "--start requires a POI id\n";
        return 2;
      }
      opt.start = val;
    } else if (arg == "--size") {
      if (!requireValue(i, val) || !ParseWxH(val, &opt.width, &opt.height)) {
        std::cerr << "--size requires format WxH (e.g. 15x12)\n";
        return 2;
      }
    } else if (arg == "--cell") {
      if (!requireValue(i, val) || !ParseF64(val, &opt.cellSize) || opt.cellSize <= 0.0) {
        std::cerr << "--cell requires a positive number\n";
        return 2;
      }
    } else if (arg == "--block") {
      BlockedRoad road;
      if (!requireValue(i, val) || !ParseEndpointPair(val, &road.from, &road.to)) {
        std::cerr << "--block requires <from,to> (e.g. grid_3_4,grid_4_4)\n";
        return 2;
      }
      opt.extraBlocks.push_back(road);
    } else if (arg == "--out-json") {
      if (!requireValue(i, val)) {
        std::cerr << "--out-json requires a path\n";
        return 2;
      }
      opt.outJson = val;
    } else if (arg == "--out-svg") {
      if (!requireValue(i, val)) {
        std::cerr << "--out-svg requires a path\n";
        return 2;
      }
      opt.outSvg = val;
    } else if (arg == "--out-html") {
      if (!requireValue(i, val)) {
        std::cerr << "--out-html requires a path\n";
        return 2;
      }
      opt.outHtml = val;
    } else if (arg == "--no-html") {
      opt.outHtml.clear();
    } else if (arg == "--log") {
      if (!requireValue(i, val)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
      opt.logPath = val;
    } else if (arg == "--list-strategies") {
      opt.listStrategies = true;
    } else if (arg == "--compare") {
      opt.compare = true;
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      PrintHelp();
      return 2;
    }
  }

  LogTee logTee;
  if (!opt.logPath.empty()) {
    LogTeeOptions logOpt;
    logOpt.path = opt.logPath;
    std::string err;
    if (!logTee.start(logOpt, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 2;
    }
  }

  RouteOptimizeConfig optCfg;
  if (opt.listStrategies) {
    PrintStrategies(RouteStrategyRegistry::WithBuiltins(), optCfg);
    return 0;
  }

  DeliveryConfig cfg;
  std::string err;
  if (!LoadDeliveryConfigJsonFile(opt.configPath, cfg, err)) {
    std::cerr << "Failed to load config: " << opt.configPath << "\n";
    std::cerr << err << "\n";
    return 2;
  }

  if (!opt.strategy.empty()) cfg.strategy = opt.strategy;
  if (!opt.start.empty()) cfg.startPoi = opt.start;
  if (opt.maxIterations > 0) cfg.maxIterations = opt.maxIterations;
  if (opt.width > 0) cfg.grid.width = opt.width;
  if (opt.height > 0) cfg.grid.height = opt.height;
  if (opt.cellSize > 0.0) cfg.grid.cellSize = opt.cellSize;
  cfg.grid.blockedRoads.insert(cfg.grid.blockedRoads.end(), opt.extraBlocks.begin(), opt.extraBlocks.end());

  optCfg.maxIterations = cfg.maxIterations;
  const RouteOptimizer optimizer(RouteStrategyRegistry::WithBuiltins(), optCfg);

  if (!optimizer.registry().contains(cfg.strategy)) {
    std::cerr << "Unknown strategy: " << cfg.strategy << "\n";
    PrintStrategies(optimizer.registry(), optCfg);
    return 2;
  }

  RoadGrid grid;
  if (!BuildRoadGridFromConfig(cfg, grid, err)) {
    std::cerr << "Invalid scenario in " << opt.configPath << "\n";
    std::cerr << err << "\n";
    return 2;
  }

  if (cfg.deliveryAddresses.empty()) {
    std::cout << "Warning: no delivery addresses in " << opt.configPath << "; nothing to do.\n";
    return 0;
  }

  std::cout << "Grid: " << grid.width() << "x" << grid.height() << " (" << grid.intersectionCount()
            << " intersections, " << grid.segmentCount() << " road segments)\n";
  std::cout << "Start: " << cfg.startPoi << "\n";
  std::cout << "Deliveries: " << cfg.deliveryAddresses.size() << "\n\n";

  bool compareOk = true;
  if (opt.compare) compareOk = RunComparison(optimizer, grid, cfg);

  OptimizedRoute route;
  RouteFailure failure;
  if (!optimizer.optimize(grid, cfg.startPoi, cfg.deliveryAddresses, cfg.strategy, route, failure)) {
    if (failure.error == RouteError::EmptyDestinations) {
      std::cout << "Warning: " << failure.message << "; nothing to do.\n";
      return 0;
    }
    std::cerr << "Route optimization failed\n";
    std::cerr << DescribeFailure(failure) << "\n";
    return 1;
  }

  if (!opt.outHtml.empty()) {
    if (!EnsureParentDir(opt.outHtml)) {
      std::cerr << "Failed to create output directory for: " << opt.outHtml << "\n";
      return 2;
    }
    if (!WriteRouteHtmlFile(opt.outHtml, grid, route, cfg.nodes, err)) {
      std::cerr << "Failed to write HTML: " << opt.outHtml << "\n";
      std::cerr << err << "\n";
      return 2;
    }
  }

  if (!opt.outSvg.empty()) {
    if (!EnsureParentDir(opt.outSvg)) {
      std::cerr << "Failed to create output directory for: " << opt.outSvg << "\n";
      return 2;
    }
    if (!WriteRouteSvgFile(opt.outSvg, grid, route, cfg.nodes, err)) {
      std::cerr << "Failed to write SVG: " << opt.outSvg << "\n";
      std::cerr << err << "\n";
      return 2;
    }
  }

  if (!opt.outJson.empty()) {
    if (!EnsureParentDir(opt.outJson)) {
      std::cerr << "Failed to create output directory for: " << opt.outJson << "\n";
      return 2;
    }
    if (!WriteRouteJsonFile(opt.outJson, grid, route, err)) {
      std::cerr << "Failed to write JSON: " << opt.outJson << "\n";
      std::cerr << err << "\n";
      return 2;
    }
  }

  std::cout << FormatRouteSummary(route, opt.outHtml);
  return compareOk ? 0 : 1;
}
