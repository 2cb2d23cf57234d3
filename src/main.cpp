#include "cli/CliParse.hpp"

#include "gridroute/DeliveryConfig.hpp"
#include "gridroute/LogTee.hpp"

#include "viewer/RaylibLog.hpp"
#include "viewer/RouteViewer.hpp"

#include <iostream>
#include <string>
#include <utility>

int main(int argc, char** argv)
{
  using namespace gridroute;

  std::string configPath = "data/config.json";
  std::string strategy;
  std::string logPath;
  int raylibLogLevel = LOG_WARNING;
  ViewerConfig vcfg;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](const char* what) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << arg << " requires " << what << "\n";
        return nullptr;
      }
      return argv[++i];
    };

    if (arg == "--help" || arg == "-h") {
      std::cout << "gridroute_viewer\n"
                << "  --config <file.json>     Scenario (default: data/config.json)\n"
                << "  --strategy <name>        Initial strategy (nearest_neighbor | 2opt)\n"
                << "  --window <WxH>           Window size (default: 1280x800)\n"
                << "  --vsync <0|1>\n"
                << "  --log <file>             Mirror stdout/stderr into a log file\n"
                << "  --raylib-log <level>     all|trace|debug|info|warn|error|fatal|none (default: warn)\n";
      return 0;
    } else if (arg == "--config") {
      const char* v = next("a path");
      if (!v) return 2;
      configPath = v;
    } else if (arg == "--strategy") {
      const char* v = next("a name");
      if (!v) return 2;
      strategy = v;
    } else if (arg == "--window") {
      const char* v = next("WxH");
      if (!v || !cli::ParseWxH(v, &vcfg.windowWidth, &vcfg.windowHeight)) {
        std::cerr << "--window requires format WxH (e.g. 1280x800)\n";
        return 2;
      }
    } else if (arg == "--vsync") {
      const char* v = next("0 or 1");
      int on = 1;
      if (!v || !cli::ParseI32(v, &on) || (on != 0 && on != 1)) {
        std::cerr << "--vsync requires 0 or 1\n";
        return 2;
      }
      vcfg.vsync = (on != 0);
    } else if (arg == "--log") {
      const char* v = next("a path");
      if (!v) return 2;
      logPath = v;
    } else if (arg == "--raylib-log") {
      const char* v = next("a level");
      if (!v) return 2;
      raylibLogLevel = ParseRaylibLogLevel(v, -1);
      if (raylibLogLevel < 0) {
        std::cerr << "Unknown raylib log level: " << v << "\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      return 2;
    }
  }

  LogTee logTee;
  if (!logPath.empty()) {
    LogTeeOptions opt;
    opt.path = logPath;
    std::string err;
    if (!logTee.start(opt, err)) {
      std::cerr << "Failed to start log: " << err << "\n";
      return 2;
    }
  }

  DeliveryConfig scenario;
  std::string err;
  if (!LoadDeliveryConfigJsonFile(configPath, scenario, err)) {
    std::cerr << "Failed to load config: " << configPath << "\n" << err << "\n";
    return 2;
  }
  if (!strategy.empty()) scenario.strategy = strategy;

  InstallRaylibLogCallback(raylibLogLevel);

  int rc = 0;
  {
    RouteViewer viewer(vcfg, std::move(scenario));
    if (!viewer.init(err)) {
      std::cerr << "Invalid scenario: " << err << "\n";
      rc = 2;
    } else {
      viewer.run();
    }
  }

  UninstallRaylibLogCallback();
  return rc;
}
