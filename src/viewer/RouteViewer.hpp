#pragma once

#include "gridroute/DeliveryConfig.hpp"
#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteStrategy.hpp"

#include "viewer/RaylibShim.hpp"

#include <string>

namespace gridroute {

struct ViewerConfig {
  int windowWidth = 1280;
  int windowHeight = 800;
  bool vsync = true;
};

// Window/context lifetime. Must outlive anything that touches the GPU.
struct RaylibContext {
  RaylibContext(const ViewerConfig& cfg, const char* title);
  ~RaylibContext();

  RaylibContext(const RaylibContext&) = delete;
  RaylibContext& operator=(const RaylibContext&) = delete;
};

// Interactive map of a delivery scenario.
//
// Controls:
//   mouse wheel        zoom around the cursor
//   right drag / WASD  pan
//   left click         toggle the intersection under the cursor (blocked <-> open)
//   Tab                cycle strategy
//   R                  reset blocks to the scenario file
//   F                  fit view
class RouteViewer {
public:
  RouteViewer(ViewerConfig vcfg, DeliveryConfig scenario);

  // Fails if the scenario does not produce a valid grid.
  bool init(std::string& outError);

  void run();

private:
  void handleInput(float dt);
  void recompute();
  void fitView();
  int pickIntersection(Vector2 worldPos) const;

  void draw();
  void drawGrid() const;
  void drawRoute() const;
  void drawMarkers() const;
  void drawHud() const;

  ViewerConfig m_vcfg;
  DeliveryConfig m_scenario;
  RaylibContext m_rl;

  RouteOptimizer m_optimizer;
  RoadGrid m_grid;
  Camera2D m_camera{};

  OptimizedRoute m_route;
  RouteFailure m_failure;
  bool m_haveRoute = false;
  int m_hover = -1;
};

} // namespace gridroute
