#include "viewer/RouteViewer.hpp"

#include "gridroute/RouteExport.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace gridroute {

namespace {

const Color kBackground{245, 247, 250, 255};
const Color kRoad{153, 153, 153, 255};
const Color kBlocked{192, 57, 43, 255};
const Color kRoute{52, 152, 219, 255};
const Color kStart{231, 76, 60, 255};
const Color kDelivery{39, 174, 96, 255};
const Color kIdle{127, 140, 141, 255};

Vector2 PixelOf(const RoadGrid& grid, int id)
{
  const Intersection& n = grid.intersection(id);
  return Vector2{static_cast<float>(n.pixelX), static_cast<float>(n.pixelY)};
}

RouteOptimizeConfig OptimizeConfigFor(const DeliveryConfig& scenario)
{
  RouteOptimizeConfig cfg;
  cfg.maxIterations = scenario.maxIterations;
  return cfg;
}

} // namespace

RaylibContext::RaylibContext(const ViewerConfig& cfg, const char* title)
{
  unsigned int flags = FLAG_WINDOW_RESIZABLE;
  if (cfg.vsync) flags |= FLAG_VSYNC_HINT;
  SetConfigFlags(flags);

  InitWindow(cfg.windowWidth, cfg.windowHeight, title);
  SetWindowMinSize(640, 400);
  SetTargetFPS(60);
}

RaylibContext::~RaylibContext() { CloseWindow(); }

RouteViewer::RouteViewer(ViewerConfig vcfg, DeliveryConfig scenario)
    : m_vcfg(vcfg)
    , m_scenario(std::move(scenario))
    , m_rl(m_vcfg, "GridRoute")
    , m_optimizer(RouteStrategyRegistry::WithBuiltins(), OptimizeConfigFor(m_scenario))
{
  SetExitKey(KEY_NULL);
  m_camera.zoom = 1.0f;
}

bool RouteViewer::init(std::string& outError)
{
  if (!BuildRoadGridFromConfig(m_scenario, m_grid, outError)) return false;
  if (!m_optimizer.registry().contains(m_scenario.strategy)) {
    outError = "unknown strategy '" + m_scenario.strategy + "'";
    return false;
  }
  fitView();
  recompute();
  return true;
}

void RouteViewer::run()
{
  while (!WindowShouldClose()) {
    handleInput(GetFrameTime());
    draw();
  }
}

void RouteViewer::recompute()
{
  m_route = OptimizedRoute{};
  m_failure.clear();
  m_haveRoute =
      m_optimizer.optimize(m_grid, m_scenario.startPoi, m_scenario.deliveryAddresses, m_scenario.strategy, m_route,
                           m_failure);

  if (m_haveRoute) {
    std::cout << FormatRouteSummary(m_route, "");
  } else {
    std::cerr << "Route optimization failed: " << DescribeFailure(m_failure) << "\n";
  }
}

void RouteViewer::fitView()
{
  double minX = 0.0;
  double minY = 0.0;
  double maxX = 0.0;
  double maxY = 0.0;
  m_grid.boundsPx(minX, minY, maxX, maxY);

  const float sw = static_cast<float>(GetScreenWidth());
  const float sh = static_cast<float>(GetScreenHeight());
  const float gw = static_cast<float>(std::max(1.0, maxX - minX));
  const float gh = static_cast<float>(std::max(1.0, maxY - minY));

  // Leave room for the HUD strip at the top.
  const float hud = 70.0f;
  m_camera.zoom = std::clamp(std::min(sw / gw, (sh - hud) / gh) * 0.95f, 0.1f, 8.0f);
  m_camera.offset = Vector2{sw * 0.5f, hud + (sh - hud) * 0.5f};
  m_camera.target = Vector2{static_cast<float>(minX) + gw * 0.5f, static_cast<float>(minY) + gh * 0.5f};
  m_camera.rotation = 0.0f;
}

int RouteViewer::pickIntersection(Vector2 worldPos) const
{
  const double cell = m_grid.cellSize();
  const int x = static_cast<int>(std::floor(worldPos.x / cell));
  const int y = static_cast<int>(std::floor(worldPos.y / cell));
  if (!m_grid.inBounds(x, y)) return -1;

  // Only within a third of a cell of the intersection centre.
  const int id = m_grid.intersectionId(x, y);
  const Intersection& n = m_grid.intersection(id);
  const double dx = worldPos.x - n.pixelX;
  const double dy = worldPos.y - n.pixelY;
  return (std::hypot(dx, dy) <= cell / 3.0) ? id : -1;
}

void RouteViewer::handleInput(float dt)
{
  if (IsMouseButtonDown(MOUSE_BUTTON_RIGHT)) {
    const Vector2 delta = GetMouseDelta();
    m_camera.target.x -= delta.x / m_camera.zoom;
    m_camera.target.y -= delta.y / m_camera.zoom;
  }

  const float panSpeed = 650.0f * dt / std::max(0.25f, m_camera.zoom);
  if (IsKeyDown(KEY_A) || IsKeyDown(KEY_LEFT)) m_camera.target.x -= panSpeed;
  if (IsKeyDown(KEY_D) || IsKeyDown(KEY_RIGHT)) m_camera.target.x += panSpeed;
  if (IsKeyDown(KEY_W) || IsKeyDown(KEY_UP)) m_camera.target.y -= panSpeed;
  if (IsKeyDown(KEY_S) || IsKeyDown(KEY_DOWN)) m_camera.target.y += panSpeed;

  const float wheel = GetMouseWheelMove();
  if (wheel != 0.0f) {
    const Vector2 mouseWorld = GetScreenToWorld2D(GetMousePosition(), m_camera);
    m_camera.offset = GetMousePosition();
    m_camera.target = mouseWorld;
    m_camera.zoom = std::clamp(m_camera.zoom + wheel * 0.125f * m_camera.zoom, 0.1f, 8.0f);
  }

  m_hover = pickIntersection(GetScreenToWorld2D(GetMousePosition(), m_camera));

  if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT) && m_hover >= 0) {
    if (m_grid.isPassable(m_hover)) {
      m_grid.blockIntersection(m_hover);
    } else {
      m_grid.unblockIntersection(m_hover);
    }
    recompute();
  }

  if (IsKeyPressed(KEY_TAB)) {
    const std::vector<std::string>& names = m_optimizer.registry().names();
    auto it = std::find(names.begin(), names.end(), m_scenario.strategy);
    if (it == names.end() || ++it == names.end()) it = names.begin();
    if (it != names.end()) {
      m_scenario.strategy = *it;
      recompute();
    }
  }

  if (IsKeyPressed(KEY_R)) {
    std::string err;
    if (!BuildRoadGridFromConfig(m_scenario, m_grid, err)) {
      std::cerr << "Failed to rebuild grid: " << err << "\n";
    } else {
      recompute();
    }
  }

  if (IsKeyPressed(KEY_F)) fitView();
}

void RouteViewer::drawGrid() const
{
  const float thick = std::max(1.0f, 2.0f / m_camera.zoom);
  for (const RoadSegment& s : m_grid.segmentSlots()) {
    if (!s.exists() || s.from > s.to) continue;
    const RoadSegment* back = m_grid.findSegment(s.to, s.from);
    const bool blocked = !s.passable || (back && !back->passable);
    DrawLineEx(PixelOf(m_grid, s.from), PixelOf(m_grid, s.to), thick, blocked ? Fade(kBlocked, 0.6f) : kRoad);
  }

  const float r = static_cast<float>(m_grid.cellSize() * 0.06);
  for (int id = 0; id < m_grid.intersectionCount(); ++id) {
    const Vector2 p = PixelOf(m_grid, id);
    if (!m_grid.isPassable(id)) {
      const float d = r * 2.0f;
      DrawLineEx(Vector2{p.x - d, p.y - d}, Vector2{p.x + d, p.y + d}, thick * 1.5f, kBlocked);
      DrawLineEx(Vector2{p.x - d, p.y + d}, Vector2{p.x + d, p.y - d}, thick * 1.5f, kBlocked);
    } else {
      DrawCircleV(p, r, RAYWHITE);
      DrawCircleLines(static_cast<int>(p.x), static_cast<int>(p.y), r, kRoad);
    }
    if (id == m_hover) DrawCircleLines(static_cast<int>(p.x), static_cast<int>(p.y), r * 3.0f, DARKGRAY);
  }
}

void RouteViewer::drawRoute() const
{
  if (!m_haveRoute || m_route.fullPath.size() < 2) return;
  const float thick = std::max(2.0f, 4.0f / m_camera.zoom);
  for (std::size_t i = 1; i < m_route.fullPath.size(); ++i) {
    DrawLineEx(PixelOf(m_grid, m_route.fullPath[i - 1]), PixelOf(m_grid, m_route.fullPath[i]), thick, kRoute);
  }
}

void RouteViewer::drawMarkers() const
{
  const float r = static_cast<float>(std::max(4.0, m_grid.cellSize() * 0.18));
  const int font = std::max(8, static_cast<int>(r * 1.2f));

  for (const PoiMapping& m : m_grid.pois()) {
    const auto it = std::find(m_route.poiPath.begin(), m_route.poiPath.end(), m.poiId);
    const long order = (m_haveRoute && it != m_route.poiPath.end()) ? static_cast<long>(it - m_route.poiPath.begin())
                                                                     : -1;
    Color fill = kIdle;
    if (m.poiId == m_scenario.startPoi) {
      fill = kStart;
    } else if (order > 0) {
      fill = kDelivery;
    }

    const Vector2 p = PixelOf(m_grid, m.intersection);
    DrawCircleV(p, r, fill);
    DrawCircleLines(static_cast<int>(p.x), static_cast<int>(p.y), r, RAYWHITE);

    if (order > 0) {
      const char* num = TextFormat("%ld", order);
      DrawText(num, static_cast<int>(p.x) - MeasureText(num, font) / 2, static_cast<int>(p.y) - font / 2, font,
               RAYWHITE);
    }

    const DeliveryNode* node = FindDeliveryNode(m_scenario, m.poiId);
    const std::string& label = (node && !node->name.empty()) ? node->name : m.poiId;
    DrawText(label.c_str(), static_cast<int>(p.x + r + 3.0f), static_cast<int>(p.y - r - font), font, DARKGRAY);
  }
}

void RouteViewer::drawHud() const
{
  const int w = GetScreenWidth();
  DrawRectangle(0, 0, w, 62, Fade(BLACK, 0.75f));

  if (m_haveRoute) {
    DrawText(TextFormat("%s  |  %.2f px  |  %d intersections  |  %d 2-opt rounds", m_route.algorithmName.c_str(),
                        m_route.totalDistance, static_cast<int>(m_route.fullPath.size()), m_route.iterations),
             10, 8, 20, RAYWHITE);
  } else {
    DrawText(TextFormat("No route: %s", DescribeFailure(m_failure).c_str()), 10, 8, 20, Color{255, 140, 120, 255});
  }

  DrawText("Click: toggle intersection   Tab: strategy   R: reset   F: fit   Wheel/RMB: view", 10, 36, 16,
           Color{200, 200, 200, 255});
}

void RouteViewer::draw()
{
  BeginDrawing();
  ClearBackground(kBackground);

  BeginMode2D(m_camera);
  drawGrid();
  drawRoute();
  drawMarkers();
  EndMode2D();

  drawHud();
  EndDrawing();
}

} // namespace gridroute
