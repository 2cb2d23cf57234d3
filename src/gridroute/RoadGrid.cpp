#include "gridroute/RoadGrid.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <sstream>
#include <system_error>

namespace gridroute {

namespace {

constexpr int kDx[kGridDirCount] = {0, 1, 0, -1};
constexpr int kDy[kGridDirCount] = {-1, 0, 1, 0};

inline std::size_t FlatIdx(int x, int y, int w)
{
  return static_cast<std::size_t>(y) * static_cast<std::size_t>(w) + static_cast<std::size_t>(x);
}

inline std::size_t SlotIdx(int id, int dir)
{
  return static_cast<std::size_t>(id) * kGridDirCount + static_cast<std::size_t>(dir);
}

bool ParseNonNegative(const std::string& s, std::size_t begin, std::size_t end, int& out)
{
  if (begin >= end) return false;
  const char* first = s.data() + begin;
  const char* last = s.data() + end;
  int v = 0;
  const auto res = std::from_chars(first, last, v, 10);
  if (res.ec != std::errc() || res.ptr != last || v < 0) return false;
  out = v;
  return true;
}

} // namespace

bool RoadGrid::build(int width, int height, double cellSize, RouteFailure& outFailure)
{
  m_w = 0;
  m_h = 0;
  m_cellSize = 0.0;
  m_nodes.clear();
  m_segments.clear();
  m_pois.clear();

  if (width <= 0 || height <= 0) {
    std::ostringstream oss;
    oss << "grid dimensions must be positive (got " << width << "x" << height << ")";
    return Fail(outFailure, RouteError::InvalidDimension, oss.str());
  }
  if (static_cast<std::int64_t>(width) * static_cast<std::int64_t>(height) > kMaxGridIntersections) {
    std::ostringstream oss;
    oss << "grid " << width << "x" << height << " exceeds " << kMaxGridIntersections << " intersections";
    return Fail(outFailure, RouteError::InvalidDimension, oss.str());
  }
  if (!std::isfinite(cellSize) || cellSize <= 0.0) {
    std::ostringstream oss;
    oss << "cell size must be a positive number (got " << cellSize << ")";
    return Fail(outFailure, RouteError::InvalidDimension, oss.str());
  }

  m_w = width;
  m_h = height;
  m_cellSize = cellSize;

  const std::size_t n = static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
  m_nodes.resize(n);
  m_segments.assign(n * kGridDirCount, RoadSegment{});

  const double half = cellSize * 0.5;
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      Intersection& it = m_nodes[FlatIdx(x, y, width)];
      it.grid = Point{x, y};
      it.pixelX = static_cast<double>(x) * cellSize + half;
      it.pixelY = static_cast<double>(y) * cellSize + half;
      it.passable = true;
    }
  }

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const int id = static_cast<int>(FlatIdx(x, y, width));
      const Intersection& a = m_nodes[static_cast<std::size_t>(id)];
      for (int d = 0; d < kGridDirCount; ++d) {
        const int nx = x + kDx[d];
        const int ny = y + kDy[d];
        if (!inBounds(nx, ny)) continue;

        const int nid = static_cast<int>(FlatIdx(nx, ny, width));
        const Intersection& b = m_nodes[static_cast<std::size_t>(nid)];

        RoadSegment& seg = m_segments[SlotIdx(id, d)];
        seg.from = id;
        seg.to = nid;
        seg.weight = std::hypot(a.pixelX - b.pixelX, a.pixelY - b.pixelY);
        seg.passable = true;
      }
    }
  }

  outFailure.clear();
  return true;
}

int RoadGrid::intersectionId(int x, int y) const
{
  if (!inBounds(x, y)) return -1;
  return static_cast<int>(FlatIdx(x, y, m_w));
}

Point RoadGrid::coordsOf(int id) const
{
  if (!validId(id)) return Point{-1, -1};
  return Point{id % m_w, id / m_w};
}

int RoadGrid::addPoi(const std::string& poiId, int x, int y)
{
  if (empty()) return -1;

  const int cx = std::clamp(x, 0, m_w - 1);
  const int cy = std::clamp(y, 0, m_h - 1);
  const int id = intersectionId(cx, cy);

  for (PoiMapping& m : m_pois) {
    if (m.poiId == poiId) {
      m.intersection = id;
      return id;
    }
  }

  m_pois.push_back(PoiMapping{poiId, id});
  return id;
}

int RoadGrid::poiIntersection(const std::string& poiId) const
{
  for (const PoiMapping& m : m_pois) {
    if (m.poiId == poiId) return m.intersection;
  }
  return -1;
}

std::vector<GridNeighbor> RoadGrid::neighbors(int id) const
{
  std::vector<GridNeighbor> out;
  neighbors(id, out);
  return out;
}

void RoadGrid::neighbors(int id, std::vector<GridNeighbor>& outNeighbors) const
{
  outNeighbors.clear();
  if (!validId(id)) return;

  for (int d = 0; d < kGridDirCount; ++d) {
    const RoadSegment& seg = m_segments[SlotIdx(id, d)];
    if (!seg.exists() || !seg.passable) continue;
    // A blocked destination is excluded even when the segment itself is open.
    if (!m_nodes[static_cast<std::size_t>(seg.to)].passable) continue;
    outNeighbors.push_back(GridNeighbor{seg.to, seg.weight});
  }
}

const RoadSegment* RoadGrid::findSegment(int from, int to) const
{
  if (!validId(from) || !validId(to)) return nullptr;
  for (int d = 0; d < kGridDirCount; ++d) {
    const RoadSegment& seg = m_segments[SlotIdx(from, d)];
    if (seg.exists() && seg.to == to) return &seg;
  }
  return nullptr;
}

RoadSegment* RoadGrid::mutableSegment(int from, int to)
{
  return const_cast<RoadSegment*>(static_cast<const RoadGrid*>(this)->findSegment(from, to));
}

bool RoadGrid::setSegmentPassable(int from, int to, bool passable)
{
  RoadSegment* seg = mutableSegment(from, to);
  if (!seg) return false;
  seg->passable = passable;
  return true;
}

bool RoadGrid::blockRoad(int a, int b)
{
  if (!findSegment(a, b) || !findSegment(b, a)) return false;
  blockSegment(a, b);
  blockSegment(b, a);
  return true;
}

bool RoadGrid::unblockRoad(int a, int b)
{
  if (!findSegment(a, b) || !findSegment(b, a)) return false;
  unblockSegment(a, b);
  unblockSegment(b, a);
  return true;
}

bool RoadGrid::setIntersectionPassable(int id, bool passable)
{
  if (!validId(id)) return false;
  m_nodes[static_cast<std::size_t>(id)].passable = passable;
  return true;
}

int RoadGrid::segmentCount() const
{
  return static_cast<int>(std::count_if(m_segments.begin(), m_segments.end(),
                                        [](const RoadSegment& s) { return s.exists(); }));
}

void RoadGrid::boundsPx(double& minX, double& minY, double& maxX, double& maxY) const
{
  minX = 0.0;
  minY = 0.0;
  maxX = static_cast<double>(m_w) * m_cellSize;
  maxY = static_cast<double>(m_h) * m_cellSize;
}

std::string IntersectionName(const RoadGrid& grid, int id)
{
  const Point p = grid.coordsOf(id);
  return "grid_" + std::to_string(p.x) + "_" + std::to_string(p.y);
}

bool ParseIntersectionName(const RoadGrid& grid, const std::string& name, int& outId)
{
  const std::string prefix = "grid_";
  if (name.rfind(prefix, 0) != 0) return false;

  const std::size_t sep = name.find('_', prefix.size());
  if (sep == std::string::npos) return false;

  int x = 0;
  int y = 0;
  if (!ParseNonNegative(name, prefix.size(), sep, x)) return false;
  if (!ParseNonNegative(name, sep + 1, name.size(), y)) return false;
  if (!grid.inBounds(x, y)) return false;

  outId = grid.intersectionId(x, y);
  return true;
}

} // namespace gridroute
