#include "gridroute/GridPathfinding.hpp"

#include <algorithm>
#include <queue>

namespace gridroute {

namespace {

struct OpenNode {
  double dist = 0.0;
  int node = -1;
};

struct OpenCmp {
  bool operator()(const OpenNode& a, const OpenNode& b) const
  {
    // min-heap emulation for std::priority_queue; equal distances settle lower ids first.
    if (a.dist != b.dist) return a.dist > b.dist;
    return a.node > b.node;
  }
};

} // namespace

ShortestPathTree ComputeShortestPathTree(const RoadGrid& grid, int source, int stopAt)
{
  ShortestPathTree tree;
  if (!grid.validId(source)) return tree;

  const std::size_t n = static_cast<std::size_t>(grid.intersectionCount());
  tree.source = source;
  tree.dist.assign(n, kUnreachable);
  tree.prev.assign(n, -1);

  std::vector<unsigned char> settled(n, 0);
  std::vector<GridNeighbor> nbrs;
  nbrs.reserve(kGridDirCount);

  std::priority_queue<OpenNode, std::vector<OpenNode>, OpenCmp> open;
  tree.dist[static_cast<std::size_t>(source)] = 0.0;
  open.push(OpenNode{0.0, source});

  while (!open.empty()) {
    const OpenNode cur = open.top();
    open.pop();

    const std::size_t cu = static_cast<std::size_t>(cur.node);
    if (settled[cu]) continue;
    settled[cu] = 1;

    if (cur.node == stopAt) break;

    grid.neighbors(cur.node, nbrs);
    for (const GridNeighbor& nb : nbrs) {
      const std::size_t nu = static_cast<std::size_t>(nb.id);
      if (settled[nu]) continue;

      const double nd = cur.dist + nb.weight;
      if (nd < tree.dist[nu]) {
        tree.dist[nu] = nd;
        tree.prev[nu] = cur.node;
        open.push(OpenNode{nd, nb.id});
      }
    }
  }

  return tree;
}

std::vector<int> ReconstructPath(const ShortestPathTree& tree, int target)
{
  std::vector<int> out;
  if (tree.source < 0 || target < 0 || static_cast<std::size_t>(target) >= tree.dist.size()) return out;
  if (!IsReachable(tree.dist[static_cast<std::size_t>(target)])) return out;

  const int n = static_cast<int>(tree.prev.size());
  int cur = target;
  out.push_back(cur);

  int guard = 0;
  while (cur != tree.source && guard++ < n + 8) {
    const int p = tree.prev[static_cast<std::size_t>(cur)];
    if (p < 0) break;
    cur = p;
    out.push_back(cur);
  }

  if (out.back() != tree.source) {
    out.clear();
    return out;
  }

  std::reverse(out.begin(), out.end());
  return out;
}

double GridDistance(const RoadGrid& grid, int from, int to)
{
  if (!grid.validId(from) || !grid.validId(to)) return kUnreachable;
  if (from == to) return 0.0;

  const ShortestPathTree tree = ComputeShortestPathTree(grid, from, to);
  return tree.dist[static_cast<std::size_t>(to)];
}

bool FindGridPath(const RoadGrid& grid, int from, int to, std::vector<int>& outPath, double* outDistance)
{
  outPath.clear();
  if (outDistance) *outDistance = kUnreachable;
  if (!grid.validId(from) || !grid.validId(to)) return false;

  if (from == to) {
    outPath.push_back(from);
    if (outDistance) *outDistance = 0.0;
    return true;
  }

  const ShortestPathTree tree = ComputeShortestPathTree(grid, from);
  outPath = ReconstructPath(tree, to);
  if (outPath.empty()) return false;

  if (outDistance) *outDistance = tree.dist[static_cast<std::size_t>(to)];
  return true;
}

} // namespace gridroute
