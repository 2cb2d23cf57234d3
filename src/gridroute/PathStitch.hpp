#pragma once

#include "gridroute/RoadGrid.hpp"
#include "gridroute/RouteError.hpp"

#include <string>
#include <vector>

namespace gridroute {

// Expand a POI visiting order into the full intersection-level path.
//
// Consecutive stops are joined by FindGridPath segments. The first segment is
// appended whole; each later segment drops its first intersection (it repeats the
// previous segment's last one). outDistance is the sum of the segment distances.
//
// Fails with UnmappedPoi or Unreachable; outputs are cleared on failure.
bool StitchTourPath(const RoadGrid& grid, const std::vector<std::string>& poiOrder, std::vector<int>& outPath,
                    double& outDistance, RouteFailure& outFailure);

} // namespace gridroute
