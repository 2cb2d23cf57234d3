#pragma once

namespace gridroute {

// Integer grid coordinate of an intersection.
//
// Kept raylib-free so it can be used by the headless core (tests, CLI, exports).
struct Point {
  int x = 0;
  int y = 0;
};

inline bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point& a, const Point& b) { return !(a == b); }

} // namespace gridroute
