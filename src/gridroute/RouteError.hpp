#pragma once

#include <cstdint>
#include <string>

namespace gridroute {

// Failure categories reported by the routing core.
//
// The core never throws: every fallible operation returns false and fills a RouteFailure.
enum class RouteError : std::uint8_t {
  None = 0,
  InvalidDimension,  // grid width/height/cell size rejected by RoadGrid::build
  UnmappedPoi,       // start or destination id has no intersection mapping
  Unreachable,       // two consecutive tour stops have no connecting path
  UnknownStrategy,   // strategy name not present in the registry
  EmptyDestinations, // optimizer invoked without any destination
};

// Stable snake_case name (used in CLI output and JSON exports).
const char* RouteErrorName(RouteError e);

struct RouteFailure {
  RouteError error = RouteError::None;
  std::string message;

  bool failed() const { return error != RouteError::None; }
  void clear()
  {
    error = RouteError::None;
    message.clear();
  }
};

// Fill `out` and return false so call sites can `return Fail(...)`.
bool Fail(RouteFailure& out, RouteError e, std::string message);

// "<name>: <message>"
std::string DescribeFailure(const RouteFailure& f);

} // namespace gridroute
