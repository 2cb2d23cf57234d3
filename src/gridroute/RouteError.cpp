#include "gridroute/RouteError.hpp"

#include <utility>

namespace gridroute {

const char* RouteErrorName(RouteError e)
{
  switch (e) {
  case RouteError::None: return "none";
  case RouteError::InvalidDimension: return "invalid_dimension";
  case RouteError::UnmappedPoi: return "unmapped_poi";
  case RouteError::Unreachable: return "unreachable";
  case RouteError::UnknownStrategy: return "unknown_strategy";
  case RouteError::EmptyDestinations: return "empty_destinations";
  }
  return "unknown";
}

bool Fail(RouteFailure& out, RouteError e, std::string message)
{
  out.error = e;
  out.message = std::move(message);
  return false;
}

std::string DescribeFailure(const RouteFailure& f)
{
  std::string s = RouteErrorName(f.error);
  if (!f.message.empty()) {
    s += ": ";
    s += f.message;
  }
  return s;
}

} // namespace gridroute
