#include "routetrie/route-error.hpp"

#include <cstddef>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace routetrie {

std::string_view RouteErrcToString(RouteErrc code) noexcept {
  switch (code) {
    case RouteErrc::UnclosedBrace:
      return "UnclosedBrace";
    case RouteErrc::UnescapedBrace:
      return "UnescapedBrace";
    case RouteErrc::EmptyParameterName:
      return "EmptyParameterName";
    case RouteErrc::InvalidParameterName:
      return "InvalidParameterName";
    case RouteErrc::CatchAllNotAtEnd:
      return "CatchAllNotAtEnd";
    case RouteErrc::ParameterNotFollowedByBoundary:
      return "ParameterNotFollowedByBoundary";
    case RouteErrc::NestedOrMisplacedWildcard:
      return "NestedOrMisplacedWildcard";
    case RouteErrc::PatternTooLong:
      return "PatternTooLong";
    case RouteErrc::TooManyParameters:
      return "TooManyParameters";
    case RouteErrc::ConflictingParameterName:
      return "ConflictingParameterName";
    case RouteErrc::ConflictingWildcard:
      return "ConflictingWildcard";
    case RouteErrc::DuplicateCatchAll:
      return "DuplicateCatchAll";
    case RouteErrc::DuplicateRoute:
      return "DuplicateRoute";
    case RouteErrc::CatchAllNotLeaf:
      return "CatchAllNotLeaf";
  }
  return "Unknown";
}

std::string_view RouteErrcDescription(RouteErrc code) noexcept {
  switch (code) {
    case RouteErrc::UnclosedBrace:
      return "'{' opens a parameter that is not closed within its segment";
    case RouteErrc::UnescapedBrace:
      return "'}' must be escaped as '}}' outside of a parameter";
    case RouteErrc::EmptyParameterName:
      return "parameter name cannot be empty";
    case RouteErrc::InvalidParameterName:
      return "parameter name cannot contain '/', '{' or '}'";
    case RouteErrc::CatchAllNotAtEnd:
      return "catch-all parameter must be the last element of the pattern";
    case RouteErrc::ParameterNotFollowedByBoundary:
      return "parameter must be followed by '/' or the end of the pattern";
    case RouteErrc::NestedOrMisplacedWildcard:
      return "wildcard is nested or not placed right after '/'";
    case RouteErrc::PatternTooLong:
      return "pattern exceeds the configured maximum length";
    case RouteErrc::TooManyParameters:
      return "pattern has more parameters than the configured maximum";
    case RouteErrc::ConflictingParameterName:
      return "a parameter with a different name is already registered at this position";
    case RouteErrc::ConflictingWildcard:
      return "a parameter and a catch-all cannot share the same position";
    case RouteErrc::DuplicateCatchAll:
      return "a catch-all with a different name is already registered at this position";
    case RouteErrc::DuplicateRoute:
      return "an identical route is already registered";
    case RouteErrc::CatchAllNotLeaf:
      return "nothing can be registered below a catch-all parameter";
  }
  return "unknown error";
}

PatternError::PatternError(RouteErrc code, std::string_view pattern, std::size_t position)
    : std::invalid_argument(std::format("Invalid route pattern '{}' at position {}: {}", pattern, position,
                                        RouteErrcDescription(code))),
      _pattern(pattern),
      _position(position),
      _code(code) {}

ConflictError::ConflictError(RouteErrc code, std::string_view pattern, std::string conflictingRoute)
    : std::logic_error(std::format("Route '{}' conflicts with registered route '{}': {}", pattern,
                                   conflictingRoute, RouteErrcDescription(code))),
      _pattern(pattern),
      _conflictingRoute(std::move(conflictingRoute)),
      _code(code) {}

}  // namespace routetrie
