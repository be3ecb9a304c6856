#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace routetrie {

enum class RouteErrc : std::uint8_t {
  // Pattern errors, detected while parsing. The trie is never touched.
  UnclosedBrace,
  UnescapedBrace,
  EmptyParameterName,
  InvalidParameterName,
  CatchAllNotAtEnd,
  ParameterNotFollowedByBoundary,
  NestedOrMisplacedWildcard,
  PatternTooLong,
  TooManyParameters,

  // Conflict errors, detected against the routes already registered.
  ConflictingParameterName,
  ConflictingWildcard,
  DuplicateCatchAll,
  DuplicateRoute,
  CatchAllNotLeaf,
};

// Short stable name of the error kind, e.g. "DuplicateRoute".
[[nodiscard]] std::string_view RouteErrcToString(RouteErrc code) noexcept;

// Human-readable description of the error kind.
[[nodiscard]] std::string_view RouteErrcDescription(RouteErrc code) noexcept;

[[nodiscard]] constexpr bool IsPatternError(RouteErrc code) noexcept {
  return code < RouteErrc::ConflictingParameterName;
}

// Thrown when a route pattern is syntactically invalid or exceeds the configured limits.
class PatternError : public std::invalid_argument {
 public:
  PatternError(RouteErrc code, std::string_view pattern, std::size_t position);

  [[nodiscard]] RouteErrc code() const noexcept { return _code; }

  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  // Byte offset in pattern() where the problem was detected.
  [[nodiscard]] std::size_t position() const noexcept { return _position; }

 private:
  std::string _pattern;
  std::size_t _position;
  RouteErrc _code;
};

// Thrown when a well-formed pattern cannot be registered because of the routes already present.
class ConflictError : public std::logic_error {
 public:
  ConflictError(RouteErrc code, std::string_view pattern, std::string conflictingRoute);

  [[nodiscard]] RouteErrc code() const noexcept { return _code; }

  // The rejected pattern.
  [[nodiscard]] std::string_view pattern() const noexcept { return _pattern; }

  // A registered route colliding with pattern(), rebuilt from the trie with braces re-escaped.
  [[nodiscard]] std::string_view conflictingRoute() const noexcept { return _conflictingRoute; }

 private:
  std::string _pattern;
  std::string _conflictingRoute;
  RouteErrc _code;
};

}  // namespace routetrie
