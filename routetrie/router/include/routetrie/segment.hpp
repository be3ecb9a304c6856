#pragma once

#include <string>
#include <variant>

#include "routetrie/vector.hpp"

namespace routetrie {

// Literal bytes to match exactly. Brace escapes are already resolved ("{{" became '{').
struct StaticSegment {
  bool operator==(const StaticSegment&) const noexcept = default;

  std::string bytes;
};

// Captures one or more bytes up to the next '/' or the end of the path.
struct ParamSegment {
  bool operator==(const ParamSegment&) const noexcept = default;

  std::string name;
};

// Captures all the remaining bytes (at least one). Always the last segment of a pattern.
struct CatchAllSegment {
  bool operator==(const CatchAllSegment&) const noexcept = default;

  std::string name;
};

using Segment = std::variant<StaticSegment, ParamSegment, CatchAllSegment>;

using SegmentList = vector<Segment>;

}  // namespace routetrie
