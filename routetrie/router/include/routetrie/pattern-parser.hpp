#pragma once

#include <span>
#include <string>
#include <string_view>

#include "routetrie/segment.hpp"

namespace routetrie {

// Parses a route pattern into its ordered list of segments.
//
// Syntax:
//  - "{name}"  named parameter, must be followed by '/' or the end of the pattern
//  - "{*name}" catch-all parameter, must be the last token and directly preceded by '/'
//  - "{{" and "}}" produce a literal '{' and '}' in static text
// Consecutive static bytes are merged into a single StaticSegment.
//
// Throws PatternError on malformed input.
[[nodiscard]] SegmentList ParsePattern(std::string_view pattern);

// Appends 'bytes' to 'out', doubling every brace so that the result parses back to the same bytes.
void AppendEscaped(std::string_view bytes, std::string& out);

// Rebuilds a pattern string from segments, the inverse of ParsePattern.
[[nodiscard]] std::string FormatPattern(std::span<const Segment> segments);

}  // namespace routetrie
