#include "routetrie/pattern-parser.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "routetrie/route-error.hpp"
#include "routetrie/segment.hpp"

namespace routetrie {
namespace {

constexpr std::string_view kEscapedOpenBrace = "{{";
constexpr std::string_view kEscapedCloseBrace = "}}";

void FlushStatic(std::string& literalBuffer, SegmentList& segments) {
  if (!literalBuffer.empty()) {
    segments.emplace_back(StaticSegment{std::move(literalBuffer)});
    // It's fine to call clear after a move.
    literalBuffer.clear();  // NOLINT(bugprone-use-after-move)
  }
}

bool LastStaticEndsWithSlash(const SegmentList& segments) {
  if (segments.empty()) {
    return false;
  }
  const auto* pStatic = std::get_if<StaticSegment>(&segments.back());
  return pStatic != nullptr && pStatic->bytes.ends_with('/');
}

}  // namespace

SegmentList ParsePattern(std::string_view pattern) {
  SegmentList segments;
  std::string literalBuffer;

  for (std::size_t pos = 0; pos < pattern.size();) {
    if (pattern.compare(pos, kEscapedOpenBrace.size(), kEscapedOpenBrace) == 0) {
      literalBuffer.push_back('{');
      pos += kEscapedOpenBrace.size();
      continue;
    }
    if (pattern.compare(pos, kEscapedCloseBrace.size(), kEscapedCloseBrace) == 0) {
      literalBuffer.push_back('}');
      pos += kEscapedCloseBrace.size();
      continue;
    }
    if (pattern[pos] == '}') {
      throw PatternError(RouteErrc::UnescapedBrace, pattern, pos);
    }
    if (pattern[pos] != '{') {
      literalBuffer.push_back(pattern[pos]);
      ++pos;
      continue;
    }

    // Parameter body runs until the closing brace, which must come before the end of the segment.
    const std::size_t openPos = pos;
    std::size_t closePos = openPos + 1U;
    for (; closePos < pattern.size() && pattern[closePos] != '}'; ++closePos) {
      if (pattern[closePos] == '{') {
        throw PatternError(RouteErrc::NestedOrMisplacedWildcard, pattern, closePos);
      }
      if (pattern[closePos] == '/') {
        throw PatternError(RouteErrc::UnclosedBrace, pattern, openPos);
      }
    }
    if (closePos == pattern.size()) {
      throw PatternError(RouteErrc::UnclosedBrace, pattern, openPos);
    }

    std::string_view body = pattern.substr(openPos + 1U, closePos - openPos - 1U);
    const bool isCatchAll = body.starts_with('*');
    if (isCatchAll) {
      body.remove_prefix(1U);
    }
    if (body.empty()) {
      throw PatternError(RouteErrc::EmptyParameterName, pattern, openPos);
    }

    const std::size_t nextPos = closePos + 1U;

    FlushStatic(literalBuffer, segments);

    if (isCatchAll) {
      if (nextPos != pattern.size()) {
        throw PatternError(RouteErrc::CatchAllNotAtEnd, pattern, nextPos);
      }
      if (!LastStaticEndsWithSlash(segments)) {
        throw PatternError(RouteErrc::NestedOrMisplacedWildcard, pattern, openPos);
      }
      segments.emplace_back(CatchAllSegment{std::string(body)});
    } else {
      if (nextPos != pattern.size() && pattern[nextPos] != '/') {
        throw PatternError(RouteErrc::ParameterNotFollowedByBoundary, pattern, nextPos);
      }
      segments.emplace_back(ParamSegment{std::string(body)});
    }

    pos = nextPos;
  }

  FlushStatic(literalBuffer, segments);
  return segments;
}

void AppendEscaped(std::string_view bytes, std::string& out) {
  for (char ch : bytes) {
    out.push_back(ch);
    if (ch == '{' || ch == '}') {
      out.push_back(ch);
    }
  }
}

std::string FormatPattern(std::span<const Segment> segments) {
  std::string out;
  for (const Segment& segment : segments) {
    std::visit(
        [&out](const auto& seg) {
          using T = std::decay_t<decltype(seg)>;
          if constexpr (std::is_same_v<T, StaticSegment>) {
            AppendEscaped(seg.bytes, out);
          } else if constexpr (std::is_same_v<T, ParamSegment>) {
            out.push_back('{');
            out.append(seg.name);
            out.push_back('}');
          } else if constexpr (std::is_same_v<T, CatchAllSegment>) {
            out.append("{*");
            out.append(seg.name);
            out.push_back('}');
          } else {
            static_assert(false, "Non-exhaustive visitor!");
          }
        },
        segment);
  }
  return out;
}

}  // namespace routetrie
