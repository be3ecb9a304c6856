#include "routetrie/pattern-parser.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "routetrie/route-error.hpp"
#include "routetrie/segment.hpp"

namespace routetrie {

namespace {

RouteErrc ParseErrc(std::string_view pattern) {
  try {
    [[maybe_unused]] auto segments = ParsePattern(pattern);
  } catch (const PatternError &err) {
    return err.code();
  }
  ADD_FAILURE() << "Pattern '" << pattern << "' should not parse";
  return RouteErrc::DuplicateRoute;
}

std::size_t ParseErrorPosition(std::string_view pattern) {
  try {
    [[maybe_unused]] auto segments = ParsePattern(pattern);
  } catch (const PatternError &err) {
    return err.position();
  }
  ADD_FAILURE() << "Pattern '" << pattern << "' should not parse";
  return 0;
}

}  // namespace

TEST(PatternParserTest, EmptyPattern) { EXPECT_TRUE(ParsePattern("").empty()); }

TEST(PatternParserTest, StaticOnly) {
  const SegmentList segments = ParsePattern("/api/v1/users");
  ASSERT_EQ(segments.size(), 1U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/api/v1/users"}));
}

TEST(PatternParserTest, NamedParameters) {
  const SegmentList segments = ParsePattern("/users/{userId}/posts/{post}");
  ASSERT_EQ(segments.size(), 4U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/users/"}));
  EXPECT_EQ(segments[1], Segment(ParamSegment{"userId"}));
  EXPECT_EQ(segments[2], Segment(StaticSegment{"/posts/"}));
  EXPECT_EQ(segments[3], Segment(ParamSegment{"post"}));
}

TEST(PatternParserTest, ParameterAfterLiteralInSameSegment) {
  const SegmentList segments = ParsePattern("/api/v{version}/resource");
  ASSERT_EQ(segments.size(), 3U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/api/v"}));
  EXPECT_EQ(segments[1], Segment(ParamSegment{"version"}));
  EXPECT_EQ(segments[2], Segment(StaticSegment{"/resource"}));
}

TEST(PatternParserTest, CatchAll) {
  const SegmentList segments = ParsePattern("/static/{*filepath}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/static/"}));
  EXPECT_EQ(segments[1], Segment(CatchAllSegment{"filepath"}));
}

TEST(PatternParserTest, RootCatchAll) {
  const SegmentList segments = ParsePattern("/{*p}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/"}));
  EXPECT_EQ(segments[1], Segment(CatchAllSegment{"p"}));
}

TEST(PatternParserTest, EscapedBracesAreMergedIntoStatic) {
  const SegmentList segments = ParsePattern("/files/{{config}}/data");
  ASSERT_EQ(segments.size(), 1U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/files/{config}/data"}));
}

TEST(PatternParserTest, EscapedBracesAroundParameter) {
  const SegmentList segments = ParsePattern("/{{x}}/{id}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/{x}/"}));
  EXPECT_EQ(segments[1], Segment(ParamSegment{"id"}));
}

TEST(PatternParserTest, AsteriskInsideNamedParameter) {
  const SegmentList segments = ParsePattern("/a/{x*y}");
  ASSERT_EQ(segments.size(), 2U);
  EXPECT_EQ(segments[1], Segment(ParamSegment{"x*y"}));
}

TEST(PatternParserTest, AsteriskInStaticTextIsLiteral) {
  const SegmentList segments = ParsePattern("/files/*");
  ASSERT_EQ(segments.size(), 1U);
  EXPECT_EQ(segments[0], Segment(StaticSegment{"/files/*"}));
}

TEST(PatternParserTest, UnclosedBrace) {
  EXPECT_EQ(ParseErrc("/users/{id"), RouteErrc::UnclosedBrace);
  EXPECT_EQ(ParseErrc("/users/{id/posts}"), RouteErrc::UnclosedBrace);
  EXPECT_EQ(ParseErrc("{"), RouteErrc::UnclosedBrace);
  EXPECT_EQ(ParseErrorPosition("/users/{id"), 7U);
}

TEST(PatternParserTest, UnescapedClosingBrace) {
  EXPECT_EQ(ParseErrc("/users/id}"), RouteErrc::UnescapedBrace);
  EXPECT_EQ(ParseErrc("/{{id}"), RouteErrc::UnescapedBrace);
  EXPECT_EQ(ParseErrorPosition("/ab}"), 3U);
}

TEST(PatternParserTest, EmptyParameterName) {
  EXPECT_EQ(ParseErrc("/users/{}"), RouteErrc::EmptyParameterName);
  EXPECT_EQ(ParseErrc("/files/{*}"), RouteErrc::EmptyParameterName);
}

TEST(PatternParserTest, CatchAllNotAtEnd) {
  EXPECT_EQ(ParseErrc("/files/{*path}/more"), RouteErrc::CatchAllNotAtEnd);
  EXPECT_EQ(ParseErrc("/files/{*path}x"), RouteErrc::CatchAllNotAtEnd);
  EXPECT_EQ(ParseErrorPosition("/files/{*path}/more"), 14U);
}

TEST(PatternParserTest, ParameterNotFollowedByBoundary) {
  EXPECT_EQ(ParseErrc("/items/{id}-detail"), RouteErrc::ParameterNotFollowedByBoundary);
  EXPECT_EQ(ParseErrc("/items/{a}{b}"), RouteErrc::ParameterNotFollowedByBoundary);
  EXPECT_EQ(ParseErrc("/items/{id}}}"), RouteErrc::ParameterNotFollowedByBoundary);
  EXPECT_EQ(ParseErrc("/items/{id}{*rest}"), RouteErrc::ParameterNotFollowedByBoundary);
}

TEST(PatternParserTest, NestedOrMisplacedWildcard) {
  EXPECT_EQ(ParseErrc("/items/{a{b}}"), RouteErrc::NestedOrMisplacedWildcard);
  EXPECT_EQ(ParseErrc("/files{*path}"), RouteErrc::NestedOrMisplacedWildcard);
  EXPECT_EQ(ParseErrc("{*path}"), RouteErrc::NestedOrMisplacedWildcard);
  EXPECT_EQ(ParseErrc("/x}}{*path}"), RouteErrc::NestedOrMisplacedWildcard);
}

TEST(PatternParserTest, ErrorMessageMentionsPatternAndPosition) {
  try {
    [[maybe_unused]] auto segments = ParsePattern("/users/{}");
    FAIL() << "expected a PatternError";
  } catch (const std::invalid_argument &err) {
    const std::string_view msg = err.what();
    EXPECT_TRUE(msg.contains("/users/{}"));
    EXPECT_TRUE(msg.contains("position 7"));
  }
}

TEST(PatternParserTest, FormatPatternIsInverseOfParse) {
  for (std::string_view pattern : {"/", "/users/{id}", "/files/{{config}}/{*rest}", "/a}}b{{c/{x}/d", "/v{v}/r"}) {
    EXPECT_EQ(FormatPattern(ParsePattern(pattern)), pattern);
  }
}

TEST(PatternParserTest, AppendEscapedDoublesBraces) {
  std::string out = "/";
  AppendEscaped("{a}", out);
  EXPECT_EQ(out, "/{{a}}");
}

}  // namespace routetrie
