#include "routetrie/path-params.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "routetrie/router.hpp"

namespace routetrie {

class PathParamsTest : public ::testing::Test {
 protected:
  PathParamsTest() {
    router.insert("/repos/{owner}/{repo}/tree/{*path}", 1);
    router.insert("/dup/{x}/{y}", 2);
  }

  Router<int> router;
};

TEST_F(PathParamsTest, DefaultIsEmpty) {
  const PathParams params;
  EXPECT_TRUE(params.empty());
  EXPECT_EQ(params.size(), 0U);
  EXPECT_EQ(params.begin(), params.end());
  EXPECT_EQ(params.get("any"), std::nullopt);
  EXPECT_TRUE(params.path().empty());
}

TEST_F(PathParamsTest, IndexedAccessAndOffsets) {
  const std::string path = "/repos/me/lib/tree/src/main.cpp";
  const auto res = router.match(path);
  ASSERT_TRUE(res.has_value());

  const PathParams &params = res->params;
  ASSERT_EQ(params.size(), 3U);
  EXPECT_EQ(params[0], (PathParamCapture{"owner", "me"}));
  EXPECT_EQ(params[1], (PathParamCapture{"repo", "lib"}));
  EXPECT_EQ(params[2], (PathParamCapture{"path", "src/main.cpp"}));

  for (std::uint32_t idx = 0; idx < params.size(); ++idx) {
    const auto [begin, end] = params.offsets(idx);
    EXPECT_EQ(params.path().substr(begin, end - begin), params[idx].value);
  }
}

TEST_F(PathParamsTest, Iteration) {
  const auto res = router.match("/repos/a/b/tree/c");
  ASSERT_TRUE(res.has_value());

  std::vector<std::string> keys;
  for (PathParamCapture capture : res->params) {
    keys.emplace_back(capture.key);
  }
  EXPECT_EQ(keys, (std::vector<std::string>{"owner", "repo", "path"}));
  EXPECT_EQ(std::distance(res->params.begin(), res->params.end()), 3);
}

TEST_F(PathParamsTest, GetReturnsFirstValue) {
  const auto res = router.match("/dup/1/2");
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(res->params.get("x"), "1");
  EXPECT_EQ(res->params.get("y"), "2");
  EXPECT_EQ(res->params.get("z"), std::nullopt);
  EXPECT_EQ(res->params.get(""), std::nullopt);
}

TEST_F(PathParamsTest, EqualityComparesBindings) {
  const std::string lhsPath = "/dup/1/2";
  const std::string rhsPath = "/dup/1/2";
  const auto lhs = router.match(lhsPath);
  const auto rhs = router.match(rhsPath);
  const auto other = router.match("/dup/1/3");
  ASSERT_TRUE(lhs && rhs && other);

  EXPECT_EQ(lhs->params, rhs->params);
  EXPECT_NE(lhs->params, other->params);
  EXPECT_NE(lhs->params, PathParams{});
}

}  // namespace routetrie
