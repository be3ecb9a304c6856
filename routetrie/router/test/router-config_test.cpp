#include "routetrie/router-config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

#include "routetrie/path-params.hpp"

namespace routetrie {

TEST(RouterConfigTest, DefaultShouldBeValid) {
  RouterConfig cfg;
  EXPECT_NO_THROW(cfg.validate());
  EXPECT_EQ(cfg.duplicatePolicy, RouterConfig::DuplicatePolicy::Reject);
  EXPECT_EQ(cfg.maxParamsPerRoute, kMaxPathParams);
}

TEST(RouterConfigTest, ValidateMaxParamsPerRoute) {
  RouterConfig cfg;
  cfg.withMaxParamsPerRoute(1);
  EXPECT_NO_THROW(cfg.validate());

  cfg.withMaxParamsPerRoute(kMaxPathParams);
  EXPECT_NO_THROW(cfg.validate());

  cfg.withMaxParamsPerRoute(0);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);

  cfg.withMaxParamsPerRoute(kMaxPathParams + 1);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RouterConfigTest, ValidateMaxPatternLength) {
  RouterConfig cfg;
  cfg.withMaxPatternLength(1);
  EXPECT_NO_THROW(cfg.validate());

  cfg.withMaxPatternLength(0);
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RouterConfigTest, ValidateDuplicatePolicy) {
  RouterConfig cfg;
  cfg.withDuplicatePolicy(RouterConfig::DuplicatePolicy::Overwrite);
  EXPECT_NO_THROW(cfg.validate());

  cfg.withDuplicatePolicy(static_cast<RouterConfig::DuplicatePolicy>(42));
  EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST(RouterConfigTest, SettersChain) {
  const RouterConfig cfg = RouterConfig{}
                               .withDuplicatePolicy(RouterConfig::DuplicatePolicy::Overwrite)
                               .withMaxParamsPerRoute(4)
                               .withMaxPatternLength(128);
  EXPECT_EQ(cfg.duplicatePolicy, RouterConfig::DuplicatePolicy::Overwrite);
  EXPECT_EQ(cfg.maxParamsPerRoute, 4U);
  EXPECT_EQ(cfg.maxPatternLength, 128U);
}

}  // namespace routetrie
