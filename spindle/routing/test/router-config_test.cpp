#include "spindle/router-config.hpp"

#include <gtest/gtest.h>

#include "spindle/invalid-argument-exception.hpp"

namespace spindle {

TEST(RouterConfigTest, Defaults) {
  RouterConfig config;
  EXPECT_EQ(config.trailingSlashPolicy, RouterConfig::TrailingSlashPolicy::Strict);
  EXPECT_FALSE(config.headFallbackToGet);
  EXPECT_EQ(config.maxBodyBytes, RouterConfig::kDefaultMaxBodyBytes);
  EXPECT_NO_THROW(config.validate());
}

TEST(RouterConfigTest, FluentSetters) {
  RouterConfig config;
  config.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect)
      .withHeadFallbackToGet()
      .withMaxBodyBytes(1024);
  EXPECT_EQ(config.trailingSlashPolicy, RouterConfig::TrailingSlashPolicy::Redirect);
  EXPECT_TRUE(config.headFallbackToGet);
  EXPECT_EQ(config.maxBodyBytes, 1024U);
  EXPECT_NO_THROW(config.validate());

  config.withHeadFallbackToGet(false);
  EXPECT_FALSE(config.headFallbackToGet);
}

TEST(RouterConfigTest, ZeroBodyLimitIsInvalid) {
  RouterConfig config;
  config.withMaxBodyBytes(0);
  EXPECT_THROW(config.validate(), invalid_argument);
}

TEST(RouterConfigTest, UnknownTrailingSlashPolicyIsInvalid) {
  RouterConfig config;
  config.trailingSlashPolicy = static_cast<RouterConfig::TrailingSlashPolicy>(42);
  EXPECT_THROW(config.validate(), invalid_argument);
}

}  // namespace spindle
