#include "spindle/exception.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "spindle/invalid-argument-exception.hpp"

namespace spindle {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("Route table is sealed").what(), "Route table is sealed");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Conflicting {} handler for path '{}'", "GET", "/users/:id").what(),
               "Conflicting GET handler for path '/users/:id'");
}

TEST(ExceptionTest, FormatTruncated) {
  const std::string longPath(300, 'a');
  exception ex("Path '{}' is too long", longPath);
  const std::string msg = ex.what();
  EXPECT_EQ(msg.size(), exception::kMsgMaxLen);
  EXPECT_TRUE(msg.starts_with("Path 'aaaa"));
  EXPECT_TRUE(msg.ends_with("..."));
}

TEST(ExceptionTest, InvalidArgumentIsAnException) {
  try {
    throw invalid_argument("pattern '{}' must start with '/'", "users");
  } catch (const exception& ex) {
    EXPECT_STREQ(ex.what(), "pattern 'users' must start with '/'");
  }
}

}  // namespace spindle
