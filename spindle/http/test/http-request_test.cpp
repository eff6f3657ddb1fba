#include "spindle/http-request.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>

#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/invalid-argument-exception.hpp"
#include "spindle/path-params.hpp"
#include "spindle/request-body.hpp"

namespace spindle {

TEST(HttpRequestTest, SplitsPathAndQuery) {
  HttpRequest req(http::Method::GET, "/search?q=route&page=2");
  EXPECT_EQ(req.method(), http::Method::GET);
  EXPECT_EQ(req.path(), "/search");
  EXPECT_EQ(req.query(), "q=route&page=2");
}

TEST(HttpRequestTest, EmptyTargetIsRoot) {
  HttpRequest req(http::Method::GET, "");
  EXPECT_EQ(req.path(), "/");
  EXPECT_EQ(req.query(), "");

  HttpRequest onlyQuery(http::Method::GET, "?a=b");
  EXPECT_EQ(onlyQuery.path(), "/");
  EXPECT_EQ(onlyQuery.query(), "a=b");
}

TEST(HttpRequestTest, Headers) {
  HttpRequest req(http::Method::POST, "/", HttpHeaders{{"Content-Type", "text/plain"}, {"X-Trace", "abc"}});
  EXPECT_EQ(req.headerValue("content-type"), "text/plain");
  EXPECT_EQ(req.headerValueOrEmpty("x-trace"), "abc");
  EXPECT_FALSE(req.headerValue("Accept").has_value());
  EXPECT_EQ(req.headers().size(), 2U);
}

TEST(HttpRequestTest, PathParamsAbsentUntilRouted) {
  HttpRequest req(http::Method::GET, "/users/42");
  EXPECT_EQ(req.pathParams(), nullptr);
  EXPECT_FALSE(req.pathParam("id").has_value());

  PathParams params;
  params.add("id", "42");
  req.setPathParams(std::move(params));
  ASSERT_NE(req.pathParams(), nullptr);
  EXPECT_EQ(req.pathParam("id"), "42");
  EXPECT_FALSE(req.pathParam("other").has_value());
}

TEST(HttpRequestTest, IntoPartsAndBack) {
  HttpRequest req(http::Method::PUT, "/items/1?x=y", HttpHeaders{{"A", "1"}}, RequestBody(std::string("payload")));
  auto [parts, body] = std::move(req).intoParts();
  EXPECT_EQ(parts.method, http::Method::PUT);
  EXPECT_EQ(parts.path, "/items/1");
  EXPECT_EQ(parts.query, "x=y");
  EXPECT_EQ(parts.headers.value("a"), "1");
  EXPECT_FALSE(parts.pathParams.has_value());

  HttpRequest rebuilt(std::move(parts), std::move(body));
  EXPECT_EQ(rebuilt.path(), "/items/1");
  EXPECT_EQ(rebuilt.body().readAll(), "payload");
}

TEST(HttpRequestTest, RejectsMethodValuesOutsideTheNamedOnes) {
  EXPECT_THROW(HttpRequest(static_cast<http::Method>(0), "/"), invalid_argument);
  EXPECT_THROW(HttpRequest(static_cast<http::Method>(http::Method::GET | http::Method::POST), "/"), invalid_argument);
  EXPECT_THROW(HttpRequest(static_cast<http::Method>(1U << http::kNbMethods), "/"), invalid_argument);

  RequestParts parts;
  parts.method = static_cast<http::Method>(0);
  EXPECT_THROW(HttpRequest(std::move(parts), RequestBody{}), invalid_argument);

  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    EXPECT_EQ(HttpRequest(http::MethodFromIdx(methodIdx), "/").method(), http::MethodFromIdx(methodIdx));
  }
}

TEST(PathParamsTest, OrderedCaptures) {
  PathParams params;
  EXPECT_TRUE(params.empty());
  params.add("id", "42");
  params.add("rest", "a/b.txt");
  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params[0].key, "id");
  EXPECT_EQ(params[0].value, "42");
  EXPECT_EQ(params[1].key, "rest");
  EXPECT_EQ(params.get("rest"), "a/b.txt");
  EXPECT_FALSE(params.get("missing").has_value());

  std::string joined;
  for (const auto& capture : params) {
    joined += capture.key + '=' + capture.value + ';';
  }
  EXPECT_EQ(joined, "id=42;rest=a/b.txt;");

  params.clear();
  EXPECT_TRUE(params.empty());
}

}  // namespace spindle
