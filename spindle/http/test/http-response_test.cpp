#include "spindle/http-response.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <span>
#include <string>
#include <utility>

#include "spindle/http-constants.hpp"
#include "spindle/http-status-code.hpp"

namespace spindle {

TEST(HttpResponseTest, DefaultIsEmptyOk) {
  HttpResponse resp;
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_TRUE(resp.headers().empty());
  EXPECT_FALSE(resp.hasBody());
  EXPECT_EQ(resp.body(), "");
}

TEST(HttpResponseTest, StatusOnly) {
  HttpResponse resp(http::StatusCodeNotFound);
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_FALSE(resp.hasBody());
}

TEST(HttpResponseTest, BodyConstructorSetsContentType) {
  HttpResponse resp("hello");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "hello");
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlainUtf8);
}

TEST(HttpResponseTest, FluentBuilding) {
  auto resp = HttpResponse(http::StatusCodeCreated).header("X-Id", "42").addHeader("Vary", "a").addHeader("Vary", "b");
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.headerValueOrEmpty("x-id"), "42");
  EXPECT_EQ(resp.headers().values("vary").size(), 2U);

  resp.header("X-Id", "43").status(http::StatusCodeAccepted);
  EXPECT_EQ(resp.headerValueOrEmpty("X-Id"), "43");
  EXPECT_EQ(resp.headers().values("X-Id").size(), 1U);
  EXPECT_EQ(resp.status(), http::StatusCodeAccepted);
}

TEST(HttpResponseTest, ByteBody) {
  const std::array<std::byte, 3> bytes{std::byte{0x00}, std::byte{0xFF}, std::byte{0x10}};
  auto resp = HttpResponse().body(std::span<const std::byte>(bytes));
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeApplicationOctetStream);
  ASSERT_EQ(resp.bodyBytes().size(), 3U);
  EXPECT_EQ(resp.bodyBytes()[1], std::byte{0xFF});
}

TEST(HttpResponseTest, EmptyContentTypeKeepsHeaders) {
  auto resp = HttpResponse().body("raw", "");
  EXPECT_EQ(resp.body(), "raw");
  EXPECT_FALSE(resp.headerValue(http::ContentType).has_value());
}

TEST(HttpResponseTest, ClearBodyKeepsHeaders) {
  HttpResponse resp("payload");
  resp.clearBody();
  EXPECT_FALSE(resp.hasBody());
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlainUtf8);
}

TEST(HttpResponseTest, IntoPartsAndBack) {
  auto resp = HttpResponse(http::StatusCodeAccepted).header("A", "1").body("data");
  auto [parts, body] = std::move(resp).intoParts();
  EXPECT_EQ(parts.status, http::StatusCodeAccepted);
  EXPECT_EQ(parts.headers.value("A"), "1");
  EXPECT_EQ(body, "data");

  parts.status = http::StatusCodeOK;
  HttpResponse rebuilt(std::move(parts), std::move(body));
  EXPECT_EQ(rebuilt.status(), http::StatusCodeOK);
  EXPECT_EQ(rebuilt.body(), "data");
}

}  // namespace spindle
