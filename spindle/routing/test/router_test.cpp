#include "spindle/router.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include "spindle/http-constants.hpp"
#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/invalid-argument-exception.hpp"
#include "spindle/method-router.hpp"
#include "spindle/path-params.hpp"
#include "spindle/request-body.hpp"
#include "spindle/route-conflict-error.hpp"
#include "spindle/router-config.hpp"

namespace spindle {

namespace {

HttpResponse Dispatch(const Router& router, http::Method method, std::string_view target, std::string body = {}) {
  return router.call(HttpRequest(method, target, HttpHeaders{}, RequestBody(std::move(body))));
}

std::string DescribeParams(const PathParams& params) {
  std::string ret;
  for (const auto& capture : params) {
    ret.append(capture.key).append("=").append(capture.value).append(";");
  }
  return ret;
}

}  // namespace

TEST(RouterTest, SingleHandlerPerPathAcceptsAnyMethod) {
  auto router = RouterBuilder().route("/", [] { return "root"; }).build();
  EXPECT_EQ(router.nbRoutes(), 1U);
  for (auto method : {http::Method::GET, http::Method::POST, http::Method::DELETE}) {
    const HttpResponse resp = Dispatch(router, method, "/");
    EXPECT_EQ(resp.status(), http::StatusCodeOK);
    EXPECT_EQ(resp.body(), "root");
  }
}

TEST(RouterTest, MethodRoutingAndMisses) {
  auto router = RouterBuilder()
                    .route("/x", Get([] { return "get x"; }))
                    .route("/x", Post([] { return "post x"; }))
                    .build();
  EXPECT_EQ(router.nbRoutes(), 1U);

  EXPECT_EQ(Dispatch(router, http::Method::GET, "/x").body(), "get x");
  EXPECT_EQ(Dispatch(router, http::Method::POST, "/x").body(), "post x");

  const HttpResponse notAllowed = Dispatch(router, http::Method::PUT, "/x");
  EXPECT_EQ(notAllowed.status(), http::StatusCodeMethodNotAllowed);
  EXPECT_EQ(notAllowed.headerValue(http::Allow), "GET, POST");

  EXPECT_EQ(Dispatch(router, http::Method::GET, "/y").status(), http::StatusCodeNotFound);
}

TEST(RouterTest, EveryRouteReachesItsHandlerExactlyOnceWithCaptures) {
  struct Route {
    http::Method method;
    std::string pattern;
    std::string target;
    std::string expectedParams;
  };
  const std::vector<Route> routes{
      {http::Method::GET, "/users", "/users", ""},
      {http::Method::POST, "/users", "/users", ""},
      {http::Method::GET, "/users/:id", "/users/42", "id=42;"},
      {http::Method::DELETE, "/users/:id", "/users/7", "id=7;"},
      {http::Method::GET, "/users/:id/posts/:post", "/users/1/posts/hello", "id=1;post=hello;"},
      {http::Method::PUT, "/files/*path", "/files/a/b/c.txt", "path=a/b/c.txt;"},
  };

  std::vector<int> hits(routes.size(), 0);
  RouterBuilder builder;
  for (std::size_t routeIdx = 0; routeIdx < routes.size(); ++routeIdx) {
    MethodRouter methodRouter;
    methodRouter.on(routes[routeIdx].method, [&hits, routeIdx](PathParams params) {
      ++hits[routeIdx];
      return DescribeParams(params);
    });
    builder.route(routes[routeIdx].pattern, std::move(methodRouter));
  }
  auto router = std::move(builder).build();
  EXPECT_EQ(router.nbRoutes(), 4U);

  for (const auto& route : routes) {
    const HttpResponse resp = Dispatch(router, route.method, route.target);
    EXPECT_EQ(resp.status(), http::StatusCodeOK) << route.target;
    EXPECT_EQ(resp.body(), route.expectedParams) << route.target;
  }
  for (int nbHits : hits) {
    EXPECT_EQ(nbHits, 1);
  }
}

TEST(RouterTest, DuplicateMethodRegistrationFails) {
  RouterBuilder builder;
  builder.route("/x", Get([] { return "a"; }));
  try {
    builder.route("/x", Get([] { return "b"; }));
    FAIL() << "expected RouteConflictError";
  } catch (const RouteConflictError& err) {
    EXPECT_EQ(err.slot().name(), "GET");
    EXPECT_NE(std::string(err.what()).find("/x"), std::string::npos);
  }
}

TEST(RouterTest, DuplicateFallbackRegistrationFails) {
  RouterBuilder builder;
  builder.route("/x", [] { return "a"; });
  EXPECT_THROW(builder.route("/x", Any([] { return "b"; })), RouteConflictError);
}

TEST(RouterTest, FailedMergeKeepsPreviousHandlers) {
  RouterBuilder builder;
  builder.route("/x", Get([] { return "get"; }));
  EXPECT_THROW(builder.route("/x", Post([] { return "post"; }).get([] { return "get2"; })), RouteConflictError);
  auto router = std::move(builder).build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/x").body(), "get");
  EXPECT_EQ(Dispatch(router, http::Method::POST, "/x").status(), http::StatusCodeMethodNotAllowed);
}

TEST(RouterTest, MalformedPatternFails) {
  RouterBuilder builder;
  EXPECT_THROW(builder.route("no-slash", [] { return "x"; }), invalid_argument);
  EXPECT_THROW(builder.route("/a/*rest/b", [] { return "x"; }), invalid_argument);
  builder.route("/items/:id", Get([] { return "x"; }));
  EXPECT_THROW(builder.route("/items/:name", Post([] { return "x"; })), invalid_argument);
  EXPECT_EQ(std::move(builder).build().nbRoutes(), 1U);
}

TEST(RouterTest, MethodAndBodyExtraction) {
  auto router = RouterBuilder()
                    .route("/echo", [](http::Method method, std::string body) {
                      return std::string(http::MethodToStr(method)) + ':' + body;
                    })
                    .build();
  EXPECT_EQ(Dispatch(router, http::Method::PUT, "/echo", "hi").body(), "PUT:hi");
}

TEST(RouterTest, CompositeResponse) {
  auto router = RouterBuilder().route("/create", Post([] { return std::tuple{http::StatusCodeCreated, "ok"}; })).build();
  const HttpResponse resp = Dispatch(router, http::Method::POST, "/create");
  EXPECT_EQ(resp.status(), http::StatusCodeCreated);
  EXPECT_EQ(resp.headerValue(http::ContentType), "text/plain;charset=utf-8");
  EXPECT_EQ(resp.body(), "ok");
}

TEST(RouterTest, InvalidUtf8BodyDoesNotInvokeHandler) {
  bool invoked = false;
  auto router = RouterBuilder()
                    .route("/text", Post([&invoked](std::string body) {
                             invoked = true;
                             return body;
                           }))
                    .build();
  const HttpResponse resp = Dispatch(router, http::Method::POST, "/text", std::string("\xC0\xAF", 2));
  EXPECT_GE(resp.status(), 500);
  EXPECT_LT(resp.status(), 600);
  EXPECT_FALSE(invoked);
}

TEST(RouterTest, BodyLimit) {
  auto router = RouterBuilder(RouterConfig{}.withMaxBodyBytes(4))
                    .route("/upload", Post([](std::string body) { return body; }))
                    .build();
  EXPECT_EQ(Dispatch(router, http::Method::POST, "/upload", "1234").body(), "1234");
  EXPECT_EQ(Dispatch(router, http::Method::POST, "/upload", "12345").status(), http::StatusCodePayloadTooLarge);
}

TEST(RouterTest, InvalidConfigIsRejected) {
  EXPECT_THROW(RouterBuilder(RouterConfig{}.withMaxBodyBytes(0)), invalid_argument);
}

TEST(RouterTest, QueryStringIsNotPartOfThePath) {
  auto router = RouterBuilder().route("/search", [](HttpRequest req) { return std::string(req.query()); }).build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/search?q=abc").body(), "q=abc");
}

TEST(RouterTest, GlobalFallback) {
  auto router = RouterBuilder()
                    .route("/known", [] { return "known"; })
                    .fallback([](HttpRequest req) {
                      return std::pair{http::StatusCodeNotFound, "no route for " + std::string(req.path())};
                    })
                    .build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/known").body(), "known");
  const HttpResponse resp = Dispatch(router, http::Method::GET, "/unknown");
  EXPECT_EQ(resp.status(), http::StatusCodeNotFound);
  EXPECT_EQ(resp.body(), "no route for /unknown");
}

TEST(RouterTest, SecondGlobalFallbackFails) {
  RouterBuilder builder;
  builder.fallback([] { return http::StatusCodeNotFound; });
  EXPECT_THROW(builder.fallback([] { return http::StatusCodeNotFound; }), RouteConflictError);
}

TEST(RouterTest, GlobalFallbackHasNoPathParams) {
  auto router = RouterBuilder().fallback([](PathParams) { return "unreachable"; }).build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/anything").status(), http::StatusCodeInternalServerError);
}

TEST(RouterTest, RouteWithoutCapturesHasEmptyPathParams) {
  auto router = RouterBuilder().route("/plain", [](PathParams params) { return std::to_string(params.size()); }).build();
  const HttpResponse resp = Dispatch(router, http::Method::GET, "/plain");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_EQ(resp.body(), "0");
}

TEST(RouterTest, HandlerExceptionYieldsInternalServerError) {
  auto router = RouterBuilder()
                    .route("/boom", [](http::Method) -> const char* { throw std::runtime_error("boom"); })
                    .build();
  const HttpResponse resp = Dispatch(router, http::Method::GET, "/boom");
  EXPECT_EQ(resp.status(), http::StatusCodeInternalServerError);
  EXPECT_EQ(resp.body(), http::ReasonInternalServerError);
}

TEST(RouterTest, StrictTrailingSlash) {
  auto router = RouterBuilder().route("/a", [] { return "a"; }).route("/b/", [] { return "b"; }).build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/a").status(), http::StatusCodeOK);
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/a/").status(), http::StatusCodeNotFound);
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/b").status(), http::StatusCodeNotFound);
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/b/").status(), http::StatusCodeOK);
}

TEST(RouterTest, NormalizeTrailingSlash) {
  auto router = RouterBuilder(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Normalize))
                    .route("/a", [] { return "a"; })
                    .route("/b/", [] { return "b"; })
                    .route("/users/:id", [](PathParams params) { return std::string(params.get("id").value()); })
                    .build();
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/a/").body(), "a");
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/b").body(), "b");
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/users/9/").body(), "9");
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/").status(), http::StatusCodeNotFound);
}

TEST(RouterTest, RedirectTrailingSlash) {
  auto router = RouterBuilder(RouterConfig{}.withTrailingSlashPolicy(RouterConfig::TrailingSlashPolicy::Redirect))
                    .route("/a", [] { return "a"; })
                    .route("/b/", [] { return "b"; })
                    .build();
  const HttpResponse resp = Dispatch(router, http::Method::GET, "/a/?x=1");
  EXPECT_EQ(resp.status(), http::StatusCodeMovedPermanently);
  EXPECT_EQ(resp.headerValue(http::Location), "/a?x=1");
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/b").status(), http::StatusCodeNotFound);
  EXPECT_EQ(Dispatch(router, http::Method::GET, "/b/").body(), "b");
}

TEST(RouterTest, HeadFallbackToGet) {
  auto router = RouterBuilder(RouterConfig{}.withHeadFallbackToGet())
                    .route("/doc", Get([] { return "content"; }))
                    .build();
  const HttpResponse resp = Dispatch(router, http::Method::HEAD, "/doc");
  EXPECT_EQ(resp.status(), http::StatusCodeOK);
  EXPECT_FALSE(resp.hasBody());
  EXPECT_EQ(resp.headerValue(http::ContentType), http::ContentTypeTextPlainUtf8);
}

TEST(RouterTest, AllowedMethods) {
  auto router = RouterBuilder()
                    .route("/x", Get([] { return "get"; }).put([] { return "put"; }))
                    .route("/any", [] { return "any"; })
                    .build();
  EXPECT_EQ(router.allowedMethods("/x"), http::Method::GET | http::Method::PUT);
  EXPECT_EQ(router.allowedMethods("/any"), 0U);
  EXPECT_EQ(router.allowedMethods("/missing"), 0U);
}

TEST(RouterTest, ConcurrentDispatch) {
  std::atomic<int> nbCalls{0};
  auto router = RouterBuilder()
                    .route("/items/:id", Get([&nbCalls](PathParams params) {
                             nbCalls.fetch_add(1, std::memory_order_relaxed);
                             return std::string(params.get("id").value());
                           }))
                    .route("/echo", Post([](std::string body) { return body; }))
                    .build();

  static constexpr int kNbThreads = 8;
  static constexpr int kNbRequestsPerThread = 200;

  std::vector<int> nbErrors(kNbThreads, 0);
  std::vector<std::thread> threads;
  threads.reserve(kNbThreads);
  for (int threadIdx = 0; threadIdx < kNbThreads; ++threadIdx) {
    threads.emplace_back([&router, &nbErrors, threadIdx] {
      for (int requestIdx = 0; requestIdx < kNbRequestsPerThread; ++requestIdx) {
        const std::string id = std::to_string(threadIdx) + '-' + std::to_string(requestIdx);
        if (Dispatch(router, http::Method::GET, "/items/" + id).body() != id) {
          ++nbErrors[threadIdx];
        }
        if (Dispatch(router, http::Method::POST, "/echo", id).body() != id) {
          ++nbErrors[threadIdx];
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (int nbThreadErrors : nbErrors) {
    EXPECT_EQ(nbThreadErrors, 0);
  }
  EXPECT_EQ(nbCalls.load(), kNbThreads * kNbRequestsPerThread);
}

}  // namespace spindle
