#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

#include "spindle/handler.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/method-router.hpp"
#include "spindle/path-trie.hpp"
#include "spindle/router-config.hpp"
#include "spindle/vector.hpp"

namespace spindle {

// Immutable request dispatcher, produced by RouterBuilder::build().
//
// Threading: a Router is never modified after construction, call() can be invoked concurrently from any
// number of threads without synchronization.
class Router {
 public:
  Router(const Router&) = delete;
  Router(Router&&) noexcept = default;
  Router& operator=(const Router&) = delete;
  Router& operator=(Router&&) noexcept = default;

  ~Router();

  // Dispatches a request and always returns a response:
  //   - the handler of the route matching the path and the method,
  //   - 301 (trailing slash Redirect policy), 404 (or the global fallback) if no route matches the path,
  //   - 405 with an Allow header if the route has no handler for the method,
  //   - 500 if the handler threw an exception.
  [[nodiscard]] HttpResponse call(HttpRequest request) const;

  // Methods explicitly registered for 'path' (after trailing slash resolution). 0 if no route matches.
  [[nodiscard]] http::MethodBmp allowedMethods(std::string_view path) const;

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Number of distinct path patterns.
  [[nodiscard]] std::size_t nbRoutes() const noexcept { return _routes.size(); }

 private:
  friend class RouterBuilder;

  struct Resolution {
    enum class Kind : std::int8_t { NotFound, Found, Redirect };

    Kind kind{Kind::NotFound};
    std::optional<PathTrie::Match> match;
  };

  Router(RouterConfig config, PathTrie trie, vector<MethodRouter> routes, std::unique_ptr<Handler> fallback) noexcept;

  [[nodiscard]] Resolution resolve(std::string_view path) const;

  [[nodiscard]] HttpResponse dispatch(HttpRequest request) const;

  RouterConfig _config;
  PathTrie _trie;
  vector<MethodRouter> _routes;
  std::unique_ptr<Handler> _fallback;
};

// Collects routes at startup and seals them into a Router.
//
//   auto router = RouterBuilder()
//                     .route("/", [] { return "hello"; })
//                     .route("/users/:id", Get(getUser).del(deleteUser))
//                     .build();
//
// Registering two handlers for the same (path, method) pair, or two fallbacks for the same path, throws
// RouteConflictError. A malformed pattern throws invalid_argument.
class RouterBuilder {
 public:
  RouterBuilder() = default;

  // Throws invalid_argument if 'config' is not valid.
  explicit RouterBuilder(RouterConfig config);

  // Registers the handlers of 'methodRouter' for 'path'.
  // Handlers for a path registered several times are merged.
  RouterBuilder& route(std::string_view path, MethodRouter methodRouter) &;

  RouterBuilder&& route(std::string_view path, MethodRouter methodRouter) && {
    return std::move(route(path, std::move(methodRouter)));
  }

  // Registers a single handler for 'path' accepting all methods.
  template <class F>
    requires(!std::same_as<std::remove_cvref_t<F>, MethodRouter>)
  RouterBuilder& route(std::string_view path, F handler) & {
    return route(path, Any(std::move(handler)));
  }

  template <class F>
    requires(!std::same_as<std::remove_cvref_t<F>, MethodRouter>)
  RouterBuilder&& route(std::string_view path, F handler) && {
    return std::move(route(path, Any(std::move(handler))));
  }

  // Sets the handler called for requests whose path does not match any route (404 by default).
  template <class F>
  RouterBuilder& fallback(F handler) & {
    setFallback(MakeHandler(std::move(handler)));
    return *this;
  }

  template <class F>
  RouterBuilder&& fallback(F handler) && {
    setFallback(MakeHandler(std::move(handler)));
    return std::move(*this);
  }

  [[nodiscard]] Router build() &&;

 private:
  void setFallback(std::unique_ptr<Handler> handler);

  RouterConfig _config;
  PathTrie _trie;
  vector<MethodRouter> _routes;
  std::unique_ptr<Handler> _fallback;
};

}  // namespace spindle
