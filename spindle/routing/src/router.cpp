#include "spindle/router.hpp"

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/http-constants.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/log.hpp"
#include "spindle/method-router.hpp"
#include "spindle/path-trie.hpp"
#include "spindle/route-conflict-error.hpp"
#include "spindle/router-config.hpp"

namespace spindle {

namespace {

bool HasTrailingSlash(std::string_view path) { return path.size() > 1U && path.back() == '/'; }

}  // namespace

Router::Router(RouterConfig config, PathTrie trie, vector<MethodRouter> routes,
               std::unique_ptr<Handler> fallback) noexcept
    : _config(config), _trie(std::move(trie)), _routes(std::move(routes)), _fallback(std::move(fallback)) {}

Router::~Router() = default;

Router::Resolution Router::resolve(std::string_view path) const {
  Resolution resolution;
  resolution.match = _trie.match(path);
  if (resolution.match) {
    resolution.kind = Resolution::Kind::Found;
    return resolution;
  }

  switch (_config.trailingSlashPolicy) {
    case RouterConfig::TrailingSlashPolicy::Normalize:
      if (HasTrailingSlash(path)) {
        path.remove_suffix(1U);
        resolution.match = _trie.match(path);
      } else if (path.size() > 1U) {
        resolution.match = _trie.match(std::string(path) + '/');
      }
      if (resolution.match) {
        resolution.kind = Resolution::Kind::Found;
      }
      break;
    case RouterConfig::TrailingSlashPolicy::Redirect:
      if (HasTrailingSlash(path)) {
        path.remove_suffix(1U);
        resolution.match = _trie.match(path);
        if (resolution.match) {
          resolution.kind = Resolution::Kind::Redirect;
        }
      }
      break;
    default:
      break;
  }
  return resolution;
}

HttpResponse Router::call(HttpRequest request) const {
  request.body().setLimit(_config.maxBodyBytes);

  const http::Method method = request.method();
  std::string path(request.path());
  try {
    return dispatch(std::move(request));
  } catch (const std::exception& ex) {
    log::error("Exception in handler for {} {}: {}", http::MethodToStr(method), path, ex.what());
  } catch (...) {
    log::error("Unknown exception in handler for {} {}", http::MethodToStr(method), path);
  }
  return HttpResponse(http::StatusCodeInternalServerError).body(http::ReasonInternalServerError);
}

HttpResponse Router::dispatch(HttpRequest request) const {
  Resolution resolution = resolve(request.path());

  switch (resolution.kind) {
    case Resolution::Kind::Found: {
      request.setPathParams(std::move(resolution.match->params));
      return _routes[resolution.match->value].call(std::move(request), _config.headFallbackToGet);
    }
    case Resolution::Kind::Redirect: {
      std::string location(request.path());
      location.pop_back();
      if (!request.query().empty()) {
        location.push_back('?');
        location.append(request.query());
      }
      log::debug("Redirecting {} to {}", request.path(), location);
      return HttpResponse(http::StatusCodeMovedPermanently).header(http::Location, location);
    }
    default:
      break;
  }

  if (_fallback) {
    return _fallback->call(std::move(request));
  }
  log::debug("No route for {} {}", http::MethodToStr(request.method()), request.path());
  return HttpResponse(http::StatusCodeNotFound);
}

http::MethodBmp Router::allowedMethods(std::string_view path) const {
  const Resolution resolution = resolve(path);
  if (!resolution.match) {
    return 0U;
  }
  return _routes[resolution.match->value].methods();
}

RouterBuilder::RouterBuilder(RouterConfig config) : _config(config) { _config.validate(); }

RouterBuilder& RouterBuilder::route(std::string_view path, MethodRouter methodRouter) & {
  if (const auto existing = _trie.find(path)) {
    if (const auto conflict = _routes[*existing].merge(std::move(methodRouter))) {
      throw RouteConflictError(*conflict, path);
    }
    log::debug("Merged handlers for path {}", path);
    return *this;
  }

  const auto methods = methodRouter.methods();
  const bool hasFallback = methodRouter.fallback() != nullptr;
  const auto idx = static_cast<PathTrie::Value>(_routes.size());
  _routes.push_back(std::move(methodRouter));
  try {
    static_cast<void>(_trie.insert(path, idx));
  } catch (const std::exception&) {
    _routes.pop_back();
    throw;
  }
  log::debug("Registered path {} with methods [{}]{}", path, BuildAllowHeader(methods),
             hasFallback ? " and a fallback" : "");
  return *this;
}

void RouterBuilder::setFallback(std::unique_ptr<Handler> handler) {
  if (_fallback) {
    throw RouteConflictError(MethodSlot::Fallback(), "*");
  }
  _fallback = std::move(handler);
}

Router RouterBuilder::build() && {
  log::debug("Building router with {} path(s)", _routes.size());
  return {_config, std::move(_trie), std::move(_routes), std::move(_fallback)};
}

}  // namespace spindle
