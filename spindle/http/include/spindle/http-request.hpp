#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/path-params.hpp"
#include "spindle/request-body.hpp"

namespace spindle {

// Everything in a request except its body. Part extractors read (and may update) this object,
// it is never consumed.
struct RequestParts {
  http::Method method{http::Method::GET};

  // Path component of the request target as received (without '?' and the query string). Never empty.
  std::string path{"/"};

  // Raw query string, without the leading '?'. Empty if the target had none.
  std::string query;

  HttpHeaders headers;

  // Engaged by the Router once the path has been matched against a route pattern.
  std::optional<PathParams> pathParams;
};

// A parsed HTTP request as handed over by the transport layer.
// It is consumed by the dispatch: body extraction drains it, and the whole object is destroyed afterwards.
class HttpRequest {
 public:
  // Builds a request from a method and a request target ("/path?query").
  // An empty target is interpreted as "/".
  // Throws invalid_argument if 'method' is not exactly one of the named methods.
  HttpRequest(http::Method method, std::string_view target, HttpHeaders headers = {}, RequestBody body = {});

  // Reassembles a request from its parts and its (possibly unread) body.
  // Throws invalid_argument if the method of 'parts' is not exactly one of the named methods.
  HttpRequest(RequestParts parts, RequestBody body);

  HttpRequest(const HttpRequest&) = delete;
  HttpRequest(HttpRequest&&) noexcept = default;
  HttpRequest& operator=(const HttpRequest&) = delete;
  HttpRequest& operator=(HttpRequest&&) noexcept = default;

  ~HttpRequest() = default;

  [[nodiscard]] http::Method method() const noexcept { return _parts.method; }

  [[nodiscard]] std::string_view path() const noexcept { return _parts.path; }

  [[nodiscard]] std::string_view query() const noexcept { return _parts.query; }

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _parts.headers; }

  // Value of the first header named 'name' (case-insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _parts.headers.value(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _parts.headers.valueOrEmpty(name);
  }

  // Captured path parameters, nullptr if the request has not been routed through a pattern.
  [[nodiscard]] const PathParams* pathParams() const noexcept {
    return _parts.pathParams ? &*_parts.pathParams : nullptr;
  }

  // Value of the captured path parameter 'key', std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> pathParam(std::string_view key) const noexcept {
    return _parts.pathParams ? _parts.pathParams->get(key) : std::nullopt;
  }

  void setPathParams(PathParams pathParams) { _parts.pathParams = std::move(pathParams); }

  [[nodiscard]] const RequestParts& parts() const noexcept { return _parts; }

  [[nodiscard]] RequestBody& body() noexcept { return _body; }
  [[nodiscard]] const RequestBody& body() const noexcept { return _body; }

  // Splits the request into its parts and its body.
  [[nodiscard]] std::pair<RequestParts, RequestBody> intoParts() && noexcept {
    return {std::move(_parts), std::move(_body)};
  }

 private:
  RequestParts _parts;
  RequestBody _body;
};

}  // namespace spindle
