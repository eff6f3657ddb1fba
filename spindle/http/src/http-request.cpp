#include "spindle/http-request.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/invalid-argument-exception.hpp"
#include "spindle/request-body.hpp"

namespace spindle {

namespace {

void CheckMethod(http::Method method) {
  if (!http::IsValidMethod(method)) {
    throw invalid_argument("Invalid HTTP method value {}", static_cast<http::MethodIdx>(method));
  }
}

}  // namespace

HttpRequest::HttpRequest(http::Method method, std::string_view target, HttpHeaders headers, RequestBody body)
    : _body(std::move(body)) {
  CheckMethod(method);
  _parts.method = method;
  _parts.headers = std::move(headers);

  const auto queryPos = target.find('?');
  if (queryPos != std::string_view::npos) {
    _parts.query.assign(target.substr(queryPos + 1U));
    target = target.substr(0, queryPos);
  }
  if (target.empty()) {
    target = "/";
  }
  _parts.path.assign(target);
}

HttpRequest::HttpRequest(RequestParts parts, RequestBody body) : _parts(std::move(parts)), _body(std::move(body)) {
  CheckMethod(_parts.method);
}

}  // namespace spindle
