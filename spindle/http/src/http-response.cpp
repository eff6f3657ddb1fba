#include "spindle/http-response.hpp"

#include <string>
#include <string_view>
#include <utility>

#include "spindle/http-constants.hpp"

namespace spindle {

HttpResponse::HttpResponse(std::string_view body, std::string_view contentType) {
  this->body(std::string(body), contentType);
}

HttpResponse& HttpResponse::body(std::string body, std::string_view contentType) & {
  _body = std::move(body);
  if (!contentType.empty()) {
    _parts.headers.set(http::ContentType, contentType);
  }
  return *this;
}

}  // namespace spindle
