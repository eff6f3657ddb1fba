#include "spindle/into-response.hpp"

#include <optional>
#include <string_view>

#include "spindle/http-header-is-valid.hpp"
#include "spindle/http-headers.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/log.hpp"

namespace spindle {

HttpResponse IntoResponseTraits<InvalidHeaderRejection>::Convert(const InvalidHeaderRejection& rejection) {
  log::warn("Handler produced an invalid response header '{}'", rejection.name);
  return HttpResponse(http::StatusCodeInternalServerError).body(std::string_view("invalid response header"));
}

std::optional<Infallible> IntoResponsePartsTraits<HttpHeaders>::Apply(const HttpHeaders& headers,
                                                                      ResponseParts& parts) {
  // First drop all previous occurrences, then append, so that a repeated name in 'headers' is kept as is.
  for (const auto& field : headers) {
    parts.headers.erase(field.name);
  }
  for (const auto& field : headers) {
    parts.headers.append(field.name, field.value);
  }
  return std::nullopt;
}

std::optional<InvalidHeaderRejection> IntoResponsePartsTraits<ResponseHeader>::Apply(ResponseHeader header,
                                                                                     ResponseParts& parts) {
  if (!http::IsValidHeaderName(header.name) || !http::IsValidHeaderValue(header.value)) {
    return InvalidHeaderRejection{std::move(header.name)};
  }
  parts.headers.set(header.name, header.value);
  return std::nullopt;
}

}  // namespace spindle
