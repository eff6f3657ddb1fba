#include "spindle/extract.hpp"

#include <cstddef>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "spindle/http-constants.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/log.hpp"
#include "spindle/request-body.hpp"
#include "spindle/utf8-validate.hpp"

namespace spindle {

namespace {

constexpr std::string_view kErrorReadingBody = "error reading body";

HttpResponse PayloadTooLargeResponse() {
  return HttpResponse(http::StatusCodePayloadTooLarge).body(http::ReasonPayloadTooLarge);
}

HttpResponse ErrorReadingBodyResponse() {
  return HttpResponse(http::StatusCodeInternalServerError).body(kErrorReadingBody);
}

// Drains the body, translating read failures into 'onIo' / 'onTooLarge'.
template <class Rejection>
Extraction<std::string, Rejection> ReadBody(RequestBody& body, Rejection onIo, Rejection onTooLarge) {
  try {
    return Extraction<std::string, Rejection>::Accept(body.readAll());
  } catch (const BodyTooLargeError& ex) {
    log::debug("Body rejected: {}", ex.what());
    return Extraction<std::string, Rejection>::Reject(onTooLarge);
  } catch (const std::system_error& ex) {
    log::debug("Body read error: {}", ex.what());
    return Extraction<std::string, Rejection>::Reject(onIo);
  }
}

}  // namespace

HttpResponse IntoResponseTraits<MissingPathParamsRejection>::Convert([[maybe_unused]] MissingPathParamsRejection) {
  log::debug("Path parameters requested by a handler not registered on a route pattern");
  return HttpResponse(http::StatusCodeInternalServerError)
      .body(std::string_view("no path parameters found for matched route"));
}

HttpResponse IntoResponseTraits<StringRejection>::Convert(StringRejection rejection) {
  switch (rejection.kind) {
    case StringRejection::Kind::TooLarge:
      return PayloadTooLargeResponse();
    case StringRejection::Kind::InvalidUtf8:
      log::debug("Request body is not valid UTF-8");
      [[fallthrough]];
    case StringRejection::Kind::Io:
      [[fallthrough]];
    default:
      return ErrorReadingBodyResponse();
  }
}

HttpResponse IntoResponseTraits<BytesRejection>::Convert(BytesRejection rejection) {
  if (rejection.kind == BytesRejection::Kind::TooLarge) {
    return PayloadTooLargeResponse();
  }
  return ErrorReadingBodyResponse();
}

Extraction<PathParams, MissingPathParamsRejection> FromRequestPartsTraits<PathParams>::Extract(RequestParts& parts) {
  if (!parts.pathParams) {
    return Extraction<PathParams, MissingPathParamsRejection>::Reject(MissingPathParamsRejection{});
  }
  return Extraction<PathParams, MissingPathParamsRejection>::Accept(*parts.pathParams);
}

Extraction<std::string, StringRejection> FromRequestTraits<std::string>::Extract(HttpRequest&& request) {
  auto extraction = ReadBody(request.body(), StringRejection{StringRejection::Kind::Io},
                             StringRejection{StringRejection::Kind::TooLarge});
  if (extraction && !IsValidUtf8(extraction.value())) {
    return Extraction<std::string, StringRejection>::Reject(StringRejection{StringRejection::Kind::InvalidUtf8});
  }
  return extraction;
}

Extraction<std::vector<std::byte>, BytesRejection> FromRequestTraits<std::vector<std::byte>>::Extract(
    HttpRequest&& request) {
  using Ret = Extraction<std::vector<std::byte>, BytesRejection>;

  auto extraction = ReadBody(request.body(), BytesRejection{BytesRejection::Kind::Io},
                             BytesRejection{BytesRejection::Kind::TooLarge});
  if (!extraction) {
    return Ret::Reject(std::move(extraction).rejection());
  }
  const std::string& bytes = extraction.value();
  std::vector<std::byte> ret(bytes.size());
  if (!bytes.empty()) {
    std::memcpy(ret.data(), bytes.data(), bytes.size());
  }
  return Ret::Accept(std::move(ret));
}

}  // namespace spindle
