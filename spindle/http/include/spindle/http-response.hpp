#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/http-constants.hpp"
#include "spindle/http-headers.hpp"
#include "spindle/http-status-code.hpp"

namespace spindle {

// Status line and header block of a response, without its body.
// Response part contributors (see into-response.hpp) operate on this object.
struct ResponseParts {
  http::StatusCode status{http::StatusCodeOK};
  HttpHeaders headers;
};

// -----------------------------------------------------------------------------
// HttpResponse
// -----------------------------------------------------------------------------
// Canonical response representation returned to the transport layer: a status code,
// an ordered header block and a fixed body (possibly empty).
//
// Setters exist in both lvalue and rvalue flavors so that responses can be built fluently:
//   return HttpResponse(http::StatusCodeCreated).header("X-Id", "42").body("created");
//
// The transport layer is responsible for framing (Content-Length / Transfer-Encoding, Date, ...).
class HttpResponse {
 public:
  // Creates a response with given status code, no header and an empty body.
  explicit HttpResponse(http::StatusCode code = http::StatusCodeOK) noexcept { _parts.status = code; }

  // Creates a 200 response with given body and Content-Type.
  explicit HttpResponse(std::string_view body, std::string_view contentType = http::ContentTypeTextPlainUtf8);

  // Reassembles a response from its parts and its body.
  HttpResponse(ResponseParts parts, std::string body) noexcept : _parts(std::move(parts)), _body(std::move(body)) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _parts.status; }

  HttpResponse& status(http::StatusCode statusCode) & noexcept {
    _parts.status = statusCode;
    return *this;
  }

  HttpResponse&& status(http::StatusCode statusCode) && noexcept {
    _parts.status = statusCode;
    return std::move(*this);
  }

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _parts.headers; }

  // Value of the first header named 'key' (case-insensitive), std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view key) const noexcept {
    return _parts.headers.value(key);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view key) const noexcept {
    return _parts.headers.valueOrEmpty(key);
  }

  // Sets header 'key' to 'value', replacing any previous occurrence.
  HttpResponse& header(std::string_view key, std::string_view value) & {
    _parts.headers.set(key, value);
    return *this;
  }

  HttpResponse&& header(std::string_view key, std::string_view value) && {
    _parts.headers.set(key, value);
    return std::move(*this);
  }

  // Appends header 'key' without checking for a previous occurrence.
  HttpResponse& addHeader(std::string_view key, std::string_view value) & {
    _parts.headers.append(key, value);
    return *this;
  }

  HttpResponse&& addHeader(std::string_view key, std::string_view value) && {
    _parts.headers.append(key, value);
    return std::move(*this);
  }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  [[nodiscard]] std::span<const std::byte> bodyBytes() const noexcept {
    return std::as_bytes(std::span<const char>(_body.data(), _body.size()));
  }

  [[nodiscard]] bool hasBody() const noexcept { return !_body.empty(); }

  // Sets the body and, if 'contentType' is not empty, the Content-Type header.
  HttpResponse& body(std::string body, std::string_view contentType = http::ContentTypeTextPlainUtf8) &;

  HttpResponse&& body(std::string body, std::string_view contentType = http::ContentTypeTextPlainUtf8) && {
    return std::move(this->body(std::move(body), contentType));
  }

  HttpResponse& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlainUtf8) & {
    return this->body(std::string(body), contentType);
  }

  HttpResponse&& body(std::string_view body, std::string_view contentType = http::ContentTypeTextPlainUtf8) && {
    return std::move(this->body(std::string(body), contentType));
  }

  HttpResponse& body(const char* body, std::string_view contentType = http::ContentTypeTextPlainUtf8) & {
    return this->body(std::string(body), contentType);
  }

  HttpResponse&& body(const char* body, std::string_view contentType = http::ContentTypeTextPlainUtf8) && {
    return std::move(this->body(std::string(body), contentType));
  }

  HttpResponse& body(std::span<const std::byte> body,
                     std::string_view contentType = http::ContentTypeApplicationOctetStream) & {
    return this->body(std::string(reinterpret_cast<const char*>(body.data()), body.size()), contentType);
  }

  HttpResponse&& body(std::span<const std::byte> body,
                      std::string_view contentType = http::ContentTypeApplicationOctetStream) && {
    return std::move(this->body(body, contentType));
  }

  // Drops the body, keeping the headers (used to answer HEAD requests with a GET handler).
  void clearBody() noexcept { _body.clear(); }

  [[nodiscard]] const ResponseParts& parts() const noexcept { return _parts; }

  // Splits the response into its parts and its body.
  [[nodiscard]] std::pair<ResponseParts, std::string> intoParts() && noexcept {
    return {std::move(_parts), std::move(_body)};
  }

 private:
  ResponseParts _parts;
  std::string _body;
};

}  // namespace spindle
