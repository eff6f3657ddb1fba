#pragma once

#include <string_view>

namespace spindle::http {

// Header field names are case-insensitive (RFC 9110 §5.1); they are stored here in their canonical form
// for emission only.
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view Allow = "Allow";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view UserAgent = "User-Agent";

inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain;charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";

inline constexpr std::string_view ReasonNotFound = "Not Found";
inline constexpr std::string_view ReasonMethodNotAllowed = "Method Not Allowed";
inline constexpr std::string_view ReasonPayloadTooLarge = "Payload Too Large";
inline constexpr std::string_view ReasonInternalServerError = "Internal Server Error";

}  // namespace spindle::http
