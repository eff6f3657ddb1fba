#pragma once

#include <cstdint>
#include <string_view>

namespace spindle::http {

/// RFC 9110 §5.6.2: tchar = "!" / "#" / "$" / "%" / "&" / "'" / "*"
///                         / "+" / "-" / "." / "^" / "_" / "`" / "|" / "~"
///                         / DIGIT / ALPHA
constexpr bool IsTchar(unsigned char uc) noexcept {
  static constexpr uint64_t kBitmap[2] = {
      // low 64
      (1ULL << '!') | (1ULL << '#') | (1ULL << '$') | (1ULL << '%') | (1ULL << '&') | (1ULL << '\'') | (1ULL << '*') |
          (1ULL << '+') | (1ULL << '-') | (1ULL << '.') | (0x3FFULL << '0'),

      // high 64 (offset by -64)
      (0x3FFFFFFULL << ('A' - 64)) | (1ULL << ('^' - 64)) | (1ULL << ('_' - 64)) | (0x3FFFFFFULL << ('a' - 64)) |
          (1ULL << ('`' - 64)) | (1ULL << ('|' - 64)) | (1ULL << ('~' - 64))};

  return uc < 128U && ((kBitmap[uc >> 6] >> (uc & 63)) & 1U) != 0U;
}

// A header name is a non-empty token.
constexpr bool IsValidHeaderName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (char ch : name) {
    if (!IsTchar(static_cast<unsigned char>(ch))) {
      return false;
    }
  }
  return true;
}

// A header value may contain HTAB and visible ASCII, never CR or LF. The empty value is allowed.
constexpr bool IsValidHeaderValue(std::string_view value) noexcept {
  for (char ch : value) {
    const auto uc = static_cast<unsigned char>(ch);
    if (uc == '\t') {
      continue;
    }
    if (uc < 0x20 || uc > 0x7E) {
      return false;
    }
  }
  return true;
}

}  // namespace spindle::http
