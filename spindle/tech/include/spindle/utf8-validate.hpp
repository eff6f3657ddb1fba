#pragma once

#include <string_view>

namespace spindle {

// Tells whether given bytes form a well-formed UTF-8 sequence (RFC 3629).
// Overlong encodings, surrogate code points and code points above U+10FFFF are rejected.
[[nodiscard]] bool IsValidUtf8(std::string_view data) noexcept;

}  // namespace spindle
