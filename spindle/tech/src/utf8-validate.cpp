#include "spindle/utf8-validate.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace spindle {

bool IsValidUtf8(std::string_view data) noexcept {
  const auto* ptr = reinterpret_cast<const uint8_t*>(data.data());
  const auto* end = ptr + data.size();

  while (ptr < end) {
    uint8_t byte = *ptr++;

    if (byte <= 0x7F) {
      continue;
    }

    std::size_t remaining;
    uint32_t codepoint;
    uint32_t minCodepoint;

    if ((byte & 0xE0) == 0xC0) {
      remaining = 1;
      codepoint = byte & 0x1F;
      minCodepoint = 0x80;
    } else if ((byte & 0xF0) == 0xE0) {
      remaining = 2;
      codepoint = byte & 0x0F;
      minCodepoint = 0x800;
    } else if ((byte & 0xF8) == 0xF0) {
      remaining = 3;
      codepoint = byte & 0x07;
      minCodepoint = 0x10000;
    } else {
      // stray continuation byte or 5/6 byte lead
      return false;
    }

    if (static_cast<std::size_t>(end - ptr) < remaining) {
      return false;
    }

    for (std::size_t idx = 0; idx < remaining; ++idx) {
      byte = *ptr++;
      if ((byte & 0xC0) != 0x80) {
        return false;
      }
      codepoint = (codepoint << 6) | (byte & 0x3F);
    }

    if (codepoint < minCodepoint) {
      return false;
    }
    if (codepoint >= 0xD800 && codepoint <= 0xDFFF) {
      return false;
    }
    if (codepoint > 0x10FFFF) {
      return false;
    }
  }

  return true;
}

}  // namespace spindle
