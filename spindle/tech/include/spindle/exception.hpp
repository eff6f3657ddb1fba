#pragma once

#include <fmt/format.h>

#include <cstddef>
#include <cstring>
#include <exception>
#include <utility>

namespace spindle {

// Base class of all exceptions thrown by spindle.
// The message is stored inline (no allocation when thrown or copied) and truncated with "..." when too long.
class exception : public std::exception {
 public:
  static constexpr std::size_t kMsgMaxLen = 127;

  template <unsigned N>
  explicit exception(const char (&str)[N]) noexcept
    requires(N <= kMsgMaxLen + 1)
  {
    std::memcpy(_data, str, N);
  }

  template <typename... Args>
  explicit exception(fmt::format_string<Args...> fmt, Args&&... args) {
    const auto res = fmt::format_to_n(_data, kMsgMaxLen, fmt, std::forward<Args>(args)...);
    if (res.size > kMsgMaxLen) {
      std::memcpy(_data + kMsgMaxLen - 3U, "...", 3U);
      _data[kMsgMaxLen] = '\0';
    } else {
      *res.out = '\0';
    }
  }

  [[nodiscard]] const char* what() const noexcept override { return _data; }

 private:
  char _data[kMsgMaxLen + 1];
};

}  // namespace spindle
