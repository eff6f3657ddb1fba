#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "spindle/vector.hpp"

namespace spindle {

struct PathParamCapture {
  std::string key;
  std::string value;
};

// Ordered (name, value) pairs captured while matching the request path against a route pattern.
// For "/users/:id/files/*rest" matched by "/users/42/files/a/b.txt": [("id", "42"), ("rest", "a/b.txt")].
class PathParams {
 public:
  using const_iterator = const PathParamCapture*;

  PathParams() noexcept = default;

  void add(std::string_view key, std::string_view value);

  // Value of the capture named 'key', std::nullopt if there is none.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;

  [[nodiscard]] const PathParamCapture& operator[](std::size_t pos) const noexcept { return _captures[pos]; }

  [[nodiscard]] std::size_t size() const noexcept { return _captures.size(); }

  [[nodiscard]] bool empty() const noexcept { return _captures.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _captures.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _captures.data() + _captures.size(); }

  void clear() noexcept { _captures.clear(); }

 private:
  vector<PathParamCapture> _captures;
};

}  // namespace spindle
