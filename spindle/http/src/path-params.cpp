#include "spindle/path-params.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace spindle {

void PathParams::add(std::string_view key, std::string_view value) {
  _captures.push_back(PathParamCapture{std::string(key), std::string(value)});
}

std::optional<std::string_view> PathParams::get(std::string_view key) const noexcept {
  for (const auto& capture : _captures) {
    if (capture.key == key) {
      return std::string_view(capture.value);
    }
  }
  return std::nullopt;
}

}  // namespace spindle
