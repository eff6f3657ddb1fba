#pragma once

#include <optional>
#include <string_view>

#include "spindle/http-method.hpp"

namespace spindle::http {

// Parses a request-line method token into a Method.
// RFC 9110 §9.1 makes method tokens case-sensitive, but parsing is lenient and accepts any case.
// Returns std::nullopt for extension methods that spindle cannot route.
std::optional<Method> MethodStrToOptEnum(std::string_view str);

}  // namespace spindle::http
