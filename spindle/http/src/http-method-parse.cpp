#include "spindle/http-method-parse.hpp"

#include <optional>
#include <string_view>

#include "spindle/http-method.hpp"
#include "spindle/string-equal-ignore-case.hpp"

namespace spindle::http {

std::optional<Method> MethodStrToOptEnum(std::string_view str) {
  if (str.empty()) {
    return std::nullopt;
  }
  // Tokens are unique by (length, first letter), a single comparison confirms the candidate.
  const char first = tolower(str.front());
  Method candidate;
  switch (str.size()) {
    case 3:
      if (first == 'g') {
        candidate = Method::GET;
      } else if (first == 'p') {
        candidate = Method::PUT;
      } else {
        return std::nullopt;
      }
      break;
    case 4:
      if (first == 'h') {
        candidate = Method::HEAD;
      } else if (first == 'p') {
        candidate = Method::POST;
      } else {
        return std::nullopt;
      }
      break;
    case 5:
      if (first == 't') {
        candidate = Method::TRACE;
      } else if (first == 'p') {
        candidate = Method::PATCH;
      } else {
        return std::nullopt;
      }
      break;
    case 6:
      candidate = Method::DELETE;
      break;
    case 7:
      if (first == 'c') {
        candidate = Method::CONNECT;
      } else if (first == 'o') {
        candidate = Method::OPTIONS;
      } else {
        return std::nullopt;
      }
      break;
    default:
      return std::nullopt;
  }
  if (!CaseInsensitiveEqual(str, MethodToStr(candidate))) {
    return std::nullopt;
  }
  return candidate;
}

}  // namespace spindle::http
