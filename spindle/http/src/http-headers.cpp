#include "spindle/http-headers.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <utility>

#include "spindle/string-equal-ignore-case.hpp"
#include "spindle/vector.hpp"

namespace spindle {

HttpHeaders::HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
  _fields.reserve(static_cast<decltype(_fields)::size_type>(fields.size()));
  for (const auto& [name, value] : fields) {
    append(name, value);
  }
}

HttpHeaders& HttpHeaders::append(std::string_view name, std::string_view value) {
  _fields.push_back(http::HeaderField{std::string(name), std::string(value)});
  return *this;
}

HttpHeaders& HttpHeaders::set(std::string_view name, std::string_view value) {
  bool found = false;
  auto writeIt = _fields.begin();
  for (auto readIt = _fields.begin(); readIt != _fields.end(); ++readIt) {
    if (CaseInsensitiveEqual(readIt->name, name)) {
      if (found) {
        continue;
      }
      found = true;
      readIt->value.assign(value);
    }
    if (writeIt != readIt) {
      *writeIt = std::move(*readIt);
    }
    ++writeIt;
  }
  _fields.erase(writeIt, _fields.end());
  if (!found) {
    append(name, value);
  }
  return *this;
}

std::size_t HttpHeaders::erase(std::string_view name) {
  const auto oldSize = _fields.size();
  auto writeIt = _fields.begin();
  for (auto readIt = _fields.begin(); readIt != _fields.end(); ++readIt) {
    if (CaseInsensitiveEqual(readIt->name, name)) {
      continue;
    }
    if (writeIt != readIt) {
      *writeIt = std::move(*readIt);
    }
    ++writeIt;
  }
  _fields.erase(writeIt, _fields.end());
  return static_cast<std::size_t>(oldSize - _fields.size());
}

std::optional<std::string_view> HttpHeaders::value(std::string_view name) const noexcept {
  for (const auto& field : _fields) {
    if (CaseInsensitiveEqual(field.name, name)) {
      return std::string_view(field.value);
    }
  }
  return std::nullopt;
}

vector<std::string_view> HttpHeaders::values(std::string_view name) const {
  vector<std::string_view> ret;
  for (const auto& field : _fields) {
    if (CaseInsensitiveEqual(field.name, name)) {
      ret.emplace_back(field.value);
    }
  }
  return ret;
}

}  // namespace spindle
