#pragma once

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/vector.hpp"

namespace spindle {

namespace http {

struct HeaderField {
  std::string name;
  std::string value;
};

}  // namespace http

// Ordered multimap of HTTP header fields.
// Characteristics:
//   * Insertion order is preserved, duplicates are allowed (append()).
//   * Name lookups are case-insensitive (RFC 9110 §5.1), stored names keep their original case.
//   * No validation is performed here: the transport layer hands over already parsed fields, and
//     user supplied response headers are validated by the ResponseHeader response part.
class HttpHeaders {
 public:
  using value_type = http::HeaderField;
  using const_iterator = const http::HeaderField*;

  HttpHeaders() noexcept = default;

  HttpHeaders(std::initializer_list<std::pair<std::string_view, std::string_view>> fields);

  // Appends a new field, keeping any existing field with the same name.
  HttpHeaders& append(std::string_view name, std::string_view value);

  // Sets the value of the field 'name', replacing all its previous occurrences.
  // The field keeps the position of its first occurrence, or is appended if absent.
  HttpHeaders& set(std::string_view name, std::string_view value);

  // Removes all fields named 'name' and returns the number of removed fields.
  std::size_t erase(std::string_view name);

  // Returns the value of the first field named 'name', std::nullopt if absent.
  [[nodiscard]] std::optional<std::string_view> value(std::string_view name) const noexcept;

  [[nodiscard]] std::string_view valueOrEmpty(std::string_view name) const noexcept {
    return value(name).value_or(std::string_view{});
  }

  // Returns all values of fields named 'name', in insertion order.
  [[nodiscard]] vector<std::string_view> values(std::string_view name) const;

  [[nodiscard]] bool contains(std::string_view name) const noexcept { return value(name).has_value(); }

  [[nodiscard]] std::size_t size() const noexcept { return _fields.size(); }

  [[nodiscard]] bool empty() const noexcept { return _fields.empty(); }

  [[nodiscard]] const_iterator begin() const noexcept { return _fields.data(); }
  [[nodiscard]] const_iterator end() const noexcept { return _fields.data() + _fields.size(); }

  void clear() noexcept { _fields.clear(); }

 private:
  vector<http::HeaderField> _fields;
};

}  // namespace spindle
