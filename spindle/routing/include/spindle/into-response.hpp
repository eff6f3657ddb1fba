#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "spindle/http-constants.hpp"
#include "spindle/http-headers.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"

namespace spindle {

// -----------------------------------------------------------------------------
// Response conversion
// -----------------------------------------------------------------------------
// A type T is convertible to a response when IntoResponseTraits<T> provides
//   static HttpResponse Convert(T value);
//
// A type T is a response part contributor when IntoResponsePartsTraits<T> provides
//   using Error = <a type convertible to a response>;
//   static std::optional<Error> Apply(T value, ResponseParts& parts);
// Apply updates the status / headers of an already built response and returns std::nullopt on success.
//
// Handlers may return any convertible type, including composites such as
//   std::tuple{http::StatusCodeCreated, ResponseHeader{"Location", "/items/42"}, "created"}
// where all elements but the last are part contributors applied left to right on the response built
// from the last element.

template <class T>
struct IntoResponseTraits {};

template <class T>
struct IntoResponsePartsTraits {};

template <class T>
concept IntoResponse = requires(T&& value) {
  { IntoResponseTraits<std::remove_cvref_t<T>>::Convert(std::forward<T>(value)) } -> std::same_as<HttpResponse>;
};

template <class T>
concept IntoResponseParts =
    requires(std::remove_cvref_t<T> value, ResponseParts& parts) {
      typename IntoResponsePartsTraits<std::remove_cvref_t<T>>::Error;
      {
        IntoResponsePartsTraits<std::remove_cvref_t<T>>::Apply(std::move(value), parts)
      } -> std::same_as<std::optional<typename IntoResponsePartsTraits<std::remove_cvref_t<T>>::Error>>;
    } && IntoResponse<typename IntoResponsePartsTraits<std::remove_cvref_t<T>>::Error>;

template <IntoResponse T>
HttpResponse ToResponse(T&& value) {
  return IntoResponseTraits<std::remove_cvref_t<T>>::Convert(std::forward<T>(value));
}

// Uninhabited type, used as the error of operations that cannot fail.
struct Infallible {
  Infallible() = delete;
};

// Sets (replaces) a single header. Fails if the name is not a valid token or the value contains
// forbidden characters.
struct ResponseHeader {
  std::string name;
  std::string value;
};

struct InvalidHeaderRejection {
  std::string name;
};

template <>
struct IntoResponseTraits<Infallible> {
  [[noreturn]] static HttpResponse Convert([[maybe_unused]] Infallible value) { std::unreachable(); }
};

template <>
struct IntoResponseTraits<HttpResponse> {
  static HttpResponse Convert(HttpResponse response) noexcept { return response; }
};

template <>
struct IntoResponseTraits<http::StatusCode> {
  static HttpResponse Convert(http::StatusCode statusCode) noexcept { return HttpResponse(statusCode); }
};

template <>
struct IntoResponseTraits<std::string> {
  static HttpResponse Convert(std::string str) {
    return HttpResponse().body(std::move(str), http::ContentTypeTextPlainUtf8);
  }
};

template <>
struct IntoResponseTraits<std::string_view> {
  static HttpResponse Convert(std::string_view str) { return HttpResponse(str, http::ContentTypeTextPlainUtf8); }
};

template <>
struct IntoResponseTraits<const char*> {
  static HttpResponse Convert(const char* str) { return HttpResponse(str, http::ContentTypeTextPlainUtf8); }
};

template <std::size_t N>
struct IntoResponseTraits<char[N]> {
  static HttpResponse Convert(std::string_view str) { return HttpResponse(str, http::ContentTypeTextPlainUtf8); }
};

template <>
struct IntoResponseTraits<std::span<const std::byte>> {
  static HttpResponse Convert(std::span<const std::byte> bytes) {
    return HttpResponse().body(bytes, http::ContentTypeApplicationOctetStream);
  }
};

template <>
struct IntoResponseTraits<std::vector<std::byte>> {
  static HttpResponse Convert(const std::vector<std::byte>& bytes) {
    return HttpResponse().body(std::span<const std::byte>(bytes), http::ContentTypeApplicationOctetStream);
  }
};

template <std::size_t N>
struct IntoResponseTraits<std::array<std::byte, N>> {
  static HttpResponse Convert(const std::array<std::byte, N>& bytes) {
    return HttpResponse().body(std::span<const std::byte>(bytes), http::ContentTypeApplicationOctetStream);
  }
};

// A variant converts its active alternative, which lets handlers return "a value or an error".
template <class... Ts>
  requires(IntoResponse<Ts> && ...)
struct IntoResponseTraits<std::variant<Ts...>> {
  static HttpResponse Convert(std::variant<Ts...> value) {
    return std::visit([](auto&& alternative) { return ToResponse(std::forward<decltype(alternative)>(alternative)); },
                      std::move(value));
  }
};

template <>
struct IntoResponseTraits<InvalidHeaderRejection> {
  static HttpResponse Convert(const InvalidHeaderRejection& rejection);
};

template <>
struct IntoResponsePartsTraits<http::StatusCode> {
  using Error = Infallible;

  static std::optional<Error> Apply(http::StatusCode statusCode, ResponseParts& parts) noexcept {
    parts.status = statusCode;
    return std::nullopt;
  }
};

// Each header of the map replaces all the headers with the same name already present in the response.
template <>
struct IntoResponsePartsTraits<HttpHeaders> {
  using Error = Infallible;

  static std::optional<Error> Apply(const HttpHeaders& headers, ResponseParts& parts);
};

template <>
struct IntoResponsePartsTraits<ResponseHeader> {
  using Error = InvalidHeaderRejection;

  static std::optional<Error> Apply(ResponseHeader header, ResponseParts& parts);
};

namespace detail {

template <class Part>
bool ApplyResponsePart(Part&& part, ResponseParts& parts, std::optional<HttpResponse>& failure) {
  auto error = IntoResponsePartsTraits<std::remove_cvref_t<Part>>::Apply(std::forward<Part>(part), parts);
  if (error) {
    failure.emplace(ToResponse(std::move(*error)));
    return false;
  }
  return true;
}

template <class Tuple, std::size_t... Is>
HttpResponse ConvertComposite(Tuple&& tuple, std::index_sequence<Is...>) {
  static constexpr std::size_t kLast = sizeof...(Is);

  auto [parts, body] = ToResponse(std::get<kLast>(std::forward<Tuple>(tuple))).intoParts();

  std::optional<HttpResponse> failure;
  // && fold: left to right, stops at the first failing contributor
  static_cast<void>((ApplyResponsePart(std::get<Is>(std::forward<Tuple>(tuple)), parts, failure) && ...));
  if (failure) {
    return std::move(*failure);
  }
  return {std::move(parts), std::move(body)};
}

template <class... Ts>
constexpr bool IsCompositeResponse() {
  using Tuple = std::tuple<Ts...>;
  constexpr std::size_t kLast = sizeof...(Ts) - 1U;
  return []<std::size_t... Is>(std::index_sequence<Is...>) {
    return (IntoResponseParts<std::tuple_element_t<Is, Tuple>> && ...);
  }(std::make_index_sequence<kLast>{}) && IntoResponse<std::tuple_element_t<kLast, Tuple>>;
}

}  // namespace detail

template <class... Ts>
  requires(sizeof...(Ts) >= 2U && detail::IsCompositeResponse<Ts...>())
struct IntoResponseTraits<std::tuple<Ts...>> {
  static HttpResponse Convert(std::tuple<Ts...> value) {
    return detail::ConvertComposite(std::move(value), std::make_index_sequence<sizeof...(Ts) - 1U>{});
  }
};

template <class Part, class Body>
  requires(IntoResponseParts<Part> && IntoResponse<Body>)
struct IntoResponseTraits<std::pair<Part, Body>> {
  static HttpResponse Convert(std::pair<Part, Body> value) {
    return detail::ConvertComposite(std::move(value), std::make_index_sequence<1U>{});
  }
};

}  // namespace spindle
