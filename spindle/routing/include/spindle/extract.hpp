#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>

#include "spindle/http-headers.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/into-response.hpp"
#include "spindle/path-params.hpp"

namespace spindle {

// Result of an extraction: either the extracted value or the rejection explaining why it failed.
template <class T, class Rejection>
class Extraction {
 public:
  static Extraction Accept(T value) { return Extraction(std::in_place_index<0>, std::move(value)); }

  static Extraction Reject(Rejection rejection) { return Extraction(std::in_place_index<1>, std::move(rejection)); }

  [[nodiscard]] bool hasValue() const noexcept { return _storage.index() == 0; }

  explicit operator bool() const noexcept { return hasValue(); }

  [[nodiscard]] T& value() & { return std::get<0>(_storage); }
  [[nodiscard]] T&& value() && { return std::get<0>(std::move(_storage)); }

  [[nodiscard]] Rejection& rejection() & { return std::get<1>(_storage); }
  [[nodiscard]] Rejection&& rejection() && { return std::get<1>(std::move(_storage)); }

 private:
  template <std::size_t I, class U>
  Extraction(std::in_place_index_t<I> idx, U&& val) : _storage(idx, std::forward<U>(val)) {}

  std::variant<T, Rejection> _storage;
};

// -----------------------------------------------------------------------------
// Extraction protocol
// -----------------------------------------------------------------------------
// Part extractors only read the request metadata and can be applied any number of times:
//   template <> struct FromRequestPartsTraits<T> {
//     using Rejection = <a type convertible to a response>;
//     static Extraction<T, Rejection> Extract(RequestParts& parts);
//   };
//
// Full request extractors take ownership of the request and may drain its body:
//   template <> struct FromRequestTraits<T> {
//     using Rejection = <a type convertible to a response>;
//     static Extraction<T, Rejection> Extract(HttpRequest&& request);
//   };
// Every part extractor is also a full request extractor (the body is then dropped).

template <class T>
struct FromRequestPartsTraits {};

template <class T>
concept FromRequestParts =
    requires(RequestParts& parts) {
      typename FromRequestPartsTraits<T>::Rejection;
      {
        FromRequestPartsTraits<T>::Extract(parts)
      } -> std::same_as<Extraction<T, typename FromRequestPartsTraits<T>::Rejection>>;
    } && IntoResponse<typename FromRequestPartsTraits<T>::Rejection>;

template <class T>
struct FromRequestTraits {};

template <FromRequestParts T>
struct FromRequestTraits<T> {
  using Rejection = typename FromRequestPartsTraits<T>::Rejection;

  static Extraction<T, Rejection> Extract(HttpRequest&& request) {
    auto [parts, body] = std::move(request).intoParts();
    return FromRequestPartsTraits<T>::Extract(parts);
  }
};

template <class T>
concept FromRequest =
    requires(HttpRequest&& request) {
      typename FromRequestTraits<T>::Rejection;
      {
        FromRequestTraits<T>::Extract(std::move(request))
      } -> std::same_as<Extraction<T, typename FromRequestTraits<T>::Rejection>>;
    } && IntoResponse<typename FromRequestTraits<T>::Rejection>;

// -----------------------------------------------------------------------------
// Rejections
// -----------------------------------------------------------------------------

// The request did not go through a route pattern, so there are no captured parameters to extract.
struct MissingPathParamsRejection {};

struct StringRejection {
  enum class Kind : std::int8_t { Io, InvalidUtf8, TooLarge };

  Kind kind;
};

struct BytesRejection {
  enum class Kind : std::int8_t { Io, TooLarge };

  Kind kind;
};

template <>
struct IntoResponseTraits<MissingPathParamsRejection> {
  static HttpResponse Convert(MissingPathParamsRejection rejection);
};

template <>
struct IntoResponseTraits<StringRejection> {
  static HttpResponse Convert(StringRejection rejection);
};

template <>
struct IntoResponseTraits<BytesRejection> {
  static HttpResponse Convert(BytesRejection rejection);
};

// -----------------------------------------------------------------------------
// Built-in extractors
// -----------------------------------------------------------------------------

template <>
struct FromRequestPartsTraits<http::Method> {
  using Rejection = Infallible;

  static Extraction<http::Method, Rejection> Extract(RequestParts& parts) {
    return Extraction<http::Method, Rejection>::Accept(parts.method);
  }
};

template <>
struct FromRequestPartsTraits<HttpHeaders> {
  using Rejection = Infallible;

  static Extraction<HttpHeaders, Rejection> Extract(RequestParts& parts) {
    return Extraction<HttpHeaders, Rejection>::Accept(parts.headers);
  }
};

template <>
struct FromRequestPartsTraits<PathParams> {
  using Rejection = MissingPathParamsRejection;

  static Extraction<PathParams, Rejection> Extract(RequestParts& parts);
};

// Reads the whole body (within the configured limit) and validates it as UTF-8.
template <>
struct FromRequestTraits<std::string> {
  using Rejection = StringRejection;

  static Extraction<std::string, Rejection> Extract(HttpRequest&& request);
};

// Reads the whole body (within the configured limit) as raw bytes.
template <>
struct FromRequestTraits<std::vector<std::byte>> {
  using Rejection = BytesRejection;

  static Extraction<std::vector<std::byte>, Rejection> Extract(HttpRequest&& request);
};

template <>
struct FromRequestTraits<HttpRequest> {
  using Rejection = Infallible;

  static Extraction<HttpRequest, Rejection> Extract(HttpRequest&& request) {
    return Extraction<HttpRequest, Rejection>::Accept(std::move(request));
  }
};

namespace detail {

// Extracts 'T' from 'parts' into 'out'. On failure, stores the converted rejection and returns false.
template <class T>
bool ExtractPart(RequestParts& parts, std::optional<T>& out, std::optional<HttpResponse>& rejection) {
  auto extraction = FromRequestPartsTraits<T>::Extract(parts);
  if (!extraction) {
    rejection.emplace(ToResponse(std::move(extraction).rejection()));
    return false;
  }
  out.emplace(std::move(extraction).value());
  return true;
}

template <class Tuple, std::size_t... Is>
constexpr bool IsCompositeExtractor(std::index_sequence<Is...>) {
  return (FromRequestParts<std::tuple_element_t<Is, Tuple>> && ...) &&
         FromRequest<std::tuple_element_t<sizeof...(Is), Tuple>>;
}

template <class Tuple, std::size_t... Is>
Extraction<Tuple, HttpResponse> ExtractComposite(HttpRequest&& request, std::index_sequence<Is...>) {
  using Ret = Extraction<Tuple, HttpResponse>;
  using Last = std::tuple_element_t<sizeof...(Is), Tuple>;

  std::tuple<std::optional<std::tuple_element_t<Is, Tuple>>...> values;
  std::optional<HttpResponse> rejection;

  auto [parts, body] = std::move(request).intoParts();

  // && fold: extraction stops at the first rejection
  static_cast<void>((ExtractPart(parts, std::get<Is>(values), rejection) && ...));
  if (rejection) {
    return Ret::Reject(std::move(*rejection));
  }

  auto lastExtraction = FromRequestTraits<Last>::Extract(HttpRequest(std::move(parts), std::move(body)));
  if (!lastExtraction) {
    return Ret::Reject(ToResponse(std::move(lastExtraction).rejection()));
  }
  return Ret::Accept(Tuple(std::move(*std::get<Is>(values))..., std::move(lastExtraction).value()));
}

}  // namespace detail

// A tuple of extractors is itself a full request extractor, following the same rule as handler parameters:
// all elements but the last are extracted from the request parts in order, the last one receives the rest
// of the request. The first rejection, already converted to a response, is the rejection of the tuple.
template <class... Ts>
  requires(sizeof...(Ts) >= 1U &&
           detail::IsCompositeExtractor<std::tuple<Ts...>>(std::make_index_sequence<sizeof...(Ts) - 1U>{}))
struct FromRequestTraits<std::tuple<Ts...>> {
  using Rejection = HttpResponse;

  static Extraction<std::tuple<Ts...>, Rejection> Extract(HttpRequest&& request) {
    return detail::ExtractComposite<std::tuple<Ts...>>(std::move(request),
                                                       std::make_index_sequence<sizeof...(Ts) - 1U>{});
  }
};

}  // namespace spindle
