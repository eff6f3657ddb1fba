#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

#include "spindle/extract.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/into-response.hpp"

namespace spindle {

// Maximum number of parameters of a handler callable.
inline constexpr std::size_t kMaxHandlerArity = 16;

// Type-erased request handler. Handlers are immutable once registered and may be called concurrently.
class Handler {
 public:
  Handler() noexcept = default;

  Handler(const Handler&) = delete;
  Handler(Handler&&) = delete;
  Handler& operator=(const Handler&) = delete;
  Handler& operator=(Handler&&) = delete;

  virtual ~Handler() = default;

  [[nodiscard]] virtual HttpResponse call(HttpRequest request) const = 0;

  [[nodiscard]] virtual std::unique_ptr<Handler> clone() const = 0;
};

// Adapts a callable taking extractable parameters and returning a convertible value into a Handler.
// All parameters but the last are extracted from the request parts in declaration order, the last one
// receives the rest of the request (it is the only one allowed to read the body).
template <class F, class Ret, class... RawArgs>
class FunctionHandler final : public Handler {
 public:
  static constexpr std::size_t kArity = sizeof...(RawArgs);

  static_assert(kArity <= kMaxHandlerArity, "Too many handler parameters");
  static_assert(IntoResponse<Ret>, "Handler return type is not convertible to a response");

  explicit FunctionHandler(F func) : _func(std::move(func)) {}

  [[nodiscard]] HttpResponse call(HttpRequest request) const override {
    // each invocation works on its own copy of the callable
    F func(_func);
    if constexpr (kArity == 0) {
      return ToResponse(std::invoke(func));
    } else {
      return callWithExtractedArgs(func, std::move(request), std::make_index_sequence<kArity - 1U>{});
    }
  }

  [[nodiscard]] std::unique_ptr<Handler> clone() const override { return std::make_unique<FunctionHandler>(_func); }

 private:
  using ArgsTuple = std::tuple<RawArgs...>;

  template <std::size_t I>
  using Arg = std::remove_cvref_t<std::tuple_element_t<I, ArgsTuple>>;

  template <std::size_t... Is>
  static HttpResponse callWithExtractedArgs(F& func, HttpRequest request, std::index_sequence<Is...>) {
    static constexpr std::size_t kLast = kArity - 1U;

    static_assert((FromRequestParts<Arg<Is>> && ...),
                  "Only the last handler parameter may consume the request body");
    static_assert(FromRequest<Arg<kLast>>, "Last handler parameter cannot be extracted from the request");

    std::tuple<std::optional<std::remove_cvref_t<RawArgs>>...> values;
    std::optional<HttpResponse> rejection;

    auto [parts, body] = std::move(request).intoParts();

    // && fold: extraction stops at the first rejection
    static_cast<void>((detail::ExtractPart(parts, std::get<Is>(values), rejection) && ...));
    if (rejection) {
      return std::move(*rejection);
    }

    auto lastExtraction = FromRequestTraits<Arg<kLast>>::Extract(HttpRequest(std::move(parts), std::move(body)));
    if (!lastExtraction) {
      return ToResponse(std::move(lastExtraction).rejection());
    }
    std::get<kLast>(values).emplace(std::move(lastExtraction).value());

    return ToResponse(std::invoke(func, std::forward<std::tuple_element_t<Is, ArgsTuple>>(*std::get<Is>(values))...,
                                  std::forward<std::tuple_element_t<kLast, ArgsTuple>>(*std::get<kLast>(values))));
  }

  F _func;
};

namespace detail {

template <class R, class... Args>
struct SignatureTraits {
  template <class F>
  using HandlerType = FunctionHandler<F, std::remove_cvref_t<R>, Args...>;
};

template <class F>
struct CallableTraits : CallableTraits<decltype(&F::operator())> {};

template <class R, class... Args>
struct CallableTraits<R (*)(Args...)> : SignatureTraits<R, Args...> {};

template <class R, class... Args>
struct CallableTraits<R (*)(Args...) noexcept> : SignatureTraits<R, Args...> {};

template <class C, class R, class... Args>
struct CallableTraits<R (C::*)(Args...)> : SignatureTraits<R, Args...> {};

template <class C, class R, class... Args>
struct CallableTraits<R (C::*)(Args...) noexcept> : SignatureTraits<R, Args...> {};

template <class C, class R, class... Args>
struct CallableTraits<R (C::*)(Args...) const> : SignatureTraits<R, Args...> {};

template <class C, class R, class... Args>
struct CallableTraits<R (C::*)(Args...) const noexcept> : SignatureTraits<R, Args...> {};

}  // namespace detail

// Wraps a callable (free function, function pointer, lambda, function object with a single call operator,
// std::function) into a Handler. Invalid signatures are rejected at compile time.
template <class F>
std::unique_ptr<Handler> MakeHandler(F func) {
  using HandlerType = typename detail::CallableTraits<F>::template HandlerType<F>;
  return std::make_unique<HandlerType>(std::move(func));
}

}  // namespace spindle
