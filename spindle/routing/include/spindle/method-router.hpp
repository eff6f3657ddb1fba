#pragma once

#include <array>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "spindle/handler.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/route-conflict-error.hpp"

namespace spindle {

// Handlers of a single path: at most one handler per HTTP method, plus an optional fallback
// accepting any method without a dedicated handler.
//
// Usually built with the free functions below and chained:
//   Get(listUsers).post(createUser)
// Registering a handler on a slot that is already set throws RouteConflictError.
class MethodRouter {
 public:
  MethodRouter() noexcept = default;

  // Copy duplicates all registered handlers.
  MethodRouter(const MethodRouter& other);
  MethodRouter& operator=(const MethodRouter& other);

  MethodRouter(MethodRouter&&) noexcept = default;
  MethodRouter& operator=(MethodRouter&&) noexcept = default;

  ~MethodRouter() = default;

  template <class F>
  MethodRouter& get(F handler) & {
    return on(http::Method::GET, std::move(handler));
  }
  template <class F>
  MethodRouter&& get(F handler) && {
    return std::move(on(http::Method::GET, std::move(handler)));
  }

  template <class F>
  MethodRouter& head(F handler) & {
    return on(http::Method::HEAD, std::move(handler));
  }
  template <class F>
  MethodRouter&& head(F handler) && {
    return std::move(on(http::Method::HEAD, std::move(handler)));
  }

  template <class F>
  MethodRouter& post(F handler) & {
    return on(http::Method::POST, std::move(handler));
  }
  template <class F>
  MethodRouter&& post(F handler) && {
    return std::move(on(http::Method::POST, std::move(handler)));
  }

  template <class F>
  MethodRouter& put(F handler) & {
    return on(http::Method::PUT, std::move(handler));
  }
  template <class F>
  MethodRouter&& put(F handler) && {
    return std::move(on(http::Method::PUT, std::move(handler)));
  }

  // 'delete' is a keyword.
  template <class F>
  MethodRouter& del(F handler) & {
    return on(http::Method::DELETE, std::move(handler));
  }
  template <class F>
  MethodRouter&& del(F handler) && {
    return std::move(on(http::Method::DELETE, std::move(handler)));
  }

  template <class F>
  MethodRouter& connect(F handler) & {
    return on(http::Method::CONNECT, std::move(handler));
  }
  template <class F>
  MethodRouter&& connect(F handler) && {
    return std::move(on(http::Method::CONNECT, std::move(handler)));
  }

  template <class F>
  MethodRouter& options(F handler) & {
    return on(http::Method::OPTIONS, std::move(handler));
  }
  template <class F>
  MethodRouter&& options(F handler) && {
    return std::move(on(http::Method::OPTIONS, std::move(handler)));
  }

  template <class F>
  MethodRouter& trace(F handler) & {
    return on(http::Method::TRACE, std::move(handler));
  }
  template <class F>
  MethodRouter&& trace(F handler) && {
    return std::move(on(http::Method::TRACE, std::move(handler)));
  }

  template <class F>
  MethodRouter& patch(F handler) & {
    return on(http::Method::PATCH, std::move(handler));
  }
  template <class F>
  MethodRouter&& patch(F handler) && {
    return std::move(on(http::Method::PATCH, std::move(handler)));
  }

  // Sets the fallback handler, called for any method without a dedicated handler.
  template <class F>
  MethodRouter& any(F handler) & {
    return setHandler(MethodSlot::Fallback(), MakeHandler(std::move(handler)));
  }
  template <class F>
  MethodRouter&& any(F handler) && {
    return std::move(setHandler(MethodSlot::Fallback(), MakeHandler(std::move(handler))));
  }

  // Registers the same handler for all methods of 'methods'.
  template <class F>
  MethodRouter& on(http::MethodBmp methods, F handler) & {
    return on(methods, MakeHandler(std::move(handler)));
  }
  template <class F>
  MethodRouter&& on(http::MethodBmp methods, F handler) && {
    return std::move(on(methods, MakeHandler(std::move(handler))));
  }

  template <class F>
  MethodRouter& on(http::Method method, F handler) & {
    return on(static_cast<http::MethodBmp>(method), std::move(handler));
  }
  template <class F>
  MethodRouter&& on(http::Method method, F handler) && {
    return std::move(on(static_cast<http::MethodBmp>(method), std::move(handler)));
  }

  MethodRouter& on(http::MethodBmp methods, std::unique_ptr<Handler> handler) &;

  // Moves the slots of 'other' into this object.
  // If both define the same slot, nothing is changed and the first conflicting slot is returned.
  [[nodiscard]] std::optional<MethodSlot> merge(MethodRouter&& other);

  // Dispatches the request to the handler of its method, or to the GET handler for a HEAD request if
  // 'headFallbackToGet' is set (the body of the response is then dropped), or to the fallback.
  // Returns 405 with an Allow header listing the registered methods if none applies.
  [[nodiscard]] HttpResponse call(HttpRequest request, bool headFallbackToGet = false) const;

  [[nodiscard]] const Handler* handler(http::Method method) const noexcept {
    return _handlers[http::MethodToIdx(method)].get();
  }

  [[nodiscard]] const Handler* fallback() const noexcept { return _fallback.get(); }

  // Methods with a dedicated handler (the fallback is not reflected).
  [[nodiscard]] http::MethodBmp methods() const noexcept { return _methodBmp; }

  [[nodiscard]] bool empty() const noexcept { return _methodBmp == 0U && !_fallback; }

 private:
  MethodRouter& setHandler(MethodSlot slot, std::unique_ptr<Handler> handler);

  [[nodiscard]] std::unique_ptr<Handler>& slotRef(MethodSlot slot) noexcept {
    return slot.isFallback() ? _fallback : _handlers[slot.idx];
  }

  std::array<std::unique_ptr<Handler>, http::kNbMethods> _handlers;
  std::unique_ptr<Handler> _fallback;
  http::MethodBmp _methodBmp{};
};

template <class F>
MethodRouter Get(F handler) {
  return MethodRouter().get(std::move(handler));
}

template <class F>
MethodRouter Head(F handler) {
  return MethodRouter().head(std::move(handler));
}

template <class F>
MethodRouter Post(F handler) {
  return MethodRouter().post(std::move(handler));
}

template <class F>
MethodRouter Put(F handler) {
  return MethodRouter().put(std::move(handler));
}

template <class F>
MethodRouter Delete(F handler) {
  return MethodRouter().del(std::move(handler));
}

template <class F>
MethodRouter Connect(F handler) {
  return MethodRouter().connect(std::move(handler));
}

template <class F>
MethodRouter Options(F handler) {
  return MethodRouter().options(std::move(handler));
}

template <class F>
MethodRouter Trace(F handler) {
  return MethodRouter().trace(std::move(handler));
}

template <class F>
MethodRouter Patch(F handler) {
  return MethodRouter().patch(std::move(handler));
}

// MethodRouter whose fallback is 'handler': it accepts any method.
template <class F>
MethodRouter Any(F handler) {
  return MethodRouter().any(std::move(handler));
}

// Builds the value of an Allow header from a methods bitmap ("GET, HEAD, POST").
[[nodiscard]] std::string BuildAllowHeader(http::MethodBmp methods);

}  // namespace spindle
