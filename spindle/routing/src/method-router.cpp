#include "spindle/method-router.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "spindle/http-constants.hpp"
#include "spindle/http-method.hpp"
#include "spindle/http-request.hpp"
#include "spindle/http-response.hpp"
#include "spindle/http-status-code.hpp"
#include "spindle/invalid-argument-exception.hpp"
#include "spindle/log.hpp"
#include "spindle/route-conflict-error.hpp"

namespace spindle {

namespace {

std::unique_ptr<Handler> CloneHandler(const std::unique_ptr<Handler>& handler) {
  return handler ? handler->clone() : nullptr;
}

}  // namespace

MethodRouter::MethodRouter(const MethodRouter& other)
    : _fallback(CloneHandler(other._fallback)), _methodBmp(other._methodBmp) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    _handlers[methodIdx] = CloneHandler(other._handlers[methodIdx]);
  }
}

MethodRouter& MethodRouter::operator=(const MethodRouter& other) {
  if (&other != this) [[likely]] {
    MethodRouter copy(other);
    *this = std::move(copy);
  }
  return *this;
}

MethodRouter& MethodRouter::on(http::MethodBmp methods, std::unique_ptr<Handler> handler) & {
  if (!handler) {
    throw invalid_argument("Cannot register a null handler");
  }
  if ((methods & http::kAllMethodsBmp) == 0U) {
    throw invalid_argument("Empty method set");
  }
  // check all slots first so that a conflict leaves the object unchanged
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (http::IsMethodIdxSet(methods, methodIdx) && _handlers[methodIdx]) {
      throw RouteConflictError(MethodSlot{methodIdx});
    }
  }
  http::MethodIdx lastIdx = http::kNbMethods;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (!http::IsMethodIdxSet(methods, methodIdx)) {
      continue;
    }
    lastIdx = methodIdx;
    _handlers[methodIdx] = handler->clone();
    _methodBmp |= http::MethodBmpFromIdx(methodIdx);
  }
  if (lastIdx != http::kNbMethods) {
    // the last slot takes the original instead of a clone
    _handlers[lastIdx] = std::move(handler);
  }
  return *this;
}

MethodRouter& MethodRouter::setHandler(MethodSlot slot, std::unique_ptr<Handler> handler) {
  std::unique_ptr<Handler>& target = slotRef(slot);
  if (target) {
    throw RouteConflictError(slot);
  }
  target = std::move(handler);
  if (!slot.isFallback()) {
    _methodBmp |= http::MethodBmpFromIdx(slot.idx);
  }
  return *this;
}

std::optional<MethodSlot> MethodRouter::merge(MethodRouter&& other) {
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (_handlers[methodIdx] && other._handlers[methodIdx]) {
      return MethodSlot{methodIdx};
    }
  }
  if (_fallback && other._fallback) {
    return MethodSlot::Fallback();
  }

  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (other._handlers[methodIdx]) {
      _handlers[methodIdx] = std::move(other._handlers[methodIdx]);
    }
  }
  if (other._fallback) {
    _fallback = std::move(other._fallback);
  }
  _methodBmp |= std::exchange(other._methodBmp, 0U);
  return std::nullopt;
}

HttpResponse MethodRouter::call(HttpRequest request, bool headFallbackToGet) const {
  const http::Method method = request.method();
  if (const Handler* pHandler = _handlers[http::MethodToIdx(method)].get()) {
    return pHandler->call(std::move(request));
  }
  if (headFallbackToGet && method == http::Method::HEAD) {
    if (const Handler* pGetHandler = _handlers[http::MethodToIdx(http::Method::GET)].get()) {
      HttpResponse response = pGetHandler->call(std::move(request));
      response.clearBody();
      return response;
    }
  }
  if (_fallback) {
    return _fallback->call(std::move(request));
  }

  log::debug("Method {} not allowed for path {}", http::MethodToStr(method), request.path());
  HttpResponse response(http::StatusCodeMethodNotAllowed);
  response.header(http::Allow, BuildAllowHeader(_methodBmp));
  return response;
}

std::string BuildAllowHeader(http::MethodBmp methods) {
  std::string ret;
  for (http::MethodIdx methodIdx = 0; methodIdx < http::kNbMethods; ++methodIdx) {
    if (!http::IsMethodIdxSet(methods, methodIdx)) {
      continue;
    }
    if (!ret.empty()) {
      ret.append(", ");
    }
    ret.append(http::MethodIdxToStr(methodIdx));
  }
  return ret;
}

}  // namespace spindle
