#pragma once

#include <string_view>

#include "spindle/exception.hpp"
#include "spindle/http-method.hpp"

namespace spindle {

// Identifies one handler slot of a MethodRouter: one of the nine methods, or the fallback.
struct MethodSlot {
  static constexpr http::MethodIdx kFallbackIdx = http::kNbMethods;

  static constexpr MethodSlot Fallback() noexcept { return MethodSlot{kFallbackIdx}; }

  [[nodiscard]] constexpr bool isFallback() const noexcept { return idx == kFallbackIdx; }

  [[nodiscard]] constexpr std::string_view name() const noexcept {
    return isFallback() ? std::string_view("fallback") : http::MethodIdxToStr(idx);
  }

  constexpr bool operator==(const MethodSlot&) const noexcept = default;

  http::MethodIdx idx;
};

// Thrown at registration time when two handlers are registered for the same slot of the same path.
class RouteConflictError : public exception {
 public:
  explicit RouteConflictError(MethodSlot slot)
      : exception("conflicting {} handler registration", slot.name()), _slot(slot) {}

  RouteConflictError(MethodSlot slot, std::string_view path)
      : exception("conflicting {} handler registration for path '{}'", slot.name(), path), _slot(slot) {}

  [[nodiscard]] MethodSlot slot() const noexcept { return _slot; }

 private:
  MethodSlot _slot;
};

}  // namespace spindle
