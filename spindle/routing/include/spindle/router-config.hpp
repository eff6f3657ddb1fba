#pragma once

#include <cstddef>
#include <cstdint>

namespace spindle {

struct RouterConfig {
  enum class TrailingSlashPolicy : std::int8_t { Strict, Normalize, Redirect };

  static constexpr std::size_t kDefaultMaxBodyBytes = 8UL * 1024UL * 1024UL;

  // Behavior for resolving paths that differ only by a trailing slash.
  // Default: Strict
  TrailingSlashPolicy trailingSlashPolicy{TrailingSlashPolicy::Strict};

  // If true, a HEAD request on a path without HEAD handler is served by its GET handler, with the body dropped.
  bool headFallbackToGet{false};

  // Maximum number of body bytes that body extractors accept. Larger bodies are rejected with 413.
  std::size_t maxBodyBytes{kDefaultMaxBodyBytes};

  // Policy for handling a trailing slash difference between registered routes and incoming requests.
  // Resolution algorithm (independent of policy):
  //   1. ALWAYS attempt an exact match on the incoming path first. If found, dispatch to it.
  //   2. If no exact match:
  //        a) If the request ends with a trailing slash (not root) and the form without the slash matches:
  //             - Strict   : 404.
  //             - Normalize: dispatch as if the slash was absent.
  //             - Redirect : 301 with a Location header pointing to the path without the slash.
  //        b) Else if the request does NOT end with a slash, policy is Normalize, and the slashed form matches:
  //           dispatch to it.
  //        c) Otherwise: 404.
  //   3. Root path "/" is never redirected or normalized.
  RouterConfig& withTrailingSlashPolicy(TrailingSlashPolicy policy);

  RouterConfig& withHeadFallbackToGet(bool enable = true);

  RouterConfig& withMaxBodyBytes(std::size_t maxBytes);

  // Throws invalid_argument if the configuration is not valid.
  void validate() const;
};

}  // namespace spindle
