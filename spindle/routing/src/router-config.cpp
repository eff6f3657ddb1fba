#include "spindle/router-config.hpp"

#include <cstddef>

#include "spindle/invalid-argument-exception.hpp"

namespace spindle {

RouterConfig& RouterConfig::withTrailingSlashPolicy(TrailingSlashPolicy policy) {
  trailingSlashPolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withHeadFallbackToGet(bool enable) {
  headFallbackToGet = enable;
  return *this;
}

RouterConfig& RouterConfig::withMaxBodyBytes(std::size_t maxBytes) {
  maxBodyBytes = maxBytes;
  return *this;
}

void RouterConfig::validate() const {
  if (maxBodyBytes == 0) {
    throw invalid_argument("maxBodyBytes should be strictly positive");
  }
  switch (trailingSlashPolicy) {
    case TrailingSlashPolicy::Strict:
    case TrailingSlashPolicy::Normalize:
    case TrailingSlashPolicy::Redirect:
      break;
    default:
      throw invalid_argument("Invalid trailing slash policy");
  }
}

}  // namespace spindle
