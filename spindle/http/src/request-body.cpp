#include "spindle/request-body.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace spindle {

std::string RequestBody::readAll() {
  if (_consumed) {
    throw std::logic_error("request body has already been consumed");
  }
  _consumed = true;

  if (auto* pBytes = std::get_if<std::string>(&_source)) {
    if (pBytes->size() > _limit) {
      throw BodyTooLargeError(_limit);
    }
    return std::exchange(*pBytes, {});
  }

  auto stream = std::move(std::get<std::unique_ptr<BodyStream>>(_source));
  std::string ret;
  if (!stream) {
    return ret;
  }
  while (true) {
    const std::size_t oldSize = ret.size();
    // one extra byte past the limit is enough to detect an oversized body
    const std::size_t remaining = _limit - oldSize;
    const std::size_t chunkSize = remaining < kReadChunkSize ? remaining + 1U : kReadChunkSize;
    ret.resize(oldSize + chunkSize);
    const std::size_t nbRead = stream->readSome(std::span<char>(ret.data() + oldSize, chunkSize));
    ret.resize(oldSize + nbRead);
    if (nbRead == 0) {
      break;
    }
    if (ret.size() > _limit) {
      throw BodyTooLargeError(_limit);
    }
  }
  return ret;
}

}  // namespace spindle
