#pragma once

#include <cstddef>
#include <limits>
#include <memory>
#include <span>
#include <string>
#include <variant>

#include "spindle/exception.hpp"

namespace spindle {

// Source of body bytes provided by the transport layer (socket, decoder, test fixture...).
class BodyStream {
 public:
  virtual ~BodyStream() = default;

  // Reads at most out.size() bytes into out and returns the number of bytes read.
  // Returns 0 once the body is exhausted.
  // May block. Throws std::system_error if the underlying source fails.
  virtual std::size_t readSome(std::span<char> out) = 0;
};

class BodyTooLargeError : public exception {
 public:
  explicit BodyTooLargeError(std::size_t limit) : exception("request body exceeds the limit of {} bytes", limit) {}
};

// The body of an HttpRequest: either bytes already received or a stream still to be drained.
// Reading the body is a destructive, single-use operation.
class RequestBody {
 public:
  static constexpr std::size_t kReadChunkSize = 4096;
  static constexpr std::size_t kNoLimit = std::numeric_limits<std::size_t>::max();

  // Creates an empty, already materialized body.
  RequestBody() noexcept = default;

  explicit RequestBody(std::string bytes) noexcept : _source(std::move(bytes)) {}

  explicit RequestBody(std::unique_ptr<BodyStream> stream) noexcept : _source(std::move(stream)) {}

  RequestBody(const RequestBody&) = delete;
  RequestBody(RequestBody&&) noexcept = default;
  RequestBody& operator=(const RequestBody&) = delete;
  RequestBody& operator=(RequestBody&&) noexcept = default;

  ~RequestBody() = default;

  [[nodiscard]] bool isStream() const noexcept { return _source.index() == 1; }

  [[nodiscard]] bool consumed() const noexcept { return _consumed; }

  // Maximum number of bytes readAll() accepts.
  [[nodiscard]] std::size_t limit() const noexcept { return _limit; }

  void setLimit(std::size_t maxBytes) noexcept { _limit = maxBytes; }

  // Drains the whole body into memory.
  // Throws:
  //   - std::logic_error if the body was already read
  //   - std::system_error if the stream fails
  //   - BodyTooLargeError if the body is larger than limit()
  [[nodiscard]] std::string readAll();

 private:
  std::variant<std::string, std::unique_ptr<BodyStream>> _source;
  std::size_t _limit{kNoLimit};
  bool _consumed{false};
};

}  // namespace spindle
