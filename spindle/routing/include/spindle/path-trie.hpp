#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "spindle/path-params.hpp"
#include "spindle/vector.hpp"

namespace spindle {

// Maps path patterns to values and resolves request paths against them.
//
// Pattern syntax (segments separated by '/', the pattern always starts with '/'):
//   - literal segment    : "users", matched exactly (case-sensitive)
//   - parameter segment  : ":id", matches one non-empty segment, captured as "id"
//   - catch-all segment  : "*rest", only allowed last, matches the non-empty remainder of the path
//                          (slashes included), captured as "rest"
//
// When several patterns match a path, literal segments have priority over parameters, which have priority
// over catch-alls, evaluated segment by segment with backtracking:
//   "/users/new" is preferred to "/users/:id" for "/users/new",
//   "/users/:id" still matches "/users/42" if "/users/new" exists.
//
// Insertion is not thread-safe. Once built, match() and find() are const and can be called concurrently.
class PathTrie {
 public:
  using Value = uint32_t;

  enum class InsertStatus : std::uint8_t { Inserted, AlreadyExists };

  struct Match {
    Value value;
    PathParams params;
  };

  PathTrie();

  PathTrie(const PathTrie&) = delete;
  PathTrie(PathTrie&&) noexcept = default;
  PathTrie& operator=(const PathTrie&) = delete;
  PathTrie& operator=(PathTrie&&) noexcept = default;

  ~PathTrie();

  // Associates 'value' to 'pattern'. If the pattern is already present, the trie is unchanged and
  // AlreadyExists is returned.
  // Throws invalid_argument if the pattern is malformed, or if it declares a parameter (or catch-all) at the
  // same position as an already inserted pattern but with a different name.
  [[nodiscard]] InsertStatus insert(std::string_view pattern, Value value);

  // Exact pattern lookup: returns the value previously inserted with 'pattern', if any.
  // Throws invalid_argument if the pattern is malformed.
  [[nodiscard]] std::optional<Value> find(std::string_view pattern) const;

  // Resolves a request path (without query string) to the best matching pattern.
  [[nodiscard]] std::optional<Match> match(std::string_view path) const;

  // Number of inserted patterns.
  [[nodiscard]] std::size_t size() const noexcept { return _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

 private:
  struct Node;

  struct LiteralChild {
    std::string literal;
    std::unique_ptr<Node> node;
  };

  struct Node {
    vector<LiteralChild> literalChildren;
    std::string paramName;
    std::unique_ptr<Node> paramChild;
    std::string catchAllName;
    std::optional<Value> catchAllValue;
    std::optional<Value> value;
  };

  using Capture = std::pair<std::string_view, std::string_view>;

  static bool matchNode(const Node& node, std::string_view path, std::span<const std::string_view> segments,
                        std::size_t segIdx, vector<Capture>& captures, Value& out);

  std::unique_ptr<Node> _root;
  std::size_t _size{};
};

}  // namespace spindle
