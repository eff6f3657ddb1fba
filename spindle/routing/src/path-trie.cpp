#include "spindle/path-trie.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

#include "spindle/invalid-argument-exception.hpp"
#include "spindle/path-params.hpp"
#include "spindle/vector.hpp"

namespace spindle {

namespace {

struct PatternSegment {
  enum class Kind : std::uint8_t { Literal, Param, CatchAll };

  Kind kind;
  std::string_view text;  // literal text, or parameter name
};

// Splits a path starting with '/' into its segments. "/" has no segment, "/a/" has two ("a" and "").
vector<std::string_view> SplitPathSegments(std::string_view path) {
  vector<std::string_view> segments;
  if (path.size() <= 1U) {
    return segments;
  }
  std::size_t pos = 1U;
  while (true) {
    const std::size_t nextSlash = path.find('/', pos);
    if (nextSlash == std::string_view::npos) {
      segments.push_back(path.substr(pos));
      break;
    }
    segments.push_back(path.substr(pos, nextSlash - pos));
    pos = nextSlash + 1U;
  }
  return segments;
}

vector<PatternSegment> CompilePattern(std::string_view pattern) {
  if (pattern.empty() || pattern.front() != '/') {
    throw invalid_argument("Path pattern '{}' should start with '/'", pattern);
  }

  vector<PatternSegment> compiled;
  const auto segments = SplitPathSegments(pattern);
  for (std::size_t segIdx = 0; segIdx < segments.size(); ++segIdx) {
    const std::string_view segment = segments[segIdx];
    if (segment.empty() || (segment.front() != ':' && segment.front() != '*')) {
      compiled.push_back(PatternSegment{PatternSegment::Kind::Literal, segment});
      continue;
    }
    const bool isCatchAll = segment.front() == '*';
    const std::string_view name = segment.substr(1U);
    if (name.empty()) {
      throw invalid_argument("Empty parameter name in path pattern '{}'", pattern);
    }
    if (isCatchAll && segIdx + 1U != segments.size()) {
      throw invalid_argument("Catch-all '*{}' should be the last segment of '{}'", name, pattern);
    }
    for (const PatternSegment& previous : compiled) {
      if (previous.kind != PatternSegment::Kind::Literal && previous.text == name) {
        throw invalid_argument("Duplicate parameter name '{}' in path pattern '{}'", name, pattern);
      }
    }
    compiled.push_back(
        PatternSegment{isCatchAll ? PatternSegment::Kind::CatchAll : PatternSegment::Kind::Param, name});
  }
  return compiled;
}

}  // namespace

PathTrie::PathTrie() : _root(std::make_unique<Node>()) {}

PathTrie::~PathTrie() = default;

PathTrie::InsertStatus PathTrie::insert(std::string_view pattern, Value value) {
  const auto compiled = CompilePattern(pattern);

  // Validate names along the way before creating any node, so that a throwing insert leaves the trie unchanged.
  const Node* pExisting = _root.get();
  for (const PatternSegment& segment : compiled) {
    if (pExisting == nullptr) {
      break;
    }
    switch (segment.kind) {
      case PatternSegment::Kind::Literal: {
        const Node* pNext = nullptr;
        for (const LiteralChild& child : pExisting->literalChildren) {
          if (child.literal == segment.text) {
            pNext = child.node.get();
            break;
          }
        }
        pExisting = pNext;
        break;
      }
      case PatternSegment::Kind::Param:
        if (pExisting->paramChild && pExisting->paramName != segment.text) {
          throw invalid_argument("Parameter ':{}' of '{}' conflicts with existing parameter ':{}'", segment.text,
                                 pattern, pExisting->paramName);
        }
        pExisting = pExisting->paramChild.get();
        break;
      case PatternSegment::Kind::CatchAll:
        if (pExisting->catchAllValue && pExisting->catchAllName != segment.text) {
          throw invalid_argument("Catch-all '*{}' of '{}' conflicts with existing catch-all '*{}'", segment.text,
                                 pattern, pExisting->catchAllName);
        }
        pExisting = nullptr;
        break;
      default:
        break;
    }
  }

  Node* pNode = _root.get();
  for (const PatternSegment& segment : compiled) {
    switch (segment.kind) {
      case PatternSegment::Kind::Literal: {
        Node* pNext = nullptr;
        for (LiteralChild& child : pNode->literalChildren) {
          if (child.literal == segment.text) {
            pNext = child.node.get();
            break;
          }
        }
        if (pNext == nullptr) {
          auto& child = pNode->literalChildren.emplace_back(LiteralChild{std::string(segment.text),
                                                                         std::make_unique<Node>()});
          pNext = child.node.get();
        }
        pNode = pNext;
        break;
      }
      case PatternSegment::Kind::Param:
        if (!pNode->paramChild) {
          pNode->paramName = segment.text;
          pNode->paramChild = std::make_unique<Node>();
        }
        pNode = pNode->paramChild.get();
        break;
      case PatternSegment::Kind::CatchAll:
        if (pNode->catchAllValue) {
          return InsertStatus::AlreadyExists;
        }
        pNode->catchAllName = segment.text;
        pNode->catchAllValue = value;
        ++_size;
        return InsertStatus::Inserted;
      default:
        break;
    }
  }

  if (pNode->value) {
    return InsertStatus::AlreadyExists;
  }
  pNode->value = value;
  ++_size;
  return InsertStatus::Inserted;
}

std::optional<PathTrie::Value> PathTrie::find(std::string_view pattern) const {
  const auto compiled = CompilePattern(pattern);

  const Node* pNode = _root.get();
  for (const PatternSegment& segment : compiled) {
    switch (segment.kind) {
      case PatternSegment::Kind::Literal: {
        const Node* pNext = nullptr;
        for (const LiteralChild& child : pNode->literalChildren) {
          if (child.literal == segment.text) {
            pNext = child.node.get();
            break;
          }
        }
        if (pNext == nullptr) {
          return std::nullopt;
        }
        pNode = pNext;
        break;
      }
      case PatternSegment::Kind::Param:
        if (!pNode->paramChild || pNode->paramName != segment.text) {
          return std::nullopt;
        }
        pNode = pNode->paramChild.get();
        break;
      case PatternSegment::Kind::CatchAll:
        if (pNode->catchAllName != segment.text) {
          return std::nullopt;
        }
        return pNode->catchAllValue;
      default:
        break;
    }
  }
  return pNode->value;
}

std::optional<PathTrie::Match> PathTrie::match(std::string_view path) const {
  if (path.empty() || path.front() != '/') {
    return std::nullopt;
  }

  const auto segments = SplitPathSegments(path);

  vector<Capture> captures;
  Value value{};
  if (!matchNode(*_root, path, std::span<const std::string_view>(segments.data(), segments.size()), 0, captures,
                 value)) {
    return std::nullopt;
  }

  Match ret{value, PathParams{}};
  for (const auto& [name, capturedValue] : captures) {
    ret.params.add(name, capturedValue);
  }
  return ret;
}

bool PathTrie::matchNode(const Node& node, std::string_view path, std::span<const std::string_view> segments,
                         std::size_t segIdx, vector<Capture>& captures, Value& out) {
  if (segIdx == segments.size()) {
    if (node.value) {
      out = *node.value;
      return true;
    }
    return false;
  }

  const std::string_view segment = segments[segIdx];

  for (const LiteralChild& child : node.literalChildren) {
    if (child.literal == segment) {
      if (matchNode(*child.node, path, segments, segIdx + 1U, captures, out)) {
        return true;
      }
      break;
    }
  }

  if (node.paramChild && !segment.empty()) {
    captures.emplace_back(node.paramName, segment);
    if (matchNode(*node.paramChild, path, segments, segIdx + 1U, captures, out)) {
      return true;
    }
    captures.pop_back();
  }

  if (node.catchAllValue) {
    const std::string_view rest = path.substr(static_cast<std::size_t>(segment.data() - path.data()));
    if (!rest.empty()) {
      captures.emplace_back(node.catchAllName, rest);
      out = *node.catchAllValue;
      return true;
    }
  }
  return false;
}

}  // namespace spindle
