#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>

#include "routetrie/vector.hpp"

namespace routetrie {

// Storage unit of the route trie. Each node exclusively owns its children; the trie is a strict tree
// without back pointers.
struct RouteNode {
  enum class Kind : std::uint8_t { Static, Param, CatchAll };

  static constexpr std::uint32_t kNoValue = std::numeric_limits<std::uint32_t>::max();

  RouteNode() noexcept = default;

  RouteNode(Kind nodeKind, std::string_view nodeLabel) : label(nodeLabel), kind(nodeKind) {}

  // Deep copy of the whole subtree.
  RouteNode(const RouteNode& other);
  RouteNode& operator=(const RouteNode& other);

  RouteNode(RouteNode&&) noexcept = default;
  RouteNode& operator=(RouteNode&&) noexcept = default;

  ~RouteNode() = default;

  [[nodiscard]] bool hasValue() const noexcept { return valueIdx != kNoValue; }

  // Bytes shared by every path reaching this node. Empty for dynamic nodes and for the root.
  [[nodiscard]] std::string_view prefix() const noexcept {
    return kind == Kind::Static ? std::string_view(label) : std::string_view();
  }

  // Name bound by this node. Empty for static nodes.
  [[nodiscard]] std::string_view paramName() const noexcept {
    return kind == Kind::Static ? std::string_view() : std::string_view(label);
  }

  // Index in staticChildren of the child whose prefix starts with 'firstByte', or staticChildren.size().
  [[nodiscard]] std::size_t staticChildPos(char firstByte) const noexcept;

  // Sibling ordering: descending priority, then ascending first byte.
  [[nodiscard]] static bool PrecedesSibling(const RouteNode& lhs, const RouteNode& rhs) noexcept {
    if (lhs.priority != rhs.priority) {
      return lhs.priority > rhs.priority;
    }
    return static_cast<unsigned char>(lhs.label.front()) < static_cast<unsigned char>(rhs.label.front());
  }

  // Prefix bytes for a static node, parameter name for a Param or CatchAll node.
  std::string label;

  // Static children, each keyed by the (unique) first byte of its prefix, sorted with PrecedesSibling.
  vector<std::unique_ptr<RouteNode>> staticChildren;

  std::unique_ptr<RouteNode> paramChild;

  // Always a leaf carrying a value.
  std::unique_ptr<RouteNode> catchAllChild;

  std::uint32_t valueIdx{kNoValue};

  // Number of values at or below this node.
  std::uint32_t priority{};

  Kind kind{Kind::Static};
};

}  // namespace routetrie
