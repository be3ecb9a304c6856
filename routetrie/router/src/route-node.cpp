#include "routetrie/route-node.hpp"

#include <cstddef>
#include <memory>
#include <utility>

namespace routetrie {

RouteNode::RouteNode(const RouteNode& other)
    : label(other.label), valueIdx(other.valueIdx), priority(other.priority), kind(other.kind) {
  staticChildren.reserve(other.staticChildren.size());
  for (const auto& child : other.staticChildren) {
    staticChildren.push_back(std::make_unique<RouteNode>(*child));
  }
  if (other.paramChild) {
    paramChild = std::make_unique<RouteNode>(*other.paramChild);
  }
  if (other.catchAllChild) {
    catchAllChild = std::make_unique<RouteNode>(*other.catchAllChild);
  }
}

RouteNode& RouteNode::operator=(const RouteNode& other) {
  if (this != &other) {
    RouteNode copy(other);
    *this = std::move(copy);
  }
  return *this;
}

std::size_t RouteNode::staticChildPos(char firstByte) const noexcept {
  std::size_t pos = 0;
  for (; pos < staticChildren.size(); ++pos) {
    if (staticChildren[pos]->label.front() == firstByte) {
      break;
    }
  }
  return pos;
}

}  // namespace routetrie
