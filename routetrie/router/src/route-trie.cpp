#include "routetrie/route-trie.hpp"

#include <algorithm>
#include <bitset>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "routetrie/log.hpp"
#include "routetrie/path-params.hpp"
#include "routetrie/pattern-parser.hpp"
#include "routetrie/route-error.hpp"
#include "routetrie/route-node.hpp"
#include "routetrie/router-config.hpp"
#include "routetrie/segment.hpp"

namespace routetrie {
namespace {

std::size_t CommonPrefixLength(std::string_view lhs, std::string_view rhs) noexcept {
  const auto [lhsIt, rhsIt] = std::ranges::mismatch(lhs, rhs);
  return static_cast<std::size_t>(lhsIt - lhs.begin());
}

std::size_t FormattedSize(const Segment& segment) {
  return std::visit(
      [](const auto& seg) -> std::size_t {
        using T = std::decay_t<decltype(seg)>;
        if constexpr (std::is_same_v<T, StaticSegment>) {
          return seg.bytes.size() + static_cast<std::size_t>(std::ranges::count_if(
                                        seg.bytes, [](char ch) { return ch == '{' || ch == '}'; }));
        } else if constexpr (std::is_same_v<T, ParamSegment>) {
          return seg.name.size() + 2U;
        } else if constexpr (std::is_same_v<T, CatchAllSegment>) {
          return seg.name.size() + 3U;
        } else {
          static_assert(false, "Non-exhaustive visitor!");
        }
      },
      segment);
}

void CheckParamName(std::string_view name, std::string_view pattern, std::size_t pos) {
  if (name.empty()) {
    throw PatternError(RouteErrc::EmptyParameterName, pattern, pos);
  }
  if (name.find_first_of("/{}") != std::string_view::npos) {
    throw PatternError(RouteErrc::InvalidParameterName, pattern, pos);
  }
}

// Appends the pattern text of 'node' alone.
void AppendLabel(const RouteNode& node, std::string& out) {
  switch (node.kind) {
    case RouteNode::Kind::Static:
      AppendEscaped(node.label, out);
      break;
    case RouteNode::Kind::Param:
      out.push_back('{');
      out.append(node.label);
      out.push_back('}');
      break;
    case RouteNode::Kind::CatchAll:
      out.append("{*");
      out.append(node.label);
      out.push_back('}');
      break;
  }
}

// Appends the pattern text of one registered route going through 'node', starting at 'node'.
void AppendAnyRoute(const RouteNode& node, std::string& out) {
  for (const RouteNode* pNode = &node; pNode != nullptr;) {
    AppendLabel(*pNode, out);
    if (pNode->hasValue()) {
      break;
    }
    if (!pNode->staticChildren.empty()) {
      pNode = pNode->staticChildren.front().get();
    } else if (pNode->paramChild) {
      pNode = pNode->paramChild.get();
    } else {
      pNode = pNode->catchAllChild.get();
    }
  }
}

// Moves the content of 'node' past 'splitPos' into a new single static child.
void SplitNode(RouteNode& node, std::size_t splitPos) {
  auto tail = std::make_unique<RouteNode>(RouteNode::Kind::Static, std::string_view(node.label).substr(splitPos));
  tail->staticChildren = std::move(node.staticChildren);
  tail->paramChild = std::move(node.paramChild);
  tail->catchAllChild = std::move(node.catchAllChild);
  tail->valueIdx = std::exchange(node.valueIdx, RouteNode::kNoValue);
  tail->priority = node.priority;

  node.label.resize(splitPos);
  // It's fine to call clear after a move.
  node.staticChildren.clear();  // NOLINT(bugprone-use-after-move)
  node.staticChildren.push_back(std::move(tail));
}

// Increments the priority of the static child at 'pos' and moves it up to keep siblings sorted.
// Returns the bumped child.
RouteNode* BumpStaticChild(RouteNode& parent, std::size_t pos) {
  auto& children = parent.staticChildren;
  ++children[pos]->priority;
  for (; pos > 0 && RouteNode::PrecedesSibling(*children[pos], *children[pos - 1U]); --pos) {
    std::swap(children[pos], children[pos - 1U]);
  }
  return children[pos].get();
}

bool CheckSubtree(const RouteNode& node, bool isRoot, std::uint32_t& nbValues) {
  std::uint32_t total = node.hasValue() ? 1U : 0U;

  std::bitset<256> firstBytes;
  const RouteNode* pPrev = nullptr;
  for (const auto& child : node.staticChildren) {
    if (child->kind != RouteNode::Kind::Static || child->label.empty()) {
      return false;
    }
    const auto firstByte = static_cast<unsigned char>(child->label.front());
    if (firstBytes.test(firstByte)) {
      return false;
    }
    firstBytes.set(firstByte);
    if (pPrev != nullptr && !RouteNode::PrecedesSibling(*pPrev, *child)) {
      return false;
    }
    pPrev = child.get();

    std::uint32_t childValues = 0;
    if (!CheckSubtree(*child, false, childValues)) {
      return false;
    }
    total += childValues;
  }

  if (node.paramChild && node.catchAllChild) {
    return false;
  }

  if (node.paramChild) {
    const RouteNode& param = *node.paramChild;
    if (param.kind != RouteNode::Kind::Param || param.label.empty()) {
      return false;
    }
    std::uint32_t childValues = 0;
    if (!CheckSubtree(param, false, childValues)) {
      return false;
    }
    total += childValues;
  }

  if (node.catchAllChild) {
    const RouteNode& catchAll = *node.catchAllChild;
    if (catchAll.kind != RouteNode::Kind::CatchAll || catchAll.label.empty() || !catchAll.hasValue() ||
        !catchAll.staticChildren.empty() || catchAll.paramChild || catchAll.catchAllChild) {
      return false;
    }
    if (catchAll.priority != 1U) {
      return false;
    }
    ++total;
  }

  if (!isRoot && total == 0) {
    // dangling node
    return false;
  }

  nbValues = total;
  return node.priority == total;
}

}  // namespace

RouteTrie::RouteTrie(RouterConfig config) : _config(std::move(config)) { _config.validate(); }

std::uint32_t RouteTrie::insert(std::string_view pattern, std::uint32_t valueIdx) {
  if (pattern.size() > _config.maxPatternLength) {
    throw PatternError(RouteErrc::PatternTooLong, pattern, _config.maxPatternLength);
  }
  const SegmentList segments = ParsePattern(pattern);
  return insertImpl(segments, pattern, valueIdx);
}

std::uint32_t RouteTrie::insert(std::span<const Segment> segments, std::uint32_t valueIdx) {
  const std::string pattern = FormatPattern(segments);
  if (pattern.size() > _config.maxPatternLength) {
    throw PatternError(RouteErrc::PatternTooLong, pattern, _config.maxPatternLength);
  }
  return insertImpl(segments, pattern, valueIdx);
}

std::uint32_t RouteTrie::insertImpl(std::span<const Segment> segments, std::string_view pattern,
                                    std::uint32_t valueIdx) {
  if (valueIdx == kNoValue) {
    throw std::invalid_argument("Value index is reserved");
  }

  // Everything that can fail is checked before the first mutation.
  validateSegments(segments, pattern);

  if (const RouteNode* pExisting = findConflict(segments, pattern)) {
    log::warn("Overwriting existing value for route '{}'", pattern);
    return pExisting->valueIdx;
  }

  insertValidated(segments, valueIdx);

  log::debug("Registered route '{}' ({} routes)", pattern, nbRoutes());
  return valueIdx;
}

void RouteTrie::validateSegments(std::span<const Segment> segments, std::string_view pattern) const {
  std::uint32_t nbParams = 0;
  std::size_t pos = 0;
  for (std::size_t idx = 0; idx < segments.size(); ++idx) {
    const Segment& segment = segments[idx];
    const Segment* pNext = idx + 1U < segments.size() ? &segments[idx + 1U] : nullptr;
    const Segment* pPrev = idx == 0 ? nullptr : &segments[idx - 1U];

    std::visit(
        [&](const auto& seg) {
          using T = std::decay_t<decltype(seg)>;
          if constexpr (std::is_same_v<T, StaticSegment>) {
            return;
          } else if constexpr (std::is_same_v<T, ParamSegment> || std::is_same_v<T, CatchAllSegment>) {
            CheckParamName(seg.name, pattern, pos);
            if (++nbParams > _config.maxParamsPerRoute) {
              throw PatternError(RouteErrc::TooManyParameters, pattern, pos);
            }
            if constexpr (std::is_same_v<T, ParamSegment>) {
              if (pNext != nullptr) {
                const auto* pNextStatic = std::get_if<StaticSegment>(pNext);
                if (pNextStatic == nullptr || !pNextStatic->bytes.starts_with('/')) {
                  throw PatternError(RouteErrc::ParameterNotFollowedByBoundary, pattern, pos + FormattedSize(segment));
                }
              }
            } else {
              if (pNext != nullptr) {
                throw ConflictError(RouteErrc::CatchAllNotLeaf, pattern, FormatPattern(segments.first(idx + 1U)));
              }
              const auto* pPrevStatic = pPrev == nullptr ? nullptr : std::get_if<StaticSegment>(pPrev);
              if (pPrevStatic == nullptr || !pPrevStatic->bytes.ends_with('/')) {
                throw PatternError(RouteErrc::NestedOrMisplacedWildcard, pattern, pos);
              }
            }
          } else {
            static_assert(false, "Non-exhaustive visitor!");
          }
        },
        segment);

    pos += FormattedSize(segment);
  }
}

const RouteNode* RouteTrie::findConflict(std::span<const Segment> segments, std::string_view pattern) const {
  const RouteNode* pNode = &_root;

  // Pattern text of the existing nodes walked so far, used to report the conflicting route.
  std::string walked;

  const auto conflict = [&walked, pattern](RouteErrc code, const RouteNode& existing) {
    std::string conflictingRoute = walked;
    AppendAnyRoute(existing, conflictingRoute);
    return ConflictError(code, pattern, std::move(conflictingRoute));
  };

  for (const Segment& segment : segments) {
    // false as soon as the insertion leaves the existing nodes: nothing below can conflict anymore.
    const bool onExistingNode = std::visit(
        [&](const auto& seg) -> bool {
          using T = std::decay_t<decltype(seg)>;
          if constexpr (std::is_same_v<T, StaticSegment>) {
            std::string_view remaining = seg.bytes;
            while (!remaining.empty()) {
              const std::size_t childPos = pNode->staticChildPos(remaining.front());
              if (childPos == pNode->staticChildren.size()) {
                return false;
              }
              const RouteNode& child = *pNode->staticChildren[childPos];
              const std::size_t common = CommonPrefixLength(child.label, remaining);
              if (common < child.label.size()) {
                // child will be split, the remaining part of the pattern lands on new nodes
                return false;
              }
              AppendEscaped(child.label, walked);
              remaining.remove_prefix(common);
              pNode = &child;
            }
            return true;
          } else if constexpr (std::is_same_v<T, ParamSegment>) {
            if (pNode->catchAllChild) {
              throw conflict(RouteErrc::ConflictingWildcard, *pNode->catchAllChild);
            }
            if (!pNode->paramChild) {
              return false;
            }
            if (pNode->paramChild->label != seg.name) {
              throw conflict(RouteErrc::ConflictingParameterName, *pNode->paramChild);
            }
            pNode = pNode->paramChild.get();
            AppendLabel(*pNode, walked);
            return true;
          } else if constexpr (std::is_same_v<T, CatchAllSegment>) {
            if (pNode->paramChild) {
              throw conflict(RouteErrc::ConflictingWildcard, *pNode->paramChild);
            }
            if (!pNode->catchAllChild) {
              return false;
            }
            if (pNode->catchAllChild->label != seg.name) {
              throw conflict(RouteErrc::DuplicateCatchAll, *pNode->catchAllChild);
            }
            pNode = pNode->catchAllChild.get();
            AppendLabel(*pNode, walked);
            return true;
          } else {
            static_assert(false, "Non-exhaustive visitor!");
          }
        },
        segment);

    if (!onExistingNode) {
      return nullptr;
    }
  }

  if (!pNode->hasValue()) {
    return nullptr;
  }
  if (_config.duplicatePolicy == RouterConfig::DuplicatePolicy::Overwrite) {
    return pNode;
  }
  throw ConflictError(RouteErrc::DuplicateRoute, pattern, std::move(walked));
}

void RouteTrie::insertValidated(std::span<const Segment> segments, std::uint32_t valueIdx) {
  RouteNode* pNode = &_root;
  ++pNode->priority;

  for (const Segment& segment : segments) {
    std::visit(
        [&pNode](const auto& seg) {
          using T = std::decay_t<decltype(seg)>;
          if constexpr (std::is_same_v<T, StaticSegment>) {
            std::string_view remaining = seg.bytes;
            while (!remaining.empty()) {
              const std::size_t childPos = pNode->staticChildPos(remaining.front());
              if (childPos == pNode->staticChildren.size()) {
                pNode->staticChildren.push_back(std::make_unique<RouteNode>(RouteNode::Kind::Static, remaining));
                remaining = {};
              } else {
                RouteNode& child = *pNode->staticChildren[childPos];
                const std::size_t common = CommonPrefixLength(child.label, remaining);
                if (common < child.label.size()) {
                  SplitNode(child, common);
                }
                remaining.remove_prefix(common);
              }
              pNode = BumpStaticChild(*pNode, childPos);
            }
          } else if constexpr (std::is_same_v<T, ParamSegment>) {
            if (!pNode->paramChild) {
              pNode->paramChild = std::make_unique<RouteNode>(RouteNode::Kind::Param, seg.name);
            }
            pNode = pNode->paramChild.get();
            ++pNode->priority;
          } else if constexpr (std::is_same_v<T, CatchAllSegment>) {
            if (!pNode->catchAllChild) {
              pNode->catchAllChild = std::make_unique<RouteNode>(RouteNode::Kind::CatchAll, seg.name);
            }
            pNode = pNode->catchAllChild.get();
            ++pNode->priority;
          } else {
            static_assert(false, "Non-exhaustive visitor!");
          }
        },
        segment);
  }

  pNode->valueIdx = valueIdx;
}

const RouteNode* RouteTrie::MatchFrom(const RouteNode& node, std::string_view path, std::size_t pos,
                                      PathParams& params) {
  if (pos == path.size()) {
    // A catch-all never matches an empty remainder.
    return node.hasValue() ? &node : nullptr;
  }

  // Static children first. At most one of them starts with the next byte.
  const std::size_t childPos = node.staticChildPos(path[pos]);
  if (childPos != node.staticChildren.size()) {
    const RouteNode& child = *node.staticChildren[childPos];
    if (path.substr(pos).starts_with(child.label)) {
      if (const RouteNode* pMatch = MatchFrom(child, path, pos + child.label.size(), params)) {
        return pMatch;
      }
    }
  }

  if (node.paramChild) {
    std::size_t end = path.find('/', pos);
    if (end == std::string_view::npos) {
      end = path.size();
    }
    if (end != pos) {
      const RouteNode& param = *node.paramChild;
      params.push(param.label, pos, end);
      if (const RouteNode* pMatch = MatchFrom(param, path, end, params)) {
        return pMatch;
      }
      params.pop();
    }
  }

  if (node.catchAllChild) {
    const RouteNode& catchAll = *node.catchAllChild;
    params.push(catchAll.label, pos, path.size());
    return &catchAll;
  }

  return nullptr;
}

std::uint32_t RouteTrie::match(std::string_view path, PathParams& params) const {
  params.reset(path);
  if (path.size() >= std::numeric_limits<std::uint32_t>::max()) {
    // bindings are stored as 32-bit offsets
    return kNoValue;
  }
  const RouteNode* pMatch = MatchFrom(_root, path, 0, params);
  if (pMatch == nullptr) {
    return kNoValue;
  }
  return pMatch->valueIdx;
}

void RouteTrie::clear() noexcept { _root = RouteNode(); }

bool RouteTrie::checkInvariants() const {
  std::uint32_t nbValues = 0;
  return CheckSubtree(_root, true, nbValues);
}

}  // namespace routetrie
