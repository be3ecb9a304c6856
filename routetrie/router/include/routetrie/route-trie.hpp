#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "routetrie/path-params.hpp"
#include "routetrie/route-node.hpp"
#include "routetrie/router-config.hpp"
#include "routetrie/segment.hpp"

namespace routetrie {

// Radix trie of route patterns mapping each registered pattern to a 32-bit value index.
//
// Construction is single-threaded: insert() must not run concurrently with any other call.
// Once built, match() is const and touches no shared mutable state, so any number of threads may match
// concurrently.
class RouteTrie {
 public:
  static constexpr std::uint32_t kNoValue = RouteNode::kNoValue;

  RouteTrie() noexcept = default;

  // Throws std::invalid_argument if the configuration is invalid.
  explicit RouteTrie(RouterConfig config);

  // Registers 'pattern' with value index 'valueIdx' (which cannot be kNoValue).
  //
  // Returns the value index now associated with the pattern: 'valueIdx' for a new route, or the index of
  // the existing route when the pattern was already registered and the duplicate policy is Overwrite.
  //
  // Throws PatternError or ConflictError. Insertion is atomic: on error the trie is left unchanged.
  std::uint32_t insert(std::string_view pattern, std::uint32_t valueIdx);

  // Same as above with an already parsed pattern. The segment sequence is validated with the same rules
  // the parser enforces.
  std::uint32_t insert(std::span<const Segment> segments, std::uint32_t valueIdx);

  // Returns the value index of the route matching 'path' and fills 'params' with its bindings, or
  // kNoValue (with empty 'params') if no route matches. Never throws for any input path.
  [[nodiscard]] std::uint32_t match(std::string_view path, PathParams& params) const;

  [[nodiscard]] const RouteNode& root() const noexcept { return _root; }

  [[nodiscard]] std::uint32_t nbRoutes() const noexcept { return _root.priority; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _config; }

  // Drops all routes. The configuration stays unchanged.
  void clear() noexcept;

  // Checks the structural invariants of the whole trie (priorities, sibling order, child slots).
  [[nodiscard]] bool checkInvariants() const;

 private:
  std::uint32_t insertImpl(std::span<const Segment> segments, std::string_view pattern, std::uint32_t valueIdx);

  void validateSegments(std::span<const Segment> segments, std::string_view pattern) const;

  [[nodiscard]] const RouteNode* findConflict(std::span<const Segment> segments, std::string_view pattern) const;

  void insertValidated(std::span<const Segment> segments, std::uint32_t valueIdx);

  static const RouteNode* MatchFrom(const RouteNode& node, std::string_view path, std::size_t pos,
                                    PathParams& params);

  RouteNode _root;
  RouterConfig _config;
};

}  // namespace routetrie
