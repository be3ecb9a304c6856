#pragma once

#include <cstdint>

#include "routetrie/path-params.hpp"

namespace routetrie {

struct RouterConfig {
  enum class DuplicatePolicy : std::int8_t { Reject, Overwrite };

  // Behavior when a pattern identical to an already registered one is inserted again.
  //   Reject   : the insertion throws a ConflictError (DuplicateRoute) and the router is left unchanged.
  //   Overwrite: the stored value is replaced, the trie shape is untouched and a warning is logged.
  // A catch-all registered under a different name at the same position is rejected by both policies.
  // Default: Reject
  DuplicatePolicy duplicatePolicy{DuplicatePolicy::Reject};

  // Maximum number of parameters (named and catch-all) of a single pattern.
  // Must be in [1, kMaxPathParams].
  std::uint32_t maxParamsPerRoute{kMaxPathParams};

  // Maximum length in bytes of a pattern, escapes included. Must be strictly positive.
  std::uint32_t maxPatternLength{4096};

  RouterConfig& withDuplicatePolicy(DuplicatePolicy policy);

  RouterConfig& withMaxParamsPerRoute(std::uint32_t maxParams);

  RouterConfig& withMaxPatternLength(std::uint32_t maxLength);

  // Throws std::invalid_argument if a field is out of range.
  void validate() const;
};

}  // namespace routetrie
