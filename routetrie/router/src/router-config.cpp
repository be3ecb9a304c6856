#include "routetrie/router-config.hpp"

#include <cstdint>
#include <stdexcept>

#include "routetrie/path-params.hpp"

namespace routetrie {

RouterConfig& RouterConfig::withDuplicatePolicy(DuplicatePolicy policy) {
  duplicatePolicy = policy;
  return *this;
}

RouterConfig& RouterConfig::withMaxParamsPerRoute(std::uint32_t maxParams) {
  maxParamsPerRoute = maxParams;
  return *this;
}

RouterConfig& RouterConfig::withMaxPatternLength(std::uint32_t maxLength) {
  maxPatternLength = maxLength;
  return *this;
}

void RouterConfig::validate() const {
  if (duplicatePolicy != DuplicatePolicy::Reject && duplicatePolicy != DuplicatePolicy::Overwrite) {
    throw std::invalid_argument("RouterConfig.duplicatePolicy is invalid");
  }
  if (maxParamsPerRoute == 0) {
    throw std::invalid_argument("RouterConfig.maxParamsPerRoute must be strictly positive");
  }
  if (maxParamsPerRoute > kMaxPathParams) {
    throw std::invalid_argument("RouterConfig.maxParamsPerRoute cannot exceed kMaxPathParams");
  }
  if (maxPatternLength == 0) {
    throw std::invalid_argument("RouterConfig.maxPatternLength must be strictly positive");
  }
}

}  // namespace routetrie
