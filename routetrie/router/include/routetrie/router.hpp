#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "routetrie/path-params.hpp"
#include "routetrie/route-trie.hpp"
#include "routetrie/router-config.hpp"
#include "routetrie/segment.hpp"
#include "routetrie/vector.hpp"

namespace routetrie {

// Result of a successful lookup.
// 'params' views the path given to match() and the router's parameter names, see PathParams.
template <class V>
struct Match {
  [[nodiscard]] V& value() const noexcept { return *pValue; }

  V* pValue{nullptr};
  PathParams params;
};

// Maps route patterns to values of type V.
//
// Pattern syntax:
//  - "/users/{id}"        named parameter, matches one or more bytes up to the next '/'
//  - "/static/{*path}"    catch-all parameter, matches all the remaining bytes (at least one)
//  - "/set/{{literal}}"   '{{' and '}}' match a literal '{' and '}'
// Static text always takes precedence over a parameter, which takes precedence over a catch-all.
// A failed static or parameter branch is retried with the next alternative, so a path matching any
// registered pattern is always found.
//
// V is never inspected. It must be move constructible and move assignable.
//
// Threading: register all routes first from a single thread. Afterwards match() can be called
// concurrently from any number of threads. To change routes at runtime, build (or copy and extend)
// another Router and publish it atomically.
template <class V>
class Router {
 public:
  using value_type = V;

  // Creates an empty Router with a default configuration (duplicates rejected).
  Router() noexcept = default;

  // Creates an empty Router with the given configuration. Throws std::invalid_argument if invalid.
  explicit Router(RouterConfig config) : _trie(std::move(config)) {}

  // Registers 'value' for 'pattern'.
  // Throws PatternError if the pattern is malformed, ConflictError if it conflicts with a registered
  // route. On error, the router is left unchanged.
  void insert(std::string_view pattern, V value) { insertImpl(pattern, std::move(value)); }

  // Registers 'value' for an already parsed pattern.
  void insert(std::span<const Segment> segments, V value) { insertImpl(segments, std::move(value)); }

  // Finds the route matching 'path'. Returns std::nullopt if there is none; never throws.
  [[nodiscard]] std::optional<Match<const V>> match(std::string_view path) const {
    Match<const V> ret;
    const std::uint32_t idx = _trie.match(path, ret.params);
    if (idx == RouteTrie::kNoValue) {
      return std::nullopt;
    }
    ret.pValue = &_values[idx];
    return ret;
  }

  // Same as match(), giving mutable access to the stored value.
  [[nodiscard]] std::optional<Match<V>> matchMut(std::string_view path) {
    Match<V> ret;
    const std::uint32_t idx = _trie.match(path, ret.params);
    if (idx == RouteTrie::kNoValue) {
      return std::nullopt;
    }
    ret.pValue = &_values[idx];
    return ret;
  }

  // Number of registered routes.
  [[nodiscard]] std::uint32_t size() const noexcept { return _trie.nbRoutes(); }

  [[nodiscard]] bool empty() const noexcept { return size() == 0; }

  [[nodiscard]] const RouterConfig& config() const noexcept { return _trie.config(); }

  [[nodiscard]] const RouteTrie& trie() const noexcept { return _trie; }

  // See RouteTrie::checkInvariants.
  [[nodiscard]] bool checkInvariants() const { return _trie.checkInvariants(); }

  // Clear all registered routes and values from the router.
  // The configuration stays unchanged.
  void clear() noexcept {
    _trie.clear();
    _values.clear();
  }

 private:
  // 'pattern' is either a pattern string or a segment span.
  template <class Pattern>
  void insertImpl(Pattern pattern, V&& value) {
    if (_values.size() >= static_cast<std::size_t>(RouteTrie::kNoValue)) {
      throw std::length_error("Too many routes");
    }

    // The value is stored before the trie is touched: if moving it throws, nothing has changed.
    const auto newIdx = static_cast<std::uint32_t>(_values.size());
    _values.reserve(_values.size() + 1U);
    _values.push_back(std::move(value));

    std::uint32_t idx = newIdx;
    try {
      idx = _trie.insert(pattern, newIdx);
      if (idx != newIdx) {
        // Overwrite of an existing route, the trie shape is unchanged.
        _values[idx] = std::move(_values.back());
      }
    } catch (...) {
      _values.pop_back();
      throw;
    }
    if (idx != newIdx) {
      _values.pop_back();
    }
  }

  RouteTrie _trie;
  vector<V> _values;
};

}  // namespace routetrie
