#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>

#include "routetrie/fixedcapacityvector.hpp"

namespace routetrie {

// Hard upper bound of dynamic segments in a single pattern. Sizes the inline binding storage so that
// matching never allocates.
inline constexpr std::uint32_t kMaxPathParams = 16;

struct PathParamCapture {
  bool operator==(const PathParamCapture&) const noexcept = default;

  std::string_view key;
  std::string_view value;
};

// Ordered parameter bindings of a successful match.
//
// Bindings are stored as [begin, end) byte offsets into the matched path, never as copies.
// Lifetime: values view the path string given to match() and keys view parameter names owned by the
// router. Both must outlive this object (and any PathParamCapture obtained from it).
class PathParams {
 private:
  struct Binding {
    std::string_view key;
    std::uint32_t begin;
    std::uint32_t end;
  };

  using Bindings = FixedCapacityVector<Binding, kMaxPathParams>;

 public:
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = PathParamCapture;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = PathParamCapture;

    const_iterator() noexcept = default;

    PathParamCapture operator*() const noexcept { return (*_pParams)[_idx]; }

    const_iterator& operator++() noexcept {
      ++_idx;
      return *this;
    }

    const_iterator operator++(int) noexcept {
      const_iterator ret = *this;
      ++_idx;
      return ret;
    }

    bool operator==(const const_iterator&) const noexcept = default;

   private:
    friend class PathParams;

    const_iterator(const PathParams* pParams, std::uint32_t idx) noexcept : _pParams(pParams), _idx(idx) {}

    const PathParams* _pParams{nullptr};
    std::uint32_t _idx{};
  };

  PathParams() noexcept = default;

  explicit PathParams(std::string_view path) noexcept : _path(path) {}

  [[nodiscard]] std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(_bindings.size()); }

  [[nodiscard]] bool empty() const noexcept { return _bindings.empty(); }

  // Prerequisite: idx < size()
  [[nodiscard]] PathParamCapture operator[](std::uint32_t idx) const noexcept {
    const Binding& binding = _bindings[idx];
    return {binding.key, _path.substr(binding.begin, binding.end - binding.begin)};
  }

  // Raw [begin, end) offsets of the idx-th binding into path().
  // Prerequisite: idx < size()
  [[nodiscard]] std::pair<std::uint32_t, std::uint32_t> offsets(std::uint32_t idx) const noexcept {
    return {_bindings[idx].begin, _bindings[idx].end};
  }

  // Value of the first binding named 'key', if any.
  [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const noexcept;

  // The path the bindings refer to.
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] const_iterator begin() const noexcept { return {this, 0}; }
  [[nodiscard]] const_iterator end() const noexcept { return {this, size()}; }

  bool operator==(const PathParams& other) const noexcept;

 private:
  friend class RouteTrie;

  void reset(std::string_view path) noexcept {
    _path = path;
    _bindings.clear();
  }

  // Prerequisite: size() < kMaxPathParams, guaranteed by insertion limits.
  void push(std::string_view key, std::size_t begin, std::size_t end) {
    _bindings.emplace_back(key, static_cast<std::uint32_t>(begin), static_cast<std::uint32_t>(end));
  }

  void pop() noexcept { _bindings.pop_back(); }

  std::string_view _path;
  Bindings _bindings;
};

}  // namespace routetrie
