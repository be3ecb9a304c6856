#include "routetrie/path-params.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string_view>

namespace routetrie {

std::optional<std::string_view> PathParams::get(std::string_view key) const noexcept {
  const auto it = std::ranges::find_if(_bindings, [key](const Binding& binding) { return binding.key == key; });
  if (it == _bindings.end()) {
    return std::nullopt;
  }
  return _path.substr(it->begin, it->end - it->begin);
}

bool PathParams::operator==(const PathParams& other) const noexcept {
  if (size() != other.size()) {
    return false;
  }
  for (std::uint32_t idx = 0; idx < size(); ++idx) {
    if ((*this)[idx] != other[idx]) {
      return false;
    }
  }
  return true;
}

}  // namespace routetrie
