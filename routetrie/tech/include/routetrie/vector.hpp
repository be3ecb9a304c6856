#pragma once

#include <amc/vector.hpp>

namespace routetrie {

template <class T>
using vector = amc::vector<T>;

}  // namespace routetrie
