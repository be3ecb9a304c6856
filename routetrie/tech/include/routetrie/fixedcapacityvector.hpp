#pragma once

#include <cstdint>

#include <amc/fixedcapacityvector.hpp>

namespace routetrie {

template <class T, std::uintmax_t N>
using FixedCapacityVector = amc::FixedCapacityVector<T, N>;

}  // namespace routetrie
