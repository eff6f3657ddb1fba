#pragma once

#include <amc/vector.hpp>

namespace spindle {

template <class T>
using vector = amc::vector<T>;

}  // namespace spindle
