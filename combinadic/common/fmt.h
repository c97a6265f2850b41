#pragma once

#include <string>
#include <type_traits>

#include <fmt/format.h>

// This file contains the essentials of fmt support in combinadic, mainly
// compatibility code to inter-operate with different versions of fmt.

namespace combinadic {

/** Returns `fmt::to_string(x)` but always with at least one digit after the
decimal point. Different versions of fmt disagree on whether to omit the
trailing ".0" when formatting integer-valued floating-point numbers.
@tparam T must be either `float` or `double`. */
template <typename T>
std::string fmt_floating_point(T x)
  requires(std::is_same_v<T, float> || std::is_same_v<T, double>)
{
  std::string result = fmt::format("{:#}", x);
  if (result.back() == '.') {
    result.push_back('0');
  }
  return result;
}

}  // namespace combinadic
