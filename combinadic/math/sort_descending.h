#pragma once

#include <algorithm>
#include <functional>
#include <span>

namespace combinadic {
namespace math {

/// Sorts `combination` in place into descending order, the canonical form
/// expected by Combinadic::Rank. Equal values (which no valid combination
/// contains) end up adjacent in unspecified order.
inline void SortDescending(std::span<int> combination) {
  std::sort(combination.begin(), combination.end(), std::greater<int>());
}

/// Returns true iff every value in `combination` is strictly greater than the
/// one that follows it. An empty or single-valued span is strictly
/// descending.
inline bool IsStrictlyDescending(std::span<const int> combination) {
  return std::adjacent_find(combination.begin(), combination.end(),
                            std::less_equal<int>()) == combination.end();
}

}  // namespace math
}  // namespace combinadic
