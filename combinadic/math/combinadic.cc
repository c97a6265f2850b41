#include "combinadic/math/combinadic.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "combinadic/common/text_logging.h"
#include "combinadic/math/binomial_coefficient.h"
#include "combinadic/math/sort_descending.h"

namespace combinadic {
namespace math {
namespace {

template <typename T>
T CheckedCount(int num_items, int group_size) {
  if (group_size < 1) {
    throw std::invalid_argument(fmt::format(
        "Combinadic: the group size must be at least 1, but was {}",
        group_size));
  }
  if (num_items <= group_size) {
    throw std::invalid_argument(fmt::format(
        "Combinadic: the number of items ({}) must exceed the group size ({})",
        num_items, group_size));
  }
  return CountCombinations<T>(num_items, group_size);
}

}  // namespace

template <typename T>
Combinadic<T>::Combinadic(int num_items, int group_size)
    : num_items_(num_items),
      group_size_(group_size),
      num_combinations_(CheckedCount<T>(num_items, group_size)),
      tables_(num_items, group_size) {
  COMBINADIC_LOGGER_DEBUG(
      "Combinadic: {} choose {} = {} combinations ({}-bit ranks) using {} "
      "table rows with {} entries",
      num_items_, group_size_, num_combinations_,
      std::numeric_limits<T>::digits + 1, tables_.num_rows(),
      tables_.arena().size());
  COMBINADIC_LOGGER_TRACE(
      "Combinadic: the {} choose {} index tables {} C(j, K - i)",
      num_items_, group_size_,
      tables_.CheckInvariants() ? "match" : "DO NOT match");
}

template <typename T>
void Combinadic<T>::ThrowIfWrongSize(size_t size, const char* func) const {
  if (size != static_cast<size_t>(group_size_)) {
    throw std::invalid_argument(fmt::format(
        "Combinadic::{}(): expected a combination of {} values, not {}", func,
        group_size_, size));
  }
}

template <typename T>
T Combinadic<T>::RankSorted(std::span<const int> combination,
                            const char* func) const {
  for (const int value : combination) {
    if (value < 0 || value >= num_items_) {
      throw std::out_of_range(fmt::format(
          "Combinadic::{}(): the value {} in [{}] is outside the item range "
          "[0, {})",
          func, value, fmt::join(combination, ", "), num_items_));
    }
  }
  if (!IsStrictlyDescending(combination)) {
    throw std::invalid_argument(fmt::format(
        "Combinadic::{}(): [{}] is not strictly descending", func,
        fmt::join(combination, ", ")));
  }

  // A strictly descending combination in [0, N) has combination[i] <= N-1-i,
  // which is always a valid index into row i.
  T result = 0;
  for (int i = 0; i < tables_.num_rows(); ++i) {
    result += tables_(i, combination[i]);
  }
  return result + combination.back();
}

template <typename T>
T Combinadic<T>::Rank(std::span<const int> combination,
                      bool already_sorted) const {
  ThrowIfWrongSize(combination.size(), "Rank");
  if (already_sorted) {
    return RankSorted(combination, "Rank");
  }
  std::vector<int> sorted(combination.begin(), combination.end());
  return RankInPlace(sorted, false);
}

template <typename T>
T Combinadic<T>::RankInPlace(std::span<int> combination,
                             bool already_sorted) const {
  ThrowIfWrongSize(combination.size(), "Rank");
  if (!already_sorted) {
    SortDescending(combination);
    const auto duplicate = std::adjacent_find(combination.begin(),
                                              combination.end());
    if (duplicate != combination.end()) {
      throw std::invalid_argument(fmt::format(
          "Combinadic::Rank(): the value {} appears more than once in [{}]",
          *duplicate, fmt::join(combination, ", ")));
    }
  }
  return RankSorted(combination, "Rank");
}

template <typename T>
void Combinadic<T>::Unrank(T rank, std::span<int> combination) const {
  ThrowIfWrongSize(combination.size(), "Unrank");
  if (rank < 0 || rank >= num_combinations_) {
    throw std::out_of_range(fmt::format(
        "Combinadic::Unrank(): the rank {} is outside the range [0, {})", rank,
        num_combinations_));
  }

  // Greedy largest fit: each row is non-decreasing, and its low entries are
  // zero, so the downward scan always stops. The value chosen for row i is
  // always less than the one chosen for row i - 1.
  T remaining = rank;
  int bound = num_items_;
  for (int i = 0; i < tables_.num_rows(); ++i) {
    const ConstVectorXBlock<T> row = tables_.row(i);
    int j = std::min(bound, tables_.row_size(i)) - 1;
    while (row[j] > remaining) {
      --j;
    }
    combination[i] = j;
    remaining -= row[j];
    bound = j;
  }
  combination[group_size_ - 1] = static_cast<int>(remaining);
}

template <typename T>
std::vector<int> Combinadic<T>::Unrank(T rank) const {
  std::vector<int> result(group_size_);
  Unrank(rank, result);
  return result;
}

}  // namespace math
}  // namespace combinadic

COMBINADIC_DEFINE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES(
    class ::combinadic::math::Combinadic)
