#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "combinadic/common/combinadic_copyable.h"
#include "combinadic/common/count_types.h"
#include "combinadic/math/combination_index_tables.h"

namespace combinadic {
namespace math {

/** A combinatorial number system: the bijection between the K-element
combinations of the items {0, ..., N-1} and the integer ranks
[0, C(N, K)).

A combination is written as a strictly descending tuple of K item indices.
Ranks follow descending-lexicographic order of those tuples, so that rank 0 is
(K-1, ..., 1, 0) and rank C(N, K) - 1 is (N-1, ..., N-K). For example, with
N = 13 and K = 5 there are 1287 combinations, and

  Rank({12, 11, 10, 9, 8}, true) == 1286
  Unrank(0) == {4, 3, 2, 1, 0}

The constructor builds the CombinationIndexTables once, after which Rank and
Unrank each take time proportional to K (Unrank scans each table row) with no
allocation beyond the convenience overloads. Every member function is const,
so one instance may serve concurrent callers as long as each caller uses its
own input and output buffers.

@tparam T is the integer width used for counts and ranks, either int32_t (at
most 2^31 - 1 combinations) or int64_t (at most 2^63 - 1 combinations). */
template <typename T>
class Combinadic final {
 public:
  COMBINADIC_DEFAULT_COPY_AND_MOVE_AND_ASSIGN(Combinadic);

  /** Constructs the number system for `group_size`-combinations of
  `num_items` items.
  @throws std::invalid_argument if group_size < 1 or num_items <= group_size.
  @throws std::overflow_error if C(num_items, group_size) does not fit in T. */
  Combinadic(int num_items, int group_size);

  /** Returns the rank of `combination`.

  When `already_sorted` is true, `combination` must be strictly descending.
  Otherwise its values may appear in any order, and the rank of their
  descending arrangement is returned; the caller's buffer is left untouched.

  @throws std::invalid_argument if combination.size() != group_size(), if
  `already_sorted` is true but the values are not strictly descending, or if
  a value appears more than once.
  @throws std::out_of_range if any value is outside [0, num_items()). */
  T Rank(std::span<const int> combination, bool already_sorted) const;

  /** Same as Rank(), except that when `already_sorted` is false the values in
  `combination` are sorted into descending order in place. */
  T RankInPlace(std::span<int> combination, bool already_sorted) const;

  /** Writes the strictly descending combination whose rank is `rank` into
  `combination`.
  @throws std::invalid_argument if combination.size() != group_size().
  @throws std::out_of_range if `rank` is outside [0, num_combinations()). */
  void Unrank(T rank, std::span<int> combination) const;

  /** Returns the strictly descending combination whose rank is `rank`.
  @throws std::out_of_range if `rank` is outside [0, num_combinations()). */
  std::vector<int> Unrank(T rank) const;

  /// Returns N.
  int num_items() const { return num_items_; }

  /// Returns K.
  int group_size() const { return group_size_; }

  /// Returns C(N, K), the number of distinct ranks.
  T num_combinations() const { return num_combinations_; }

  /** (Advanced) Returns the index tables behind Rank and Unrank, for
  diagnostics and testing. There are no rows when K = 1. */
  const CombinationIndexTables<T>& tables() const { return tables_; }

 private:
  // Ranks a combination that is known to have the right size; checks the
  // value range and the strict ordering.
  T RankSorted(std::span<const int> combination, const char* func) const;

  void ThrowIfWrongSize(size_t size, const char* func) const;

  int num_items_{};
  int group_size_{};
  T num_combinations_{};
  CombinationIndexTables<T> tables_;
};

/// The bounded engine, for up to 2^31 - 1 combinations.
using Combinadic32 = Combinadic<int32_t>;

/// The wide engine, for up to 2^63 - 1 combinations.
using Combinadic64 = Combinadic<int64_t>;

}  // namespace math
}  // namespace combinadic

COMBINADIC_DECLARE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES(
    class ::combinadic::math::Combinadic)
