#pragma once

#include <cstdint>
#include <vector>

#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/combinadic_copyable.h"
#include "combinadic/common/count_types.h"
#include "combinadic/common/eigen_types.h"

namespace combinadic {
namespace math {

/** The precomputed binomial coefficient tables that let Combinadic rank and
unrank a K-combination of N items in O(K).

There are K - 1 rows (none at all when K = 1). Row i, where row 0 is the most
significant, has N - i entries and holds

  tables(i, j) == C(j, K - i)

with C(x, y) = 0 for x < y. Each row is therefore non-decreasing in j.

All rows live in a single contiguous arena, addressed by per-row offsets; the
rows are exposed only as read-only views. The tables are built once by the
constructor and are never modified afterwards, so a const instance may be
shared between threads freely.

The constructor does not check that the entries fit in `T`; callers must first
establish that C(N, K) does (see CountCombinations()), since every entry is at
most C(N - 1, K).

@tparam T is either int32_t or int64_t. */
template <typename T>
class CombinationIndexTables final {
 public:
  COMBINADIC_DEFAULT_COPY_AND_MOVE_AND_ASSIGN(CombinationIndexTables);

  /** Builds the tables for `group_size`-combinations of `num_items` items.
  @throws std::exception unless 1 <= group_size < num_items. */
  CombinationIndexTables(int num_items, int group_size);

  int num_items() const { return num_items_; }

  int group_size() const { return group_size_; }

  /** Returns K - 1, or zero when K = 1. */
  int num_rows() const { return static_cast<int>(row_offsets_.size()) - 1; }

  /** Returns N - i, the number of entries in row `i`. */
  int row_size(int i) const {
    COMBINADIC_ASSERT(i >= 0 && i < num_rows());
    return static_cast<int>(row_offsets_[i + 1] - row_offsets_[i]);
  }

  /** Returns the position of row `i` within arena(). */
  Eigen::Index row_offset(int i) const {
    COMBINADIC_ASSERT(i >= 0 && i < num_rows());
    return row_offsets_[i];
  }

  /** Returns a read-only view of row `i`. */
  ConstVectorXBlock<T> row(int i) const {
    return arena_.segment(row_offset(i), row_size(i));
  }

  /** Returns C(j, K - i). */
  const T& operator()(int i, int j) const {
    COMBINADIC_ASSERT(j >= 0 && j < row_size(i));
    return arena_[row_offsets_[i] + j];
  }

  /** Returns every row, concatenated in order from row 0. */
  const VectorX<T>& arena() const { return arena_; }

  /** Recomputes every entry independently and returns true iff each one
  equals C(j, K - i). This is O(N K^2), so is intended for tests and debug
  logging only. */
  bool CheckInvariants() const;

 private:
  int num_items_{};
  int group_size_{};
  // Row i occupies arena_[row_offsets_[i], row_offsets_[i + 1]).
  std::vector<Eigen::Index> row_offsets_;
  VectorX<T> arena_;
};

}  // namespace math
}  // namespace combinadic

COMBINADIC_DECLARE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES(
    class ::combinadic::math::CombinationIndexTables)
