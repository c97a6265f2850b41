#include "combinadic/math/combination_index_tables.h"

#include <optional>

#include "combinadic/common/combinadic_throw.h"
#include "combinadic/math/binomial_coefficient.h"

namespace combinadic {
namespace math {

template <typename T>
CombinationIndexTables<T>::CombinationIndexTables(int num_items,
                                                  int group_size)
    : num_items_(num_items), group_size_(group_size) {
  COMBINADIC_THROW_UNLESS(group_size >= 1, group_size);
  COMBINADIC_THROW_UNLESS(num_items > group_size, num_items, group_size);

  const int K = group_size;
  const int N = num_items;
  const int rows = K - 1;

  row_offsets_.resize(rows + 1);
  row_offsets_[0] = 0;
  for (int i = 0; i < rows; ++i) {
    row_offsets_[i + 1] = row_offsets_[i] + (N - i);
  }
  arena_ = VectorX<T>::Zero(row_offsets_[rows]);
  if (rows == 0) {
    return;
  }

  auto cell = [this](int i, int j) -> T& {
    return arena_[row_offsets_[i] + j];
  };

  // The last row holds C(j, 2), the triangular numbers.
  const int last = rows - 1;
  for (int j = 2; j < N - last; ++j) {
    cell(last, j) = cell(last, j - 1) + (j - 1);
  }

  // Every other row follows from the one below it by Pascal's rule,
  //   C(j, m) = C(j - 1, m) + C(j - 1, m - 1),
  // starting at C(m, m) = 1 where m = K - i.
  for (int i = rows - 2; i >= 0; --i) {
    const int m = K - i;
    cell(i, m) = 1;
    for (int j = m + 1; j < N - i; ++j) {
      cell(i, j) = cell(i, j - 1) + cell(i + 1, j - 1);
    }
  }
}

template <typename T>
bool CombinationIndexTables<T>::CheckInvariants() const {
  for (int i = 0; i < num_rows(); ++i) {
    if (row_size(i) != num_items_ - i) {
      return false;
    }
    for (int j = 0; j < row_size(i); ++j) {
      const std::optional<int64_t> expected =
          WideBinomialCoefficient(j, group_size_ - i);
      if (!expected.has_value() || *expected != (*this)(i, j)) {
        return false;
      }
    }
  }
  return true;
}

}  // namespace math
}  // namespace combinadic

COMBINADIC_DEFINE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES(
    class ::combinadic::math::CombinationIndexTables)
