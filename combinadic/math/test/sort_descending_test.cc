#include "combinadic/math/sort_descending.h"

#include <vector>

#include <gtest/gtest.h>

namespace combinadic {
namespace math {
namespace {

GTEST_TEST(SortDescendingTest, Sorts) {
  std::vector<int> values{3, 9, 0, 4, 7};
  SortDescending(values);
  EXPECT_EQ(values, std::vector<int>({9, 7, 4, 3, 0}));
  EXPECT_TRUE(IsStrictlyDescending(values));
}

GTEST_TEST(SortDescendingTest, SortsSubspan) {
  std::vector<int> values{1, 2, 3, 4};
  SortDescending(std::span<int>(values).subspan(1, 2));
  EXPECT_EQ(values, std::vector<int>({1, 3, 2, 4}));
}

GTEST_TEST(SortDescendingTest, StrictlyDescending) {
  EXPECT_TRUE(IsStrictlyDescending(std::vector<int>{}));
  EXPECT_TRUE(IsStrictlyDescending(std::vector<int>{5}));
  EXPECT_TRUE(IsStrictlyDescending(std::vector<int>{12, 11, 10, 9, 8}));
  EXPECT_FALSE(IsStrictlyDescending(std::vector<int>{1, 2}));
  EXPECT_FALSE(IsStrictlyDescending(std::vector<int>{4, 4, 1}));

  // Sorting keeps duplicates, so the result is not strictly descending.
  std::vector<int> duplicated{2, 6, 2};
  SortDescending(duplicated);
  EXPECT_EQ(duplicated, std::vector<int>({6, 2, 2}));
  EXPECT_FALSE(IsStrictlyDescending(duplicated));
}

}  // namespace
}  // namespace math
}  // namespace combinadic
