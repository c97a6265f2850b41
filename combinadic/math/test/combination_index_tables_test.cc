#include "combinadic/math/combination_index_tables.h"

#include <cstdint>

#include <gtest/gtest.h>

#include "combinadic/common/test_utilities/expect_throws_message.h"
#include "combinadic/math/binomial_coefficient.h"

namespace combinadic {
namespace math {
namespace {

GTEST_TEST(CombinationIndexTablesTest, Shape) {
  const CombinationIndexTables<int32_t> dut(13, 5);
  EXPECT_EQ(dut.num_items(), 13);
  EXPECT_EQ(dut.group_size(), 5);
  ASSERT_EQ(dut.num_rows(), 4);
  Eigen::Index offset = 0;
  for (int i = 0; i < dut.num_rows(); ++i) {
    EXPECT_EQ(dut.row_size(i), 13 - i);
    EXPECT_EQ(dut.row_offset(i), offset);
    EXPECT_EQ(dut.row(i).size(), 13 - i);
    offset += dut.row_size(i);
  }
  EXPECT_EQ(dut.arena().size(), 13 + 12 + 11 + 10);
}

GTEST_TEST(CombinationIndexTablesTest, SingleItemGroupsHaveNoRows) {
  const CombinationIndexTables<int64_t> dut(10, 1);
  EXPECT_EQ(dut.num_rows(), 0);
  EXPECT_EQ(dut.arena().size(), 0);
  EXPECT_TRUE(dut.CheckInvariants());
}

GTEST_TEST(CombinationIndexTablesTest, PairsAreTriangularNumbers) {
  const CombinationIndexTables<int32_t> dut(7, 2);
  ASSERT_EQ(dut.num_rows(), 1);
  const int expected[] = {0, 0, 1, 3, 6, 10, 15};
  for (int j = 0; j < 7; ++j) {
    EXPECT_EQ(dut(0, j), expected[j]) << j;
    EXPECT_EQ(dut.row(0)[j], expected[j]) << j;
  }
}

// Spot-checks the most significant row of the N = 7, K = 3 tables.
GTEST_TEST(CombinationIndexTablesTest, Triples) {
  const CombinationIndexTables<int32_t> dut(7, 3);
  ASSERT_EQ(dut.num_rows(), 2);
  const int row0[] = {0, 0, 0, 1, 4, 10, 20};
  for (int j = 0; j < 7; ++j) {
    EXPECT_EQ(dut(0, j), row0[j]) << j;
  }
  EXPECT_EQ(dut.row_size(1), 6);
  EXPECT_EQ(dut(1, 5), 10);
}

// Every entry is C(j, K - i), for a range of shapes and both widths.
GTEST_TEST(CombinationIndexTablesTest, EntriesAreBinomialCoefficients) {
  for (int n = 2; n <= 20; ++n) {
    for (int k = 1; k < n; ++k) {
      const CombinationIndexTables<int32_t> dut(n, k);
      EXPECT_TRUE(dut.CheckInvariants()) << n << " choose " << k;
      for (int i = 0; i < dut.num_rows(); ++i) {
        for (int j = 0; j < dut.row_size(i); ++j) {
          ASSERT_EQ(dut(i, j), *WideBinomialCoefficient(j, k - i))
              << "N = " << n << ", K = " << k << ", i = " << i
              << ", j = " << j;
        }
      }
    }
  }
  EXPECT_TRUE(CombinationIndexTables<int64_t>(66, 33).CheckInvariants());
}

GTEST_TEST(CombinationIndexTablesTest, RowsAreNonDecreasing) {
  const CombinationIndexTables<int64_t> dut(40, 9);
  for (int i = 0; i < dut.num_rows(); ++i) {
    for (int j = 1; j < dut.row_size(i); ++j) {
      EXPECT_LE(dut(i, j - 1), dut(i, j));
    }
  }
}

GTEST_TEST(CombinationIndexTablesTest, Copyable) {
  const CombinationIndexTables<int32_t> original(9, 4);
  const CombinationIndexTables<int32_t> copy = original;
  EXPECT_EQ(copy.arena(), original.arena());
  EXPECT_EQ(copy.num_rows(), 3);
}

GTEST_TEST(CombinationIndexTablesTest, BadShape) {
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      CombinationIndexTables<int32_t>(5, 0),
      ".*condition 'group_size >= 1' failed. group_size = 0.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      CombinationIndexTables<int32_t>(5, 5),
      ".*condition 'num_items > group_size' failed. num_items = 5, "
      "group_size = 5.");
}

}  // namespace
}  // namespace math
}  // namespace combinadic
