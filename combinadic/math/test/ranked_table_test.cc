#include "combinadic/math/ranked_table.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "combinadic/common/test_utilities/expect_throws_message.h"

namespace combinadic {
namespace math {
namespace {

GTEST_TEST(RankedTableTest, Append) {
  RankedTable<std::string> dut(4, 2);
  EXPECT_TRUE(dut.empty());
  EXPECT_EQ(dut.engine().num_combinations(), 6);

  for (const char* name : {"ba", "ca", "cb", "da", "db", "dc"}) {
    dut.Append(name);
  }
  EXPECT_EQ(dut.size(), 6);
  EXPECT_EQ(dut.at(2), "cb");
  const std::vector<int> combination{3, 1};
  EXPECT_EQ(dut.at(combination, true), "db");
  const std::vector<int> unsorted{0, 3};
  EXPECT_EQ(dut.at(unsorted, false), "da");

  COMBINADIC_EXPECT_THROWS_MESSAGE(
      dut.Append("extra"),
      "RankedTable::Append\\(\\): the table already holds all 6 "
      "combinations");
}

// Setting past the end fills every new slot with the payload.
GTEST_TEST(RankedTableTest, SetGrows) {
  RankedTable<int, int64_t> dut(13, 5);
  dut.Reserve();
  dut.Set(3, 7);
  ASSERT_EQ(dut.size(), 4);
  EXPECT_EQ(dut.payloads(), std::vector<int>({7, 7, 7, 7}));

  dut.Set(1, -2);
  EXPECT_EQ(dut.payloads(), std::vector<int>({7, -2, 7, 7}));

  const std::vector<int> largest{12, 11, 10, 9, 8};
  dut.Set(largest, true, 5);
  EXPECT_EQ(dut.size(), 1287);
  EXPECT_EQ(dut.at(1286), 5);
  EXPECT_EQ(dut.at(1285), 5);
  EXPECT_EQ(dut.at(0), 7);
}

GTEST_TEST(RankedTableTest, SetByUnsortedCombination) {
  RankedTable<double> dut(7, 3);
  std::vector<int> combination{0, 2, 1};
  dut.Set(combination, false, 0.5);
  EXPECT_EQ(dut.size(), 1);
  EXPECT_EQ(dut.at(0), 0.5);
  // The caller's combination is unchanged.
  EXPECT_EQ(combination, std::vector<int>({0, 2, 1}));
}

GTEST_TEST(RankedTableTest, SharedEngine) {
  auto engine = std::make_shared<const Combinadic32>(6, 3);
  RankedTable<int> first(engine);
  RankedTable<std::string> second(engine);
  EXPECT_EQ(&first.engine(), &second.engine());

  first.Append(1);
  RankedTable<int> copy = first;
  copy.Append(2);
  EXPECT_EQ(first.size(), 1);
  EXPECT_EQ(copy.size(), 2);
  EXPECT_EQ(&copy.engine(), engine.get());
}

GTEST_TEST(RankedTableTest, BadRanks) {
  RankedTable<int> dut(5, 2);
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      dut.Set(10, 0),
      "RankedTable::Set\\(\\): the rank 10 is outside the range \\[0, 10\\)");
  EXPECT_THROW(dut.Set(-1, 0), std::out_of_range);
  EXPECT_TRUE(dut.empty());

  dut.Append(4);
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      dut.at(1),
      "RankedTable::at\\(\\): no payload has been stored at rank 1 \\(the "
      "table size is 1\\)");
  EXPECT_THROW(dut.at(10), std::out_of_range);

  const std::vector<int> invalid{5, 0};
  EXPECT_THROW(dut.at(invalid, true), std::out_of_range);
}

GTEST_TEST(RankedTableTest, NullEngine) {
  EXPECT_THROW(RankedTable<int>(std::shared_ptr<const Combinadic32>{}),
               std::exception);
}

}  // namespace
}  // namespace math
}  // namespace combinadic
