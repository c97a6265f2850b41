#include "combinadic/common/combinadic_throw.h"

#include <cstdint>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "combinadic/common/combinadic_assertion_error.h"
#include "combinadic/common/test_utilities/expect_no_throw.h"
#include "combinadic/common/test_utilities/expect_throws_message.h"

namespace {

GTEST_TEST(CombinadicThrowTest, BasicTest) {
  COMBINADIC_EXPECT_NO_THROW(COMBINADIC_THROW_UNLESS(true));
  EXPECT_THROW(COMBINADIC_THROW_UNLESS(false), std::runtime_error);
  EXPECT_THROW(COMBINADIC_THROW_UNLESS(false),
               combinadic::internal::assertion_error);
}

// Up to four value expressions are supported, and each is encoded as
// "text = value".
GTEST_TEST(CombinadicThrowTest, ThrowWithValues) {
  const int num_items = 13;
  const int group_size = 5;
  const int64_t rank = 1287;
  const int value = -1;
  COMBINADIC_EXPECT_NO_THROW(COMBINADIC_THROW_UNLESS(true, num_items));
  COMBINADIC_EXPECT_NO_THROW(
      COMBINADIC_THROW_UNLESS(true, num_items, group_size, rank, value));

  // COMBINADIC_EXPECT_THROWS_MESSAGE needs an expression, not the do-while
  // statement of COMBINADIC_THROW_UNLESS, so wrap it in a lambda.
  auto do_throw = [&](int count) {
    switch (count) {
      case 1:
        COMBINADIC_THROW_UNLESS(false, num_items);
        return;
      case 2:
        COMBINADIC_THROW_UNLESS(false, num_items, group_size);
        return;
      case 3:
        COMBINADIC_THROW_UNLESS(false, num_items, group_size, rank);
        return;
      case 4:
        COMBINADIC_THROW_UNLESS(false, num_items, group_size, rank, value);
        return;
    }
    COMBINADIC_UNREACHABLE();
  };

  COMBINADIC_EXPECT_THROWS_MESSAGE(do_throw(1), ".*num_items = 13.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(do_throw(2),
                                   ".*num_items = 13, group_size = 5.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      do_throw(3), ".*num_items = 13, group_size = 5, rank = 1287.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      do_throw(4),
      ".*num_items = 13, group_size = 5, rank = 1287, value = -1.");
}

GTEST_TEST(CombinadicThrowTest, MessageNamesCondition) {
  auto check = [](int k) {
    COMBINADIC_THROW_UNLESS(k >= 1, k);
  };
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      check(0),
      "Failure at .*combinadic_throw_test.cc:[0-9]+ in operator\\(\\)\\(\\): "
      "condition 'k >= 1' failed. k = 0.");
}

// Floating-point values always carry a fractional digit.
GTEST_TEST(CombinadicThrowTest, BuiltInFormatting) {
  auto throw_error = [](const auto& value) {
    COMBINADIC_THROW_UNLESS(false, value);
  };
  const double d = 1;
  COMBINADIC_EXPECT_THROWS_MESSAGE(throw_error(d), ".*1.0.*");
  const float f = 2;
  COMBINADIC_EXPECT_THROWS_MESSAGE(throw_error(f), ".*2.0.*");
  const int64_t big = 7219428434016265740;
  COMBINADIC_EXPECT_THROWS_MESSAGE(throw_error(big),
                                   ".*value = 7219428434016265740.");
}

}  // namespace
