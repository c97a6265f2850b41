#pragma once

#include <regex>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "combinadic/common/combinadic_assert.h"

/** @file
Unit test helper macros for "expecting" an exception to be thrown and also
testing its message against a regular expression. Usage example: @code
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      StatementUnderTest(), // You expect this statement to throw ...
      ".*some important.*phrases.*that must appear.*");  // ... this message.
@endcode
The regular expression must match the entire error message. Failure is a
non-fatal test error; the ASSERT variant makes it fatal. The `_IF_ARMED`
variants require the exception only when COMBINADIC_ASSERT is armed. */

#define COMBINADIC_EXPECT_THROWS_MESSAGE_HELPER(expression, regexp,         \
                                                must_throw, fatal_failure)  \
  do {                                                                      \
    try {                                                                   \
      static_cast<void>(expression);                                        \
      if (must_throw) {                                                     \
        std::string message = "\tExpected: " #expression                    \
                              " throws an exception.\n"                     \
                              " Actual: it throws nothing";                 \
        if (fatal_failure) {                                                \
          GTEST_FATAL_FAILURE_(message.c_str());                            \
        } else {                                                            \
          GTEST_NONFATAL_FAILURE_(message.c_str());                         \
        }                                                                   \
      }                                                                     \
    } catch (const std::exception& err) {                                   \
      auto matcher = [](const char* s, const std::string& re) {             \
        return std::regex_match(s, std::regex(re));                         \
      };                                                                    \
      if (fatal_failure) {                                                  \
        ASSERT_PRED2(matcher, err.what(), regexp);                          \
      } else {                                                              \
        EXPECT_PRED2(matcher, err.what(), regexp);                          \
      }                                                                     \
    }                                                                       \
  } while (0)

#define COMBINADIC_EXPECT_THROWS_MESSAGE(expression, regexp)            \
  COMBINADIC_EXPECT_THROWS_MESSAGE_HELPER(expression, regexp,           \
                                          true /*must_throw*/,          \
                                          false /*non-fatal*/)

#define COMBINADIC_ASSERT_THROWS_MESSAGE(expression, regexp)            \
  COMBINADIC_EXPECT_THROWS_MESSAGE_HELPER(expression, regexp,           \
                                          true /*must_throw*/,          \
                                          true /*fatal*/)

#define COMBINADIC_EXPECT_THROWS_MESSAGE_IF_ARMED(expression, regexp)   \
  COMBINADIC_EXPECT_THROWS_MESSAGE_HELPER(                              \
      expression, regexp, ::combinadic::kCombinadicAssertIsArmed,       \
      false /*non-fatal*/)
