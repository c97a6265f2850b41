#pragma once

#include <exception>
#include <typeinfo>

#include <gtest/gtest.h>

// Private helper macro to ensure error messages are the same for EXPECT and
// ASSERT variants of this macro.
#define COMBINADIC_TEST_NO_THROW_IMPL(statement, fail_macro)              \
  try {                                                                   \
    statement;                                                            \
  } catch (const std::exception& e) {                                     \
    fail_macro()                                                          \
      << "Expected: Does not throw:\n  " << #statement << std::endl       \
      << "Actual: Throws " << typeid(e).name() << std::endl               \
      << "  " << e.what();                                                \
  }

/** Unittest helper to explicitly indicate that a statement should not throw an
exception. Prefer this over EXPECT_NO_THROW because it reports the exception
message when a failure indeed happens. */
#define COMBINADIC_EXPECT_NO_THROW(statement) \
  COMBINADIC_TEST_NO_THROW_IMPL(statement, ADD_FAILURE)

/** Same as COMBINADIC_EXPECT_NO_THROW, but halts the execution of the given
test case on failure. */
#define COMBINADIC_ASSERT_NO_THROW(statement) \
  COMBINADIC_TEST_NO_THROW_IMPL(statement, GTEST_FAIL)
