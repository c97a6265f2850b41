#pragma once

#include <array>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include <fmt/format.h>

#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/fmt.h"

/// @file
/// Provides a convenient wrapper to throw an exception when a condition is
/// unmet.  This is similar to an assertion, but uses exceptions instead of
/// `::abort()`, and cannot be disabled.

namespace combinadic {
namespace internal {

/* StringifyValue converts `value` into a string. Floating-point values always
carry a fractional digit; integers (ranks, item indices, sizes) are printed in
plain decimal. */
template <typename T>
std::string StringifyValue(const T& value) {
  if constexpr (std::is_floating_point_v<T>) {
    return fmt_floating_point(value);
  } else if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
    return fmt::to_string(value);
  } else {
    static_assert(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>,
                  "COMBINADIC_THROW_UNLESS only reports integer and "
                  "floating-point value expressions.");
  }
}

// The collection of possible name-value pairs passed to
// COMBINADIC_THROW_UNLESS.
struct ThrowValuesBuf {
  std::array<std::pair<const char*, std::string>, 4> values;
};

// Throw an error message.
[[noreturn]] void Throw(const char* condition, const char* func,
                        const char* file, int line,
                        const ThrowValuesBuf& buffer = {});

template <typename... ValuePairs>
[[noreturn]] __attribute__((noinline, cold)) void ThrowWithValues(
    const char* condition, const char* func, const char* file, int line,
    ValuePairs&&... pairs) {
  constexpr size_t N = sizeof...(pairs);
  static_assert(N % 2 == 0,
                "There should be an even number: up to 4 (name, value) pairs.");
  ThrowValuesBuf buffer;
  auto pairs_tuple = std::forward_as_tuple(std::forward<ValuePairs>(pairs)...);
  [&]<size_t... I>(std::integer_sequence<size_t, I...>&&) {
    (((buffer.values[I].first = std::get<2 * I>(std::move(pairs_tuple)),
       buffer.values[I].second =
           StringifyValue(std::get<2 * I + 1>(std::move(pairs_tuple)))),
      ...));
  }(std::make_index_sequence<N / 2>{});

  Throw(condition, func, file, line, buffer);
}

// Iterates through a list of up to four variadic macro arguments, turning
// each value expression into a ("text", value) pair.
#define COMBINADIC_GET_NTH_ARG(_1, _2, _3, _4, N, ...) N
#define COMBINADIC_ENCODE_0(...)
#define COMBINADIC_ENCODE_1(value) static_cast<const char*>(#value), value
#define COMBINADIC_ENCODE_2(value, ...) \
  static_cast<const char*>(#value), value, COMBINADIC_ENCODE_1(__VA_ARGS__)
#define COMBINADIC_ENCODE_3(value, ...) \
  static_cast<const char*>(#value), value, COMBINADIC_ENCODE_2(__VA_ARGS__)
#define COMBINADIC_ENCODE_4(value, ...) \
  static_cast<const char*>(#value), value, COMBINADIC_ENCODE_3(__VA_ARGS__)

#define COMBINADIC_ENCODE_EACH(...)                                     \
  COMBINADIC_GET_NTH_ARG(__VA_ARGS__ __VA_OPT__(, ) COMBINADIC_ENCODE_4, \
                         COMBINADIC_ENCODE_3, COMBINADIC_ENCODE_2,       \
                         COMBINADIC_ENCODE_1, COMBINADIC_ENCODE_0)       \
  (__VA_ARGS__)

}  // namespace internal
}  // namespace combinadic

/** Evaluates @p condition and iff the value is false will throw an exception
with a message showing at least the condition text, function name, file,
and line.

The condition must not be a pointer; always write out "!= nullptr".

Up to four integer or floating-point value expressions can follow the
condition. Each expression and its value is included in the error message:

  COMBINADIC_THROW_UNLESS(k >= 0, n, k);
*/
#define COMBINADIC_THROW_UNLESS(condition, ...)                               \
  do {                                                                        \
    typedef ::combinadic::assert::ConditionTraits<                            \
        typename std::remove_cv_t<decltype(condition)>>                       \
        Trait;                                                                \
    static_assert(Trait::is_valid, "Condition should be bool-convertible.");  \
    static_assert(                                                            \
        !std::is_pointer_v<decltype(condition)>,                              \
        "When using COMBINADIC_THROW_UNLESS on a raw pointer, always write "  \
        "out COMBINADIC_THROW_UNLESS(foo != nullptr).");                      \
    if (!Trait::Evaluate(condition)) {                                        \
      ::combinadic::internal::ThrowWithValues(                                \
          #condition, __func__, __FILE__,                                     \
          __LINE__ __VA_OPT__(, COMBINADIC_ENCODE_EACH(__VA_ARGS__)));        \
    }                                                                         \
  } while (0)
