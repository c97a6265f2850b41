#pragma once

#include <type_traits>

/// @file
/// Provides the assertion macros used for internal invariants of the
/// combinadic library. User-facing precondition failures are reported with
/// COMBINADIC_THROW_UNLESS (see combinadic_throw.h) instead.
///
/// - @p COMBINADIC_DEMAND(condition) is always armed. Iff @p condition is
///   false it reports an assertion failure naming the condition, function,
///   file, and line.
/// - @p COMBINADIC_ASSERT(condition) behaves like COMBINADIC_DEMAND while
///   assertions are armed. If @p COMBINADIC_ENABLE_ASSERTS is defined it is
///   armed; if @p COMBINADIC_DISABLE_ASSERTS is defined it is disarmed;
///   otherwise NDEBUG governs it as usual. A disarmed assertion still
///   syntax-checks its condition.
/// - @p COMBINADIC_UNREACHABLE() marks a point in the code that is knowably
///   unreachable from reading the enclosing function alone.
///
/// By default an assertion failure aborts the program. A process can opt into
/// exceptions instead by calling
/// `combinadic_set_assertion_failure_to_throw_exception()`.

// Users should NOT set these; only this header should set them.
#ifdef COMBINADIC_ASSERT_IS_ARMED
# error Unexpected COMBINADIC_ASSERT_IS_ARMED defined.
#endif
#ifdef COMBINADIC_ASSERT_IS_DISARMED
# error Unexpected COMBINADIC_ASSERT_IS_DISARMED defined.
#endif

#if defined(COMBINADIC_ENABLE_ASSERTS) && defined(COMBINADIC_DISABLE_ASSERTS)
# error Conflicting assertion toggles.
#elif defined(COMBINADIC_ENABLE_ASSERTS)
# define COMBINADIC_ASSERT_IS_ARMED
#elif defined(COMBINADIC_DISABLE_ASSERTS) || defined(NDEBUG)
# define COMBINADIC_ASSERT_IS_DISARMED
#else
# define COMBINADIC_ASSERT_IS_ARMED
#endif

namespace combinadic {
namespace internal {
// Abort the program with an error message.
[[noreturn]] void Abort(const char* condition, const char* func,
                        const char* file, int line);
// Report an assertion failure; will either Abort(...) or throw.
[[noreturn]] void AssertionFailed(const char* condition, const char* func,
                                  const char* file, int line);
}  // namespace internal
namespace assert {
// Allows for specialization of how to bool-convert Conditions used in
// assertions, in case they are not intrinsically convertible.
template <typename Condition>
struct ConditionTraits {
  static constexpr bool is_valid = std::is_convertible_v<Condition, bool>;
  static bool Evaluate(const Condition& value) { return value; }
};
}  // namespace assert
}  // namespace combinadic

#define COMBINADIC_UNREACHABLE()                                      \
  ::combinadic::internal::Abort("Unreachable code was reached?!",     \
                                __func__, __FILE__, __LINE__)

#define COMBINADIC_DEMAND(condition)                                         \
  do {                                                                       \
    typedef ::combinadic::assert::ConditionTraits<                           \
        typename std::remove_cv_t<decltype(condition)>> Trait;               \
    static_assert(Trait::is_valid, "Condition should be bool-convertible."); \
    if (!Trait::Evaluate(condition)) {                                       \
      ::combinadic::internal::AssertionFailed(                               \
           #condition, __func__, __FILE__, __LINE__);                        \
    }                                                                        \
  } while (0)

#ifdef COMBINADIC_ASSERT_IS_ARMED
namespace combinadic {
constexpr bool kCombinadicAssertIsArmed = true;
constexpr bool kCombinadicAssertIsDisarmed = false;
}  // namespace combinadic
# define COMBINADIC_ASSERT(condition) COMBINADIC_DEMAND(condition)
#else
namespace combinadic {
constexpr bool kCombinadicAssertIsArmed = false;
constexpr bool kCombinadicAssertIsDisarmed = true;
}  // namespace combinadic
# define COMBINADIC_ASSERT(condition) static_assert(                        \
    ::combinadic::assert::ConditionTraits<                                  \
        typename std::remove_cv_t<decltype(condition)>>::is_valid,          \
    "Condition should be bool-convertible.");
#endif
