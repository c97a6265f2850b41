#pragma once

/** @file
Macros that selectively enable or disable the special member functions for
copy-construction, copy-assignment, move-construction, and move-assignment.
When enabled, the `= default` implementation is provided. Classes that need
custom copy or move functions should not use these macros. */

/** Deletes the copy and move constructors and assignment operators. Invoke
this macro in the public section of the class declaration, e.g.:
<pre>
class Foo {
 public:
  COMBINADIC_NO_COPY_NO_MOVE_NO_ASSIGN(Foo)

  // ...
};
</pre>
*/
#define COMBINADIC_NO_COPY_NO_MOVE_NO_ASSIGN(Classname) \
  Classname(const Classname&) = delete;                 \
  void operator=(const Classname&) = delete;            \
  Classname(Classname&&) = delete;                      \
  void operator=(Classname&&) = delete;

/** Defaults the copy and move constructors and assignment operators. Use this
only when copy-construction and copy-assignment defaults are well-formed. The
macro fails to compile when the class is not CopyAssignable, so classes that
use it need no unit tests for the presence of these functions. */
#define COMBINADIC_DEFAULT_COPY_AND_MOVE_AND_ASSIGN(Classname)  \
  Classname(const Classname&) = default;                        \
  Classname& operator=(const Classname&) = default;             \
  Classname(Classname&&) = default;                             \
  Classname& operator=(Classname&&) = default;                  \
  /* Fails at compile-time if copy-assign doesn't compile. */   \
  static void CombinadicDefaultCopyAndMoveAndAssign_DoAssign(   \
      Classname* a, const Classname& b) { *a = b; }             \
  static_assert(                                                \
      &CombinadicDefaultCopyAndMoveAndAssign_DoAssign ==        \
      &CombinadicDefaultCopyAndMoveAndAssign_DoAssign,          \
      "This assertion is never false; its only purpose is to "  \
      "generate 'use of deleted function: operator=' errors "   \
      "when Classname is a template.");
