#pragma once

#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/combinadic_copyable.h"

namespace combinadic {

/// (Advanced) A basic implementation of the Name-Value Pair concept as used in
/// the Serialize / Archive pattern.
///
/// %NameValue stores a pointer to a const `name` and a pointer to a mutable
/// `value`.  Both pointers must remain valid throughout the lifetime of an
/// object.  %NameValue objects are typically short-lived, existing only for a
/// transient moment while an Archive is visiting some Serializable field.
///
/// A Serializable config struct lists its fields like this:
/// @code
/// struct Foo {
///   template <typename Archive>
///   void Serialize(Archive* a) {
///     a->Visit(COMBINADIC_NVP(num_items));
///     a->Visit(COMBINADIC_NVP(group_size));
///   }
///   int num_items{};
///   int group_size{};
/// };
/// @endcode
template <typename T>
class NameValue {
 public:
  COMBINADIC_NO_COPY_NO_MOVE_NO_ASSIGN(NameValue);

  /// Type of the referenced value.
  typedef T value_type;

  /// (Advanced) Constructs a %NameValue.  Prefer COMBINADIC_NVP instead of
  /// this constructor.  Both pointers are aliased and must remain valid for
  /// the lifetime of this object.  Neither pointer can be nullptr.
  NameValue(const char* name_in, T* value_in)
      : name_(name_in), value_(value_in) {
    COMBINADIC_ASSERT(name_in != nullptr);
    COMBINADIC_ASSERT(value_in != nullptr);
  }

  const char* name() const { return name_; }
  T* value() const { return value_; }

 private:
  const char* const name_;
  T* const value_;
};

/// (Advanced) Creates a NameValue. The conventional method for calling this
/// function is the COMBINADIC_NVP sugar macro below.
template <typename T>
NameValue<T> MakeNameValue(const char* name, T* value) {
  return NameValue<T>(name, value);
}

}  // namespace combinadic

/// Creates a NameValue pair for an lvalue `x`.
#define COMBINADIC_NVP(x) ::combinadic::MakeNameValue(#x, &(x))
