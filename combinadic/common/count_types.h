#pragma once

#include <cstdint>

/// @file
/// The integer widths used for combination counts and ranks. Class templates
/// that are parameterized on the count type `T` are explicitly instantiated
/// on exactly these types:
///
/// - `int32_t`: the bounded engine; at most 2^31 - 1 combinations.
/// - `int64_t`: the wide engine; at most 2^63 - 1 combinations (e.g.,
///   66 choose 33 = 7,219,428,434,016,265,740).

/// Declares that template instantiations exist for both count types.
/// This should only be used in .h files, never in .cc files.
#define COMBINADIC_DECLARE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES( \
    SomeType)                                                             \
  extern template SomeType<int32_t>;                                      \
  extern template SomeType<int64_t>;

/// Defines template instantiations for both count types.
/// This should only be used in .cc files, never in .h files.
#define COMBINADIC_DEFINE_CLASS_TEMPLATE_INSTANTIATIONS_ON_COUNT_TYPES( \
    SomeType)                                                            \
  template SomeType<int32_t>;                                            \
  template SomeType<int64_t>;
