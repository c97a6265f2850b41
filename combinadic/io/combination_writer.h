#pragma once

#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "combinadic/common/name_value.h"
#include "combinadic/math/combinadic.h"

namespace combinadic {
namespace io {

/** Controls how CombinationWriter functions render combinations as text.

For example, with the defaults and N = 13, K = 3 the first ranks are written
as
<pre>
 2, 1, 0
 3, 1, 0
 ...
</pre>
and with `display_strings: [a, b, c, d]`, `separator: ""`,
`group_separator: " "`, `max_line_length: 12` and N = 4, K = 2 the whole
listing is
<pre>
ba ca cb da
db dc
</pre> */
struct CombinationWriterConfig {
  /** Passes this object to an Archive. */
  template <typename Archive>
  void Serialize(Archive* a) {
    a->Visit(COMBINADIC_NVP(field_width));
    a->Visit(COMBINADIC_NVP(display_strings));
    a->Visit(COMBINADIC_NVP(separator));
    a->Visit(COMBINADIC_NVP(group_separator));
    a->Visit(COMBINADIC_NVP(max_line_length));
    a->Visit(COMBINADIC_NVP(ascending));
    a->Visit(COMBINADIC_NVP(reverse_values));
    ValidateOrThrow();
  }

  /** Throws std::exception if a field is out of range. */
  void ValidateOrThrow() const;

  /** The minimum width of each numeric value, which is right-aligned. When
  unset, the width is the number of decimal digits in N - 1, so that every
  value of a listing lines up. Ignored when `display_strings` is set. */
  std::optional<int> field_width;

  /** When non-empty, item v is written as `display_strings[v]` instead of as
  a number. Must then name every item. */
  std::vector<std::string> display_strings;

  /** Written between the values of one combination. */
  std::string separator{","};

  /** Written between consecutive combinations on the same line. */
  std::string group_separator{" "};

  /** When positive, combinations share a line until the next one would make
  the line longer than this many characters (a combination longer than the
  limit still gets a line of its own). When zero, every combination is on a
  line by itself. */
  int max_line_length{0};

  /** Writes ranks from 0 upward when true, from the last rank downward when
  false. */
  bool ascending{true};

  /** Writes the values of each combination from least to most significant
  (i.e., ascending) instead of in their canonical descending order. */
  bool reverse_values{false};
};

/** Returns `combination` as text according to `config`, for a number system
of `num_items` items.
@throws std::exception if `config` is invalid, or if `display_strings` does
not name every value of `combination`. */
std::string FormatCombination(std::span<const int> combination,
                              const CombinationWriterConfig& config,
                              int num_items);

/** Writes every combination of `combinadic`, in rank order, to `out`. Each
line ends with a newline.
@throws std::exception if `config` is invalid or names too few
`display_strings`. */
template <typename T>
void WriteCombinations(const math::Combinadic<T>& combinadic,
                       const CombinationWriterConfig& config,
                       std::ostream* out);

/** Same as WriteCombinations, but (over)writes the file `filename`.
@throws std::runtime_error if the file cannot be written. */
template <typename T>
void WriteCombinationsToFile(const math::Combinadic<T>& combinadic,
                             const CombinationWriterConfig& config,
                             const std::string& filename);

/** Returns every combination of `combinadic` formatted by FormatCombination,
in rank order. Line wrapping and `group_separator` do not apply.

The whole list is held in memory; prefer WriteCombinations() for large
number systems.
@throws std::length_error if num_combinations() exceeds the largest possible
`std::vector` size (e.g., 66 choose 33 on a 64-bit engine).
@throws std::bad_alloc if the list does not fit in memory.
@throws std::exception if `config` is invalid or names too few
`display_strings`. */
template <typename T>
std::vector<std::string> ListCombinations(
    const math::Combinadic<T>& combinadic,
    const CombinationWriterConfig& config);

}  // namespace io
}  // namespace combinadic
