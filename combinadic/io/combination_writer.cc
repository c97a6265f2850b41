#include "combinadic/io/combination_writer.h"

#include <cstdint>
#include <fstream>
#include <functional>
#include <stdexcept>

#include <fmt/format.h>

#include "combinadic/common/combinadic_throw.h"
#include "combinadic/common/text_logging.h"

namespace combinadic {
namespace io {
namespace {

// Calls `visit` with every combination of `combinadic`, in the rank order
// requested by `ascending`.
template <typename T>
void ForEachCombination(
    const math::Combinadic<T>& combinadic, bool ascending,
    const std::function<void(std::span<const int>)>& visit) {
  std::vector<int> combination(combinadic.group_size());
  const T count = combinadic.num_combinations();
  for (T i = 0; i < count; ++i) {
    combinadic.Unrank(ascending ? i : count - 1 - i, combination);
    visit(combination);
  }
}

// Validates `config` against a number system of `num_items` items, and
// returns the width of each formatted value.
int ResolveFieldWidth(const CombinationWriterConfig& config, int num_items) {
  config.ValidateOrThrow();
  if (!config.display_strings.empty() &&
      config.display_strings.size() < static_cast<size_t>(num_items)) {
    throw std::invalid_argument(fmt::format(
        "FormatCombination(): display_strings names {} items, but there are "
        "{}",
        config.display_strings.size(), num_items));
  }
  return config.field_width.value_or(
      static_cast<int>(fmt::formatted_size("{}", num_items - 1)));
}

// Formats one combination once ResolveFieldWidth() has accepted `config`.
std::string FormatResolved(std::span<const int> combination,
                           const CombinationWriterConfig& config,
                           int num_items, int width) {
  const bool use_strings = !config.display_strings.empty();
  std::string result;
  const int size = static_cast<int>(combination.size());
  for (int n = 0; n < size; ++n) {
    const int value = combination[config.reverse_values ? size - 1 - n : n];
    if (n > 0) {
      result += config.separator;
    }
    if (use_strings) {
      if (value < 0 || value >= num_items) {
        throw std::out_of_range(fmt::format(
            "FormatCombination(): no display string for the value {}", value));
      }
      result += config.display_strings[value];
    } else {
      result += fmt::format("{:>{}}", value, width);
    }
  }
  return result;
}

}  // namespace

void CombinationWriterConfig::ValidateOrThrow() const {
  if (field_width.has_value()) {
    COMBINADIC_THROW_UNLESS(*field_width >= 1, *field_width);
  }
  COMBINADIC_THROW_UNLESS(max_line_length >= 0, max_line_length);
}

std::string FormatCombination(std::span<const int> combination,
                              const CombinationWriterConfig& config,
                              int num_items) {
  return FormatResolved(combination, config, num_items,
                        ResolveFieldWidth(config, num_items));
}

template <typename T>
void WriteCombinations(const math::Combinadic<T>& combinadic,
                       const CombinationWriterConfig& config,
                       std::ostream* out) {
  COMBINADIC_THROW_UNLESS(out != nullptr);
  const int num_items = combinadic.num_items();
  const int width = ResolveFieldWidth(config, num_items);

  const size_t max_length = config.max_line_length;
  std::string line;
  ForEachCombination<T>(
      combinadic, config.ascending, [&](std::span<const int> combination) {
        const std::string text =
            FormatResolved(combination, config, num_items, width);
        if (max_length == 0) {
          *out << text << '\n';
          return;
        }
        if (!line.empty()) {
          if (line.size() + config.group_separator.size() + text.size() >
              max_length) {
            *out << line << '\n';
            line.clear();
          } else {
            line += config.group_separator;
          }
        }
        line += text;
      });
  if (!line.empty()) {
    *out << line << '\n';
  }
}

template <typename T>
void WriteCombinationsToFile(const math::Combinadic<T>& combinadic,
                             const CombinationWriterConfig& config,
                             const std::string& filename) {
  std::ofstream file(filename);
  if (!file) {
    throw std::runtime_error(fmt::format(
        "WriteCombinationsToFile(): could not open '{}' for writing",
        filename));
  }
  WriteCombinations(combinadic, config, &file);
  file.close();
  if (file.fail()) {
    throw std::runtime_error(fmt::format(
        "WriteCombinationsToFile(): error while writing '{}'", filename));
  }
  log()->info("Wrote {} combinations of {} choose {} to '{}'",
              combinadic.num_combinations(), combinadic.num_items(),
              combinadic.group_size(), filename);
}

template <typename T>
std::vector<std::string> ListCombinations(
    const math::Combinadic<T>& combinadic,
    const CombinationWriterConfig& config) {
  const int num_items = combinadic.num_items();
  const int width = ResolveFieldWidth(config, num_items);
  std::vector<std::string> result;
  if (static_cast<uint64_t>(combinadic.num_combinations()) >
      result.max_size()) {
    throw std::length_error(fmt::format(
        "ListCombinations(): {} choose {} has {} combinations, more than a "
        "list can hold; use WriteCombinations() instead",
        num_items, combinadic.group_size(), combinadic.num_combinations()));
  }
  result.reserve(combinadic.num_combinations());
  ForEachCombination<T>(
      combinadic, config.ascending, [&](std::span<const int> combination) {
        result.push_back(
            FormatResolved(combination, config, num_items, width));
      });
  return result;
}

template void WriteCombinations<int32_t>(const math::Combinadic<int32_t>&,
                                         const CombinationWriterConfig&,
                                         std::ostream*);
template void WriteCombinations<int64_t>(const math::Combinadic<int64_t>&,
                                         const CombinationWriterConfig&,
                                         std::ostream*);
template void WriteCombinationsToFile<int32_t>(
    const math::Combinadic<int32_t>&, const CombinationWriterConfig&,
    const std::string&);
template void WriteCombinationsToFile<int64_t>(
    const math::Combinadic<int64_t>&, const CombinationWriterConfig&,
    const std::string&);
template std::vector<std::string> ListCombinations<int32_t>(
    const math::Combinadic<int32_t>&, const CombinationWriterConfig&);
template std::vector<std::string> ListCombinations<int64_t>(
    const math::Combinadic<int64_t>&, const CombinationWriterConfig&);

}  // namespace io
}  // namespace combinadic
