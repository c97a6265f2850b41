#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <gflags/gflags.h>

#include "combinadic/common/name_value.h"
#include "combinadic/common/text_logging.h"
#include "combinadic/common/yaml/yaml_io.h"
#include "combinadic/io/combination_writer.h"
#include "combinadic/math/combinadic.h"

DEFINE_int32(n, 0, "The number of items N; overrides num_items from --config.");
DEFINE_int32(k, 0,
             "The number of items K in each combination; overrides "
             "group_size from --config.");
DEFINE_bool(wide, false,
            "Use 64-bit ranks (up to 2^63 - 1 combinations) instead of "
            "32-bit ranks.");
DEFINE_string(config, "",
              "A YAML file with num_items, group_size, wide, and an optional "
              "writer mapping (see CombinationWriterConfig).");
DEFINE_bool(count, false, "Print the number of combinations, C(N, K).");
DEFINE_string(rank, "",
              "Print the rank of the given comma-separated combination, "
              "e.g., `12,11,10,9,8`.");
DEFINE_bool(sorted, true,
            "Whether the --rank combination is already in strictly "
            "descending order. When false, it is sorted first.");
DEFINE_string(unrank, "", "Print the combination with the given rank.");
DEFINE_bool(dump, false, "Write every combination, in rank order.");
DEFINE_string(output, "",
              "With --dump, the file to write; when empty, writes to stdout.");

namespace combinadic {
namespace {

// The contents of a --config file.
struct ToolConfig {
  template <typename Archive>
  void Serialize(Archive* a) {
    a->Visit(COMBINADIC_NVP(num_items));
    a->Visit(COMBINADIC_NVP(group_size));
    a->Visit(COMBINADIC_NVP(wide));
    a->Visit(COMBINADIC_NVP(writer));
  }

  int num_items{};
  int group_size{};
  bool wide{false};
  io::CombinationWriterConfig writer;
};

template <typename T>
T ParseInteger(std::string_view text) {
  T result{};
  const char* const end = text.data() + text.size();
  const auto [ptr, error] = std::from_chars(text.data(), end, result);
  if (error != std::errc{} || ptr != end) {
    throw std::invalid_argument(
        fmt::format("'{}' is not a valid integer", text));
  }
  return result;
}

std::vector<int> ParseCombination(std::string_view text) {
  std::vector<int> result;
  while (true) {
    const size_t comma = text.find(',');
    result.push_back(ParseInteger<int>(text.substr(0, comma)));
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return result;
}

template <typename T>
void Run(const ToolConfig& config) {
  const math::Combinadic<T> combinadic(config.num_items, config.group_size);
  log()->debug("{} choose {} = {}", combinadic.num_items(),
               combinadic.group_size(), combinadic.num_combinations());

  if (FLAGS_count) {
    std::cout << combinadic.num_combinations() << "\n";
  } else if (!FLAGS_rank.empty()) {
    const std::vector<int> combination = ParseCombination(FLAGS_rank);
    std::cout << combinadic.Rank(combination, FLAGS_sorted) << "\n";
  } else if (!FLAGS_unrank.empty()) {
    const std::vector<int> combination =
        combinadic.Unrank(ParseInteger<T>(FLAGS_unrank));
    std::cout << io::FormatCombination(combination, config.writer,
                                       combinadic.num_items())
              << "\n";
  } else if (FLAGS_output.empty()) {
    io::WriteCombinations(combinadic, config.writer, &std::cout);
  } else {
    io::WriteCombinationsToFile(combinadic, config.writer, FLAGS_output);
  }
}

int main(int argc, char* argv[]) {
  gflags::SetUsageMessage(
      "Ranks and unranks K-combinations of N items in the combinatorial "
      "number system");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  // The user must supply exactly one command.
  const int num_commands = (FLAGS_count ? 1 : 0) +
                           (FLAGS_rank.empty() ? 0 : 1) +
                           (FLAGS_unrank.empty() ? 0 : 1) +
                           (FLAGS_dump ? 1 : 0);
  if (num_commands != 1) {
    gflags::ShowUsageWithFlags(argv[0]);
    return 1;
  }

  try {
    ToolConfig config;
    if (!FLAGS_config.empty()) {
      config = yaml::LoadYamlFile<ToolConfig>(FLAGS_config, std::nullopt,
                                              ToolConfig{});
    }
    if (FLAGS_n != 0) {
      config.num_items = FLAGS_n;
    }
    if (FLAGS_k != 0) {
      config.group_size = FLAGS_k;
    }
    if (FLAGS_wide) {
      config.wide = true;
    }

    if (config.wide) {
      Run<int64_t>(config);
    } else {
      Run<int32_t>(config);
    }
  } catch (const std::exception& e) {
    std::cerr << "combinadic_tool: " << e.what() << "\n";
    return 1;
  }
  return 0;
}

}  // namespace
}  // namespace combinadic

int main(int argc, char* argv[]) {
  return combinadic::main(argc, argv);
}
