// Adds --spdlog_level and --spdlog_pattern to the gflags command line of any
// executable that links this file.

#include <string>

#include <gflags/gflags.h>

#include "combinadic/common/text_logging.h"

DEFINE_string(spdlog_level, combinadic::logging::kSetLogLevelUnchanged,
              combinadic::logging::kSetLogLevelHelpMessage);
DEFINE_string(spdlog_pattern, "%+",
              combinadic::logging::kSetLogPatternHelpMessage);

// Validate flags and update the logger configuration to match their values.
namespace {
bool ValidateSpdlogLevel(const char*, const std::string& value) {
  combinadic::logging::set_log_level(value);
  return true;
}
bool ValidateSpdlogPattern(const char*, const std::string& value) {
  combinadic::logging::set_log_pattern(value);
  return true;
}
}  // namespace
DEFINE_validator(spdlog_level, &ValidateSpdlogLevel);
DEFINE_validator(spdlog_pattern, &ValidateSpdlogPattern);
