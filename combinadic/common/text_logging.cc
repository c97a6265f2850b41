#include "combinadic/common/text_logging.h"

#include <memory>
#include <stdexcept>
#include <utility>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include "combinadic/common/never_destroyed.h"

namespace combinadic {

namespace {
// Returns the default logger.  NOTE: This function assumes that it is mutexed,
// as in the initializer of a static local.
std::shared_ptr<logging::logger> onetime_create_log() {
  // Check if anyone has already set up a logger named "console".  If so, we
  // will just return it; if not, we'll create our own default one.
  std::shared_ptr<logging::logger> result(spdlog::get("console"));
  if (!result) {
    // The stderr sink is wrapped in a dist_sink so that users can atomically
    // swap out the sinks used by all combinadic logging.
    auto wrapper = std::make_shared<spdlog::sinks::dist_sink_mt>();
    wrapper->add_sink(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    result = std::make_shared<logging::logger>("console", std::move(wrapper));
    result->set_level(spdlog::level::info);
  }
  return result;
}
}  // namespace

logging::logger* log() {
  static const never_destroyed<std::shared_ptr<logging::logger>> g_logger(
      onetime_create_log());
  return g_logger.access().get();
}

logging::sink* logging::get_dist_sink() {
  auto* sink = log()->sinks().empty() ? nullptr : log()->sinks().front().get();
  auto* result = dynamic_cast<spdlog::sinks::dist_sink_mt*>(sink);
  if (result == nullptr) {
    throw std::logic_error(
        "combinadic::logging::get_dist_sink(): error: the spdlog sink "
        "configuration has unexpectedly changed.");
  }
  return result;
}

std::string logging::set_log_level(const std::string& level) {
  spdlog::level::level_enum prev_value = combinadic::log()->level();
  spdlog::level::level_enum value{};
  if (level == "trace") {
    value = spdlog::level::trace;
  } else if (level == "debug") {
    value = spdlog::level::debug;
  } else if (level == "info") {
    value = spdlog::level::info;
  } else if (level == "warn") {
    value = spdlog::level::warn;
  } else if (level == "err") {
    value = spdlog::level::err;
  } else if (level == "critical") {
    value = spdlog::level::critical;
  } else if (level == "off") {
    value = spdlog::level::off;
  } else if (level == "unchanged") {
    value = prev_value;
  } else {
    throw std::runtime_error(fmt::format("Unknown spdlog level: {}", level));
  }
  combinadic::log()->set_level(value);
  switch (prev_value) {
    case spdlog::level::trace: return "trace";
    case spdlog::level::debug: return "debug";
    case spdlog::level::info: return "info";
    case spdlog::level::warn: return "warn";
    case spdlog::level::err: return "err";
    case spdlog::level::critical: return "critical";
    case spdlog::level::off: return "off";
    default: {
      // N.B. `spdlog::level::level_enum` is not an `enum class`, so the
      // compiler does not know that it has a closed set of values.
      throw std::runtime_error("Should not reach here!");
    }
  }
}

const char* const logging::kSetLogLevelHelpMessage =
    "sets the spdlog output threshold; possible values are "
    "'unchanged', "
    "'trace', "
    "'debug', "
    "'info', "
    "'warn', "
    "'err', "
    "'critical', "
    "'off'";

void logging::set_log_pattern(const std::string& pattern) {
  combinadic::log()->set_pattern(pattern);
}

const char* const logging::kSetLogPatternHelpMessage =
    "sets the spdlog pattern for formatting; for more information, see "
    "https://github.com/gabime/spdlog/wiki/3.-Custom-formatting";

const char* const logging::kSetLogLevelUnchanged = "unchanged";

}  // namespace combinadic
