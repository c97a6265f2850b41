#pragma once

/** @file
This is the entry point for all text logging within combinadic.
Once you've included this file, the suggested ways you
should write log messages include:
<pre>
  combinadic::log()->trace("Some trace message: {} {}", something, other);
  combinadic::log()->debug(...);
  combinadic::log()->info(...);
  combinadic::log()->warn(...);
  combinadic::log()->error(...);
  combinadic::log()->critical(...);
</pre>
If you want to log objects that are expensive to serialize, these macros will
not be compiled if debugging is turned off (-DNDEBUG is set):
<pre>
  COMBINADIC_LOGGER_TRACE("message: {}", something_conditionally_compiled);
  COMBINADIC_LOGGER_DEBUG("message: {}", something_conditionally_compiled);
</pre>

The format string syntax is fmtlib; see https://fmt.dev/latest/syntax.html.

@warning This file should only be included from cc files, not header files. */

#include <string>

#include "combinadic/common/fmt.h"

#ifndef NDEBUG

// When in Debug builds, before including spdlog we set the compile-time
// minimum log threshold so that spdlog defaults to enabling all log levels.
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE

#define COMBINADIC_LOGGER_TRACE(...)                                          \
  do {                                                                        \
    ::combinadic::logging::logger* const combinadic_spdlog_macro_logger =     \
        ::combinadic::log();                                                  \
    if (combinadic_spdlog_macro_logger->level() <= spdlog::level::trace) {    \
      SPDLOG_LOGGER_TRACE(combinadic_spdlog_macro_logger, __VA_ARGS__);       \
    }                                                                         \
  } while (0)
#define COMBINADIC_LOGGER_DEBUG(...)                                          \
  do {                                                                        \
    ::combinadic::logging::logger* const combinadic_spdlog_macro_logger =     \
        ::combinadic::log();                                                  \
    if (combinadic_spdlog_macro_logger->level() <= spdlog::level::debug) {    \
      SPDLOG_LOGGER_DEBUG(combinadic_spdlog_macro_logger, __VA_ARGS__);       \
    }                                                                         \
  } while (0)

#else

#define COMBINADIC_LOGGER_TRACE(...)
#define COMBINADIC_LOGGER_DEBUG(...)

#endif

#include <spdlog/spdlog.h>

namespace combinadic {
namespace logging {

/** The combinadic::logging::logger class provides text logging methods.
See the text_logging.h documentation for a short tutorial. */
using logger = spdlog::logger;

/** The sink type behind combinadic::log(). */
using spdlog::sinks::sink;

}  // namespace logging

/** Retrieve an instance of a logger to use for logging; for example:
<pre>
  combinadic::log()->info("potato!")
</pre>

See the text_logging.h documentation for a short tutorial. */
logging::logger* log();

namespace logging {

/** Sets the log threshold used by combinadic's C++ code.
@param level Must be a string from spdlog enumerations: `trace`, `debug`,
`info`, `warn`, `err`, `critical`, `off`, or `unchanged` (not an enum, but
useful for command-line).
@return The string value of the previous log level.
@throws std::exception if `level` is not one of the above. */
std::string set_log_level(const std::string& level);

/** The "unchanged" string to pass to set_log_level() so as to achieve a no-op.
 */
extern const char* const kSetLogLevelUnchanged;

/** An end-user help string suitable to describe the effects of set_log_level().
 */
extern const char* const kSetLogLevelHelpMessage;

/** Invokes `combinadic::log()->set_pattern(pattern)`.
@param pattern Formatting for message. For more information, see:
https://github.com/gabime/spdlog/wiki/3.-Custom-formatting */
void set_log_pattern(const std::string& pattern);

/** An end-user help string suitable to describe the effects of
set_log_pattern(). */
extern const char* const kSetLogPatternHelpMessage;

/** (Advanced) Retrieves the default sink for all combinadic logs. The return
value can be cast to spdlog::sinks::dist_sink_mt, allowing consumers to
redirect the logs to locations other than the default of stderr. */
sink* get_dist_sink();

}  // namespace logging
}  // namespace combinadic
