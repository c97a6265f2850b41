// This file contains the implementation of both combinadic_assert and
// combinadic_throw.
/* clang-format off to disable clang-format-includes */
#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/combinadic_throw.h"
/* clang-format on */

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "combinadic/common/combinadic_assertion_error.h"
#include "combinadic/common/never_destroyed.h"

namespace combinadic {
namespace internal {

namespace {

// Singleton to manage assertion configuration.
struct AssertionConfig {
  static AssertionConfig& singleton() {
    static never_destroyed<AssertionConfig> global;
    return global.access();
  }

  std::atomic<bool> assertion_failures_are_exceptions{false};
};

// Stream into @p out the given failure details; only @p condition may be null.
void PrintFailureDetailTo(std::ostream& out, const char* condition,
                          const char* func, const char* file, int line) {
  out << "Failure at " << file << ":" << line << " in " << func << "()";
  if (condition) {
    out << ": condition '" << condition << "' failed.";
  } else {
    out << ".";
  }
}

}  // namespace

// Declared in combinadic_assert.h.
void Abort(const char* condition, const char* func, const char* file,
           int line) {
  std::cerr << "abort: ";
  PrintFailureDetailTo(std::cerr, condition, func, file, line);
  std::cerr << std::endl;
  std::abort();
}

// Declared in combinadic_throw.h.
void Throw(const char* condition, const char* func, const char* file,
           int line, const ThrowValuesBuf& buffer) {
  std::ostringstream what;
  PrintFailureDetailTo(what, condition, func, file, line);
  if (buffer.values[0].first != nullptr) {
    std::vector<std::string> pairs;
    pairs.reserve(buffer.values.size());
    for (const auto& [key, value_str] : buffer.values) {
      if (key == nullptr) break;
      pairs.push_back(fmt::format("{} = {}", key, value_str));
    }
    what << fmt::format(" {}.", fmt::join(pairs, ", "));
  }
  throw assertion_error(what.str());
}

// Declared in combinadic_assert.h.
void AssertionFailed(const char* condition, const char* func, const char* file,
                     int line) {
  if (AssertionConfig::singleton().assertion_failures_are_exceptions) {
    Throw(condition, func, file, line);
  } else {
    Abort(condition, func, file, line);
  }
}

}  // namespace internal
}  // namespace combinadic

// Configures the COMBINADIC_ASSERT and COMBINADIC_DEMAND failure handling.
//
// By default, assertion failures will result in an ::abort().  If this method
// has ever been called, failures will result in a thrown exception instead.
// The configuration has process-wide scope.
//
// This is declared here in the cc file (not in any header file) to discourage
// casual use; language bindings and tests declare it themselves.
extern "C" void combinadic_set_assertion_failure_to_throw_exception();

void combinadic_set_assertion_failure_to_throw_exception() {
  combinadic::internal::AssertionConfig::singleton()
      .assertion_failures_are_exceptions = true;
}
