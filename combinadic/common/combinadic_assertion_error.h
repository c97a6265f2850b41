#pragma once

#include <stdexcept>
#include <string>

namespace combinadic {
namespace internal {

// This is what COMBINADIC_THROW_UNLESS throws, and what COMBINADIC_DEMAND
// throws when assertions are configured to throw.
class assertion_error : public std::runtime_error {
 public:
  explicit assertion_error(const std::string& what_arg)
      : std::runtime_error(what_arg) {}
};

}  // namespace internal
}  // namespace combinadic
