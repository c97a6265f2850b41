#pragma once

#include <cstddef>
#include <new>
#include <utility>

#include "combinadic/common/combinadic_copyable.h"

namespace combinadic {

/// Wraps an underlying type T such that its storage is a direct member field
/// of this object, but T's destructor is never invoked.
///
/// This is meant for function-local static variables that are not trivially
/// destructible, such as the process-wide logger and the assertion
/// configuration, whose destruction order at program exit is indeterminate:
/// @code
/// logging::logger* log() {
///   static const never_destroyed<std::shared_ptr<logging::logger>> g_logger(
///       CreateLogger());
///   return g_logger.access().get();
/// }
/// @endcode
template <typename T>
class never_destroyed {
 public:
  COMBINADIC_NO_COPY_NO_MOVE_NO_ASSIGN(never_destroyed)

  /// Passes the constructor arguments along to T using perfect forwarding.
  template <typename... Args>
  explicit never_destroyed(Args&&... args) {
    new (storage_) T(std::forward<Args>(args)...);
  }

  /// Does nothing.  Guaranteed!
  ~never_destroyed() = default;

  /// Returns the underlying T reference.
  T& access() { return *std::launder(reinterpret_cast<T*>(storage_)); }
  const T& access() const {
    return *std::launder(reinterpret_cast<const T*>(storage_));
  }

 private:
  alignas(T) std::byte storage_[sizeof(T)];
};

}  // namespace combinadic
