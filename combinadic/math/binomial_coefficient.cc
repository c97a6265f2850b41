#include "combinadic/math/binomial_coefficient.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

#include <fmt/format.h>

#include "combinadic/common/combinadic_throw.h"
#include "combinadic/common/text_logging.h"

namespace combinadic {
namespace math {

template <typename T>
std::optional<T> BinomialCoefficient(int n, int k) {
  COMBINADIC_THROW_UNLESS(n >= 0, n);
  COMBINADIC_THROW_UNLESS(k >= 0, k);

  if (k > n) {
    return T{0};
  }

  T result = 1;
  for (int i = 1; i <= k; ++i) {
    T product{};
    if (__builtin_mul_overflow(result, static_cast<T>(n - k + i), &product)) {
      return std::nullopt;
    }
    // The product of i consecutive integers is divisible by i!.
    result = product / i;
  }
  return result;
}

std::optional<int64_t> WideBinomialCoefficient(int64_t n, int64_t k) {
  COMBINADIC_THROW_UNLESS(n >= 0, n);
  COMBINADIC_THROW_UNLESS(k >= 0, k);

  if (k > n) {
    return 0;
  }
  k = std::min(k, n - k);

  int64_t result = 1;
  for (int64_t d = 1; d <= k; ++d) {
    // result * (n - d + 1) is divisible by d. Once the factor shared with
    // `result` is removed, the remainder of d divides (n - d + 1) exactly.
    const int64_t g = std::gcd(result, d);
    const int64_t factor = (n - d + 1) / (d / g);
    int64_t next{};
    if (__builtin_mul_overflow(result / g, factor, &next)) {
      return std::nullopt;
    }
    result = next;
  }
  return result;
}

template <typename T>
T CountCombinations(int n, int k) {
  constexpr T kMax = std::numeric_limits<T>::max();
  constexpr int kBits = std::numeric_limits<T>::digits + 1;

  const std::optional<int64_t> wide = WideBinomialCoefficient(n, k);
  if (!wide.has_value() || *wide > kMax) {
    throw std::overflow_error(fmt::format(
        "{} choose {} exceeds the {}-bit combination count limit of {}", n, k,
        kBits, kMax));
  }

  const std::optional<T> bounded = BinomialCoefficient<T>(n, k);
  if (!bounded.has_value()) {
    COMBINADIC_LOGGER_DEBUG(
        "{} choose {} overflowed an intermediate {}-bit product; using the "
        "wide result {}", n, k, kBits, *wide);
  } else if (*bounded != *wide) {
    throw std::overflow_error(fmt::format(
        "{} choose {} is {} in 64 bits but {} in {} bits", n, k, *wide,
        *bounded, kBits));
  }
  return static_cast<T>(*wide);
}

template std::optional<int32_t> BinomialCoefficient<int32_t>(int, int);
template std::optional<int64_t> BinomialCoefficient<int64_t>(int, int);
template int32_t CountCombinations<int32_t>(int, int);
template int64_t CountCombinations<int64_t>(int, int);

}  // namespace math
}  // namespace combinadic
