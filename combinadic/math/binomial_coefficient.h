#pragma once

#include <cstdint>
#include <optional>

namespace combinadic {
namespace math {

/** Computes the binomial coefficient `n`-choose-`k` entirely in the integer
 width `T`, using the multiplicative formula with one multiply and one exact
 divide per factor: after step i the running value is C(n-k+i, i).

 This is the bounded-width fast path. It never executes a signed overflow:
 if any intermediate product does not fit in `T`, it returns std::nullopt,
 even in cases where the final result itself would have fit.

 Returns 0 when k > n.

 @tparam T is either int32_t or int64_t.
 @throws std::exception if n < 0 or k < 0. */
template <typename T>
std::optional<T> BinomialCoefficient(int n, int k);

/** Computes the binomial coefficient `n`-choose-`k` in 64 bits using the
 overflow-resistant iteration r = r * (n - d + 1) / d for d = 1..k, with two
 refinements: k is replaced by min(k, n - k), and the common factor of r and
 d is divided out before each multiply. The result is therefore exact
 whenever C(n, k) fits in an int64_t, and std::nullopt otherwise.

 Returns 0 when k > n.

 @throws std::exception if n < 0 or k < 0. */
std::optional<int64_t> WideBinomialCoefficient(int64_t n, int64_t k);

/** Returns the number of `k`-element combinations drawn from `n` items as a
 `T`. The wide computation is authoritative; the bounded fast path is
 computed as well and must agree with it whenever it completes.

 @tparam T is either int32_t or int64_t.
 @throws std::overflow_error if C(n, k) exceeds std::numeric_limits<T>::max(),
 or if the two computations disagree.
 @throws std::exception if n < 0 or k < 0. */
template <typename T>
T CountCombinations(int n, int k);

}  // namespace math
}  // namespace combinadic
