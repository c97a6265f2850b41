#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "combinadic/common/combinadic_copyable.h"
#include "combinadic/common/combinadic_throw.h"
#include "combinadic/math/combinadic.h"

namespace combinadic {
namespace math {

/** A growable array of caller-supplied payloads, one per combination,
addressed either by rank or by the combination itself.

The table starts empty and grows up to Combinadic::num_combinations() entries.
Several tables may share one engine (and so one set of index tables):
<pre>
  auto engine = std::make_shared<const Combinadic32>(13, 5);
  RankedTable<double> odds(engine);
  RankedTable<std::string> names(engine);
</pre>

@tparam Payload must be copyable; Set() may copy it into several slots.
@tparam T is the engine width, either int32_t or int64_t. */
template <typename Payload, typename T = int32_t>
class RankedTable final {
 public:
  COMBINADIC_DEFAULT_COPY_AND_MOVE_AND_ASSIGN(RankedTable);

  /** Creates an empty table over `engine`, which must not be null. */
  explicit RankedTable(std::shared_ptr<const Combinadic<T>> engine)
      : engine_(std::move(engine)) {
    COMBINADIC_THROW_UNLESS(engine_ != nullptr);
  }

  /** Creates an empty table over a new engine for `group_size`-combinations
  of `num_items` items.
  @throws std::exception as Combinadic's constructor does. */
  RankedTable(int num_items, int group_size)
      : RankedTable(
            std::make_shared<const Combinadic<T>>(num_items, group_size)) {}

  /** Stores `payload` at the next rank, size().
  @throws std::out_of_range if the table already holds a payload for every
  combination. */
  void Append(Payload payload) {
    if (size() == engine_->num_combinations()) {
      throw std::out_of_range(fmt::format(
          "RankedTable::Append(): the table already holds all {} "
          "combinations",
          size()));
    }
    payloads_.push_back(std::move(payload));
  }

  /** Stores `payload` at `rank`. When `rank` is at or past the end of the
  table, the table grows to size rank + 1, and every new slot (not just the
  last one) holds a copy of `payload`.
  @throws std::out_of_range if `rank` is outside [0, num_combinations()). */
  void Set(T rank, const Payload& payload) {
    ThrowIfOutOfRange(rank, "Set");
    if (rank >= size()) {
      payloads_.resize(static_cast<size_t>(rank) + 1, payload);
    } else {
      payloads_[rank] = payload;
    }
  }

  /** Stores `payload` at the rank of `combination`; see Combinadic::Rank()
  for the meaning of `already_sorted` and Set(T, const Payload&) for how the
  table grows.
  @throws std::exception if `combination` is not valid. */
  void Set(std::span<const int> combination, bool already_sorted,
           const Payload& payload) {
    Set(engine_->Rank(combination, already_sorted), payload);
  }

  /** Returns the payload at `rank`.
  @throws std::out_of_range if there is none. */
  const Payload& at(T rank) const {
    ThrowIfOutOfRange(rank, "at");
    if (rank >= size()) {
      throw std::out_of_range(fmt::format(
          "RankedTable::at(): no payload has been stored at rank {} (the table "
          "size is {})",
          rank, size()));
    }
    return payloads_[rank];
  }

  /** Returns the payload at the rank of `combination`.
  @throws std::exception if `combination` is not valid or has no payload. */
  const Payload& at(std::span<const int> combination,
                    bool already_sorted) const {
    return at(engine_->Rank(combination, already_sorted));
  }

  /** Returns the number of stored payloads; ranks [0, size()) are set. */
  T size() const { return static_cast<T>(payloads_.size()); }

  bool empty() const { return payloads_.empty(); }

  /** Allocates room for a payload at every rank. */
  void Reserve() { payloads_.reserve(engine_->num_combinations()); }

  const Combinadic<T>& engine() const { return *engine_; }

  /** Returns the payloads in rank order. */
  const std::vector<Payload>& payloads() const { return payloads_; }

 private:
  void ThrowIfOutOfRange(T rank, const char* func) const {
    if (rank < 0 || rank >= engine_->num_combinations()) {
      throw std::out_of_range(fmt::format(
          "RankedTable::{}(): the rank {} is outside the range [0, {})", func,
          rank, engine_->num_combinations()));
    }
  }

  std::shared_ptr<const Combinadic<T>> engine_;
  std::vector<Payload> payloads_;
};

}  // namespace math
}  // namespace combinadic
