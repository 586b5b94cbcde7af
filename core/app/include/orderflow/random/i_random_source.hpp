#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace orderflow {

// -----------------------------------------------------------------------------
// IRandomSource — injectable source of uniform random draws
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface behind every probabilistic decision in the
//         simulation: product and quantity choice, prices, dwell times,
//         arrival delays, cancel-or-advance, cancellation reason.
//
// @details
// Follows the same dependency-injection shape as ITimeProvider. Production
// wires a Mt19937RandomSource (seeded from std::random_device unless a seed
// is configured). Tests wire either a seeded Mt19937RandomSource or a
// scripted source that replays fixed values, so that a given branch (for
// example "cancel while confirmed") can be forced without touching the
// policy code.
//
// Thread model:
//   Implementations are NOT required to be thread-safe. The engine draws
//   from a single thread (its loop).
//
// Ownership:
//   Components hold a non-const reference (drawing mutates the generator
//   state). The source must outlive every component that references it.
// -----------------------------------------------------------------------------
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // -------------------------------------------------------------------------
  // uniformReal(lo, hi)
  // -------------------------------------------------------------------------
  // @brief  Uniform double in [lo, hi]. Returns lo when lo == hi.
  //
  // @details
  // Callers guarantee lo <= hi (validated configuration).
  // -------------------------------------------------------------------------
  virtual double uniformReal(double lo, double hi) = 0;

  // -------------------------------------------------------------------------
  // uniformInt(lo, hi)
  // -------------------------------------------------------------------------
  // @brief  Uniform integer in the closed range [lo, hi].
  // -------------------------------------------------------------------------
  virtual std::int64_t uniformInt(std::int64_t lo, std::int64_t hi) = 0;

  // -------------------------------------------------------------------------
  // unitInterval()
  // -------------------------------------------------------------------------
  // @brief  Uniform double in [0, 1). Used for Bernoulli decisions such as
  //         "cancel with probability p": cancel iff unitInterval() < p.
  // -------------------------------------------------------------------------
  virtual double unitInterval() = 0;
};

// -----------------------------------------------------------------------------
// pickIndex / pickOne — uniform choice from a non-empty container
// -----------------------------------------------------------------------------
// Throws std::invalid_argument on an empty container rather than indexing
// out of range.
// -----------------------------------------------------------------------------
inline std::size_t pickIndex(IRandomSource& rng, std::size_t size) {
  if (size == 0) {
    throw std::invalid_argument("pickIndex: cannot choose from an empty set");
  }
  return static_cast<std::size_t>(
      rng.uniformInt(0, static_cast<std::int64_t>(size) - 1));
}

template <typename Container>
const typename Container::value_type& pickOne(IRandomSource& rng,
                                              const Container& items) {
  return items[pickIndex(rng, items.size())];
}

}  // namespace orderflow
