#pragma once

#include "orderflow/random/i_random_source.hpp"

#include <cstdint>
#include <random>

namespace orderflow {

// -----------------------------------------------------------------------------
// Mt19937RandomSource — std::mt19937_64 backed IRandomSource
// -----------------------------------------------------------------------------
//
// @brief  Default random source for production runs and seeded tests.
//
// @details
// Two constructors:
//   - Mt19937RandomSource()      seeds from std::random_device (production:
//                                every run differs).
//   - Mt19937RandomSource(seed)  fixed seed (tests, or --seed on the command
//                                line to reproduce a run).
//
// Distributions are constructed per call; no per-range state is kept.
//
// Thread model: not thread-safe; owned and used by one thread.
// -----------------------------------------------------------------------------
class Mt19937RandomSource final : public IRandomSource {
 public:
  Mt19937RandomSource();
  explicit Mt19937RandomSource(std::uint64_t seed);

  double uniformReal(double lo, double hi) override;
  std::int64_t uniformInt(std::int64_t lo, std::int64_t hi) override;
  double unitInterval() override;

 private:
  std::mt19937_64 engine_;
};

}  // namespace orderflow
