#include "orderflow/random/mt_random_source.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
Mt19937RandomSource::Mt19937RandomSource() : engine_(std::random_device{}()) {}

Mt19937RandomSource::Mt19937RandomSource(std::uint64_t seed) : engine_(seed) {}

// -----------------------------------------------------------------------------
// uniformReal: [lo, hi]
// -----------------------------------------------------------------------------
double Mt19937RandomSource::uniformReal(double lo, double hi) {
  if (!(lo < hi)) {
    return lo;
  }
  // uniform_real_distribution is half-open [lo, hi); for continuous ranges
  // the missing endpoint has probability zero.
  std::uniform_real_distribution<double> dist(lo, hi);
  return dist(engine_);
}

// -----------------------------------------------------------------------------
// uniformInt: [lo, hi]
// -----------------------------------------------------------------------------
std::int64_t Mt19937RandomSource::uniformInt(std::int64_t lo, std::int64_t hi) {
  if (hi <= lo) {
    return lo;
  }
  std::uniform_int_distribution<std::int64_t> dist(lo, hi);
  return dist(engine_);
}

// -----------------------------------------------------------------------------
// unitInterval: [0, 1)
// -----------------------------------------------------------------------------
double Mt19937RandomSource::unitInterval() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(engine_);
}

}  // namespace orderflow
