#include "orderflow/time/monotonic_time_provider.hpp"

#include <chrono>

namespace orderflow {

// -----------------------------------------------------------------------------
// now_ms(): steady_clock reading in milliseconds
// -----------------------------------------------------------------------------
std::int64_t MonotonicTimeProvider::now_ms() const {
  auto duration = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::milliseconds>(duration)
      .count();
}

}  // namespace orderflow
