#include "orderflow/time/simulation_time_provider.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// now_ms(): atomic read of the simulated clock
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// advance_time(): atomic write to the simulated clock
// -----------------------------------------------------------------------------
void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

// -----------------------------------------------------------------------------
// advance_by(): atomic relative step
// -----------------------------------------------------------------------------
std::int64_t SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  // fetch_add returns the previous value; add delta to report the new one.
  return current_time_ms_.fetch_add(delta_ms) + delta_ms;
}

}  // namespace orderflow
