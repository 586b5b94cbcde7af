#pragma once

#include "orderflow/time/i_time_provider.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// MonotonicTimeProvider — steady-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Session clock for production runs, backed by
//         std::chrono::steady_clock.
//
// @details
// The SimulationEngine uses this provider to measure elapsed session time,
// per-order dwell time and the next-arrival deadline. steady_clock never
// goes backwards, so a wall-clock adjustment during a run cannot make an
// order "due" early or stretch the session.
//
// The absolute value returned by now_ms() has no meaning (it is relative to
// the steady clock's epoch, typically boot time). Only differences between
// two readings are used.
//
// Thread model:
//   steady_clock::now() is safe to call from any thread. No state.
// -----------------------------------------------------------------------------
class MonotonicTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace orderflow
