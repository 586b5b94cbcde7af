#pragma once

#include "orderflow/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace orderflow {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider implementation whose "current time" is set
//         explicitly instead of read from a system clock.
//
// @details
// Tests construct the engine with a SimulationTimeProvider and step it
// between ticks:
//
//   clock.advance_time(start_ms);
//   engine.start();
//   clock.advance_by(30'000);   // thirty simulated seconds
//   engine.tick();
//
// Dwell eligibility, arrival scheduling and session expiry then follow the
// simulated timeline exactly, with no sleeping and no timing flakiness.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_, lock-free on 64-bit platforms;
//   a test thread may write while an engine thread reads.
//
// Ownership:
//   Created by the test (or harness) and passed by reference.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Initializes the clock to start_ms (0 by default).
  // -------------------------------------------------------------------------
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  // -------------------------------------------------------------------------
  // now_ms() override
  // -------------------------------------------------------------------------
  // @brief  Returns the last time set by advance_time() / advance_by().
  // -------------------------------------------------------------------------
  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the clock to the given absolute value.
  //
  // @details
  // Monotonicity is not enforced; tests are free to set arbitrary times.
  // The engine never reads a clock backwards in practice because tests only
  // move forward.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // -------------------------------------------------------------------------
  // advance_by(delta_ms)
  // -------------------------------------------------------------------------
  // @brief  Moves the clock forward by delta_ms and returns the new time.
  // -------------------------------------------------------------------------
  std::int64_t advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace orderflow
