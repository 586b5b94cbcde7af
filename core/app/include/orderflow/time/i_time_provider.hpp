#pragma once

#include <cstdint>

namespace orderflow {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from the
//         std::chrono clocks.
//
// @details
// The simulation reads time for two unrelated purposes:
//
//   1. Scheduling: elapsed session time, per-order dwell, next arrival.
//      These comparisons must not jump when the wall clock is adjusted, so
//      production injects MonotonicTimeProvider (std::chrono::steady_clock).
//   2. Stamping: the ISO-8601 "timestamp" field of each emitted payload.
//      That must be real UTC, so production injects LiveTimeProvider
//      (std::chrono::system_clock).
//
// Tests inject SimulationTimeProvider for both roles and drive time by hand,
// which lets a five-minute session run in microseconds without sleeping.
//
// Units:
//   int64_t milliseconds on every clock. Dwell ranges, arrival delays and the
//   session length are converted once (time_utils.hpp) and then compared as
//   plain differences.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads. The engine reads from
//   its loop thread only, but a signal handler path or test thread may read
//   concurrently.
//
// Ownership:
//   Components hold a const reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  // -------------------------------------------------------------------------
  // Destructor
  // -------------------------------------------------------------------------
  // @brief  Virtual destructor for safe polymorphic deletion.
  // -------------------------------------------------------------------------
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Returns the current time in milliseconds on this provider's
  //         timeline.
  //
  // @return int64_t  For LiveTimeProvider: milliseconds since the Unix epoch.
  //         For MonotonicTimeProvider: milliseconds since an unspecified
  //         fixed origin (only differences are meaningful).
  //         For SimulationTimeProvider: the last value set by the test.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None. This is a pure read operation.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace orderflow
