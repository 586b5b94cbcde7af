#pragma once

#include "orderflow/time/i_time_provider.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used as the engine's wall clock: every emitted payload carries
// formatIso8601Utc(wall_clock.now_ms()). Never used for dwell or session
// arithmetic, because system_clock may step backwards under NTP.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  // Milliseconds since 1970-01-01 00:00:00 UTC.
  std::int64_t now_ms() const override;
};

}  // namespace orderflow
