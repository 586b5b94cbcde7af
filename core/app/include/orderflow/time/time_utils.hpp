#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions shared by the factory, policy, engine and payload
//         encoder.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// Longest configurable interval (about 31 years). Keeps every converted
// interval, and its sum with an epoch timestamp, inside std::int64_t.
constexpr double kMaxIntervalSeconds = 1.0e9;

// True for a finite, non-negative interval no longer than
// kMaxIntervalSeconds. NaN and infinities are rejected.
inline bool isValidIntervalSeconds(double seconds) {
  return std::isfinite(seconds) && seconds >= 0.0 &&
         seconds <= kMaxIntervalSeconds;
}

// -------------------------------------------------------------------------
// secondsToMs
// -------------------------------------------------------------------------
// @brief  Converts a (possibly fractional) number of seconds to integer
//         milliseconds, rounding to nearest.
//
// @details
// Dwell draws and arrival delays are uniform doubles in seconds. Rounding
// instead of truncating keeps the drawn value within +/-0.5 ms of the
// configured range bounds.
// -------------------------------------------------------------------------
inline std::int64_t secondsToMs(double seconds) {
  return static_cast<std::int64_t>(std::llround(seconds * 1000.0));
}

// Minutes (fractional allowed) to milliseconds.
inline std::int64_t minutesToMs(double minutes) {
  return secondsToMs(minutes * 60.0);
}

// -------------------------------------------------------------------------
// formatIso8601Utc
// -------------------------------------------------------------------------
// @brief  Formats epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
//
// @param  epoch_ms  Milliseconds since 1970-01-01 00:00:00 UTC. Negative
//                   values are clamped to the epoch.
// @return std::string  ISO-8601 UTC timestamp with millisecond precision.
// -------------------------------------------------------------------------
std::string formatIso8601Utc(std::int64_t epoch_ms);

}  // namespace orderflow
