// =============================================================================
// time_test.cpp
// =============================================================================
// Unit tests for the time providers and time_utils.
//
// Validates:
//   - SimulationTimeProvider moves only when told to
//   - MonotonicTimeProvider never goes backwards
//   - LiveTimeProvider reports a plausible epoch time
//   - Seconds/minutes conversion and ISO-8601 formatting
// =============================================================================

#include "orderflow/time/live_time_provider.hpp"
#include "orderflow/time/monotonic_time_provider.hpp"
#include "orderflow/time/simulation_time_provider.hpp"
#include "orderflow/time/time_utils.hpp"

#include <gtest/gtest.h>

using orderflow::SimulationTimeProvider;

// -----------------------------------------------------------------------------
// 1. SimulationTimeProvider.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, StartsAtGivenTimeAndAdvancesExplicitly) {
  SimulationTimeProvider clock(1'000);
  EXPECT_EQ(clock.now_ms(), 1'000);
  EXPECT_EQ(clock.now_ms(), 1'000);

  EXPECT_EQ(clock.advance_by(250), 1'250);
  EXPECT_EQ(clock.now_ms(), 1'250);

  clock.advance_time(60'000);
  EXPECT_EQ(clock.now_ms(), 60'000);

  SimulationTimeProvider origin;
  EXPECT_EQ(origin.now_ms(), 0);
}

// -----------------------------------------------------------------------------
// 2. System clocks.
// -----------------------------------------------------------------------------
TEST(MonotonicTimeProviderTest, NeverGoesBackwards) {
  orderflow::MonotonicTimeProvider clock;
  std::int64_t previous = clock.now_ms();
  for (int i = 0; i < 1'000; ++i) {
    std::int64_t now = clock.now_ms();
    EXPECT_GE(now, previous);
    previous = now;
  }
}

TEST(LiveTimeProviderTest, ReportsEpochMilliseconds) {
  orderflow::LiveTimeProvider clock;
  // 2020-01-01T00:00:00Z
  EXPECT_GT(clock.now_ms(), 1'577'836'800'000);
}

// -----------------------------------------------------------------------------
// 3. Conversions.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, SecondsAndMinutesToMilliseconds) {
  EXPECT_EQ(orderflow::secondsToMs(0.0), 0);
  EXPECT_EQ(orderflow::secondsToMs(1.0), 1'000);
  EXPECT_EQ(orderflow::secondsToMs(2.5), 2'500);
  EXPECT_EQ(orderflow::secondsToMs(0.0004), 0);
  EXPECT_EQ(orderflow::secondsToMs(0.0006), 1);

  EXPECT_EQ(orderflow::minutesToMs(5.0), 300'000);
  EXPECT_EQ(orderflow::minutesToMs(0.5), 30'000);
}

TEST(TimeUtilsTest, FormatsIso8601Utc) {
  EXPECT_EQ(orderflow::formatIso8601Utc(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(orderflow::formatIso8601Utc(1'700'000'000'123),
            "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(orderflow::formatIso8601Utc(951'782'400'007),
            "2000-02-29T00:00:00.007Z");
  EXPECT_EQ(orderflow::formatIso8601Utc(-5), "1970-01-01T00:00:00.000Z");
}
