#pragma once

#include "orderflow/lifecycle/lifecycle_policy.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>

namespace orderflow {

// -----------------------------------------------------------------------------
// SessionSummary
// -----------------------------------------------------------------------------
//
// @brief  Frozen end-of-session report.
//
// @details
// Derived fields:
//   success_rate       shipped / created     (0 when created == 0)
//   cancellation_rate  cancelled / created   (0 when created == 0)
//   orders_per_minute  created / elapsed minutes (0 when elapsed == 0)
//
// Conservation: created == shipped + cancelled + active_at_cutoff. The two
// rates therefore sum to at most 1, and to exactly 1 iff nothing was left
// active.
// -----------------------------------------------------------------------------
struct SessionSummary {
  std::uint64_t created{0};
  std::uint64_t status_updates{0};
  std::uint64_t shipped{0};
  std::uint64_t cancelled{0};
  std::uint64_t active_at_cutoff{0};
  std::uint64_t dispatch_failures{0};

  std::int64_t elapsed_ms{0};

  double success_rate{0.0};
  double cancellation_rate{0.0};
  double orders_per_minute{0.0};
};

// -----------------------------------------------------------------------------
// SessionStatistics — running counters for one session
// -----------------------------------------------------------------------------
//
// @brief  Counts admissions, emitted transitions, terminal outcomes and
//         dispatch failures while the session runs.
//
// @details
// Mutated only by SimulationEngine inside a tick. summarize() computes the
// derived rates once, at shutdown.
//
// Thread model: engine loop thread only.
// -----------------------------------------------------------------------------
class SessionStatistics {
 public:
  // Resets every counter and records the session start (session clock).
  void begin(std::int64_t start_ms);

  void recordCreated() { ++created_; }

  // Counts one emitted status update and its terminal outcome, if any.
  void recordTransition(const Transition& transition);

  void recordDispatchFailures(std::uint64_t count) {
    dispatch_failures_ += count;
  }

  std::uint64_t created() const { return created_; }
  std::uint64_t statusUpdates() const { return status_updates_; }
  std::uint64_t shipped() const { return shipped_; }
  std::uint64_t cancelled() const { return cancelled_; }
  std::uint64_t dispatchFailures() const { return dispatch_failures_; }
  std::int64_t startMs() const { return start_ms_; }

  // -------------------------------------------------------------------------
  // summarize(active_at_cutoff, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Builds the SessionSummary for a session that ends at now_ms.
  //         Negative elapsed time is clamped to 0.
  // -------------------------------------------------------------------------
  SessionSummary summarize(std::size_t active_at_cutoff,
                           std::int64_t now_ms) const;

 private:
  std::int64_t start_ms_{0};
  std::uint64_t created_{0};
  std::uint64_t status_updates_{0};
  std::uint64_t shipped_{0};
  std::uint64_t cancelled_{0};
  std::uint64_t dispatch_failures_{0};
};

// -----------------------------------------------------------------------------
// printSummary(out, summary)
// -----------------------------------------------------------------------------
// Renders the end-of-session report: counters, rates as percentages with one
// decimal, elapsed time in seconds and minutes with two decimals, and the
// average arrival rate in orders per minute.
// -----------------------------------------------------------------------------
void printSummary(std::ostream& out, const SessionSummary& summary);

}  // namespace orderflow
