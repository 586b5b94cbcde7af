#pragma once

#include "orderflow/domain/order_status.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// DwellRange
// -----------------------------------------------------------------------------
// Responsibility: Inclusive [min_seconds, max_seconds] range from which the
// dwell time of a state is drawn when an order enters it.
// -----------------------------------------------------------------------------
struct DwellRange {
  double min_seconds{0.0};
  double max_seconds{0.0};
};

// -----------------------------------------------------------------------------
// LifecyclePolicyConfig — tunables of the per-order state machine
// -----------------------------------------------------------------------------
//
// @brief  Cancellation probability and the dwell range of each active state.
//
// @details
// Defaults reproduce a typical storefront: an order is confirmed within
// 10-30 s, picked within 15-45 s, shipped within 20-60 s, and each check has
// an 8% chance of cancelling instead of advancing. With three checks per
// order that is roughly a 78% ship rate (0.92^3).
//
// Shipped and Cancelled are terminal and have no dwell; dwellFor() throws
// std::logic_error if asked for them.
//
// Thread model:
//   Plain data struct with value semantics, copied into LifecyclePolicy at
//   construction. No shared mutable state.
// -----------------------------------------------------------------------------
struct LifecyclePolicyConfig {
  /// Probability in [0, 1] that a due check cancels the order instead of
  /// advancing it. 0 forces every order to ship; 1 cancels every order on
  /// its first check (while pending).
  double cancellation_probability{0.08};

  DwellRange pending{10.0, 30.0};     // pending -> confirmed
  DwellRange confirmed{15.0, 45.0};   // confirmed -> processing
  DwellRange processing{20.0, 60.0};  // processing -> shipped

  // -------------------------------------------------------------------------
  // dwellFor(status)
  // -------------------------------------------------------------------------
  // @brief  Range for an active status.
  // @throws std::logic_error for Shipped or Cancelled.
  // -------------------------------------------------------------------------
  const DwellRange& dwellFor(domain::OrderStatus status) const;

  // -------------------------------------------------------------------------
  // validate()
  // -------------------------------------------------------------------------
  // @brief  Rejects out-of-range settings before the session starts.
  //
  // @throws ConfigError if cancellation_probability is outside [0, 1] or any
  //         dwell bound is NaN, infinite, negative or longer than
  //         kMaxIntervalSeconds, or a range has min > max.
  // -------------------------------------------------------------------------
  void validate() const;
};

}  // namespace orderflow
