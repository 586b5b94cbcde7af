#pragma once

#include "orderflow/domain/order.hpp"
#include "orderflow/domain/order_status.hpp"
#include "orderflow/lifecycle/lifecycle_policy_config.hpp"
#include "orderflow/random/i_random_source.hpp"

#include <cstdint>
#include <optional>

namespace orderflow {

// -----------------------------------------------------------------------------
// TransitionDecision
// -----------------------------------------------------------------------------
// Outcome of evaluating one order at one instant.
// -----------------------------------------------------------------------------
enum class TransitionDecision {
  Hold,     // Not due yet (or terminal): leave the order untouched
  Cancel,   // Due, and the cancellation draw hit
  Advance,  // Due, move to the next state in the progression
};

// -----------------------------------------------------------------------------
// Transition
// -----------------------------------------------------------------------------
// Responsibility: Record of one applied transition, returned to the engine
// so it can update statistics and decide whether to retire the order.
// -----------------------------------------------------------------------------
struct Transition {
  domain::OrderStatus from{domain::OrderStatus::Pending};
  domain::OrderStatus to{domain::OrderStatus::Pending};

  bool isTerminal() const { return domain::isTerminal(to); }
};

// -----------------------------------------------------------------------------
// LifecyclePolicy — per-order probabilistic, time-gated state machine
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a single order holds, cancels or advances, and
//         applies the chosen transition to that order.
//
// @details
// Rules:
//   1. Eligibility. An order is due when
//        now_ms - last_status_change_ms >= next_due_ms
//      and it is not terminal. Orders that are not due are never modified.
//   2. Decision. For a due order draw u = rng.unitInterval():
//        u <  cancellation_probability  -> Cancel
//        u >= cancellation_probability  -> Advance
//   3. Cancel. state := Cancelled{reason, from}, reason drawn uniformly from
//      the pre-cancellation state's kCancellationReasons. No dwell is
//      scheduled.
//   4. Advance. state := NextState<current>. If the new state is active, a
//      fresh next_due_ms is drawn from its dwell range. Shipped is terminal
//      and receives no dwell.
//   Both transitions set last_status_change_ms := now_ms (session clock)
//   and timestamp_ms := wall_now_ms (payload timestamp).
//
// Purity:
//   The policy owns no order state and no counters. Its only mutable
//   dependency is the injected IRandomSource; given the same random
//   sequence, it makes the same decisions. Registry membership and
//   statistics are the engine's concern.
//
// Terminal orders:
//   decide() returns Hold for them; apply() with Cancel/Advance throws
//   std::logic_error, because a terminal order must already have left the
//   registry. The variant visitor only instantiates transitions for active
//   alternatives, so Shipped -> Confirmed cannot even be expressed.
//
// Thread model:
//   Used only on the SimulationEngine loop thread.
//
// Ownership:
//   Owns a copy of its configuration. Holds a reference to the random
//   source, which must outlive the policy.
// -----------------------------------------------------------------------------
class LifecyclePolicy {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Validates and stores the configuration.
  //
  // @param  config  Cancellation probability and dwell ranges.
  // @param  rng     Random source for every draw the policy makes.
  //
  // @throws ConfigError if config.validate() fails.
  // -------------------------------------------------------------------------
  LifecyclePolicy(const LifecyclePolicyConfig& config, IRandomSource& rng);

  LifecyclePolicy(const LifecyclePolicy&) = delete;
  LifecyclePolicy& operator=(const LifecyclePolicy&) = delete;

  // -------------------------------------------------------------------------
  // isDue(order, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Eligibility rule (1). Pure read, no random draw.
  // -------------------------------------------------------------------------
  bool isDue(const domain::Order& order, std::int64_t now_ms) const;

  // -------------------------------------------------------------------------
  // drawDwellMs(status)
  // -------------------------------------------------------------------------
  // @brief  Uniform dwell for an active status, in milliseconds.
  //
  // @details
  // Used by the policy on every advance and by OrderFactory for the initial
  // pending dwell, so both draw from the same configured range.
  //
  // @throws std::logic_error for a terminal status.
  // -------------------------------------------------------------------------
  std::int64_t drawDwellMs(domain::OrderStatus status);

  // -------------------------------------------------------------------------
  // decide(order, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Rules (1) and (2). Consumes one random draw only when the order
  //         is due.
  // -------------------------------------------------------------------------
  TransitionDecision decide(const domain::Order& order, std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // apply(order, decision, now_ms, wall_now_ms)
  // -------------------------------------------------------------------------
  // @brief  Rules (3) and (4). Mutates the order in place.
  //
  // @return The applied transition, or std::nullopt for Hold.
  //
  // @throws std::logic_error if the order is terminal and the decision is
  //         Cancel or Advance.
  // -------------------------------------------------------------------------
  std::optional<Transition> apply(domain::Order& order,
                                  TransitionDecision decision,
                                  std::int64_t now_ms,
                                  std::int64_t wall_now_ms);

  // -------------------------------------------------------------------------
  // evaluate(order, now_ms, wall_now_ms)
  // -------------------------------------------------------------------------
  // @brief  decide() followed by apply(). The engine's per-order entry point.
  // -------------------------------------------------------------------------
  std::optional<Transition> evaluate(domain::Order& order, std::int64_t now_ms,
                                     std::int64_t wall_now_ms);

  const LifecyclePolicyConfig& config() const { return config_; }

 private:
  Transition cancel(domain::Order& order);
  Transition advance(domain::Order& order);

  const LifecyclePolicyConfig config_;
  IRandomSource& rng_;
};

}  // namespace orderflow
