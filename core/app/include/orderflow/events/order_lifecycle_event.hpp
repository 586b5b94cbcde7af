#pragma once

#include "orderflow/domain/order.hpp"
#include "orderflow/domain/order_status.hpp"

#include <cstdint>
#include <optional>

namespace orderflow {

// -----------------------------------------------------------------------------
// OrderLifecycleEvent
// -----------------------------------------------------------------------------
//
// @brief  Emitted by SimulationEngine when an order is created and on every
//         status transition. Carries a snapshot of the order after the
//         change and the status it moved from.
//
// @details
// The order field is a full copy taken after the transition has been
// applied, so sinks never observe the registry's mutable entry.
// previous_status is empty for the creation event and holds the
// pre-transition status otherwise.
//
// sequence_id increases by one for every event a single engine emits, so a
// consumer can detect gaps. Per order, events are emitted in lifecycle
// order: created (pending), then each transition in turn.
//
// Thread model:
//   Created and dispatched on the engine loop thread. Plain data with value
//   semantics.
// -----------------------------------------------------------------------------
struct OrderLifecycleEvent {
  domain::Order order;                                  // Snapshot after change
  std::optional<domain::OrderStatus> previous_status;   // Empty on creation
  std::uint64_t sequence_id{0};

  bool isCreation() const { return !previous_status.has_value(); }
};

}  // namespace orderflow
