#pragma once

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — externally visible lifecycle status of a simulated order
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every status an order can report in an emitted event.
//
// @details
// The lifecycle is a short forward-only chain with a single failure exit:
//
//   Pending ───> Confirmed ───> Processing ───> Shipped
//      │             │               │
//      └─────────────┴───────────────┴──────> Cancelled
//
// Terminal states: Shipped (success) and Cancelled (failure). An order
// reaches exactly one of them and never leaves it.
//
// OrderStatus is the flat, wire-level view. The authoritative state of an
// order is the LifecycleState variant (lifecycle_state.hpp); OrderStatus is
// derived from it via statusOf() and is what payloads and statistics use.
//
// Thread model:
//   Plain enum, value type. Thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,     // Newly created, awaiting confirmation
  Confirmed,   // Payment/stock confirmed, awaiting processing
  Processing,  // Being picked and packed
  Shipped,     // Handed to the carrier, terminal (success)
  Cancelled,   // Cancelled before shipping, terminal (failure)
};

// -------------------------------------------------------------------------
// toString(status)
// -------------------------------------------------------------------------
// @brief  Lower-case wire name ("pending", "confirmed", ...). Used in the
//         JSON payload and in log lines.
// -------------------------------------------------------------------------
const char* toString(OrderStatus status);

// True for Shipped and Cancelled.
bool isTerminal(OrderStatus status);

}  // namespace domain
}  // namespace orderflow
