#pragma once

#include "orderflow/domain/order.hpp"
#include "orderflow/events/order_lifecycle_event.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace orderflow {

// Insertion-ordered JSON: keys appear in the documented schema order.
using Payload = nlohmann::ordered_json;

// -----------------------------------------------------------------------------
// toPayload(order)
// -----------------------------------------------------------------------------
//
// @brief  Serializes an order into the external event schema.
//
// @details
// Field order:
//   order_id, timestamp, product_id, product_name, quantity, price, total,
//   customer_id, customer_email, payment_method,
//   shipping_address {street, city, state, zip_code, country},
//   status, cancellation_reason (only when status == "cancelled")
//
// timestamp is the order's wall-clock timestamp_ms formatted as ISO-8601 UTC
// with millisecond precision ("2026-03-01T12:00:00.123Z").
//
// The session-clock scheduling fields (last_status_change_ms, next_due_ms)
// are internal and never written.
// -----------------------------------------------------------------------------
Payload toPayload(const domain::Order& order);

// Payload of the event's order snapshot.
Payload toPayload(const OrderLifecycleEvent& event);

// -----------------------------------------------------------------------------
// serializePayload / prettyPayload
// -----------------------------------------------------------------------------
// Compact form for the broker; indented (2 spaces) form for the console.
// -----------------------------------------------------------------------------
std::string serializePayload(const OrderLifecycleEvent& event);
std::string prettyPayload(const OrderLifecycleEvent& event);

}  // namespace orderflow
