#pragma once

#include "orderflow/domain/lifecycle_state.hpp"
#include "orderflow/domain/order_status.hpp"
#include "orderflow/domain/payment_method.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// OrderId
// -----------------------------------------------------------------------------
// Responsibility: Unique identifier of a simulated order ("ORD-10000042").
// Kept in its wire form: the identifier is also the broker message key and
// appears verbatim in the payload.
// -----------------------------------------------------------------------------
using OrderId = std::string;

// -----------------------------------------------------------------------------
// ShippingAddress
// -----------------------------------------------------------------------------
struct ShippingAddress {
  std::string street;
  std::string city;
  std::string state;     // Two-letter state code
  std::string zip_code;
  std::string country;   // ISO 3166-1 alpha-3
};

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  One simulated e-commerce purchase: immutable commercial attributes
//         plus the mutable lifecycle attributes driven by the engine.
//
// @details
// Commercial attributes are set once by OrderFactory and never touched
// again. Lifecycle attributes are mutated only by LifecyclePolicy::apply(),
// which runs on the SimulationEngine's loop.
//
// Time fields:
//   last_status_change_ms and next_due_ms live on the session clock (a
//   monotonic timeline) and are internal scheduling data; they are never
//   serialized. timestamp_ms lives on the wall clock and becomes the
//   payload's ISO-8601 "timestamp".
//
// Value semantics:
//   Every emitted event holds its own copy. The only authoritative copy
//   lives inside ActiveOrderRegistry.
// -----------------------------------------------------------------------------
struct Order {
  OrderId id;                        // Unique, immutable
  std::string product_id;
  std::string product_name;
  int quantity{0};                   // 1..5
  double price{0.0};                 // Unit price, two decimals
  double total{0.0};                 // quantity * price, two decimals
  std::string customer_id;
  std::string customer_email;
  PaymentMethod payment_method{PaymentMethod::CreditCard};
  ShippingAddress shipping_address;

  LifecycleState state{Pending{}};   // Authoritative lifecycle state
  std::int64_t last_status_change_ms{0};  // Session clock, last transition
  std::int64_t next_due_ms{0};       // Dwell before the next check (ms)
  std::int64_t timestamp_ms{0};      // Wall clock, last emitted event

  OrderStatus status() const { return statusOf(state); }

  bool isTerminal() const { return domain::isTerminal(status()); }

  std::optional<CancellationReason> cancellationReason() const {
    return cancellationReasonOf(state);
  }
};

}  // namespace domain
}  // namespace orderflow
