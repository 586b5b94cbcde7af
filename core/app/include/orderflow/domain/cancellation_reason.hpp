#pragma once

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// CancellationReason
// -----------------------------------------------------------------------------
// Responsibility: Why an order left the lifecycle early. Each active state
// owns the subset of reasons that are plausible while an order sits in it
// (see kCancellationReasons on Pending, Confirmed and Processing in
// lifecycle_state.hpp). CustomerCancelled appears in every subset.
// -----------------------------------------------------------------------------
enum class CancellationReason {
  PaymentFailed,
  PaymentDeclined,
  CustomerCancelled,
  FraudSuspected,
  InventoryUnavailable,
  PaymentVerificationFailed,
  AddressInvalid,
  InventoryDamaged,
  ShippingAddressUnreachable,
  CustomerRequestedCancellation,
};

// Snake-case wire name, e.g. "payment_failed".
const char* toString(CancellationReason reason);

}  // namespace domain
}  // namespace orderflow
