#include "orderflow/domain/cancellation_reason.hpp"

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// toString(CancellationReason)
// -----------------------------------------------------------------------------
const char* toString(CancellationReason reason) {
  using R = CancellationReason;
  switch (reason) {
    case R::PaymentFailed:                 return "payment_failed";
    case R::PaymentDeclined:               return "payment_declined";
    case R::CustomerCancelled:             return "customer_cancelled";
    case R::FraudSuspected:                return "fraud_suspected";
    case R::InventoryUnavailable:          return "inventory_unavailable";
    case R::PaymentVerificationFailed:     return "payment_verification_failed";
    case R::AddressInvalid:                return "address_invalid";
    case R::InventoryDamaged:              return "inventory_damaged";
    case R::ShippingAddressUnreachable:    return "shipping_address_unreachable";
    case R::CustomerRequestedCancellation:
      return "customer_requested_cancellation";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace orderflow
