#include "orderflow/events/event_payload.hpp"
#include "orderflow/domain/cancellation_reason.hpp"
#include "orderflow/domain/payment_method.hpp"
#include "orderflow/time/time_utils.hpp"

#include <utility>

namespace orderflow {

// -----------------------------------------------------------------------------
// toPayload(order)
// -----------------------------------------------------------------------------
Payload toPayload(const domain::Order& order) {
  Payload j;
  j["order_id"] = order.id;
  j["timestamp"] = formatIso8601Utc(order.timestamp_ms);
  j["product_id"] = order.product_id;
  j["product_name"] = order.product_name;
  j["quantity"] = order.quantity;
  j["price"] = order.price;
  j["total"] = order.total;
  j["customer_id"] = order.customer_id;
  j["customer_email"] = order.customer_email;
  j["payment_method"] = domain::toString(order.payment_method);

  Payload address;
  address["street"] = order.shipping_address.street;
  address["city"] = order.shipping_address.city;
  address["state"] = order.shipping_address.state;
  address["zip_code"] = order.shipping_address.zip_code;
  address["country"] = order.shipping_address.country;
  j["shipping_address"] = std::move(address);

  j["status"] = domain::toString(order.status());
  if (auto reason = order.cancellationReason()) {
    j["cancellation_reason"] = domain::toString(*reason);
  }
  return j;
}

Payload toPayload(const OrderLifecycleEvent& event) {
  return toPayload(event.order);
}

std::string serializePayload(const OrderLifecycleEvent& event) {
  return toPayload(event).dump();
}

std::string prettyPayload(const OrderLifecycleEvent& event) {
  return toPayload(event).dump(2);
}

}  // namespace orderflow
