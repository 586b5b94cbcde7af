#include "orderflow/factory/order_factory.hpp"
#include "orderflow/config/config_error.hpp"

#include <cmath>
#include <utility>

namespace orderflow {

// -----------------------------------------------------------------------------
// roundToCents
// -----------------------------------------------------------------------------
double roundToCents(double value) { return std::round(value * 100.0) / 100.0; }

// -----------------------------------------------------------------------------
// validateCatalog
// -----------------------------------------------------------------------------
void validateCatalog(const domain::ProductCatalog& catalog) {
  if (catalog.empty()) {
    throw ConfigError("product catalog must contain at least one product");
  }
  for (const auto& product : catalog) {
    if (product.id.empty()) {
      throw ConfigError("product catalog entry has an empty id");
    }
    if (!(product.min_price >= 0.0) || !(product.max_price >= 0.0)) {
      throw ConfigError("product " + product.id + " has a negative price");
    }
    if (product.min_price > product.max_price) {
      throw ConfigError("product " + product.id +
                        " has min_price > max_price");
    }
  }
}

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
OrderFactory::OrderFactory(domain::ProductCatalog catalog,
                           OrderIdGenerator& id_gen, LifecyclePolicy& policy,
                           IRandomSource& rng,
                           const ITimeProvider& session_clock,
                           const ITimeProvider& wall_clock)
    : catalog_(std::move(catalog)),
      id_gen_(id_gen),
      policy_(policy),
      rng_(rng),
      customers_(rng),
      session_clock_(session_clock),
      wall_clock_(wall_clock) {
  validateCatalog(catalog_);
}

// -----------------------------------------------------------------------------
// create: build a Pending order with a drawn dwell
// -----------------------------------------------------------------------------
domain::Order OrderFactory::create() {
  const domain::Product& product = pickOne(rng_, catalog_);

  domain::Order order;
  order.product_id = product.id;
  order.product_name = product.name;
  order.quantity =
      static_cast<int>(rng_.uniformInt(kMinQuantity, kMaxQuantity));
  order.price =
      roundToCents(rng_.uniformReal(product.min_price, product.max_price));
  order.total = roundToCents(order.quantity * order.price);

  order.id = id_gen_.next_id();
  order.customer_id = customers_.customerId();
  order.customer_email = customers_.email();
  order.payment_method = pickOne(rng_, domain::kAllPaymentMethods);
  order.shipping_address = customers_.shippingAddress();

  order.state = domain::Pending{};
  order.last_status_change_ms = session_clock_.now_ms();
  order.next_due_ms = policy_.drawDwellMs(domain::OrderStatus::Pending);
  order.timestamp_ms = wall_clock_.now_ms();

  return order;
}

}  // namespace orderflow
