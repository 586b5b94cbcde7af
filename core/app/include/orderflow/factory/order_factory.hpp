#pragma once

#include "orderflow/domain/order.hpp"
#include "orderflow/domain/product.hpp"
#include "orderflow/factory/customer_data_generator.hpp"
#include "orderflow/factory/order_id_generator.hpp"
#include "orderflow/lifecycle/lifecycle_policy.hpp"
#include "orderflow/random/i_random_source.hpp"
#include "orderflow/time/i_time_provider.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// OrderFactory — builds new orders in their initial lifecycle state
// -----------------------------------------------------------------------------
//
// @brief  Constructs a fully populated domain::Order with randomized
//         commercial attributes, status Pending and a drawn pending dwell.
//
// @details
// create() performs, in order:
//   1. product    uniform over the catalog
//   2. quantity   uniform integer in [kMinQuantity, kMaxQuantity]
//   3. price      uniform in [product.min_price, product.max_price],
//                 rounded to two decimals
//   4. total      roundToCents(quantity * price)
//   5. identity   next_id() from the OrderIdGenerator (collision-free)
//   6. customer   id, email, shipping address from CustomerDataGenerator
//   7. payment    uniform over domain::kAllPaymentMethods
//   8. lifecycle  state Pending, last_status_change_ms = session now,
//                 next_due_ms = policy.drawDwellMs(Pending),
//                 timestamp_ms = wall now
//
// Side effects:
//   None beyond the random draws and the id counter. The factory never
//   touches the registry, the statistics or any sink; admission is the
//   engine's job.
//
// Thread model:
//   Used only on the SimulationEngine loop thread.
//
// Ownership:
//   Owns a copy of the catalog. Holds references to the id generator,
//   policy, random source and both clocks; all are owned by the engine (or
//   the test) and outlive the factory.
// -----------------------------------------------------------------------------
class OrderFactory {
 public:
  static constexpr int kMinQuantity = 1;
  static constexpr int kMaxQuantity = 5;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @throws ConfigError if the catalog is empty or a product has a negative
  //         price or min_price > max_price.
  // -------------------------------------------------------------------------
  OrderFactory(domain::ProductCatalog catalog, OrderIdGenerator& id_gen,
               LifecyclePolicy& policy, IRandomSource& rng,
               const ITimeProvider& session_clock,
               const ITimeProvider& wall_clock);

  OrderFactory(const OrderFactory&) = delete;
  OrderFactory& operator=(const OrderFactory&) = delete;

  // -------------------------------------------------------------------------
  // create()
  // -------------------------------------------------------------------------
  // @brief  Builds the next order. See class comment for the exact steps.
  // -------------------------------------------------------------------------
  domain::Order create();

  const domain::ProductCatalog& catalog() const { return catalog_; }

 private:
  const domain::ProductCatalog catalog_;
  OrderIdGenerator& id_gen_;
  LifecyclePolicy& policy_;
  IRandomSource& rng_;
  CustomerDataGenerator customers_;
  const ITimeProvider& session_clock_;
  const ITimeProvider& wall_clock_;
};

// -------------------------------------------------------------------------
// validateCatalog(catalog)
// -------------------------------------------------------------------------
// @brief  Startup check shared by OrderFactory and configuration loading.
// @throws ConfigError on an empty catalog or an invalid price range.
// -------------------------------------------------------------------------
void validateCatalog(const domain::ProductCatalog& catalog);

// Rounds to two decimal places (cents), half away from zero.
double roundToCents(double value);

}  // namespace orderflow
