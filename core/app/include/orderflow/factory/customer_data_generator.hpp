#pragma once

#include "orderflow/domain/order.hpp"
#include "orderflow/random/i_random_source.hpp"

#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// CustomerDataGenerator — plausible customer identity and address fields
// -----------------------------------------------------------------------------
//
// @brief  Fills the attributes that downstream consumers display but the
//         lifecycle engine never inspects: customer id, email address and
//         shipping address.
//
// @details
// Values are assembled from small built-in word pools (first/last names,
// street names, US cities and state codes, mail domains, country codes).
// They look realistic in a consumer's log or dashboard.
//
// Formats:
//   customerId()      "CUST-NNNNNN" (100000..999999, repeats allowed: a
//                     customer may place several orders)
//   email()           "<first>.<last><NN>@<domain>"
//   shippingAddress() {"1234 Maple Avenue", "Springfield", "IL", "62704",
//                      "USA"}
//
// Thread model: as thread-safe as the injected IRandomSource (i.e. not).
// -----------------------------------------------------------------------------
class CustomerDataGenerator {
 public:
  explicit CustomerDataGenerator(IRandomSource& rng) : rng_(rng) {}

  std::string customerId();
  std::string email();
  domain::ShippingAddress shippingAddress();

 private:
  IRandomSource& rng_;
};

}  // namespace orderflow
