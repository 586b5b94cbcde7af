#pragma once

#include <string>
#include <vector>

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// Product
// -----------------------------------------------------------------------------
// Responsibility: One catalog entry. The unit price of every order for this
// product is drawn uniformly from [min_price, max_price].
// -----------------------------------------------------------------------------
struct Product {
  std::string id;         // e.g. "PROD-001"
  std::string name;       // e.g. "Wireless Bluetooth Headphones"
  double min_price{0.0};
  double max_price{0.0};
};

using ProductCatalog = std::vector<Product>;

// -------------------------------------------------------------------------
// defaultCatalog()
// -------------------------------------------------------------------------
// @brief  The built-in catalog of fifteen consumer-electronics products.
//
// @details
// Used when the configuration file does not provide a "catalog" array.
// Returned by value; callers own their copy.
// -------------------------------------------------------------------------
ProductCatalog defaultCatalog();

}  // namespace domain
}  // namespace orderflow
