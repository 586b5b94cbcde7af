#include "orderflow/domain/product.hpp"

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// defaultCatalog: fifteen products with realistic retail price bands
// -----------------------------------------------------------------------------
ProductCatalog defaultCatalog() {
  return {
      {"PROD-001", "Wireless Bluetooth Headphones", 29.99, 199.99},
      {"PROD-002", "Smart Watch", 99.99, 499.99},
      {"PROD-003", "Laptop Stand", 19.99, 89.99},
      {"PROD-004", "USB-C Cable", 9.99, 29.99},
      {"PROD-005", "Mechanical Keyboard", 59.99, 299.99},
      {"PROD-006", "Wireless Mouse", 19.99, 129.99},
      {"PROD-007", "Phone Case", 14.99, 49.99},
      {"PROD-008", "Portable Charger", 24.99, 79.99},
      {"PROD-009", "LED Desk Lamp", 29.99, 89.99},
      {"PROD-010", "Webcam HD", 39.99, 199.99},
      {"PROD-011", "External Hard Drive", 49.99, 199.99},
      {"PROD-012", "Monitor 27 inch", 199.99, 699.99},
      {"PROD-013", "Gaming Chair", 149.99, 499.99},
      {"PROD-014", "Desk Organizer", 12.99, 39.99},
      {"PROD-015", "Bluetooth Speaker", 29.99, 249.99},
  };
}

}  // namespace domain
}  // namespace orderflow
