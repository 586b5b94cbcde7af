#include "orderflow/domain/order_status.hpp"

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// toString(OrderStatus)
// -----------------------------------------------------------------------------
const char* toString(OrderStatus status) {
  using S = OrderStatus;
  switch (status) {
    case S::Pending:    return "pending";
    case S::Confirmed:  return "confirmed";
    case S::Processing: return "processing";
    case S::Shipped:    return "shipped";
    case S::Cancelled:  return "cancelled";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// isTerminal
// -----------------------------------------------------------------------------
bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Shipped || status == OrderStatus::Cancelled;
}

}  // namespace domain
}  // namespace orderflow
