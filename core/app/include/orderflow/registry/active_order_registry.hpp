#pragma once

#include "orderflow/domain/order.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace orderflow {

class LifecyclePolicy;

// -----------------------------------------------------------------------------
// ActiveOrderRegistry — the in-flight (non-terminal) order book
// -----------------------------------------------------------------------------
//
// @brief  Holds the authoritative copy of every order that has been created
//         and has not yet reached Shipped or Cancelled.
//
// @details
// Membership rule: an order is present iff it is non-terminal. The engine
// inserts an order right after OrderFactory::create() and erases it in the
// same tick in which LifecyclePolicy moves it to a terminal state.
//
// insert() enforces both halves of the rule at the door:
//   - a duplicate id is a programming error (ids are collision-free), and
//   - a terminal order must never enter the book.
// Both throw std::logic_error.
//
// Iteration order:
//   collectDue() and snapshot() return orders sorted by id. Ids come from a
//   monotonically increasing sequence, so this is creation order and makes
//   a tick's processing order reproducible under a fixed random sequence.
//
// Thread model:
//   Owned by SimulationEngine and accessed only from its loop thread. No
//   mutex.
//
// Ownership:
//   Owns the Order values. find() hands out references that stay valid
//   until the entry is erased.
// -----------------------------------------------------------------------------
class ActiveOrderRegistry {
 public:
  ActiveOrderRegistry() = default;

  ActiveOrderRegistry(const ActiveOrderRegistry&) = delete;
  ActiveOrderRegistry& operator=(const ActiveOrderRegistry&) = delete;

  // -------------------------------------------------------------------------
  // insert(order)
  // -------------------------------------------------------------------------
  // @brief  Admits a newly created order.
  //
  // @return Reference to the stored copy.
  //
  // @throws std::logic_error if the id is already present or the order is
  //         terminal.
  // -------------------------------------------------------------------------
  domain::Order& insert(domain::Order order);

  domain::Order* find(const domain::OrderId& id);
  const domain::Order* find(const domain::OrderId& id) const;

  bool contains(const domain::OrderId& id) const;

  // Returns true if an entry was removed.
  bool erase(const domain::OrderId& id);

  std::size_t size() const { return orders_.size(); }
  bool empty() const { return orders_.empty(); }

  // -------------------------------------------------------------------------
  // collectDue(policy, now_ms)
  // -------------------------------------------------------------------------
  // @brief  Ids of every order for which policy.isDue(order, now_ms) holds.
  //
  // @details
  // A pure read. The engine takes this snapshot before mutating any order,
  // so an order that transitions during the tick cannot be picked up again
  // in the same tick.
  // -------------------------------------------------------------------------
  std::vector<domain::OrderId> collectDue(const LifecyclePolicy& policy,
                                          std::int64_t now_ms) const;

  // Copies of all active orders, sorted by id.
  std::vector<domain::Order> snapshot() const;

 private:
  std::unordered_map<domain::OrderId, domain::Order> orders_;
};

}  // namespace orderflow
