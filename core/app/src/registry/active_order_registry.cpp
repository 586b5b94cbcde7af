#include "orderflow/registry/active_order_registry.hpp"
#include "orderflow/lifecycle/lifecycle_policy.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace orderflow {

// -----------------------------------------------------------------------------
// insert: admit a new non-terminal order
// -----------------------------------------------------------------------------
domain::Order& ActiveOrderRegistry::insert(domain::Order order) {
  if (order.isTerminal()) {
    throw std::logic_error("ActiveOrderRegistry: refusing terminal order " +
                           order.id + " (status=" +
                           domain::toString(order.status()) + ")");
  }

  const domain::OrderId id = order.id;
  auto [it, inserted] = orders_.emplace(id, std::move(order));
  if (!inserted) {
    throw std::logic_error("ActiveOrderRegistry: duplicate order_id=" + id);
  }
  return it->second;
}

domain::Order* ActiveOrderRegistry::find(const domain::OrderId& id) {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

const domain::Order* ActiveOrderRegistry::find(
    const domain::OrderId& id) const {
  auto it = orders_.find(id);
  return it == orders_.end() ? nullptr : &it->second;
}

bool ActiveOrderRegistry::contains(const domain::OrderId& id) const {
  return orders_.count(id) != 0;
}

bool ActiveOrderRegistry::erase(const domain::OrderId& id) {
  return orders_.erase(id) != 0;
}

// -----------------------------------------------------------------------------
// collectDue: snapshot of due ids in creation order
// -----------------------------------------------------------------------------
std::vector<domain::OrderId> ActiveOrderRegistry::collectDue(
    const LifecyclePolicy& policy, std::int64_t now_ms) const {
  std::vector<domain::OrderId> due;
  for (const auto& [id, order] : orders_) {
    if (policy.isDue(order, now_ms)) {
      due.push_back(id);
    }
  }
  std::sort(due.begin(), due.end());
  return due;
}

std::vector<domain::Order> ActiveOrderRegistry::snapshot() const {
  std::vector<domain::Order> copy;
  copy.reserve(orders_.size());
  for (const auto& entry : orders_) {
    copy.push_back(entry.second);
  }
  std::sort(copy.begin(), copy.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.id < b.id;
            });
  return copy;
}

}  // namespace orderflow
