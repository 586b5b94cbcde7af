#include "orderflow/lifecycle/lifecycle_policy.hpp"
#include "orderflow/time/time_utils.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace orderflow {

// -----------------------------------------------------------------------------
// Constructor: validate configuration up front
// -----------------------------------------------------------------------------
LifecyclePolicy::LifecyclePolicy(const LifecyclePolicyConfig& config,
                                 IRandomSource& rng)
    : config_(config), rng_(rng) {
  config_.validate();
}

// -----------------------------------------------------------------------------
// isDue: elapsed time in the current state has reached the drawn dwell
// -----------------------------------------------------------------------------
bool LifecyclePolicy::isDue(const domain::Order& order,
                            std::int64_t now_ms) const {
  if (order.isTerminal()) {
    return false;
  }
  return now_ms - order.last_status_change_ms >= order.next_due_ms;
}

// -----------------------------------------------------------------------------
// drawDwellMs: uniform draw from the status's range, in milliseconds
// -----------------------------------------------------------------------------
std::int64_t LifecyclePolicy::drawDwellMs(domain::OrderStatus status) {
  const DwellRange& range = config_.dwellFor(status);
  return secondsToMs(rng_.uniformReal(range.min_seconds, range.max_seconds));
}

// -----------------------------------------------------------------------------
// decide: hold unless due; then one Bernoulli draw
// -----------------------------------------------------------------------------
TransitionDecision LifecyclePolicy::decide(const domain::Order& order,
                                           std::int64_t now_ms) {
  if (!isDue(order, now_ms)) {
    return TransitionDecision::Hold;
  }
  return rng_.unitInterval() < config_.cancellation_probability
             ? TransitionDecision::Cancel
             : TransitionDecision::Advance;
}

// -----------------------------------------------------------------------------
// apply: perform the decided transition and stamp both clocks
// -----------------------------------------------------------------------------
std::optional<Transition> LifecyclePolicy::apply(domain::Order& order,
                                                 TransitionDecision decision,
                                                 std::int64_t now_ms,
                                                 std::int64_t wall_now_ms) {
  Transition transition;
  switch (decision) {
    case TransitionDecision::Hold:
      return std::nullopt;
    case TransitionDecision::Cancel:
      transition = cancel(order);
      break;
    case TransitionDecision::Advance:
      transition = advance(order);
      break;
  }

  order.last_status_change_ms = now_ms;
  order.timestamp_ms = wall_now_ms;
  return transition;
}

// -----------------------------------------------------------------------------
// evaluate: decide + apply
// -----------------------------------------------------------------------------
std::optional<Transition> LifecyclePolicy::evaluate(domain::Order& order,
                                                    std::int64_t now_ms,
                                                    std::int64_t wall_now_ms) {
  return apply(order, decide(order, now_ms), now_ms, wall_now_ms);
}

// -----------------------------------------------------------------------------
// cancel: Cancelled{reason drawn from the current state's set, from}
// -----------------------------------------------------------------------------
Transition LifecyclePolicy::cancel(domain::Order& order) {
  const domain::OrderStatus from = order.status();

  order.state = std::visit(
      [this, &order](const auto& state) -> domain::LifecycleState {
        using State = std::decay_t<decltype(state)>;
        if constexpr (domain::kIsActiveState<State>) {
          return domain::Cancelled{pickOne(rng_, State::kCancellationReasons),
                                   State::kStatus};
        } else {
          throw std::logic_error("cannot cancel order " + order.id +
                                 " in terminal status '" +
                                 domain::toString(State::kStatus) + "'");
        }
      },
      order.state);

  // A cancelled order is never due again; no dwell to draw.
  order.next_due_ms = 0;
  return Transition{from, domain::OrderStatus::Cancelled};
}

// -----------------------------------------------------------------------------
// advance: NextState<current>, plus a fresh dwell unless now terminal
// -----------------------------------------------------------------------------
Transition LifecyclePolicy::advance(domain::Order& order) {
  const domain::OrderStatus from = order.status();

  order.state = std::visit(
      [&order](const auto& state) -> domain::LifecycleState {
        using State = std::decay_t<decltype(state)>;
        if constexpr (domain::kIsActiveState<State>) {
          return domain::NextStateT<State>{};
        } else {
          throw std::logic_error("cannot advance order " + order.id +
                                 " past terminal status '" +
                                 domain::toString(State::kStatus) + "'");
        }
      },
      order.state);

  const domain::OrderStatus to = order.status();
  order.next_due_ms = domain::isTerminal(to) ? 0 : drawDwellMs(to);
  return Transition{from, to};
}

}  // namespace orderflow
