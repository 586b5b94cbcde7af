#pragma once

#include "orderflow/domain/cancellation_reason.hpp"
#include "orderflow/domain/order_status.hpp"

#include <array>
#include <optional>
#include <type_traits>
#include <variant>

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// Lifecycle state alternatives
// -----------------------------------------------------------------------------
//
// @brief  One empty tag type per lifecycle state. The Cancelled alternative
//         is the only one that carries data: the reason and the state the
//         order was cancelled from.
//
// @details
// Each tag exposes its OrderStatus as kStatus so that statusOf() can derive
// the flat status without a lookup table. The three active tags also
// expose kCancellationReasons, the reason set drawn from when an order in
// that state is cancelled. Because the reason set lives on the type, the
// policy cannot pick a confirmed-stage reason for a pending order.
//
// Shipped and Cancelled have no kCancellationReasons and no
// NextState specialization (below): code that tries to advance or cancel a
// terminal order fails to compile instead of failing at runtime.
// -----------------------------------------------------------------------------
struct Pending {
  static constexpr OrderStatus kStatus = OrderStatus::Pending;
  static constexpr std::array<CancellationReason, 4> kCancellationReasons{
      CancellationReason::PaymentFailed,
      CancellationReason::PaymentDeclined,
      CancellationReason::CustomerCancelled,
      CancellationReason::FraudSuspected,
  };
};

struct Confirmed {
  static constexpr OrderStatus kStatus = OrderStatus::Confirmed;
  static constexpr std::array<CancellationReason, 4> kCancellationReasons{
      CancellationReason::InventoryUnavailable,
      CancellationReason::CustomerCancelled,
      CancellationReason::PaymentVerificationFailed,
      CancellationReason::AddressInvalid,
  };
};

struct Processing {
  static constexpr OrderStatus kStatus = OrderStatus::Processing;
  static constexpr std::array<CancellationReason, 4> kCancellationReasons{
      CancellationReason::CustomerCancelled,
      CancellationReason::InventoryDamaged,
      CancellationReason::ShippingAddressUnreachable,
      CancellationReason::CustomerRequestedCancellation,
  };
};

struct Shipped {
  static constexpr OrderStatus kStatus = OrderStatus::Shipped;
};

struct Cancelled {
  static constexpr OrderStatus kStatus = OrderStatus::Cancelled;
  CancellationReason reason{CancellationReason::CustomerCancelled};
  OrderStatus cancelled_from{OrderStatus::Pending};  // State before cancel
};

// -----------------------------------------------------------------------------
// LifecycleState
// -----------------------------------------------------------------------------
// Responsibility: The authoritative lifecycle state of an order.
//
// Invariants:
// - A cancellation reason exists only inside the Cancelled alternative.
// - Transitions are written per alternative (std::visit + if constexpr);
//   a transition the state machine does not have does not compile.
// -----------------------------------------------------------------------------
using LifecycleState =
    std::variant<Pending, Confirmed, Processing, Shipped, Cancelled>;

// -----------------------------------------------------------------------------
// NextState<S> — forward progression, defined only for active states
// -----------------------------------------------------------------------------
template <typename State>
struct NextState;  // Undefined for Shipped and Cancelled.

template <>
struct NextState<Pending> {
  using type = Confirmed;
};

template <>
struct NextState<Confirmed> {
  using type = Processing;
};

template <>
struct NextState<Processing> {
  using type = Shipped;
};

template <typename State>
using NextStateT = typename NextState<State>::type;

// True for the alternatives that may still transition.
template <typename State>
inline constexpr bool kIsActiveState =
    std::is_same_v<State, Pending> || std::is_same_v<State, Confirmed> ||
    std::is_same_v<State, Processing>;

// -------------------------------------------------------------------------
// statusOf(state)
// -------------------------------------------------------------------------
// @brief  Flat OrderStatus of the variant's current alternative.
// -------------------------------------------------------------------------
inline OrderStatus statusOf(const LifecycleState& state) {
  return std::visit(
      [](const auto& s) { return std::decay_t<decltype(s)>::kStatus; },
      state);
}

// Reason of a cancelled state; std::nullopt for every other alternative.
inline std::optional<CancellationReason> cancellationReasonOf(
    const LifecycleState& state) {
  if (const auto* cancelled = std::get_if<Cancelled>(&state)) {
    return cancelled->reason;
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace orderflow
