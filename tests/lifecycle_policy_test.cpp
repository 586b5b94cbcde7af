// =============================================================================
// lifecycle_policy_test.cpp
// =============================================================================
// Unit tests for orderflow::LifecyclePolicy and LifecyclePolicyConfig.
//
// Validates:
//   - Orders that are not due are held untouched (no random draw)
//   - Advance follows pending -> confirmed -> processing -> shipped and
//     draws the next dwell from the new state's range
//   - Cancel picks the reason from the pre-cancellation state's set
//   - Probability bounds (0 never cancels, 1 always cancels, u == p advances)
//   - Terminal orders are never transitioned
//   - Configuration validation
//
// Design: ScriptedRandomSource makes every draw explicit.
// =============================================================================

#include "orderflow/config/config_error.hpp"
#include "orderflow/lifecycle/lifecycle_policy.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <limits>
#include <stdexcept>

using orderflow::LifecyclePolicy;
using orderflow::LifecyclePolicyConfig;
using orderflow::TransitionDecision;
using orderflow::domain::CancellationReason;
using orderflow::domain::Order;
using orderflow::domain::OrderStatus;

namespace {

Order makePendingOrder(std::int64_t last_change_ms, std::int64_t dwell_ms) {
  Order order;
  order.id = "ORD-10000001";
  order.state = orderflow::domain::Pending{};
  order.last_status_change_ms = last_change_ms;
  order.next_due_ms = dwell_ms;
  order.timestamp_ms = 0;
  return order;
}

template <std::size_t N>
bool contains(const std::array<CancellationReason, N>& set,
              CancellationReason reason) {
  return std::find(set.begin(), set.end(), reason) != set.end();
}

}  // namespace

class LifecyclePolicyTest : public ::testing::Test {
 protected:
  orderflow::test::ScriptedRandomSource rng;
  LifecyclePolicyConfig config;
};

// -----------------------------------------------------------------------------
// 1. Not due: decide() holds, evaluate() leaves the order untouched and
//    consumes no Bernoulli draw.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, NotDueOrderIsHeldUnchanged) {
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(1'000, 10'000);

  EXPECT_FALSE(policy.isDue(order, 10'999));
  EXPECT_EQ(policy.decide(order, 10'999), TransitionDecision::Hold);

  auto transition = policy.evaluate(order, 10'999, 5'000);
  EXPECT_FALSE(transition.has_value());
  EXPECT_EQ(order.status(), OrderStatus::Pending);
  EXPECT_EQ(order.last_status_change_ms, 1'000);
  EXPECT_EQ(order.next_due_ms, 10'000);
  EXPECT_EQ(order.timestamp_ms, 0);
  EXPECT_EQ(rng.unit_draws, 0u);
}

// -----------------------------------------------------------------------------
// 2. Due exactly at the boundary: advance to confirmed, stamp both clocks,
//    draw the confirmed dwell.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, DueOrderAdvancesAndDrawsNextDwell) {
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(1'000, 10'000);
  rng.units = {0.5};
  rng.real_fraction = 0.5;

  ASSERT_TRUE(policy.isDue(order, 11'000));
  auto transition = policy.evaluate(order, 11'000, 1'700'000'000'000);

  ASSERT_TRUE(transition.has_value());
  EXPECT_EQ(transition->from, OrderStatus::Pending);
  EXPECT_EQ(transition->to, OrderStatus::Confirmed);
  EXPECT_FALSE(transition->isTerminal());
  EXPECT_EQ(order.status(), OrderStatus::Confirmed);
  EXPECT_EQ(order.last_status_change_ms, 11'000);
  EXPECT_EQ(order.timestamp_ms, 1'700'000'000'000);
  // confirmed dwell: 15 + 0.5 * (45 - 15) = 30 s
  EXPECT_EQ(order.next_due_ms, 30'000);
  EXPECT_FALSE(order.cancellationReason().has_value());
}

// -----------------------------------------------------------------------------
// 3. Full forward path ends in shipped with no further dwell.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, ForwardPathEndsInShipped) {
  config.cancellation_probability = 0.0;
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(0, 10'000);

  auto t1 = policy.evaluate(order, 10'000, 0);
  ASSERT_TRUE(t1.has_value());
  EXPECT_EQ(order.status(), OrderStatus::Confirmed);
  EXPECT_EQ(order.next_due_ms, 15'000);

  auto t2 = policy.evaluate(order, 25'000, 0);
  ASSERT_TRUE(t2.has_value());
  EXPECT_EQ(order.status(), OrderStatus::Processing);
  EXPECT_EQ(order.next_due_ms, 20'000);

  auto t3 = policy.evaluate(order, 45'000, 0);
  ASSERT_TRUE(t3.has_value());
  EXPECT_EQ(t3->from, OrderStatus::Processing);
  EXPECT_EQ(t3->to, OrderStatus::Shipped);
  EXPECT_TRUE(t3->isTerminal());
  EXPECT_TRUE(order.isTerminal());
  EXPECT_EQ(order.next_due_ms, 0);
  EXPECT_FALSE(order.cancellationReason().has_value());
}

// -----------------------------------------------------------------------------
// 4. Cancellation from each active state draws from that state's reasons.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, CancelFromPendingUsesPendingReasons) {
  config.cancellation_probability = 1.0;
  LifecyclePolicy policy(config, rng);

  for (std::int64_t k = 0; k < 4; ++k) {
    rng.int_offset = k;
    Order order = makePendingOrder(0, 0);
    auto t = policy.evaluate(order, 0, 42);

    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->from, OrderStatus::Pending);
    EXPECT_EQ(t->to, OrderStatus::Cancelled);
    ASSERT_TRUE(order.cancellationReason().has_value());
    EXPECT_EQ(*order.cancellationReason(),
              orderflow::domain::Pending::kCancellationReasons[k]);
    const auto& cancelled = std::get<orderflow::domain::Cancelled>(order.state);
    EXPECT_EQ(cancelled.cancelled_from, OrderStatus::Pending);
    EXPECT_EQ(order.next_due_ms, 0);
  }
}

TEST_F(LifecyclePolicyTest, CancelFromConfirmedAndProcessingUsesTheirReasons) {
  LifecyclePolicy policy(config, rng);

  Order confirmed = makePendingOrder(0, 0);
  confirmed.state = orderflow::domain::Confirmed{};
  rng.int_offset = 3;
  ASSERT_EQ(policy.apply(confirmed, TransitionDecision::Cancel, 0, 0)->from,
            OrderStatus::Confirmed);
  EXPECT_EQ(*confirmed.cancellationReason(), CancellationReason::AddressInvalid);
  EXPECT_TRUE(contains(orderflow::domain::Confirmed::kCancellationReasons,
                       *confirmed.cancellationReason()));

  Order processing = makePendingOrder(0, 0);
  processing.state = orderflow::domain::Processing{};
  rng.int_offset = 1;
  ASSERT_EQ(policy.apply(processing, TransitionDecision::Cancel, 0, 0)->from,
            OrderStatus::Processing);
  EXPECT_EQ(*processing.cancellationReason(),
            CancellationReason::InventoryDamaged);
  EXPECT_FALSE(contains(orderflow::domain::Pending::kCancellationReasons,
                        *processing.cancellationReason()));
}

// -----------------------------------------------------------------------------
// 5. Probability bounds.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, ZeroProbabilityNeverCancels) {
  config.cancellation_probability = 0.0;
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(0, 0);
  rng.units = {0.0};

  EXPECT_EQ(policy.decide(order, 0), TransitionDecision::Advance);
}

TEST_F(LifecyclePolicyTest, FullProbabilityAlwaysCancels) {
  config.cancellation_probability = 1.0;
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(0, 0);
  rng.units = {0.999999};

  EXPECT_EQ(policy.decide(order, 0), TransitionDecision::Cancel);
}

TEST_F(LifecyclePolicyTest, DrawEqualToProbabilityAdvances) {
  config.cancellation_probability = 0.25;
  LifecyclePolicy policy(config, rng);
  Order order = makePendingOrder(0, 0);
  rng.units = {0.25, 0.2499};

  EXPECT_EQ(policy.decide(order, 0), TransitionDecision::Advance);
  EXPECT_EQ(policy.decide(order, 0), TransitionDecision::Cancel);
}

// -----------------------------------------------------------------------------
// 6. Terminal orders: never due, never transitioned.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, TerminalOrdersAreNeverTransitioned) {
  LifecyclePolicy policy(config, rng);

  Order shipped = makePendingOrder(0, 0);
  shipped.state = orderflow::domain::Shipped{};
  EXPECT_FALSE(policy.isDue(shipped, 1'000'000));
  EXPECT_EQ(policy.decide(shipped, 1'000'000), TransitionDecision::Hold);
  EXPECT_THROW(policy.apply(shipped, TransitionDecision::Advance, 0, 0),
               std::logic_error);
  EXPECT_THROW(policy.apply(shipped, TransitionDecision::Cancel, 0, 0),
               std::logic_error);
  EXPECT_EQ(shipped.status(), OrderStatus::Shipped);

  Order cancelled = makePendingOrder(0, 0);
  cancelled.state = orderflow::domain::Cancelled{
      CancellationReason::FraudSuspected, OrderStatus::Pending};
  EXPECT_FALSE(policy.evaluate(cancelled, 1'000'000, 0).has_value());
  EXPECT_THROW(policy.apply(cancelled, TransitionDecision::Advance, 0, 0),
               std::logic_error);
  EXPECT_EQ(*cancelled.cancellationReason(),
            CancellationReason::FraudSuspected);
}

// -----------------------------------------------------------------------------
// 7. Dwell draws and configuration validation.
// -----------------------------------------------------------------------------
TEST_F(LifecyclePolicyTest, DwellDrawsStayInsideConfiguredRanges) {
  LifecyclePolicy policy(config, rng);

  rng.real_fraction = 0.0;
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Pending), 10'000);
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Confirmed), 15'000);
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Processing), 20'000);

  rng.real_fraction = 1.0;
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Pending), 30'000);
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Confirmed), 45'000);
  EXPECT_EQ(policy.drawDwellMs(OrderStatus::Processing), 60'000);

  EXPECT_THROW(policy.drawDwellMs(OrderStatus::Shipped), std::logic_error);
  EXPECT_THROW(policy.drawDwellMs(OrderStatus::Cancelled), std::logic_error);
}

TEST_F(LifecyclePolicyTest, InvalidConfigurationIsRejected) {
  LifecyclePolicyConfig bad = config;
  bad.cancellation_probability = 1.5;
  EXPECT_THROW({ LifecyclePolicy rejected(bad, rng); }, orderflow::ConfigError);

  bad = config;
  bad.cancellation_probability = -0.01;
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.cancellation_probability = std::numeric_limits<double>::quiet_NaN();
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.confirmed = {50.0, 40.0};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.processing = {-1.0, 5.0};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  // NaN fails both ordering comparisons, so it needs its own rejection.
  bad = config;
  bad.pending = {std::numeric_limits<double>::quiet_NaN(), 5.0};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.confirmed = {1.0, std::numeric_limits<double>::quiet_NaN()};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.processing = {1.0, std::numeric_limits<double>::infinity()};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  bad = config;
  bad.pending = {1.0, 1e300};
  EXPECT_THROW(bad.validate(), orderflow::ConfigError);

  EXPECT_NO_THROW(config.validate());
}
