// =============================================================================
// order_factory_test.cpp
// =============================================================================
// Unit tests for orderflow::OrderFactory, OrderIdGenerator and
// CustomerDataGenerator.
//
// Validates:
//   - New orders start pending with the pending dwell and both clock stamps
//   - Identifiers are unique and sequential
//   - Quantity, price and total follow the catalog and rounding rules
//   - Customer, email, address and payment method formats
//   - Catalog validation at construction
// =============================================================================

#include "orderflow/config/config_error.hpp"
#include "orderflow/factory/order_factory.hpp"
#include "orderflow/random/mt_random_source.hpp"
#include "orderflow/time/simulation_time_provider.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <string>

using orderflow::OrderFactory;
using orderflow::OrderIdGenerator;
using orderflow::domain::Order;
using orderflow::domain::OrderStatus;

namespace {

bool allDigits(const std::string& text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool hasAtMostTwoDecimals(double value) {
  double cents = value * 100.0;
  return std::fabs(cents - std::round(cents)) < 1e-6;
}

}  // namespace

class OrderFactoryTest : public ::testing::Test {
 protected:
  orderflow::SimulationTimeProvider session_clock{5'000};
  orderflow::SimulationTimeProvider wall_clock{1'700'000'000'000};
  orderflow::LifecyclePolicyConfig policy_config;
  OrderIdGenerator id_gen;
};

// -----------------------------------------------------------------------------
// 1. Initial lifecycle state.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, NewOrderStartsPendingWithPendingDwell) {
  orderflow::test::ScriptedRandomSource rng;
  rng.real_fraction = 0.5;
  orderflow::LifecyclePolicy policy(policy_config, rng);
  OrderFactory factory(orderflow::domain::defaultCatalog(), id_gen, policy,
                       rng, session_clock, wall_clock);

  Order order = factory.create();

  EXPECT_EQ(order.status(), OrderStatus::Pending);
  EXPECT_FALSE(order.isTerminal());
  EXPECT_FALSE(order.cancellationReason().has_value());
  EXPECT_EQ(order.last_status_change_ms, 5'000);
  EXPECT_EQ(order.timestamp_ms, 1'700'000'000'000);
  // pending dwell: 10 + 0.5 * (30 - 10) = 20 s
  EXPECT_EQ(order.next_due_ms, 20'000);
}

// -----------------------------------------------------------------------------
// 2. Scripted draws: first product, minimum quantity, mid-range price.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, CommercialAttributesFollowTheDraws) {
  orderflow::test::ScriptedRandomSource rng;
  rng.real_fraction = 0.5;
  orderflow::LifecyclePolicy policy(policy_config, rng);
  OrderFactory factory(orderflow::domain::defaultCatalog(), id_gen, policy,
                       rng, session_clock, wall_clock);

  Order order = factory.create();

  EXPECT_EQ(order.product_id, "PROD-001");
  EXPECT_EQ(order.product_name, "Wireless Bluetooth Headphones");
  EXPECT_EQ(order.quantity, 1);
  EXPECT_DOUBLE_EQ(order.price, 114.99);  // 29.99 + 0.5 * 170.00
  EXPECT_DOUBLE_EQ(order.total, 114.99);
  EXPECT_EQ(order.payment_method, orderflow::domain::PaymentMethod::CreditCard);
}

TEST_F(OrderFactoryTest, QuantityIsClampedToFive) {
  orderflow::test::ScriptedRandomSource rng;
  rng.int_offset = 100;  // Every integer draw hits its upper bound.
  orderflow::LifecyclePolicy policy(policy_config, rng);
  OrderFactory factory(orderflow::domain::defaultCatalog(), id_gen, policy,
                       rng, session_clock, wall_clock);

  Order order = factory.create();

  EXPECT_EQ(order.quantity, OrderFactory::kMaxQuantity);
  EXPECT_EQ(order.product_id, "PROD-015");
  EXPECT_DOUBLE_EQ(order.price, 29.99);
  EXPECT_DOUBLE_EQ(order.total, 149.95);
  EXPECT_EQ(order.payment_method,
            orderflow::domain::PaymentMethod::BankTransfer);
}

// -----------------------------------------------------------------------------
// 3. Identifiers: "ORD-" + sequence, unique across many orders.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, IdentifiersAreUniqueAndSequential) {
  orderflow::Mt19937RandomSource rng(7);
  orderflow::LifecyclePolicy policy(policy_config, rng);
  OrderFactory factory(orderflow::domain::defaultCatalog(), id_gen, policy,
                       rng, session_clock, wall_clock);

  EXPECT_EQ(factory.create().id, "ORD-10000000");
  EXPECT_EQ(factory.create().id, "ORD-10000001");

  std::set<std::string> ids;
  for (int i = 0; i < 5'000; ++i) {
    ids.insert(factory.create().id);
  }
  EXPECT_EQ(ids.size(), 5'000u);
}

TEST(OrderIdGeneratorTest, CustomStartingSequence) {
  OrderIdGenerator gen(42);
  EXPECT_EQ(gen.next_id(), "ORD-42");
  EXPECT_EQ(gen.next_id(), "ORD-43");
}

// -----------------------------------------------------------------------------
// 4. Randomized property check over many orders.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, RandomOrdersRespectCatalogAndRounding) {
  orderflow::Mt19937RandomSource rng(20240601);
  orderflow::LifecyclePolicy policy(policy_config, rng);
  const auto catalog = orderflow::domain::defaultCatalog();
  OrderFactory factory(catalog, id_gen, policy, rng, session_clock,
                       wall_clock);

  for (int i = 0; i < 2'000; ++i) {
    Order order = factory.create();

    auto product =
        std::find_if(catalog.begin(), catalog.end(),
                     [&](const auto& p) { return p.id == order.product_id; });
    ASSERT_NE(product, catalog.end());
    EXPECT_EQ(order.product_name, product->name);

    EXPECT_GE(order.quantity, 1);
    EXPECT_LE(order.quantity, 5);
    EXPECT_GE(order.price, product->min_price);
    EXPECT_LE(order.price, product->max_price);
    EXPECT_TRUE(hasAtMostTwoDecimals(order.price)) << order.price;
    EXPECT_TRUE(hasAtMostTwoDecimals(order.total)) << order.total;
    EXPECT_DOUBLE_EQ(order.total,
                     orderflow::roundToCents(order.quantity * order.price));

    EXPECT_GE(order.next_due_ms, 10'000);
    EXPECT_LE(order.next_due_ms, 30'000);

    EXPECT_TRUE(std::find(orderflow::domain::kAllPaymentMethods.begin(),
                          orderflow::domain::kAllPaymentMethods.end(),
                          order.payment_method) !=
                orderflow::domain::kAllPaymentMethods.end());
  }
}

// -----------------------------------------------------------------------------
// 5. Customer data formats.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, CustomerFieldsAreWellFormed) {
  orderflow::Mt19937RandomSource rng(99);
  orderflow::LifecyclePolicy policy(policy_config, rng);
  OrderFactory factory(orderflow::domain::defaultCatalog(), id_gen, policy,
                       rng, session_clock, wall_clock);

  for (int i = 0; i < 200; ++i) {
    Order order = factory.create();

    ASSERT_EQ(order.customer_id.rfind("CUST-", 0), 0u) << order.customer_id;
    EXPECT_EQ(order.customer_id.size(), 11u);
    EXPECT_TRUE(allDigits(order.customer_id.substr(5)));

    auto at = order.customer_email.find('@');
    ASSERT_NE(at, std::string::npos) << order.customer_email;
    EXPECT_GT(at, 0u);
    EXPECT_NE(order.customer_email.find('.', at), std::string::npos);

    const auto& address = order.shipping_address;
    EXPECT_FALSE(address.street.empty());
    EXPECT_FALSE(address.city.empty());
    EXPECT_EQ(address.state.size(), 2u);
    EXPECT_EQ(address.zip_code.size(), 5u);
    EXPECT_TRUE(allDigits(address.zip_code)) << address.zip_code;
    EXPECT_EQ(address.country.size(), 3u);
  }
}

// -----------------------------------------------------------------------------
// 6. Catalog validation.
// -----------------------------------------------------------------------------
TEST_F(OrderFactoryTest, InvalidCatalogIsRejected) {
  orderflow::test::ScriptedRandomSource rng;
  orderflow::LifecyclePolicy policy(policy_config, rng);

  EXPECT_THROW(
      {
        OrderFactory factory({}, id_gen, policy, rng, session_clock,
                             wall_clock);
      },
      orderflow::ConfigError);

  orderflow::domain::ProductCatalog inverted{
      {"PROD-X", "Inverted", 50.0, 10.0}};
  EXPECT_THROW(
      {
        OrderFactory factory(inverted, id_gen, policy, rng, session_clock,
                             wall_clock);
      },
      orderflow::ConfigError);

  orderflow::domain::ProductCatalog single{{"PROD-Y", "Fixed", 5.0, 5.0}};
  OrderFactory factory(single, id_gen, policy, rng, session_clock, wall_clock);
  EXPECT_DOUBLE_EQ(factory.create().price, 5.0);
}

TEST(RoundToCentsTest, RoundsHalfAwayFromZero) {
  EXPECT_DOUBLE_EQ(orderflow::roundToCents(1.005000001), 1.01);
  EXPECT_DOUBLE_EQ(orderflow::roundToCents(2.344), 2.34);
  EXPECT_DOUBLE_EQ(orderflow::roundToCents(3 * 19.99), 59.97);
}
