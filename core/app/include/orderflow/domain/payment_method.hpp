#pragma once

#include <array>

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// PaymentMethod
// -----------------------------------------------------------------------------
// Responsibility: How the customer paid. Fixed enumerated set; the factory
// draws uniformly from kAllPaymentMethods.
// -----------------------------------------------------------------------------
enum class PaymentMethod {
  CreditCard,
  DebitCard,
  PayPal,
  ApplePay,
  GooglePay,
  BankTransfer,
};

inline constexpr std::array<PaymentMethod, 6> kAllPaymentMethods{
    PaymentMethod::CreditCard, PaymentMethod::DebitCard,
    PaymentMethod::PayPal,     PaymentMethod::ApplePay,
    PaymentMethod::GooglePay,  PaymentMethod::BankTransfer,
};

// Snake-case wire name, e.g. "credit_card".
const char* toString(PaymentMethod method);

}  // namespace domain
}  // namespace orderflow
