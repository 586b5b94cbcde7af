#include "orderflow/domain/payment_method.hpp"

namespace orderflow {
namespace domain {

// -----------------------------------------------------------------------------
// toString(PaymentMethod)
// -----------------------------------------------------------------------------
const char* toString(PaymentMethod method) {
  using P = PaymentMethod;
  switch (method) {
    case P::CreditCard:   return "credit_card";
    case P::DebitCard:    return "debit_card";
    case P::PayPal:       return "paypal";
    case P::ApplePay:     return "apple_pay";
    case P::GooglePay:    return "google_pay";
    case P::BankTransfer: return "bank_transfer";
  }
  return "unknown";
}

}  // namespace domain
}  // namespace orderflow
