#include "orderflow/lifecycle/lifecycle_policy_config.hpp"
#include "orderflow/config/config_error.hpp"
#include "orderflow/time/time_utils.hpp"

#include <stdexcept>
#include <string>

namespace orderflow {

namespace {

void validateRange(const DwellRange& range, const char* state) {
  if (!isValidIntervalSeconds(range.min_seconds) ||
      !isValidIntervalSeconds(range.max_seconds)) {
    throw ConfigError(std::string("dwell range for '") + state +
                      "' must be finite, non-negative and at most " +
                      std::to_string(kMaxIntervalSeconds) + " s");
  }
  if (range.min_seconds > range.max_seconds) {
    throw ConfigError(std::string("dwell range for '") + state +
                      "' has min_seconds > max_seconds");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// dwellFor: map active status to its configured range
// -----------------------------------------------------------------------------
const DwellRange& LifecyclePolicyConfig::dwellFor(
    domain::OrderStatus status) const {
  using S = domain::OrderStatus;
  switch (status) {
    case S::Pending:    return pending;
    case S::Confirmed:  return confirmed;
    case S::Processing: return processing;
    case S::Shipped:
    case S::Cancelled:
      break;
  }
  throw std::logic_error(std::string("no dwell range for terminal status '") +
                         domain::toString(status) + "'");
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void LifecyclePolicyConfig::validate() const {
  // Written as a negated range test so that NaN is rejected too.
  if (!(cancellation_probability >= 0.0 && cancellation_probability <= 1.0)) {
    throw ConfigError("cancellation_probability must be within [0, 1]");
  }
  validateRange(pending, "pending");
  validateRange(confirmed, "confirmed");
  validateRange(processing, "processing");
}

}  // namespace orderflow
