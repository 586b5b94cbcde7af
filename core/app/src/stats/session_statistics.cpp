#include "orderflow/stats/session_statistics.hpp"
#include "orderflow/domain/order_status.hpp"

#include <iomanip>
#include <string>

namespace orderflow {

void SessionStatistics::begin(std::int64_t start_ms) {
  *this = SessionStatistics{};
  start_ms_ = start_ms;
}

void SessionStatistics::recordTransition(const Transition& transition) {
  ++status_updates_;
  if (transition.to == domain::OrderStatus::Shipped) {
    ++shipped_;
  } else if (transition.to == domain::OrderStatus::Cancelled) {
    ++cancelled_;
  }
}

// -----------------------------------------------------------------------------
// summarize: zero-safe rates
// -----------------------------------------------------------------------------
SessionSummary SessionStatistics::summarize(std::size_t active_at_cutoff,
                                            std::int64_t now_ms) const {
  SessionSummary s;
  s.created = created_;
  s.status_updates = status_updates_;
  s.shipped = shipped_;
  s.cancelled = cancelled_;
  s.active_at_cutoff = active_at_cutoff;
  s.dispatch_failures = dispatch_failures_;
  s.elapsed_ms = now_ms > start_ms_ ? now_ms - start_ms_ : 0;

  if (created_ > 0) {
    s.success_rate =
        static_cast<double>(shipped_) / static_cast<double>(created_);
    s.cancellation_rate =
        static_cast<double>(cancelled_) / static_cast<double>(created_);
  }

  if (s.elapsed_ms > 0) {
    const double minutes = static_cast<double>(s.elapsed_ms) / 60'000.0;
    s.orders_per_minute = static_cast<double>(created_) / minutes;
  }
  return s;
}

// -----------------------------------------------------------------------------
// printSummary
// -----------------------------------------------------------------------------
void printSummary(std::ostream& out, const SessionSummary& summary) {
  const double seconds = static_cast<double>(summary.elapsed_ms) / 1000.0;

  std::ios_base::fmtflags flags = out.flags();
  std::streamsize precision = out.precision();

  out << std::string(80, '=') << "\n"
      << "Generator finished.\n"
      << "Total new orders created: " << summary.created << "\n"
      << "Total status updates: " << summary.status_updates << "\n"
      << "Total orders shipped: " << summary.shipped << "\n"
      << "Total orders cancelled: " << summary.cancelled << "\n"
      << "Active orders (still in pipeline): " << summary.active_at_cutoff
      << "\n"
      << std::fixed << std::setprecision(1)
      << "Success rate: " << summary.success_rate * 100.0 << "%\n"
      << "Cancellation rate: " << summary.cancellation_rate * 100.0 << "%\n"
      << std::setprecision(2)
      << "Total time elapsed: " << seconds << " seconds ("
      << seconds / 60.0 << " minutes)\n"
      << "Average rate: " << summary.orders_per_minute
      << " new orders per minute\n"
      << "Dispatch failures: " << summary.dispatch_failures << "\n";

  out.flags(flags);
  out.precision(precision);
}

}  // namespace orderflow
