#pragma once

#include <string>
#include <utility>

namespace orderflow {

// -----------------------------------------------------------------------------
// PublishResult
// -----------------------------------------------------------------------------
// Outcome of one publish attempt. reason is empty on success.
// -----------------------------------------------------------------------------
struct PublishResult {
  bool ok{false};
  std::string reason;

  static PublishResult success() { return PublishResult{true, {}}; }
  static PublishResult failure(std::string why) {
    return PublishResult{false, std::move(why)};
  }
};

// -----------------------------------------------------------------------------
// IBrokerClient — message broker seam
// -----------------------------------------------------------------------------
//
// @brief  Hides the broker wire protocol behind a single publish call.
//
// @details
// publish(topic, key, payload) is best-effort: one attempt, bounded by the
// implementation's own timeout, no retry. The key is the order id; brokers
// that partition by key therefore keep every event of one order in one
// partition, which preserves per-order ordering.
//
// A client that cannot be constructed (bad endpoint) throws from its
// constructor; a client that was constructed reports per-message failures
// through PublishResult rather than by throwing.
//
// Thread model:
//   Called only from the SimulationEngine loop thread (via BrokerSink).
// -----------------------------------------------------------------------------
class IBrokerClient {
 public:
  virtual ~IBrokerClient() = default;

  virtual PublishResult publish(const std::string& topic,
                                const std::string& key,
                                const std::string& payload) = 0;

  // Wait for in-flight messages, bounded by the client's linger setting.
  virtual void flush() = 0;

  // Release connections. Idempotent.
  virtual void close() = 0;
};

}  // namespace orderflow
