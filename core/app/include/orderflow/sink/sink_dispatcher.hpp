#pragma once

#include "orderflow/events/order_lifecycle_event.hpp"
#include "orderflow/sink/i_event_sink.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace orderflow {

// -----------------------------------------------------------------------------
// SinkDispatcher — fan-out of lifecycle events to every configured sink
// -----------------------------------------------------------------------------
//
// @brief  Delivers each OrderLifecycleEvent to all registered sinks, in
//         registration order, isolating every sink from the others.
//
// @details
// Delivery rules:
//   1. dispatch() calls write() on each sink in turn.
//   2. A std::exception thrown by one sink is caught, logged to std::cerr as
//        [SinkDispatcher] WARNING: sink=<name> failed to deliver
//        order_id=<id>: <what>
//      and counted (total and per sink). The remaining sinks still receive
//      the event.
//   3. dispatch() never throws a sink's exception back to the caller. The
//      engine loop therefore never aborts on a delivery failure.
//
// Shutdown:
//   close() flushes then closes every sink exactly once. A second call is a
//   no-op. A sink whose flush/close throws is logged; the others are still
//   closed. After close(), dispatch() drops events and addSink() throws.
//
// Thread model:
//   Owned by SimulationEngine and called only from its loop thread. No
//   mutex.
//
// Ownership:
//   Owns its sinks via std::unique_ptr<IEventSink>.
// -----------------------------------------------------------------------------
class SinkDispatcher {
 public:
  // Opaque id returned by addSink(); pass to removeSink() or
  // failureCount(id).
  using SinkId = std::size_t;

  SinkDispatcher() = default;
  ~SinkDispatcher();

  SinkDispatcher(const SinkDispatcher&) = delete;
  SinkDispatcher& operator=(const SinkDispatcher&) = delete;

  // -------------------------------------------------------------------------
  // addSink(sink)
  // -------------------------------------------------------------------------
  // @throws std::invalid_argument for a null sink.
  // @throws std::logic_error after close().
  // -------------------------------------------------------------------------
  SinkId addSink(std::unique_ptr<IEventSink> sink);

  // -------------------------------------------------------------------------
  // removeSink(id)
  // -------------------------------------------------------------------------
  // @brief  Detaches the sink, flushing and closing it first.
  // @return false if no sink has that id.
  // -------------------------------------------------------------------------
  bool removeSink(SinkId id);

  // -------------------------------------------------------------------------
  // dispatch(event)
  // -------------------------------------------------------------------------
  // @return Number of sinks that failed to take this event.
  // -------------------------------------------------------------------------
  std::size_t dispatch(const OrderLifecycleEvent& event);

  void close();

  std::size_t sinkCount() const { return sinks_.size(); }
  bool isClosed() const { return closed_; }

  // Total failed deliveries across all sinks since construction.
  std::uint64_t failureCount() const { return total_failures_; }

  // Failed deliveries for one sink (0 for an unknown id).
  std::uint64_t failureCount(SinkId id) const;

 private:
  struct SinkEntry {
    SinkId id;
    std::unique_ptr<IEventSink> sink;
    std::uint64_t failures{0};
  };

  static void shutdownSink(IEventSink& sink);

  SinkId next_id_{0};
  std::vector<SinkEntry> sinks_;
  std::uint64_t total_failures_{0};
  bool closed_{false};
};

}  // namespace orderflow
