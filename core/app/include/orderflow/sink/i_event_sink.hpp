#pragma once

#include "orderflow/events/order_lifecycle_event.hpp"

#include <string>

namespace orderflow {

// -----------------------------------------------------------------------------
// IEventSink — abstract destination for lifecycle events
// -----------------------------------------------------------------------------
//
// @brief  Polymorphic base for every place an OrderLifecycleEvent can be
//         delivered: the console, a message broker, a test recorder.
//
// @details
// SinkDispatcher owns sinks through std::unique_ptr<IEventSink> and calls
// them in registration order. Each call is isolated: an exception thrown by
// one sink is caught by the dispatcher and does not prevent delivery to the
// others.
//
// Contract:
//   write(event)  Deliver one event. Throw (SinkError or any
//                 std::exception) on failure. Must not retry internally
//                 beyond its own bounded wait.
//   flush()       Push out anything buffered. May throw.
//   close()       Release resources. Called exactly once by the
//                 dispatcher, after the last write() and flush(). May throw.
//
// Thread model:
//   Called only from the SimulationEngine loop thread.
// -----------------------------------------------------------------------------
class IEventSink {
 public:
  virtual ~IEventSink() = default;

  // Short identifier used in log lines ("console", "broker").
  virtual std::string name() const = 0;

  virtual void write(const OrderLifecycleEvent& event) = 0;

  virtual void flush() = 0;

  virtual void close() = 0;
};

}  // namespace orderflow
