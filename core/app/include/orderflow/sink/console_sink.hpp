#pragma once

#include "orderflow/sink/i_event_sink.hpp"

#include <ostream>

namespace orderflow {

// -----------------------------------------------------------------------------
// ConsoleSink — human-readable event stream
// -----------------------------------------------------------------------------
//
// @brief  Writes each event's payload as JSON indented by two spaces,
//         followed by a blank line.
//
// @details
// Production passes std::cout; tests pass an std::ostringstream. The stream
// is borrowed and must outlive the sink. A stream left in a failed state
// after a write is reported as SinkError and the state is cleared so the
// next event gets a fresh attempt.
// -----------------------------------------------------------------------------
class ConsoleSink final : public IEventSink {
 public:
  explicit ConsoleSink(std::ostream& out) : out_(out) {}

  std::string name() const override { return "console"; }
  void write(const OrderLifecycleEvent& event) override;
  void flush() override;
  void close() override;

 private:
  std::ostream& out_;
};

}  // namespace orderflow
