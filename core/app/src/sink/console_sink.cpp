#include "orderflow/sink/console_sink.hpp"
#include "orderflow/events/event_payload.hpp"
#include "orderflow/sink/sink_error.hpp"

namespace orderflow {

// -----------------------------------------------------------------------------
// write: pretty JSON + blank line
// -----------------------------------------------------------------------------
void ConsoleSink::write(const OrderLifecycleEvent& event) {
  out_ << prettyPayload(event) << "\n\n";
  if (!out_) {
    out_.clear();
    throw SinkError("output stream is in a failed state");
  }
}

void ConsoleSink::flush() { out_.flush(); }

void ConsoleSink::close() { out_.flush(); }

}  // namespace orderflow
